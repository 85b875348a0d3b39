#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include <boost/json.hpp>

#include <anipler/http/http-types.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>

namespace anipler
{
  namespace json = boost::json;

  // GET /ready entry.
  //
  struct ready_entry
  {
    std::string task_id;
    std::string name;
    std::int64_t size = 0;
  };

  // POST /claim answer: where the puller copies the artifact from.
  //
  struct claim_grant
  {
    std::string task_id;
    std::string relay_endpoint;
    std::string relay_path;
    std::string name;
  };

  // POST /confirm answer. Reclaimed is false if the relay storage is left
  // for the sweep job.
  //
  struct confirm_result
  {
    std::string task_id;
    bool reclaimed = false;
  };

  // Wire format. The parse functions throw std::invalid_argument on missing
  // or mistyped members.
  //
  json::object
  serialize (const ready_entry&);

  json::array
  serialize (const std::vector<ready_entry>&);

  json::object
  serialize (const claim_grant&);

  json::object
  serialize (const confirm_result&);

  ready_entry
  parse_ready_entry (const json::value&);

  std::vector<ready_entry>
  parse_ready_list (const json::value&);

  claim_grant
  parse_claim_grant (const json::value&);

  // {"task_id": "..."} request body.
  //
  json::object
  task_request (const std::string& task_id);

  std::string
  parse_task_request (const json::value&);

  // Error body and status for a failed request.
  //
  json::object
  error_body (error_kind, const std::string& message);

  http_status
  status_of (error_kind);
}
