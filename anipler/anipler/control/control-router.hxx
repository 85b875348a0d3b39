#pragma once

#include <memory>
#include <string>

#include <boost/beast/http.hpp>

#include <anipler/control/control-types.hxx>
#include <anipler/lifecycle/lifecycle-engine.hxx>

namespace anipler
{
  namespace http = boost::beast::http;

  // Control channel request handling.
  //
  //   GET  /health   no authentication
  //   GET  /ready    list of Ready artifacts
  //   POST /claim    {"task_id"} -> relay location, 409 if taken
  //   POST /confirm  {"task_id"} -> 200, 404 or 409
  //
  // Every other path needs the bearer token first, so an unauthenticated
  // caller cannot tell which paths or tasks exist.
  //
  template <typename E = lifecycle_engine>
  class basic_control_router
  {
  public:
    using engine_type = E;
    using request_type = http::request<http::string_body>;
    using response_type = http::response<http::string_body>;

    basic_control_router (std::shared_ptr<engine_type> e, std::string key);

    void
    set_verbose (bool v);

    response_type
    handle (const request_type& r);

  private:
    response_type
    dispatch (const request_type& r, const std::string& path);

    std::shared_ptr<engine_type> engine_;
    std::string key_;
    bool verbose_ = false;
  };

  using control_router = basic_control_router<>;

  // Build a JSON response.
  //
  http::response<http::string_body>
  json_response (http_status, const json::value&, unsigned version = 11);
}

#include <anipler/control/control-router.txx>
