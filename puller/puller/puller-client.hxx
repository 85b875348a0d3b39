#pragma once

#include <string>
#include <vector>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

#include <anipler/http/http-client.hxx>
#include <anipler/control/control-types.hxx>

namespace puller
{
  namespace asio = boost::asio;

  using anipler::ready_entry;
  using anipler::claim_grant;
  using anipler::confirm_result;

  // Control channel client.
  //
  // Failures throw anipler::lifecycle_error with the kind the relay
  // reported (unauthorized, not_found, transient, ...).
  //
  class relay_client
  {
  public:
    relay_client (asio::io_context& ioc, std::string url, std::string key);

    relay_client (const relay_client&) = delete;
    relay_client& operator= (const relay_client&) = delete;

    void
    set_verbose (bool v)
    {
      verbose_ = v;
    }

    asio::awaitable<std::vector<ready_entry>>
    ready ();

    // Reserve the artifact. Return nullopt if another puller holds it.
    //
    asio::awaitable<std::optional<claim_grant>>
    claim (const std::string& task_id);

    // Report the artifact as pulled. Return nullopt if it was already
    // archived.
    //
    asio::awaitable<std::optional<confirm_result>>
    confirm (const std::string& task_id);

  private:
    asio::awaitable<anipler::http_response>
    call (anipler::http_request);

    // Throw the error the response carries.
    //
    [[noreturn]] void
    fail (const std::string& what, const anipler::http_response&);

    anipler::http_client client_;
    std::string url_;
    std::string key_;
    bool verbose_ = false;
  };
}
