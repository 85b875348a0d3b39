#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include <chrono>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <anipler/control/control-router.hxx>

namespace anipler
{
  namespace asio = boost::asio;

  struct control_server_traits
  {
    // Idle time before a keep-alive connection is dropped.
    //
    static constexpr std::chrono::seconds idle_timeout {30};

    static constexpr std::uint64_t body_limit = 64 * 1024;
  };

  // HTTP listener for the control channel.
  //
  // One coroutine accepts, one coroutine per connection reads requests and
  // hands them to the router. Requests on a connection are served in order.
  //
  template <typename R = control_router, typename T = control_server_traits>
  class basic_control_server
  {
  public:
    using router_type = R;
    using traits_type = T;
    using endpoint_type = asio::ip::tcp::endpoint;

    basic_control_server (asio::io_context&, std::shared_ptr<router_type>);

    // Bind and start accepting. Throws std::system_error if the address is
    // not available.
    //
    void
    start (const std::string& address, std::uint16_t port);

    void
    stop ();

    // Bound endpoint (useful with port 0).
    //
    endpoint_type
    local_endpoint () const;

    void
    set_verbose (bool v)
    {
      verbose_ = v;
    }

  private:
    asio::awaitable<void>
    accept ();

    asio::awaitable<void>
    session (asio::ip::tcp::socket);

    asio::io_context& ioc_;
    std::shared_ptr<router_type> router_;
    asio::ip::tcp::acceptor acceptor_;
    bool verbose_ = false;
  };

  using control_server = basic_control_server<>;
}

#include <anipler/control/control-server.txx>
