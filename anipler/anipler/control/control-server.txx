#include <iostream>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>

namespace anipler
{
  namespace beast = boost::beast;

  template <typename R, typename T>
  basic_control_server<R, T>::
  basic_control_server (asio::io_context& ioc, std::shared_ptr<router_type> r)
    : ioc_ (ioc), router_ (std::move (r)), acceptor_ (ioc)
  {
  }

  template <typename R, typename T>
  void basic_control_server<R, T>::
  start (const std::string& address, std::uint16_t port)
  {
    boost::system::error_code ec;
    auto a (asio::ip::make_address (address, ec));

    if (ec)
      throw std::system_error (ec, "invalid listen address '" + address + "'");

    endpoint_type e (a, port);

    acceptor_.open (e.protocol ());
    acceptor_.set_option (asio::socket_base::reuse_address (true));
    acceptor_.bind (e);
    acceptor_.listen (asio::socket_base::max_listen_connections);

    std::cout << "listening on " << local_endpoint () << std::endl;

    asio::co_spawn (ioc_, accept (), asio::detached);
  }

  template <typename R, typename T>
  void basic_control_server<R, T>::
  stop ()
  {
    boost::system::error_code ec;
    acceptor_.close (ec);
  }

  template <typename R, typename T>
  typename basic_control_server<R, T>::endpoint_type
  basic_control_server<R, T>::
  local_endpoint () const
  {
    return acceptor_.local_endpoint ();
  }

  template <typename R, typename T>
  asio::awaitable<void> basic_control_server<R, T>::
  accept ()
  {
    for (;;)
    {
      boost::system::error_code ec;
      asio::ip::tcp::socket s (
        co_await acceptor_.async_accept (
          asio::redirect_error (asio::use_awaitable, ec)));

      if (ec == asio::error::operation_aborted || !acceptor_.is_open ())
        co_return;

      // Running out of descriptors and the like. Keep accepting.
      //
      if (ec)
      {
        std::cerr << "warning: accept failed: " << ec.message () << std::endl;
        continue;
      }

      asio::co_spawn (ioc_, session (std::move (s)), asio::detached);
    }
  }

  template <typename R, typename T>
  asio::awaitable<void> basic_control_server<R, T>::
  session (asio::ip::tcp::socket s)
  {
    beast::tcp_stream stream (std::move (s));
    beast::flat_buffer buf;
    boost::system::error_code ec;

    for (;;)
    {
      stream.expires_after (traits_type::idle_timeout);

      http::request_parser<http::string_body> p;
      p.body_limit (traits_type::body_limit);

      co_await http::async_read (stream, buf, p,
                                 asio::redirect_error (asio::use_awaitable, ec));

      if (ec == http::error::end_of_stream)
        break;

      if (ec)
      {
        // Idle keep-alive connections time out all the time.
        //
        if (verbose_ && ec != beast::error::timeout)
          std::cerr << "warning: control read failed: " << ec.message ()
                    << std::endl;
        break;
      }

      http::request<http::string_body> req (p.release ());
      http::response<http::string_body> res (router_->handle (req));
      res.keep_alive (req.keep_alive ());

      co_await http::async_write (stream, res,
                                  asio::redirect_error (asio::use_awaitable, ec));

      if (ec)
      {
        std::cerr << "warning: control write failed: " << ec.message ()
                  << std::endl;
        break;
      }

      if (!res.keep_alive ())
        break;
    }

    stream.socket ().shutdown (asio::ip::tcp::socket::shutdown_send, ec);
  }
}
