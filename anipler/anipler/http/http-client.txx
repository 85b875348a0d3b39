#include <chrono>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace anipler
{
  namespace http_detail
  {
    namespace http = beast::http;

    inline http::verb
    to_beast_verb (http_method m)
    {
      switch (m)
      {
        case http_method::get:     return http::verb::get;
        case http_method::head:    return http::verb::head;
        case http_method::post:    return http::verb::post;
        case http_method::put:     return http::verb::put;
        case http_method::delete_: return http::verb::delete_;
      }
      return http::verb::get;
    }

    // Write the request to the stream and read the response back into our
    // own representation.
    //
    template <typename R, typename Q, typename Stream>
    asio::awaitable<R>
    exchange (Stream& s, const Q& req, const std::string& target)
    {
      http::request<http::string_body> br;
      br.method (to_beast_verb (req.method));
      br.target (target);
      br.version (req.version.major * 10 + req.version.minor);

      for (const auto& h: req.headers)
        br.set (h.name, h.value);

      if (req.body)
      {
        br.body () = *req.body;
        br.prepare_payload ();
      }

      co_await http::async_write (s, br, asio::use_awaitable);

      // Telegram and qBittorrent answers are small but the relay listing can
      // grow with the backlog, so lift Beast's 1MB default.
      //
      beast::flat_buffer b;
      http::response_parser<http::string_body> p;
      p.body_limit (64 * 1024 * 1024);
      co_await http::async_read (s, b, p, asio::use_awaitable);

      auto& bres (p.get ());

      R r;
      r.status  = static_cast<http_status> (
        static_cast<std::uint16_t> (bres.result ()));
      r.version = http_version (bres.version () / 10, bres.version () % 10);
      r.reason  = std::string (bres.reason ());

      for (const auto& h: bres)
        r.headers.add (std::string (h.name_string ()),
                       std::string (h.value ()));

      if (!bres.body ().empty ())
        r.body = std::move (bres.body ());

      co_return r;
    }
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& tr (session_->traits ());

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + req.url);

    url_parts parts (parse_url (req.url));

    response_type r (parts.scheme == "https"
                     ? co_await request_ssl (req)
                     : co_await request_tcp (req));

    if (tr.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        // Relative locations are resolved against the current authority.
        //
        std::string u (*loc);
        if (!u.empty () && u.front () == '/')
          u = parts.scheme + "://" + parts.host + ':' + parts.port + u;

        request_type next (req.method, u, req.version);
        next.headers = req.headers;
        next.headers.remove ("Host");
        next.body = req.body;

        if (r.status == http_status::see_other)
        {
          next.method = http_method::get;
          next.body = std::nullopt;
          next.headers.remove ("Content-Length");
          next.headers.remove ("Content-Type");
        }

        next.normalize ();
        co_return co_await request_impl (std::move (next),
                                         redirect_count + 1);
      }
    }

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_ssl (const request_type& req)
  {
    using tcp = asio::ip::tcp;
    using stream_type = beast::ssl_stream<beast::tcp_stream>;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    url_parts parts (parse_url (req.url));

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (
      parts.host, parts.port, asio::use_awaitable));

    stream_type s (ctx, session_->ssl_context ());

    // Beast does not wrap SNI so go through the native handle.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());
      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    auto& layer (beast::get_lowest_layer (s));
    layer.expires_after (std::chrono::milliseconds (tr.connect_timeout));
    co_await layer.async_connect (addrs, asio::use_awaitable);

    co_await s.async_handshake (ssl::stream_base::client,
                                asio::use_awaitable);

    layer.expires_after (std::chrono::milliseconds (tr.request_timeout));

    // No TLS shutdown: plenty of servers just drop the connection after the
    // response and waiting for close_notify blocks until the timeout.
    //
    co_return co_await http_detail::exchange<response_type> (
      s, req, parts.target);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_tcp (const request_type& req)
  {
    using tcp = asio::ip::tcp;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    url_parts parts (parse_url (req.url));

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (
      parts.host, parts.port, asio::use_awaitable));

    beast::tcp_stream s (ctx);

    s.expires_after (std::chrono::milliseconds (tr.connect_timeout));
    co_await s.async_connect (addrs, asio::use_awaitable);

    s.expires_after (std::chrono::milliseconds (tr.request_timeout));

    response_type r (co_await http_detail::exchange<response_type> (
      s, req, parts.target));

    beast::error_code ec;
    s.socket ().shutdown (tcp::socket::shutdown_both, ec);

    co_return r;
  }
}
