#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <anipler/http/http-types.hxx>
#include <anipler/http/http-request.hxx>
#include <anipler/http/http-response.hxx>

namespace anipler
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration traits.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds.
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds. Must exceed the long-poll period when
    // the client is used for Telegram getUpdates.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 5;

    bool verify_ssl = true;

    // SSL certificate file path (empty means system defaults).
    //
    string_type ssl_cert_file;

    bool follow_redirects = true;
  };

  // HTTP client session context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // One connection per request. The relay API, the seedbox WebUI and the
  // Bot API are all low-volume so there is no connection reuse.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    explicit
    basic_http_client (asio::io_context& ioc)
      : session_ (std::make_unique<session_type> (ioc, traits_type ())) {}

    basic_http_client (asio::io_context& ioc, const traits_type& traits)
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform an HTTP request and return the response whatever its status.
    //
    asio::awaitable<response_type>
    request (const request_type& req);

    asio::awaitable<response_type>
    get (const string_type& url);

    asio::awaitable<response_type>
    post (const string_type& url,
          const string_type& body,
          const string_type& content_type = string_type ("application/json"));

    session_type&
    session () noexcept
    {
      return *session_;
    }

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirect_count);

    asio::awaitable<response_type>
    request_ssl (const request_type& req);

    asio::awaitable<response_type>
    request_tcp (const request_type& req);

  private:
    std::unique_ptr<session_type> session_;
  };

  // URL components.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
  };

  // Split a scheme://host[:port][/target] URL. The scheme defaults to http.
  //
  url_parts
  parse_url (const std::string&);

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <anipler/http/http-client.ixx>
#include <anipler/http/http-client.txx>
