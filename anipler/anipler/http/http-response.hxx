#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <anipler/http/http-types.hxx>

namespace anipler
{
  // HTTP response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    http_version             version;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s) : status (s) {}

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    bool
    is_server_error () const noexcept
    {
      return status_code () >= 500 && status_code () < 600;
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    // Return the body or the empty string.
    //
    string_type
    text () const
    {
      return body ? string_type (*body) : string_type ();
    }
  };

  using http_response = basic_http_response<std::string>;
}
