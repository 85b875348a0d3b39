#pragma once

#include <string>
#include <utility>
#include <optional>
#include <type_traits>

#include <anipler/http/http-types.hxx>

namespace anipler
{
  // HTTP request.
  //
  template <typename S, typename B = S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_method              method = http_method::get;
    string_type              url;
    http_version             version;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    // Return the request target (path and query component of the URL).
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_content_type (string_type ct)
    {
      set_header (string_type ("Content-Type"), std::move (ct));
    }

    void
    set_bearer_token (const string_type& token)
    {
      set_header (string_type ("Authorization"),
                  string_type ("Bearer ") + token);
    }

    void
    set_body (body_type b)
    {
      body = std::move (b);
    }

    // Add the default headers (Host, User-Agent, Content-Length) unless
    // already present.
    //
    void
    normalize ();
  };

  using http_request = basic_http_request<std::string>;
}

#include <anipler/http/http-request.ixx>
