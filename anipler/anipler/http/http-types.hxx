#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <ostream>
#include <utility>
#include <optional>

namespace anipler
{
  // HTTP method (verb).
  //
  enum class http_method
  {
    get,
    head,
    post,
    put,
    delete_
  };

  std::string
  to_string (http_method);

  http_method
  to_http_method (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // We only list the codes that either side of the relay actually produces or
  // reacts to. Anything else still round-trips through the numeric value.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    created               = 201,
    accepted              = 202,
    no_content            = 204,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    method_not_allowed    = 405,
    conflict              = 409,
    payload_too_large     = 413,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  // HTTP headers collection.
  //
  // Lookups are case-insensitive. Duplicates are allowed through add() since
  // Set-Cookie is the one header we genuinely need more than once.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Return the first value of the field or nullopt if there is none.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    // Return all the values of the field in order of appearance.
    //
    std::vector<string_type>
    get_all (const string_type& name) const;

    bool
    contains (const string_type& name) const;

    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    using iterator       = typename fields_type::iterator;
    using const_iterator = typename fields_type::const_iterator;

    iterator       begin ()       noexcept { return fields.begin (); }
    const_iterator begin () const noexcept { return fields.begin (); }
    iterator       end ()         noexcept { return fields.end (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }

  // Percent-encode a string for use in a query component or a form body.
  //
  std::string
  url_encode (const std::string&);

  // Encode the parameters as application/x-www-form-urlencoded.
  //
  std::string
  form_encode (const std::map<std::string, std::string>&);
}

#include <anipler/http/http-types.ixx>
