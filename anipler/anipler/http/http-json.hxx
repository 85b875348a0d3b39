#pragma once

#include <string>
#include <stdexcept>

#include <boost/json.hpp>

#include <anipler/http/http-types.hxx>
#include <anipler/http/http-request.hxx>
#include <anipler/http/http-response.hxx>

namespace anipler
{
  // Parse the response body as JSON. A missing or malformed body is an
  // error.
  //
  template <typename S>
  inline boost::json::value
  parse_json (const basic_http_response<S>& r)
  {
    if (!r.body)
      throw std::runtime_error ("HTTP response has no body to parse as JSON");

    boost::system::error_code ec;
    boost::json::value v (boost::json::parse (*r.body, ec));

    if (ec)
      throw std::runtime_error ("invalid JSON in HTTP response: " +
                                ec.message ());

    return v;
  }

  // Construct a request with a JSON body.
  //
  template <typename S>
  inline basic_http_request<S>
  make_json_request (http_method m, const S& url, const boost::json::value& j)
  {
    basic_http_request<S> r (m, url);
    r.set_content_type (S ("application/json"));
    r.set_header (S ("Accept"), S ("application/json"));
    r.set_body (boost::json::serialize (j));
    r.normalize ();
    return r;
  }
}
