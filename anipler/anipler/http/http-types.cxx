#include <anipler/http/http-types.hxx>

#include <cctype>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>

using namespace std;

namespace anipler
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:     return "GET";
      case http_method::head:    return "HEAD";
      case http_method::post:    return "POST";
      case http_method::put:     return "PUT";
      case http_method::delete_: return "DELETE";
    }
    return "GET";
  }

  http_method
  to_http_method (const string& s)
  {
    string u;
    u.reserve (s.size ());
    transform (s.begin (), s.end (), back_inserter (u),
               [] (unsigned char c) { return toupper (c); });

    if (u == "GET")    return http_method::get;
    if (u == "HEAD")   return http_method::head;
    if (u == "POST")   return http_method::post;
    if (u == "PUT")    return http_method::put;
    if (u == "DELETE") return http_method::delete_;

    throw invalid_argument ("invalid HTTP method: " + s);
  }

  string http_version::
  string () const
  {
    ostringstream os;

    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);

    return os.str ();
  }

  std::string
  url_encode (const std::string& s)
  {
    ostringstream o;
    o << hex << uppercase;

    for (unsigned char c: s)
    {
      // RFC 3986 unreserved characters pass through unchanged.
      //
      if (isalnum (c) || c == '-' || c == '_' || c == '.' || c == '~')
        o << c;
      else
        o << '%' << setw (2) << setfill ('0') << static_cast<unsigned> (c);
    }

    return o.str ();
  }

  std::string
  form_encode (const map<std::string, std::string>& ps)
  {
    std::string r;

    for (const auto& [k, v]: ps)
    {
      if (!r.empty ())
        r += '&';

      r += url_encode (k);
      r += '=';
      r += url_encode (v);
    }

    return r;
  }
}
