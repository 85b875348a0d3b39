#include <anipler/http/http-client.hxx>

namespace anipler
{
  url_parts
  parse_url (const std::string& url)
  {
    url_parts r;
    std::size_t pos (0);

    std::size_t p (url.find ("://"));
    if (p != std::string::npos)
    {
      r.scheme = url.substr (0, p);
      pos = p + 3;
    }
    else
      r.scheme = "http";

    std::size_t end (url.find ('/', pos));
    if (end == std::string::npos)
      end = url.size ();

    std::string auth (url.substr (pos, end - pos));
    std::size_t colon (auth.rfind (':'));

    if (colon != std::string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = r.scheme == "https" ? "443" : "80";
    }

    r.target = end < url.size () ? url.substr (end) : std::string ("/");
    return r;
  }

  template class basic_http_session<http_client_traits<>>;
  template class basic_http_client<http_client_traits<>>;
}
