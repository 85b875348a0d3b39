#include <anipler/version.hxx>

namespace anipler
{
  template <typename S, typename B>
  inline typename basic_http_request<S, B>::string_type
  basic_http_request<S, B>::
  target () const
  {
    std::size_t pos (0);

    std::size_t se (url.find ("://"));
    if (se != string_type::npos)
      pos = se + 3;

    std::size_t ps (url.find ('/', pos));
    if (ps == string_type::npos)
      return string_type ("/");

    return url.substr (ps);
  }

  template <typename S, typename B>
  inline void basic_http_request<S, B>::
  normalize ()
  {
    if (body && !has_header (string_type ("Content-Length")))
    {
      if constexpr (std::is_same<body_type, string_type>::value)
        set_header (string_type ("Content-Length"),
                    std::to_string (body->size ()));
    }

    if (!has_header (string_type ("Host")))
    {
      std::size_t pos (0);

      std::size_t se (url.find ("://"));
      if (se != string_type::npos)
        pos = se + 3;

      // Keep the port: the relay and the seedbox WebUI rarely listen on the
      // default ones.
      //
      std::size_t he (url.find ('/', pos));
      if (he == string_type::npos)
        he = url.size ();

      string_type h (url.substr (pos, he - pos));
      if (!h.empty ())
        set_header (string_type ("Host"), std::move (h));
    }

    if (!has_header (string_type ("User-Agent")))
      set_header (string_type ("User-Agent"),
                  string_type ("anipler/" ANIPLER_VERSION_STR));
  }
}
