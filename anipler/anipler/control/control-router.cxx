#include <anipler/control/control-router.hxx>

#include <anipler/version.hxx>

namespace anipler
{
  http::response<http::string_body>
  json_response (http_status s, const json::value& v, unsigned version)
  {
    http::response<http::string_body> r (
      static_cast<http::status> (static_cast<unsigned> (s)), version);

    r.set (http::field::server, "anipler/" ANIPLER_VERSION_STR);
    r.set (http::field::content_type, "application/json");
    r.body () = json::serialize (v);
    r.prepare_payload ();
    return r;
  }

  template class basic_control_router<lifecycle_engine>;
}
