#include <anipler/control/control-types.hxx>

#include <stdexcept>

using namespace std;

namespace anipler
{
  static const json::object&
  object_of (const json::value& v, const char* what)
  {
    if (!v.is_object ())
      throw invalid_argument (string (what) + " is not an object");

    return v.get_object ();
  }

  static string
  string_member (const json::object& o, const char* n)
  {
    auto i (o.find (n));

    if (i == o.end () || !i->value ().is_string ())
      throw invalid_argument (string ("missing or invalid '") + n + "'");

    return json::value_to<string> (i->value ());
  }

  json::object
  serialize (const ready_entry& e)
  {
    json::object o;
    o["task_id"] = e.task_id;
    o["name"]    = e.name;
    o["size"]    = e.size;
    return o;
  }

  json::array
  serialize (const vector<ready_entry>& es)
  {
    json::array a;
    a.reserve (es.size ());

    for (const ready_entry& e: es)
      a.push_back (serialize (e));

    return a;
  }

  json::object
  serialize (const claim_grant& g)
  {
    json::object o;
    o["task_id"]        = g.task_id;
    o["relay_endpoint"] = g.relay_endpoint;
    o["relay_path"]     = g.relay_path;
    o["name"]           = g.name;
    return o;
  }

  json::object
  serialize (const confirm_result& r)
  {
    json::object o;
    o["task_id"]   = r.task_id;
    o["reclaimed"] = r.reclaimed;
    return o;
  }

  ready_entry
  parse_ready_entry (const json::value& v)
  {
    const json::object& o (object_of (v, "ready entry"));

    ready_entry e;
    e.task_id = string_member (o, "task_id");
    e.name    = string_member (o, "name");

    if (auto i = o.find ("size"); i != o.end ())
    {
      if (i->value ().is_int64 ())
        e.size = i->value ().get_int64 ();
      else if (i->value ().is_uint64 ())
        e.size = static_cast<int64_t> (i->value ().get_uint64 ());
      else
        throw invalid_argument ("invalid 'size'");
    }

    return e;
  }

  vector<ready_entry>
  parse_ready_list (const json::value& v)
  {
    if (!v.is_array ())
      throw invalid_argument ("ready list is not an array");

    vector<ready_entry> r;
    for (const json::value& e: v.get_array ())
      r.push_back (parse_ready_entry (e));

    return r;
  }

  claim_grant
  parse_claim_grant (const json::value& v)
  {
    const json::object& o (object_of (v, "claim answer"));

    claim_grant g;
    g.task_id        = string_member (o, "task_id");
    g.relay_endpoint = string_member (o, "relay_endpoint");
    g.relay_path     = string_member (o, "relay_path");
    g.name           = string_member (o, "name");
    return g;
  }

  json::object
  task_request (const string& id)
  {
    json::object o;
    o["task_id"] = id;
    return o;
  }

  string
  parse_task_request (const json::value& v)
  {
    string id (string_member (object_of (v, "request body"), "task_id"));

    if (id.empty ())
      throw invalid_argument ("empty 'task_id'");

    return id;
  }

  json::object
  error_body (error_kind k, const string& m)
  {
    json::object o;
    o["error"]   = to_string (k);
    o["message"] = m;
    return o;
  }

  http_status
  status_of (error_kind k)
  {
    switch (k)
    {
      case error_kind::not_found:          return http_status::not_found;
      case error_kind::conflict:           return http_status::conflict;
      case error_kind::invalid_transition: return http_status::conflict;
      case error_kind::unauthorized:       return http_status::unauthorized;
      case error_kind::transient:          return http_status::service_unavailable;
      case error_kind::fatal:              return http_status::internal_server_error;
    }
    return http_status::internal_server_error;
  }
}
