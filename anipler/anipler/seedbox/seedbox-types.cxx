#include <anipler/seedbox/seedbox-types.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace anipler
{
  namespace json = boost::json;

  static const json::value&
  member (const json::object& o, const char* n)
  {
    auto i (o.find (n));

    if (i == o.end ())
      throw invalid_argument (string ("missing field '") + n +
                              "' in torrent info");

    return i->value ();
  }

  static int64_t
  integer (const json::value& v, const char* n)
  {
    if (v.is_int64 ())
      return v.get_int64 ();

    if (v.is_uint64 ())
      return static_cast<int64_t> (v.get_uint64 ());

    if (v.is_double ())
      return static_cast<int64_t> (v.get_double ());

    throw invalid_argument (string ("field '") + n + "' is not a number");
  }

  torrent_info
  parse_torrent_info (const json::value& v)
  {
    if (!v.is_object ())
      throw invalid_argument ("torrent info is not an object");

    const json::object& o (v.get_object ());

    auto str = [&o] (const char* n) -> string
    {
      const json::value& x (member (o, n));

      if (!x.is_string ())
        throw invalid_argument (string ("field '") + n + "' is not a string");

      return json::value_to<string> (x);
    };

    torrent_info t;
    t.hash         = str ("hash");
    t.name         = str ("name");
    t.content_path = str ("content_path");

    // Older Web API versions have no state for some entries.
    //
    if (auto i = o.find ("state"); i != o.end () && i->value ().is_string ())
      t.state = json::value_to<string> (i->value ());

    const json::value& p (member (o, "progress"));
    if (p.is_double ())
      t.progress = p.get_double ();
    else
      t.progress = static_cast<double> (integer (p, "progress"));

    t.size     = integer (member (o, "size"), "size");
    t.added_on = integer (member (o, "added_on"), "added_on");

    return t;
  }

  task_status
  status_of (const torrent_info& t)
  {
    return t.progress < 1.0 ? task_status::downloading : task_status::seeding;
  }

  task_fact
  to_task_fact (const torrent_info& t)
  {
    task_fact f;
    f.id = t.hash;
    f.status = status_of (t);
    f.name = t.name;
    f.size = t.size;
    f.added_on = t.added_on;

    // The content path of a torrent still downloading may point at the
    // incomplete directory.
    //
    if (f.status == task_status::seeding)
      f.content_path = t.content_path;

    return f;
  }

  optional<string>
  magnet_hash (const string& s)
  {
    const string p ("xt=urn:btih:");

    if (s.compare (0, 7, "magnet:") != 0)
      return nullopt;

    size_t b (s.find (p));
    if (b == string::npos)
      return nullopt;

    b += p.size ();
    size_t e (s.find ('&', b));

    string h (s.substr (b, e == string::npos ? string::npos : e - b));
    if (h.empty ())
      return nullopt;

    for (char& c: h)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    return h;
  }
}
