#include <anipler/seedbox/seedbox-types.hxx>

#include <cassert>
#include <stdexcept>

using namespace std;
using namespace anipler;

namespace json = boost::json;

static void
test_parse ()
{
  json::value v (json::parse (R"({
    "hash": "abc123",
    "name": "Show S01",
    "content_path": "/downloads/Show S01",
    "state": "stalledUP",
    "progress": 1,
    "size": 734003200,
    "added_on": 1700000000,
    "tags": "anipler"
  })"));

  torrent_info t (parse_torrent_info (v));
  assert (t.hash == "abc123");
  assert (t.name == "Show S01");
  assert (t.progress == 1.0);
  assert (t.size == 734003200);
  assert (t.added_on == 1700000000);
  assert (status_of (t) == task_status::seeding);

  task_fact f (to_task_fact (t));
  assert (f.id == "abc123");
  assert (*f.status == task_status::seeding);
  assert (*f.content_path == "/downloads/Show S01");
}

static void
test_downloading ()
{
  json::value v (json::parse (R"({
    "hash": "def",
    "name": "Movie",
    "content_path": "/incomplete/Movie",
    "progress": 0.42,
    "size": 10,
    "added_on": 1
  })"));

  torrent_info t (parse_torrent_info (v));
  assert (t.state.empty ());
  assert (status_of (t) == task_status::downloading);

  // Incomplete location is not recorded.
  //
  task_fact f (to_task_fact (t));
  assert (!f.content_path);
  assert (*f.name == "Movie");
}

static void
test_invalid ()
{
  auto bad = [] (const char* s)
  {
    try
    {
      parse_torrent_info (json::parse (s));
      assert (false);
    }
    catch (const invalid_argument&)
    {
    }
  };

  bad (R"([])");
  bad (R"({"name": "x", "content_path": "/x", "progress": 1,
           "size": 1, "added_on": 1})");
  bad (R"({"hash": "h", "name": "x", "content_path": "/x",
           "progress": "done", "size": 1, "added_on": 1})");
  bad (R"({"hash": 5, "name": "x", "content_path": "/x",
           "progress": 1, "size": 1, "added_on": 1})");
}

static void
test_magnet ()
{
  assert (*magnet_hash ("magnet:?xt=urn:btih:ABCDEF0123&dn=Show") ==
          "abcdef0123");
  assert (*magnet_hash ("magnet:?dn=x&xt=urn:btih:ff") == "ff");
  assert (!magnet_hash ("https://example.org/show.torrent"));
  assert (!magnet_hash ("magnet:?dn=nothing"));
}

int
main ()
{
  test_parse ();
  test_downloading ();
  test_invalid ();
  test_magnet ();
}
