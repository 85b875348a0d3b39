#include <anipler/control/control-router.hxx>

#include <map>
#include <cassert>
#include <iostream>

using namespace std;
using namespace anipler;

// Engine stand-in with just the claim flow. Readiness per task id:
// 'r' ready, 'c' reserved, 'd' deleted.
//
class fake_engine
{
public:
  map<string, char> tasks;
  size_t confirms = 0;

  vector<ready_entry>
  ready ()
  {
    vector<ready_entry> r;
    for (const auto& [id, s]: tasks)
      if (s == 'r')
        r.push_back (ready_entry {id, "name-" + id, 42});
    return r;
  }

  claim_grant
  claim (const string& id)
  {
    char& s (at (id));

    if (s != 'r')
      throw lifecycle_error (error_kind::conflict, "task " + id + " is taken");

    s = 'c';
    return claim_grant {id, "relay", "/srv/artifacts/" + id, "name-" + id};
  }

  confirm_result
  confirm (const string& id)
  {
    char& s (at (id));

    if (s == 'd')
      throw lifecycle_error (error_kind::conflict,
                             "task " + id + " is already deleted");

    ++confirms;
    s = 'd';
    return confirm_result {id, true};
  }

private:
  char&
  at (const string& id)
  {
    auto i (tasks.find (id));

    if (i == tasks.end ())
      throw lifecycle_error (error_kind::not_found, "unknown task " + id);

    return i->second;
  }
};

using router = basic_control_router<fake_engine>;

static const string key ("s3cret");

static router::request_type
request (http::verb m,
         const string& target,
         const string& body = "",
         const string& token = key)
{
  router::request_type r (m, target, 11);

  if (!token.empty ())
    r.set (http::field::authorization, "Bearer " + token);

  if (!body.empty ())
  {
    r.set (http::field::content_type, "application/json");
    r.body () = body;
  }

  r.prepare_payload ();
  return r;
}

static json::value
body_of (const router::response_type& r)
{
  return json::parse (r.body ());
}

static string
error_of (const router::response_type& r)
{
  return json::value_to<string> (body_of (r).at ("error"));
}

static void
test_health ()
{
  auto e (make_shared<fake_engine> ());
  router rt (e, key);

  auto r (rt.handle (request (http::verb::get, "/health", "", "")));
  assert (r.result () == http::status::ok);
  assert (json::value_to<string> (body_of (r).at ("status")) == "ok");
}

static void
test_auth ()
{
  auto e (make_shared<fake_engine> ());
  e->tasks["a"] = 'r';
  router rt (e, key);

  // Missing, wrong, and wrong scheme.
  //
  {
    auto r (rt.handle (request (http::verb::get, "/ready", "", "")));
    assert (r.result () == http::status::unauthorized);
    assert (r[http::field::www_authenticate] == "Bearer");
    assert (error_of (r) == "unauthorized");
  }

  {
    auto r (rt.handle (request (http::verb::get, "/ready", "", "s3creT")));
    assert (r.result () == http::status::unauthorized);
  }

  {
    auto q (request (http::verb::get, "/ready", "", ""));
    q.set (http::field::authorization, "Basic " + key);
    assert (rt.handle (q).result () == http::status::unauthorized);
  }

  // Unknown paths do not leak past authentication either.
  //
  {
    auto r (rt.handle (request (http::verb::get, "/nope", "", "")));
    assert (r.result () == http::status::unauthorized);
  }

  // Nothing was claimed by the rejected callers.
  //
  assert (e->tasks["a"] == 'r');

  // An empty key never matches.
  //
  router open (e, "");
  auto r (open.handle (request (http::verb::get, "/ready", "", "")));
  assert (r.result () == http::status::unauthorized);
}

static void
test_claim_flow ()
{
  auto e (make_shared<fake_engine> ());
  e->tasks["a"] = 'r';
  e->tasks["b"] = 'r';
  router rt (e, key);

  {
    auto r (rt.handle (request (http::verb::get, "/ready?x=1")));
    assert (r.result () == http::status::ok);
    assert (r[http::field::content_type] == "application/json");

    vector<ready_entry> l (parse_ready_list (body_of (r)));
    assert (l.size () == 2);
    assert (l[0].task_id == "a" && l[0].size == 42);
  }

  {
    auto r (rt.handle (request (http::verb::post, "/claim",
                                json::serialize (task_request ("a")))));
    assert (r.result () == http::status::ok);

    claim_grant g (parse_claim_grant (body_of (r)));
    assert (g.task_id == "a");
    assert (g.relay_endpoint == "relay");
    assert (g.relay_path == "/srv/artifacts/a");
  }

  // Second claim loses.
  //
  {
    auto r (rt.handle (request (http::verb::post, "/claim",
                                R"({"task_id":"a"})")));
    assert (r.result () == http::status::conflict);
    assert (error_of (r) == "conflict");
  }

  {
    auto r (rt.handle (request (http::verb::post, "/confirm",
                                R"({"task_id":"a"})")));
    assert (r.result () == http::status::ok);
    assert (body_of (r).at ("reclaimed").as_bool ());
  }

  {
    auto r (rt.handle (request (http::verb::post, "/confirm",
                                R"({"task_id":"a"})")));
    assert (r.result () == http::status::conflict);
  }

  {
    auto r (rt.handle (request (http::verb::post, "/confirm",
                                R"({"task_id":"zz"})")));
    assert (r.result () == http::status::not_found);
    assert (error_of (r) == "not_found");
  }

  assert (e->confirms == 1);

  // Only b remains ready.
  //
  auto r (rt.handle (request (http::verb::get, "/ready")));
  assert (parse_ready_list (body_of (r)).size () == 1);
}

static void
test_bad_requests ()
{
  auto e (make_shared<fake_engine> ());
  e->tasks["a"] = 'r';
  router rt (e, key);

  assert (rt.handle (request (http::verb::post, "/claim", "{oops")).result ()
          == http::status::bad_request);

  assert (rt.handle (request (http::verb::post, "/claim", R"({"id":"a"})"))
          .result () == http::status::bad_request);

  assert (rt.handle (request (http::verb::post, "/claim", R"({"task_id":""})"))
          .result () == http::status::bad_request);

  assert (rt.handle (request (http::verb::get, "/claim")).result ()
          == http::status::method_not_allowed);

  assert (rt.handle (request (http::verb::post, "/ready", "{}")).result ()
          == http::status::method_not_allowed);

  assert (rt.handle (request (http::verb::get, "/missing")).result ()
          == http::status::not_found);

  assert (e->tasks["a"] == 'r');
}

int
main ()
{
  test_health ();
  test_auth ();
  test_claim_flow ();
  test_bad_requests ();

  cout << "all control router tests passed" << endl;
}
