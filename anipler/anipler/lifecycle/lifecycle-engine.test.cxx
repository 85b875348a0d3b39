#include <anipler/lifecycle/lifecycle-engine.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <cassert>
#include <fstream>
#include <iostream>
#include <exception>
#include <filesystem>

using namespace std;
using namespace anipler;

namespace fs = std::filesystem;

// Seedbox that lists whatever the test put in.
//
struct fake_seedbox
{
  vector<torrent_info> torrents;
  vector<string> added;

  asio::awaitable<vector<torrent_info>>
  list (const string&)
  {
    co_return torrents;
  }

  asio::awaitable<optional<string>>
  add (const string& source, const string& tag)
  {
    added.push_back (source + ' ' + tag);
    co_return magnet_hash (source);
  }
};

using engine = basic_lifecycle_engine<
  lifecycle_engine_traits<lifecycle_store, transfer_executor, fake_seedbox>>;

template <typename R>
static R
run (asio::io_context& ioc, asio::awaitable<R> a)
{
  optional<R> r;
  exception_ptr ep;

  asio::co_spawn (ioc,
                  move (a),
                  [&] (exception_ptr e, R v)
                  {
                    ep = e;
                    if (!e)
                      r = move (v);
                  });

  ioc.restart ();
  ioc.run ();

  if (ep)
    rethrow_exception (ep);

  return move (*r);
}

template <typename F>
static void
expect (error_kind k, F&& f)
{
  try
  {
    f ();
    assert (false);
  }
  catch (const lifecycle_error& e)
  {
    assert (e.kind () == k);
  }
}

struct fixture
{
  fs::path root;
  asio::io_context ioc;
  shared_ptr<lifecycle_store> store;
  shared_ptr<transfer_executor> executor;
  shared_ptr<fake_seedbox> seedbox;
  unique_ptr<engine> e;

  explicit
  fixture (const string& n)
    : root (fs::temp_directory_path () / ("anipler-engine-" + n))
  {
    fs::remove_all (root);
    fs::create_directories (root / "seedbox");

    store = make_shared<lifecycle_store> ("");
    executor = make_shared<transfer_executor> (ioc);
    seedbox = make_shared<fake_seedbox> ();

    executor->set_command_builder (
      [] (const copy_request& r, const fs::path& s)
      {
        return vector<string> {"cp", "-R", r.source, s.string () + '/'};
      });

    engine_config c;
    c.artifacts_dir = root / "relay" / "artifacts";
    c.relay_endpoint = "relay.example.org";
    c.claim_lease = 60000;

    e = make_unique<engine> (store, executor, seedbox, c);
  }

  ~fixture ()
  {
    fs::remove_all (root);
  }

  // Seedbox download of a single file in its own directory.
  //
  void
  download (const string& id, const string& name, double progress = 1.0)
  {
    fs::path d (root / "seedbox" / name);
    fs::create_directories (d);
    ofstream (d / "e01.mkv") << "episode of " << name;

    torrent_info t;
    t.hash = id;
    t.name = name;
    t.content_path = d.string ();
    t.progress = progress;
    t.size = 42;
    t.added_on = system_time_ms () / 1000 + 60;
    seedbox->torrents.push_back (t);
  }
};

static void
test_happy_path ()
{
  fixture f ("happy");
  f.download ("T1", "Show");

  pull_report p (run (f.ioc, f.e->pull ()));
  assert (p.listed == 1 && p.merged == 1);

  transfer_report t (run (f.ioc, f.e->transfer ()));
  assert (t.transferred == 1 && t.failed == 0 && t.pending == 0);

  auto a (f.store->find_artifact ("T1"));
  assert (a && a->readiness () == artifact_readiness::ready);

  fs::path rp (a->relay_path ());
  assert (rp == relay_path (f.e->config ().artifacts_dir, "T1"));
  assert (fs::exists (rp / "Show" / "e01.mkv"));

  vector<ready_entry> rs (f.e->ready ());
  assert (rs.size () == 1);
  assert (rs[0].task_id == "T1" && rs[0].name == "Show" && rs[0].size == 42);

  claim_grant g (f.e->claim ("T1"));
  assert (g.relay_endpoint == "relay.example.org");
  assert (g.relay_path == rp.string ());
  assert (g.name == "Show");

  confirm_result c (f.e->confirm ("T1"));
  assert (c.reclaimed);
  assert (!fs::exists (rp));
  assert (f.store->find_artifact ("T1")->readiness () ==
          artifact_readiness::deleted);

  // Same torrent still seeding: nothing more to do for it.
  //
  run (f.ioc, f.e->pull ());
  t = run (f.ioc, f.e->transfer ());
  assert (t.transferred == 0 && t.pending == 0);
  assert (f.e->ready ().empty ());

  expect (error_kind::conflict, [&] { f.e->confirm ("T1"); });
}

static void
test_horizon ()
{
  fixture f ("horizon");
  f.download ("OLD", "Old Show");
  f.download ("NEW", "New Show");
  f.download ("DL", "Incomplete", 0.5);
  f.seedbox->torrents[0].added_on = 1;

  pull_report p (run (f.ioc, f.e->pull ()));
  assert (p.listed == 3 && p.ignored == 1 && p.merged == 2);
  assert (!f.store->find_task ("OLD"));

  transfer_report t (run (f.ioc, f.e->transfer ()));
  assert (t.transferred == 1);
  assert (!f.store->find_artifact ("DL"));

  // Completes later.
  //
  f.seedbox->torrents[2].progress = 1.0;
  run (f.ioc, f.e->pull ());
  t = run (f.ioc, f.e->transfer ());
  assert (t.transferred == 1);
  assert (f.store->find_artifact ("DL")->readiness () ==
          artifact_readiness::ready);
}

static void
test_failure_then_success ()
{
  fixture f ("retry");
  f.download ("T1", "Show");

  bool fail (true);
  f.executor->set_command_builder (
    [&fail] (const copy_request& r, const fs::path& s)
    {
      if (fail)
        return vector<string> {"false"};

      return vector<string> {"cp", "-R", r.source, s.string () + '/'};
    });

  run (f.ioc, f.e->pull ());

  transfer_report t (run (f.ioc, f.e->transfer ()));
  assert (t.transferred == 0 && t.failed == 1 && t.pending == 1);
  assert (t.failures.size () == 1);
  assert (f.store->find_artifact ("T1")->readiness () ==
          artifact_readiness::pending);

  // Pending artifacts are neither advertised nor claimable.
  //
  assert (f.e->ready ().empty ());
  expect (error_kind::not_found, [&] { f.e->claim ("T1"); });
  expect (error_kind::not_found, [&] { f.e->confirm ("T1"); });

  status_report s (f.e->report ());
  assert (s.pending.size () == 1 && s.awaiting.empty ());
  assert (to_string (s).find ("Pending transfers") != string::npos);

  fail = false;
  t = run (f.ioc, f.e->transfer ());
  assert (t.transferred == 1 && t.pending == 0);
  assert (f.store->find_artifact ("T1")->readiness () ==
          artifact_readiness::ready);

  // Once Ready it is not copied again.
  //
  t = run (f.ioc, f.e->transfer ());
  assert (t.transferred == 0);
}

static void
test_double_claim ()
{
  fixture f ("claim");
  f.download ("T1", "Show");

  run (f.ioc, f.e->pull ());
  run (f.ioc, f.e->transfer ());

  f.e->claim ("T1");
  expect (error_kind::conflict, [&] { f.e->claim ("T1"); });
  expect (error_kind::not_found, [&] { f.e->claim ("T9"); });
}

static void
test_sweep ()
{
  fixture f ("sweep");
  f.download ("T1", "Show");
  f.download ("T2", "Movie");

  run (f.ioc, f.e->pull ());
  run (f.ioc, f.e->transfer ());

  // Crash between mark_claimed and the removal (T1), and between the
  // removal and mark_deleted (T2).
  //
  f.store->mark_claimed ("T1");
  f.store->mark_claimed ("T2");

  fs::path p1 (f.store->find_artifact ("T1")->relay_path ());
  fs::path p2 (f.store->find_artifact ("T2")->relay_path ());
  fs::remove_all (p2);

  // And a removal that stopped half way.
  //
  fs::create_directories (f.e->config ().artifacts_dir / "T3.deleting");

  sweep_report r (f.e->sweep ());
  assert (r.reclaimed == 2 && r.failed == 0 && r.leftovers == 1);
  assert (!fs::exists (p1));
  assert (f.store->find_artifact ("T1")->readiness () ==
          artifact_readiness::deleted);
  assert (f.store->find_artifact ("T2")->readiness () ==
          artifact_readiness::deleted);

  r = f.e->sweep ();
  assert (r.reclaimed == 0 && r.leftovers == 0);
}

static void
test_interrupted_confirm ()
{
  fixture f ("confirm");
  f.download ("T1", "Show");

  run (f.ioc, f.e->pull ());
  run (f.ioc, f.e->transfer ());
  f.e->claim ("T1");

  // Claimed but not removed: the puller retries the confirm.
  //
  f.store->mark_claimed ("T1");

  confirm_result c (f.e->confirm ("T1"));
  assert (c.reclaimed);
  assert (f.store->find_artifact ("T1")->readiness () ==
          artifact_readiness::deleted);
}

static void
test_concurrent_transfer ()
{
  fixture f ("concurrent");
  f.download ("T1", "Show");

  // Slow enough for the second run to overlap.
  //
  f.executor->set_command_builder (
    [] (const copy_request& r, const fs::path& s)
    {
      return vector<string> {
        "sh", "-c", "sleep 0.3 && cp -R \"$0\" \"$1\"/", r.source, s.string ()};
    });

  run (f.ioc, f.e->pull ());

  transfer_report a, b;

  asio::co_spawn (f.ioc,
                  [&] () -> asio::awaitable<void>
                  {
                    a = co_await f.e->transfer ();
                  },
                  asio::detached);

  asio::co_spawn (f.ioc,
                  [&] () -> asio::awaitable<void>
                  {
                    b = co_await f.e->transfer ();
                  },
                  asio::detached);

  f.ioc.restart ();
  f.ioc.run ();

  assert (a.transferred == 1);
  assert (b.transferred == 0 && b.skipped == 1);
  assert (f.store->list_ready ().size () == 1);
  assert (f.store->list_pending ().empty ());
}

static void
test_ingest ()
{
  fixture f ("ingest");

  auto h (run (f.ioc, f.e->ingest ("magnet:?xt=urn:btih:ABC&dn=x")));
  assert (h && *h == "abc");
  assert (f.seedbox->added.size () == 1);
  assert (f.seedbox->added[0] == "magnet:?xt=urn:btih:ABC&dn=x anipler");
}

static void
test_relay_path ()
{
  fs::path d ("/relay/artifacts");

  assert (relay_path (d, "abc123") == d / "abc123");
  assert (relay_path (d, "../etc") == d / "_.._etc");
  assert (relay_path (d, ".hidden") == d / "_.hidden");
  assert (relay_path (d, "") == d / "_");
}

int
main ()
{
  test_happy_path ();
  test_horizon ();
  test_failure_then_success ();
  test_double_claim ();
  test_sweep ();
  test_interrupted_confirm ();
  test_concurrent_transfer ();
  test_ingest ();
  test_relay_path ();
}
