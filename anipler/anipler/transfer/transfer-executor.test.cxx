#include <anipler/transfer/transfer-executor.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

#include <chrono>
#include <cassert>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <filesystem>

using namespace std;
using namespace std::chrono_literals;
using namespace anipler;

namespace fs = std::filesystem;

// Stand in for rsync: copy the local source into the staging directory.
//
static vector<string>
cp_command (const copy_request& r, const fs::path& staging)
{
  return {"cp", "-R", r.source, staging.string () + '/'};
}

static transfer_outcome
run_copy (asio::io_context& ioc, transfer_executor& x, const copy_request& r)
{
  transfer_outcome o;

  asio::co_spawn (
    ioc,
    [&] () -> asio::awaitable<void>
    {
      o = co_await x.copy (r);
    },
    asio::detached);

  ioc.restart ();
  ioc.run ();
  return o;
}

static fs::path
scratch (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("anipler-transfer-" + n));
  fs::remove_all (d);
  fs::create_directories (d / "src" / "Show");
  ofstream (d / "src" / "Show" / "e01.mkv") << "episode";
  return d;
}

static void
test_copy ()
{
  fs::path d (scratch ("copy"));
  asio::io_context ioc;
  transfer_executor x (ioc);
  x.set_command_builder (&cp_command);

  copy_request r;
  r.source = (d / "src" / "Show").string ();
  r.destination = d / "relay" / "T1";

  transfer_outcome o (run_copy (ioc, x, r));
  assert (o.ok ());
  assert (fs::exists (d / "relay" / "T1" / "Show" / "e01.mkv"));
  assert (!fs::exists (transfer_executor::staging_path (r.destination)));

  // Second run finds the completed destination.
  //
  o = run_copy (ioc, x, r);
  assert (o.ok ());
  assert (o.reason == "already present");

  fs::remove_all (d);
}

static void
test_failure ()
{
  fs::path d (scratch ("failure"));
  asio::io_context ioc;
  transfer_executor x (ioc);
  x.set_command_builder ([] (const copy_request&, const fs::path&)
                         {
                           return vector<string> {"false"};
                         });

  copy_request r;
  r.source = (d / "src" / "Show").string ();
  r.destination = d / "relay" / "T1";

  transfer_outcome o (run_copy (ioc, x, r));
  assert (o.status == transfer_status::failure);
  assert (o.reason.find ("exited with code") != string::npos);
  assert (!fs::exists (r.destination));

  // Partial data stays around for the retry.
  //
  assert (fs::exists (transfer_executor::staging_path (r.destination)));

  // Retry with a working program completes the copy.
  //
  x.set_command_builder (&cp_command);
  o = run_copy (ioc, x, r);
  assert (o.ok ());
  assert (fs::exists (d / "relay" / "T1" / "Show" / "e01.mkv"));

  x.set_command_builder ([] (const copy_request&, const fs::path&)
                         {
                           return vector<string> {"anipler-no-such-program"};
                         });
  r.destination = d / "relay" / "T2";
  o = run_copy (ioc, x, r);
  assert (o.status == transfer_status::failure);

  fs::remove_all (d);
}

static void
test_timeout ()
{
  fs::path d (scratch ("timeout"));
  asio::io_context ioc;
  transfer_executor x (ioc);
  x.set_command_builder ([] (const copy_request&, const fs::path&)
                         {
                           return vector<string> {"sleep", "30"};
                         });

  copy_request r;
  r.source = (d / "src" / "Show").string ();
  r.destination = d / "relay" / "T1";
  r.options.timeout = chrono::seconds (1);

  transfer_outcome o (run_copy (ioc, x, r));
  assert (o.status == transfer_status::cancelled);
  assert (!fs::exists (r.destination));

  fs::remove_all (d);
}

static void
test_busy ()
{
  fs::path d (scratch ("busy"));
  asio::io_context ioc;
  transfer_executor x (ioc);
  x.set_command_builder ([] (const copy_request& r, const fs::path& s)
                         {
                           return vector<string> {
                             "sh", "-c", "sleep 1 && cp -R \"$0\" \"$1\"/",
                             r.source, s.string ()};
                         });

  copy_request r;
  r.source = (d / "src" / "Show").string ();
  r.destination = d / "relay" / "T1";

  transfer_outcome a, b, c;

  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void> { a = co_await x.copy (r); },
                  asio::detached);

  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void> { b = co_await x.copy (r); },
                  asio::detached);

  // A different destination is not affected.
  //
  copy_request r2 (r);
  r2.destination = d / "relay" / "T2";

  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void> { c = co_await x.copy (r2); },
                  asio::detached);

  ioc.run ();

  assert (a.ok ());
  assert (b.status == transfer_status::busy);
  assert (c.ok ());
  assert (fs::exists (d / "relay" / "T1" / "Show" / "e01.mkv"));
  assert (fs::exists (d / "relay" / "T2" / "Show" / "e01.mkv"));

  fs::remove_all (d);
}

static void
test_dry_run ()
{
  fs::path d (scratch ("dry"));
  asio::io_context ioc;
  transfer_executor x (ioc);
  x.set_dry_run (true);

  copy_request r;
  r.endpoint = "seedbox";
  r.source = "/downloads/Show";
  r.destination = d / "relay" / "T1";

  transfer_outcome o (run_copy (ioc, x, r));
  assert (o.status == transfer_status::cancelled);
  assert (!fs::exists (transfer_executor::staging_path (r.destination)));

  fs::remove_all (d);
}

static void
test_rsync_command ()
{
  copy_request r;
  r.endpoint = "user@seedbox";
  r.source = "/downloads/My Show";
  r.destination = "/relay/artifacts/T1";
  r.options.rate_limit = 500;
  r.options.ssh_key = "/keys/id";

  vector<string> a (transfer_executor::rsync_command (
                      r, transfer_executor::staging_path (r.destination)));

  assert (a.front () == "rsync");
  assert (find (a.begin (), a.end (), "--partial") != a.end ());
  assert (find (a.begin (), a.end (), "--bwlimit=500") != a.end ());
  assert (a[a.size () - 2] == "user@seedbox:/downloads/My Show");
  assert (a.back () == "/relay/artifacts/.T1.partial/");

  auto rsh (find (a.begin (), a.end (), "--rsh"));
  assert (rsh != a.end ());
  assert ((rsh + 1)->find ("ConnectTimeout=30") != string::npos);
  assert ((rsh + 1)->find ("-i /keys/id") != string::npos);

  r.options.rate_limit = 0;
  a = transfer_executor::rsync_command (r, "/s");
  assert (none_of (a.begin (), a.end (),
                   [] (const string& s) { return s.find ("--bwlimit") == 0; }));
}

static void
test_remove ()
{
  fs::path d (scratch ("remove"));
  asio::io_context ioc;
  transfer_executor x (ioc);

  fs::path p (d / "src" / "Show");
  assert (x.remove (p).ok ());
  assert (!fs::exists (p));

  x.wait_removals ();
  assert (!fs::exists (p.string () + ".deleting"));

  // Gone already.
  //
  transfer_outcome o (x.remove (p));
  assert (o.ok () && o.reason == "already absent");

  // Leftovers of an interrupted removal.
  //
  fs::create_directories (d / "relay" / "T1.deleting" / "x");
  fs::create_directories (d / "relay" / "T2");
  assert (x.purge_leftovers (d / "relay") == 1);
  assert (!fs::exists (d / "relay" / "T1.deleting"));
  assert (fs::exists (d / "relay" / "T2"));
  assert (x.purge_leftovers (d / "missing") == 0);

  fs::remove_all (d);
}

static vector<string>
sleep_command (const copy_request&, const fs::path&)
{
  return {"sleep", "5"};
}

static void
test_cancel ()
{
  fs::path d (scratch ("cancel"));
  asio::io_context ioc;
  transfer_executor x (ioc);
  x.set_command_builder (&sleep_command);

  copy_request r;
  r.source = (d / "src" / "Show").string ();
  r.destination = d / "relay" / "T1";

  transfer_outcome o;

  asio::co_spawn (ioc,
                  [&] () -> asio::awaitable<void> { o = co_await x.copy (r); },
                  asio::detached);

  ioc.run_for (300ms);

  auto start (chrono::steady_clock::now ());
  x.cancel ();
  ioc.run ();

  assert (chrono::steady_clock::now () - start < 2s);
  assert (o.status == transfer_status::cancelled);
  assert (o.reason == "interrupted");
  assert (!fs::exists (r.destination));
  assert (fs::exists (transfer_executor::staging_path (r.destination)));

  // No new copies once cancelled.
  //
  x.set_command_builder (&cp_command);
  o = run_copy (ioc, x, r);
  assert (o.status == transfer_status::cancelled);
  assert (o.reason == "shutting down");
  assert (!fs::exists (r.destination));

  fs::remove_all (d);
}

// The daemon owns the executor but not the io_context: a copy still
// suspended when the daemon goes away is destroyed with the context,
// after the executor.
//
static void
test_teardown ()
{
  fs::path d (scratch ("teardown"));

  {
    asio::io_context ioc;

    {
      auto x (make_shared<transfer_executor> (ioc));
      x->set_command_builder (&sleep_command);

      copy_request r;
      r.source = (d / "src" / "Show").string ();
      r.destination = d / "relay" / "T1";

      transfer_executor& xr (*x);

      asio::co_spawn (
        ioc,
        [&xr, r] () -> asio::awaitable<void>
        {
          co_await xr.copy (r);
        },
        asio::detached);

      ioc.run_for (300ms);
      ioc.stop ();
    }
  }

  assert (!fs::exists (d / "relay" / "T1"));

  fs::remove_all (d);
}

int
main ()
{
  test_copy ();
  test_failure ();
  test_timeout ();
  test_busy ();
  test_dry_run ();
  test_rsync_command ();
  test_remove ();
  test_cancel ();
  test_teardown ();
}
