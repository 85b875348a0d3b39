#include <anipler/scheduler/scheduler.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace anipler;

using namespace std::chrono_literals;

// Job body that takes a while and counts its runs.
//
static scheduler::job_body
slow_job (asio::io_context& ioc,
          int& runs,
          vector<string>& log,
          const string& name)
{
  return [&ioc, &runs, &log, name] () -> asio::awaitable<string>
  {
    log.push_back (name + " begin");
    ++runs;

    asio::steady_timer t (ioc, 50ms);
    co_await t.async_wait (asio::use_awaitable);

    log.push_back (name + " end");
    co_return "run " + to_string (runs);
  };
}

static void
spawn (asio::io_context& ioc, scheduler& s, const string& n, job_report& r)
{
  asio::co_spawn (ioc,
                  [&s, n, &r] () -> asio::awaitable<void>
                  {
                    r = co_await s.trigger (n);
                  },
                  asio::detached);
}

static void
start (asio::io_context& ioc, scheduler& s, const string& n)
{
  asio::co_spawn (ioc, s.start (n), asio::detached);
}

static void
test_coalesce ()
{
  asio::io_context ioc;
  scheduler s (ioc);

  int runs (0);
  vector<string> log;
  s.add_job ("sweep", slow_job (ioc, runs, log, "sweep"));
  s.add_job ("transfer", slow_job (ioc, runs, log, "transfer"));

  start (ioc, s, "sweep");
  ioc.run ();
  assert (runs == 1);

  // Two triggers while the first is in flight: one run, same report.
  //
  runs = 0;
  job_report a, b;
  spawn (ioc, s, "transfer", a);
  spawn (ioc, s, "transfer", b);

  ioc.restart ();
  ioc.run ();

  assert (runs == 1);
  assert (a.ok && b.ok);
  assert (a.summary == b.summary);
  assert (a.job == "transfer");

  // After completion a trigger starts a fresh run.
  //
  spawn (ioc, s, "transfer", a);
  ioc.restart ();
  ioc.run ();
  assert (runs == 2);
  assert (!s.running ("transfer"));
}

static void
test_parallel ()
{
  asio::io_context ioc;
  scheduler s (ioc);

  int runs (0);
  vector<string> log;
  s.add_job ("sweep", slow_job (ioc, runs, log, "sweep"));
  s.add_job ("pull", slow_job (ioc, runs, log, "pull"));
  s.add_job ("transfer", slow_job (ioc, runs, log, "transfer"));

  start (ioc, s, "sweep");
  ioc.run ();
  log.clear ();

  job_report a, b;
  spawn (ioc, s, "pull", a);
  spawn (ioc, s, "transfer", b);

  ioc.restart ();
  ioc.run ();

  // Both started before either finished.
  //
  assert (log.size () == 4);
  assert (log[0] == "pull begin" && log[1] == "transfer begin");
  assert (a.ok && b.ok);
}

static void
test_startup_gate ()
{
  asio::io_context ioc;
  scheduler s (ioc);

  int runs (0);
  vector<string> log;
  s.add_job ("sweep", slow_job (ioc, runs, log, "sweep"));
  s.add_job ("pull", slow_job (ioc, runs, log, "pull"));

  // Trigger arrives before the scheduler is started.
  //
  job_report r;
  spawn (ioc, s, "pull", r);
  start (ioc, s, "sweep");

  ioc.run ();

  assert (s.started ());
  assert (log.size () == 4);
  assert (log[0] == "sweep begin" && log[1] == "sweep end");
  assert (log[2] == "pull begin");
  assert (r.ok);
}

static void
test_failure ()
{
  asio::io_context ioc;
  scheduler s (ioc);

  bool fail (true);
  s.add_job ("sweep",
             [] () -> asio::awaitable<string> { co_return "clean"; });
  s.add_job ("pull",
             [&fail] () -> asio::awaitable<string>
             {
               if (fail)
                 throw runtime_error ("seedbox unreachable");

               co_return "merged 1";
             });

  vector<string> begun;
  vector<job_report> finished;
  s.on_begin ([&begun] (const string& n) { begun.push_back (n); });
  s.on_finish ([&finished] (const job_report& r) { finished.push_back (r); });

  start (ioc, s, "sweep");

  job_report r;
  spawn (ioc, s, "pull", r);
  ioc.run ();

  assert (!r.ok);
  assert (r.summary == "seedbox unreachable");

  fail = false;
  spawn (ioc, s, "pull", r);
  ioc.restart ();
  ioc.run ();
  assert (r.ok && r.summary == "merged 1");

  assert (begun.size () == 3 && begun[0] == "sweep");
  assert (finished.size () == 3);
  assert (!finished[1].ok && finished[2].ok);

  // Unknown job.
  //
  bool thrown (false);
  asio::co_spawn (ioc,
                  s.trigger ("nope"),
                  [&thrown] (exception_ptr e, job_report)
                  {
                    try
                    {
                      if (e)
                        rethrow_exception (e);
                    }
                    catch (const invalid_argument&)
                    {
                      thrown = true;
                    }
                  });
  ioc.restart ();
  ioc.run ();
  assert (thrown);
}

static void
test_interval ()
{
  asio::io_context ioc;
  scheduler s (ioc);

  int sweeps (0), pulls (0);
  s.add_job ("sweep",
             [&sweeps] () -> asio::awaitable<string>
             {
               ++sweeps;
               co_return "";
             },
             1s);
  s.add_job ("pull",
             [&pulls] () -> asio::awaitable<string>
             {
               ++pulls;
               co_return "";
             },
             1s);
  s.add_job ("report",
             [] () -> asio::awaitable<string> { co_return ""; });

  start (ioc, s, "sweep");

  asio::steady_timer t (ioc, 2500ms);
  t.async_wait ([&s] (const boost::system::error_code&) { s.stop (); });

  // Returns once stop() cancelled the interval timers.
  //
  ioc.run ();

  assert (sweeps == 3);
  assert (pulls == 2);
}

int
main ()
{
  test_coalesce ();
  test_parallel ();
  test_startup_gate ();
  test_failure ();
  test_interval ();
}
