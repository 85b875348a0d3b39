#include <anipler/scheduler/scheduler.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

#include <iostream>
#include <stdexcept>

using namespace std;

namespace anipler
{
  scheduler::
  scheduler (asio::io_context& ioc)
    : ioc_ (ioc), gate_ (ioc, asio::steady_timer::time_point::max ())
  {
  }

  void scheduler::
  set_verbose (bool v)
  {
    verbose_ = v;
  }

  void scheduler::
  add_job (string n, job_body b, optional<chrono::seconds> i)
  {
    job_entry& j (jobs_[move (n)]);
    j.body = move (b);
    j.interval = i;
  }

  void scheduler::
  on_begin (begin_observer o)
  {
    begin_ = move (o);
  }

  void scheduler::
  on_finish (finish_observer o)
  {
    finish_ = move (o);
  }

  scheduler::job_entry& scheduler::
  find (const string& n)
  {
    auto i (jobs_.find (n));

    if (i == jobs_.end ())
      throw invalid_argument ("unknown job '" + n + "'");

    return i->second;
  }

  bool scheduler::
  running (const string& n) const
  {
    auto i (jobs_.find (n));
    return i != jobs_.end () && i->second.current != nullptr;
  }

  asio::awaitable<job_report> scheduler::
  trigger (const string& n)
  {
    job_entry& j (find (n));

    while (!open_ && n != startup_)
    {
      boost::system::error_code ec;
      co_await gate_.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));

      if (stopped_ && !open_)
        co_return job_report {n, false, "scheduler stopped"};
    }

    if (shared_ptr<in_flight> f = j.current)
    {
      if (verbose_)
        cout << n << " already running, waiting for it" << "\n";

      boost::system::error_code ec;
      co_await f->done.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));

      co_return f->report;
    }

    co_return co_await execute (n, j);
  }

  asio::awaitable<job_report> scheduler::
  execute (const string& n, job_entry& j)
  {
    shared_ptr<in_flight> f (make_shared<in_flight> (ioc_));
    j.current = f;

    if (begin_)
      begin_ (n);

    if (verbose_)
      cout << "running " << n << "\n";

    job_report r;
    r.job = n;

    // Failures stay within the run: the next one is the retry.
    //
    try
    {
      r.summary = co_await j.body ();
    }
    catch (const exception& e)
    {
      r.ok = false;
      r.summary = e.what ();
    }

    if (r.ok)
      cout << n << ": " << r.summary << "\n";
    else
      cerr << "error: " << n << " failed: " << r.summary << endl;

    f->report = r;
    j.current.reset ();
    f->done.cancel ();

    if (finish_)
      finish_ (r);

    co_return r;
  }

  asio::awaitable<void> scheduler::
  start (const string& s)
  {
    find (s);
    startup_ = s;

    co_await trigger (s);

    open_ = true;
    gate_.cancel ();

    if (stopped_)
      co_return;

    for (auto& [n, j]: jobs_)
    {
      if (!j.interval)
        continue;

      auto t (make_shared<asio::steady_timer> (ioc_));
      timers_.push_back (t);

      asio::co_spawn (ioc_, loop (n, *j.interval, t), asio::detached);
    }
  }

  asio::awaitable<void> scheduler::
  loop (string n, chrono::seconds i, shared_ptr<asio::steady_timer> t)
  {
    while (!stopped_)
    {
      t->expires_after (i);

      boost::system::error_code ec;
      co_await t->async_wait (asio::redirect_error (asio::use_awaitable, ec));

      if (stopped_)
        break;

      co_await trigger (n);
    }
  }

  void scheduler::
  stop ()
  {
    stopped_ = true;

    for (auto& t: timers_)
      t->cancel ();

    timers_.clear ();
    gate_.cancel ();
  }
}
