#include <anipler/transfer/transfer-executor.hxx>

#include <boost/process.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <system_error>

using namespace std;
using namespace std::chrono_literals;

namespace anipler
{
  namespace bp = boost::process;

  // Render the argument vector the way a shell would accept it back.
  //
  static string
  command_line (const vector<string>& args)
  {
    string r;

    for (const string& a: args)
    {
      if (!r.empty ())
        r += ' ';

      if (a.find_first_of (" \t\"'\\$") == string::npos && !a.empty ())
        r += a;
      else
      {
        r += '\'';
        for (char c: a)
        {
          if (c == '\'')
            r += "'\\''";
          else
            r += c;
        }
        r += '\'';
      }
    }

    return r;
  }

  // Last non-empty line of the copy program's diagnostics.
  //
  static string
  last_line (const fs::path& f)
  {
    ifstream is (f);
    string l, r;

    while (getline (is, l))
    {
      if (!l.empty ())
        r = l;
    }

    return r;
  }

  transfer_executor::
  transfer_executor (asio::io_context& ioc)
    : ioc_ (ioc),
      builder_ (&transfer_executor::rsync_command),
      busy_ (make_shared<set<string>> ())
  {
  }

  void transfer_executor::
  cancel ()
  {
    cancelled_ = true;
  }

  void transfer_executor::
  wait_removals ()
  {
    unique_lock<mutex> l (removals_mutex_);
    removals_done_.wait (l, [this] {return removals_.empty ();});
  }

  void transfer_executor::
  set_verbose (bool v)
  {
    verbose_ = v;
  }

  void transfer_executor::
  set_dry_run (bool v)
  {
    dry_run_ = v;
  }

  void transfer_executor::
  set_command_builder (command_builder b)
  {
    builder_ = move (b);
  }

  fs::path transfer_executor::
  staging_path (const fs::path& d)
  {
    return d.parent_path () / ('.' + d.filename ().string () + ".partial");
  }

  vector<string> transfer_executor::
  rsync_command (const copy_request& r, const fs::path& staging)
  {
    const copy_options& o (r.options);

    string ssh ("ssh -o BatchMode=yes -o StrictHostKeyChecking=accept-new");
    ssh += " -o ConnectTimeout=" + to_string (o.connect_timeout.count ());

    if (!o.ssh_key.empty ())
      ssh += " -i " + command_line ({o.ssh_key});

    vector<string> a {
      "rsync",
      "--recursive",
      "--partial",
      "--times",
      "--protect-args"};

    if (o.rate_limit != 0)
      a.push_back ("--bwlimit=" + to_string (o.rate_limit));

    a.push_back ("--rsh");
    a.push_back (ssh);

    a.push_back (r.endpoint.empty () ? r.source : r.endpoint + ':' + r.source);
    a.push_back (staging.string () + '/');

    return a;
  }

  asio::awaitable<transfer_outcome> transfer_executor::
  copy (const copy_request& r)
  {
    const fs::path& d (r.destination);
    string k (d.lexically_normal ().string ());

    if (cancelled_)
      co_return transfer_outcome::cancelled ("shutting down");

    if (busy_->count (k) != 0)
      co_return transfer_outcome::busy (d.string () + " is in use");

    busy_guard g (busy_, k);

    // The rename below is the last step of a successful copy so an existing
    // destination is a complete one.
    //
    error_code ec;
    if (fs::exists (d, ec))
    {
      if (verbose_)
        cout << d.string () << " already present" << "\n";

      co_return transfer_outcome::success ("already present");
    }

    fs::path s (staging_path (d));
    vector<string> args (builder_ (r, s));

    if (args.empty ())
      co_return transfer_outcome::failure ("empty copy command");

    if (dry_run_)
    {
      cout << "dry run: " << command_line (args) << "\n";
      co_return transfer_outcome::cancelled ("dry run");
    }

    fs::create_directories (s, ec);
    if (ec)
      co_return transfer_outcome::failure (
        "unable to create " + s.string () + ": " + ec.message ());

    if (verbose_)
      cout << "copying " << (r.endpoint.empty () ? "" : r.endpoint + ':')
           << r.source << " to " << d.string () << "\n";

    string exe (args.front ());
    if (exe.find ('/') == string::npos)
    {
      auto p (bp::search_path (exe));

      if (p.empty ())
        co_return transfer_outcome::failure ("program " + exe + " not found");

      exe = p.string ();
    }

    vector<string> rest (args.begin () + 1, args.end ());
    fs::path log (d.parent_path () / ('.' + d.filename ().string () + ".log"));

    bp::child c (exe,
                 bp::args (rest),
                 bp::std_in < bp::null,
                 bp::std_out > bp::null,
                 bp::std_err > log.string (),
                 ec);

    if (ec)
      co_return transfer_outcome::failure (
        "unable to start " + exe + ": " + ec.message ());

    asio::steady_timer t (ioc_);

    auto timeout (r.options.timeout);
    auto deadline (chrono::steady_clock::now () + timeout);

    while (c.running (ec))
    {
      // Partial data stays in staging for the next run.
      //
      if (cancelled_)
      {
        c.terminate (ec);
        fs::remove (log, ec);

        co_return transfer_outcome::cancelled ("interrupted");
      }

      if (timeout.count () != 0 && chrono::steady_clock::now () >= deadline)
      {
        c.terminate (ec);
        fs::remove (log, ec);

        co_return transfer_outcome::cancelled (
          "timed out after " + to_string (timeout.count ()) + "s");
      }

      t.expires_after (100ms);
      co_await t.async_wait (asio::use_awaitable);
    }

    if (ec)
      co_return transfer_outcome::failure (
        "unable to wait for " + exe + ": " + ec.message ());

    int code (c.exit_code ());
    string diag (last_line (log));
    fs::remove (log, ec);

    if (code != 0)
    {
      string m (fs::path (exe).filename ().string () +
                " exited with code " + to_string (code));

      if (!diag.empty ())
        m += ": " + diag;

      co_return transfer_outcome::failure (move (m));
    }

    fs::rename (s, d, ec);
    if (ec)
      co_return transfer_outcome::failure (
        "unable to move " + s.string () + " into place: " + ec.message ());

    co_return transfer_outcome::success ();
  }

  transfer_outcome transfer_executor::
  remove (const fs::path& p)
  {
    string k (p.lexically_normal ().string ());

    if (busy_->count (k) != 0)
      return transfer_outcome::busy (p.string () + " is in use");

    error_code ec;
    if (!fs::exists (fs::symlink_status (p, ec)))
    {
      if (ec && ec != errc::no_such_file_or_directory)
        return transfer_outcome::failure (
          "unable to stat " + p.string () + ": " + ec.message ());

      return transfer_outcome::success ("already absent");
    }

    fs::path a (p.string () + ".deleting");
    string ak (a.lexically_normal ().string ());

    {
      lock_guard<mutex> l (removals_mutex_);

      if (removals_.count (ak) != 0)
        return transfer_outcome::busy (
          "earlier removal of " + p.string () + " still in progress");
    }

    // An earlier removal of the same path may have stopped half way.
    //
    fs::remove_all (a, ec);
    if (ec)
      return transfer_outcome::failure (
        "unable to remove " + a.string () + ": " + ec.message ());

    fs::rename (p, a, ec);
    if (ec)
      return transfer_outcome::failure (
        "unable to rename " + p.string () + ": " + ec.message ());

    // From here on the path is gone as far as anyone is concerned. The
    // tree may be large so delete it off the io_context thread; whatever
    // remove_all() leaves behind is picked up by purge_leftovers().
    //
    {
      lock_guard<mutex> l (removals_mutex_);
      removals_.insert (ak);
    }

    asio::post (remover_,
                [this, a, ak, v = verbose_] ()
                {
                  error_code ec;
                  fs::remove_all (a, ec);

                  if (ec)
                    cerr << "warning: unable to remove " << a.string ()
                         << ": " << ec.message () << endl;
                  else if (v)
                    cout << "removed " << a.string () << "\n";

                  {
                    lock_guard<mutex> l (removals_mutex_);
                    removals_.erase (ak);
                  }

                  removals_done_.notify_all ();
                });

    return transfer_outcome::success ();
  }

  size_t transfer_executor::
  purge_leftovers (const fs::path& dir)
  {
    size_t n (0);
    error_code ec;

    if (!fs::is_directory (dir, ec))
      return 0;

    vector<fs::path> ls;
    for (const auto& e: fs::directory_iterator (dir, ec))
    {
      const string f (e.path ().filename ().string ());
      const string x (".deleting");

      if (f.size () > x.size () &&
          f.compare (f.size () - x.size (), x.size (), x) == 0)
        ls.push_back (e.path ());
    }

    // Skip the ones the removal thread is working on.
    //
    {
      lock_guard<mutex> l (removals_mutex_);
      ls.erase (remove_if (ls.begin (),
                           ls.end (),
                           [this] (const fs::path& p)
                           {
                             return removals_.count (
                               p.lexically_normal ().string ()) != 0;
                           }),
                ls.end ());
    }

    if (ec)
    {
      cerr << "warning: unable to scan " << dir.string () << ": "
           << ec.message () << endl;
      return 0;
    }

    for (const fs::path& p: ls)
    {
      fs::remove_all (p, ec);

      if (ec)
        cerr << "warning: unable to remove " << p.string () << ": "
             << ec.message () << endl;
      else
        ++n;
    }

    return n;
  }
}
