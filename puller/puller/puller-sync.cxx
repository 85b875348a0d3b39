#include <puller/puller-sync.hxx>

#include <sstream>
#include <iostream>
#include <system_error>

#include <anipler/lifecycle/lifecycle-engine.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>

using namespace std;
using namespace anipler;

namespace puller
{
  string
  to_string (const sync_report& r)
  {
    ostringstream os;
    os << "pulled " << r.pulled << ", skipped " << r.skipped
       << ", failed " << r.failed;

    for (const string& f: r.failures)
      os << "\n  " << f;

    return os.str ();
  }

  fs::path
  staging_dir (const fs::path& d, const string& id)
  {
    return relay_path (d / ".anipler", id);
  }

  // Move everything the copy produced into the destination. Nothing that is
  // already there is replaced.
  //
  static void
  install (const fs::path& from, const fs::path& to)
  {
    for (const fs::directory_entry& e: fs::directory_iterator (from))
    {
      fs::path t (to / e.path ().filename ());

      if (fs::exists (fs::symlink_status (t)))
        throw lifecycle_error (error_kind::conflict,
                               t.string () + " already exists");
    }

    for (const fs::directory_entry& e: fs::directory_iterator (from))
      fs::rename (e.path (), to / e.path ().filename ());

    fs::remove (from);
  }

  // Pull one artifact. Return false if it was skipped.
  //
  static asio::awaitable<bool>
  sync_one (relay_client& c,
            transfer_executor& x,
            const sync_config& cfg,
            const ready_entry& e)
  {
    optional<claim_grant> g (co_await c.claim (e.task_id));

    if (!g)
    {
      cout << e.name << " is claimed by another puller, skipping" << endl;
      co_return false;
    }

    fs::path s (staging_dir (cfg.destination, e.task_id));
    fs::create_directories (s.parent_path ());

    copy_request r;
    r.endpoint = cfg.ssh_host.empty () ? g->relay_endpoint : cfg.ssh_host;
    r.source = g->relay_path + '/';
    r.destination = s;
    r.options = cfg.copy;

    cout << "pulling " << e.name << " (" << e.size << " bytes)" << endl;

    transfer_outcome o (co_await x.copy (r));

    if (!o.ok ())
      throw lifecycle_error (error_kind::transient,
                             "copy of " + e.name + " " +
                             (o.reason.empty ()
                              ? string ("failed")
                              : "failed: " + o.reason));

    install (s, cfg.destination);

    optional<confirm_result> cr (co_await c.confirm (e.task_id));

    if (!cr)
      cout << e.name << " was already archived" << endl;
    else if (!cr->reclaimed)
      cout << "warning: relay kept the storage of " << e.name
           << " for its sweep job" << endl;

    cout << "pulled " << e.name << endl;
    co_return true;
  }

  asio::awaitable<sync_report>
  sync_artifacts (relay_client& c, transfer_executor& x, const sync_config& cfg)
  {
    sync_report r;

    vector<ready_entry> es (co_await c.ready ());

    if (es.empty ())
      cout << "no artifacts ready" << endl;

    for (const ready_entry& e: es)
    {
      try
      {
        if (co_await sync_one (c, x, cfg, e))
          ++r.pulled;
        else
          ++r.skipped;
      }
      catch (const lifecycle_error& ex)
      {
        // A bad key fails every artifact the same way.
        //
        if (ex.kind () == error_kind::unauthorized)
          throw;

        cerr << "error: " << ex.what () << endl;
        ++r.failed;
        r.failures.push_back (e.name + ": " + ex.what ());
      }
      catch (const fs::filesystem_error& ex)
      {
        cerr << "error: " << ex.what () << endl;
        ++r.failed;
        r.failures.push_back (e.name + ": " + ex.what ());
      }
    }

    co_return r;
  }
}
