#include <map>
#include <chrono>
#include <memory>
#include <string>
#include <iostream>
#include <exception>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/signal_set.hpp>

#include <anipler/anipler-config.hxx>
#include <anipler/anipler-options.hxx>
#include <anipler/chat/chat-surface.hxx>
#include <anipler/chat/chat-transport.hxx>
#include <anipler/control/control-router.hxx>
#include <anipler/control/control-server.hxx>
#include <anipler/lifecycle/lifecycle-engine.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>
#include <anipler/lifecycle/lifecycle-store.hxx>
#include <anipler/scheduler/scheduler.hxx>
#include <anipler/seedbox/seedbox-client.hxx>
#include <anipler/transfer/transfer-executor.hxx>

#include <anipler/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace anipler
{
  // The relay daemon.
  //
  // Every capability (store, seedbox, executor, chat transport) is built
  // once here and handed to the components that use it.
  //
  class relay_daemon
  {
  public:
    relay_daemon (asio::io_context& ioc, daemon_config c)
      : ioc_ (ioc), config_ (move (c)), scheduler_ (ioc)
    {
    }

    // Open the store, wire the jobs and start serving. Throw if the daemon
    // cannot start.
    //
    void
    start ();

    // Stop the timers, the acceptor and the poll loop, and cancel the
    // copies in progress.
    //
    void
    stop ();

    static constexpr chrono::seconds drain_timeout {10};

  private:
    void
    open_store ();

    void
    wire_jobs ();

    void
    wire_chat ();

    // Job audit. Failures here never affect the job itself.
    //
    void
    audit_begin (const string& job);

    void
    audit_finish (const job_report&);

    asio::io_context& ioc_;
    daemon_config config_;

    shared_ptr<lifecycle_store> store_;
    shared_ptr<transfer_executor> executor_;
    shared_ptr<lifecycle_engine> engine_;
    scheduler scheduler_;
    unique_ptr<control_server> server_;
    unique_ptr<command_surface> surface_;

    map<string, unsigned long long> runs_;
  };

  void relay_daemon::
  open_store ()
  {
    if (config_.stateless)
    {
      cout << "warning: stateless mode, lifecycle state is not persisted"
           << endl;
    }
    else
      fs::create_directories (config_.storage);

    store_ = make_shared<lifecycle_store> (
      config_.stateless ? fs::path () : config_.storage);

    // A damaged store could hand out or delete the wrong artifact.
    //
    if (!store_->check ())
      throw lifecycle_error (error_kind::fatal,
                             "lifecycle store in " + config_.storage.string () +
                             " failed the integrity check");

    fs::create_directories (config_.engine.artifacts_dir);
  }

  void relay_daemon::
  start ()
  {
    bool v (config_.verbose);

    open_store ();

    executor_ = make_shared<transfer_executor> (ioc_);
    executor_->set_verbose (v);
    executor_->set_dry_run (config_.dry_run);

    auto q (make_shared<seedbox_client> (ioc_,
                                         config_.qbit_url,
                                         config_.qbit_username,
                                         config_.qbit_password));
    q->set_verbose (v);

    engine_ = make_shared<lifecycle_engine> (store_, executor_, q, config_.engine);
    engine_->set_verbose (v);

    wire_jobs ();

    auto r (make_shared<control_router> (engine_, config_.api_key));
    r->set_verbose (v);

    server_ = make_unique<control_server> (ioc_, r);
    server_->set_verbose (v);
    server_->start (config_.listen_host, config_.listen_port);

    if (config_.bot_enabled ())
      wire_chat ();

    // Sweep first so a confirm interrupted by the last shutdown is finished
    // before anything else looks at the artifacts.
    //
    asio::co_spawn (ioc_,
                    scheduler_.start ("sweep"),
                    [] (exception_ptr e)
                    {
                      if (!e)
                        return;

                      try { rethrow_exception (e); }
                      catch (const exception& x)
                      {
                        cerr << "error: scheduler: " << x.what () << endl;
                      }
                    });

    if (surface_ != nullptr)
      asio::co_spawn (ioc_, surface_->run (), asio::detached);
  }

  void relay_daemon::
  wire_jobs ()
  {
    scheduler_.set_verbose (config_.verbose);

    shared_ptr<lifecycle_engine> e (engine_);

    scheduler_.add_job (
      "pull",
      [e] () -> asio::awaitable<string>
      {
        co_return to_string (co_await e->pull ());
      },
      config_.pull_interval);

    scheduler_.add_job (
      "transfer",
      [e] () -> asio::awaitable<string>
      {
        co_return to_string (co_await e->transfer ());
      },
      config_.transfer_interval);

    scheduler_.add_job (
      "sweep",
      [e] () -> asio::awaitable<string>
      {
        co_return to_string (e->sweep ());
      },
      config_.sweep_interval);

    scheduler_.add_job (
      "report",
      [e] () -> asio::awaitable<string>
      {
        co_return to_string (e->report ());
      });

    scheduler_.on_begin ([this] (const string& j) {audit_begin (j);});
    scheduler_.on_finish ([this] (const job_report& r) {audit_finish (r);});
  }

  void relay_daemon::
  wire_chat ()
  {
    auto t (make_shared<telegram_transport> (ioc_, *config_.bot_token));
    t->set_verbose (config_.verbose);

    command_surface_config c;
    c.chat_id = config_.chat_id;

    surface_ = make_unique<command_surface> (ioc_, t, c);
    surface_->set_verbose (config_.verbose);

    surface_->add_trigger (scheduler_, "pull",
                           "Pull torrent information from the seedbox.");
    surface_->add_trigger (scheduler_, "transfer",
                           "Transfer finished torrents to the relay.");
    surface_->add_trigger (scheduler_, "report",
                           "Report torrents and artifacts in flight.");

    shared_ptr<lifecycle_engine> e (engine_);

    surface_->add_command (
      "add",
      "Add a magnet link or torrent URL to the seedbox.",
      [e] (const string& s) -> asio::awaitable<string>
      {
        if (s.empty ())
          co_return "usage: /add <magnet link or torrent URL>";

        optional<string> h (co_await e->ingest (s));
        co_return h ? "Added torrent " + *h : string ("Added torrent");
      });
  }

  void relay_daemon::
  stop ()
  {
    scheduler_.stop ();

    if (server_ != nullptr)
      server_->stop ();

    if (surface_ != nullptr)
      surface_->stop ();

    if (executor_ != nullptr)
      executor_->cancel ();
  }

  void relay_daemon::
  audit_begin (const string& j)
  {
    try
    {
      runs_[j] = store_->begin_job_run (j);
    }
    catch (const exception& e)
    {
      cerr << "warning: unable to record " << j << " run: " << e.what ()
           << endl;
    }
  }

  void relay_daemon::
  audit_finish (const job_report& r)
  {
    auto i (runs_.find (r.job));

    if (i == runs_.end ())
      return;

    unsigned long long id (i->second);
    runs_.erase (i);

    try
    {
      store_->finish_job_run (id, (r.ok ? "ok: " : "failed: ") + r.summary);
    }
    catch (const exception& e)
    {
      cerr << "warning: unable to record " << r.job << " outcome: "
           << e.what () << endl;
    }
  }
}

int
main (int argc, char* argv[])
{
  using namespace anipler;

  try
  {
    options opt (argc, argv);

    if (opt.version ())
    {
      cout << "anipler-daemon " << ANIPLER_VERSION_ID << "\n";
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: anipler-daemon [options]" << "\n"
        << "options:"                        << "\n";

      opt.print_usage (o);

      o << "\n"
        << "Settings come from the ANIPLER_* environment variables; the\n"
        << "options override them.\n";

      return 0;
    }

    daemon_config c (load_daemon_config (opt));

    asio::io_context ioc;
    relay_daemon d (ioc, move (c));

    d.start ();

    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    bool stopping (false);

    signals.async_wait (
      [&d, &ioc, &stopping] (const boost::system::error_code& ec, int s)
      {
        if (ec)
          return;

        cout << "received signal " << s << ", shutting down" << endl;

        d.stop ();
        stopping = true;
        ioc.stop ();
      });

    ioc.run ();

    // Let the stopped components wind down while the daemon they refer to
    // is still alive: copies report cancelled within a poll interval and
    // their jobs record the outcome. Long-polls and idle keep-alive
    // connections are not waited for.
    //
    if (stopping)
    {
      ioc.restart ();
      ioc.run_for (relay_daemon::drain_timeout);
    }

    return 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
