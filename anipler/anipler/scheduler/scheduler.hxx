#pragma once

#include <map>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <functional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace anipler
{
  namespace asio = boost::asio;

  // Outcome of one job run.
  //
  struct job_report
  {
    std::string job;
    bool ok = true;
    std::string summary;
  };

  // Named jobs run on their own interval and on demand.
  //
  // A job never runs twice at the same time: a trigger that arrives while the
  // job is running waits for that run and gets its report. Different jobs run
  // concurrently. Until start() has run the startup job, every other trigger
  // waits.
  //
  class scheduler
  {
  public:
    // Job body. Return the summary; throw to fail the run.
    //
    using job_body = std::function<asio::awaitable<std::string> ()>;

    using begin_observer = std::function<void (const std::string& job)>;
    using finish_observer = std::function<void (const job_report&)>;

    explicit
    scheduler (asio::io_context& ioc);

    scheduler (const scheduler&) = delete;
    scheduler& operator= (const scheduler&) = delete;

    void
    set_verbose (bool v);

    // Register a job. Without an interval it only runs when triggered.
    //
    void
    add_job (std::string name,
             job_body body,
             std::optional<std::chrono::seconds> interval = std::nullopt);

    void
    on_begin (begin_observer o);

    void
    on_finish (finish_observer o);

    // Run the job, or join its run in progress. Throw std::invalid_argument
    // if there is no such job.
    //
    asio::awaitable<job_report>
    trigger (const std::string& name);

    // Run the startup job, admit triggers, then start the interval timers.
    //
    asio::awaitable<void>
    start (const std::string& startup_job);

    // Stop the interval timers. Runs in progress complete.
    //
    void
    stop ();

    bool
    running (const std::string& name) const;

    bool
    started () const noexcept
    {
      return open_;
    }

  private:
    // Run in progress. Waiters park on the timer which is cancelled once the
    // report is in.
    //
    struct in_flight
    {
      explicit
      in_flight (asio::io_context& ioc)
        : done (ioc, asio::steady_timer::time_point::max ()) {}

      asio::steady_timer done;
      job_report report;
    };

    struct job_entry
    {
      job_body body;
      std::optional<std::chrono::seconds> interval;
      std::shared_ptr<in_flight> current;
    };

    job_entry&
    find (const std::string& name);

    asio::awaitable<job_report>
    execute (const std::string& name, job_entry& j);

    asio::awaitable<void>
    loop (std::string name,
          std::chrono::seconds interval,
          std::shared_ptr<asio::steady_timer> t);

    asio::io_context& ioc_;
    std::map<std::string, job_entry> jobs_;
    std::vector<std::shared_ptr<asio::steady_timer>> timers_;
    asio::steady_timer gate_;
    std::string startup_;
    bool open_ = false;
    bool stopped_ = false;
    bool verbose_ = false;
    begin_observer begin_;
    finish_observer finish_;
  };
}
