#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <boost/asio/awaitable.hpp>

#include <anipler/lifecycle/lifecycle-types.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>
#include <anipler/lifecycle/lifecycle-store.hxx>
#include <anipler/transfer/transfer-types.hxx>
#include <anipler/transfer/transfer-executor.hxx>
#include <anipler/seedbox/seedbox-client.hxx>
#include <anipler/control/control-types.hxx>

namespace anipler
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  template <typename S = lifecycle_store,
            typename X = transfer_executor,
            typename Q = seedbox_client>
  struct lifecycle_engine_traits
  {
    using store_type = S;
    using executor_type = X;
    using seedbox_type = Q;
  };

  struct engine_config
  {
    // Relay storage for artifacts, one entry per task.
    //
    fs::path artifacts_dir;

    // ssh endpoint the content is copied from.
    //
    std::string seedbox_endpoint;

    // ssh endpoint the puller copies artifacts from.
    //
    std::string relay_endpoint;

    std::string tag = "anipler";

    copy_options copy;

    // Milliseconds.
    //
    std::int64_t claim_lease = 6 * 3600 * 1000;
    std::int64_t deleted_retention = 0;
  };

  struct pull_report
  {
    std::size_t listed = 0;
    std::size_t ignored = 0; // Added before the import horizon.
    std::size_t merged = 0;
  };

  struct transfer_report
  {
    std::size_t transferred = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0; // Timed out or dry run.
    std::size_t skipped = 0;   // Busy or raced by another writer.
    std::size_t pending = 0;   // Pending after the run.
    std::vector<std::string> failures;
  };

  struct sweep_report
  {
    std::size_t reclaimed = 0;
    std::size_t failed = 0;
    std::size_t leftovers = 0;
    std::size_t purged = 0;
  };

  // Read-only picture of the work in flight.
  //
  struct status_report
  {
    std::vector<task> awaiting;     // Seeding, no artifact yet.
    std::vector<task> pending;      // Artifact Pending (copy failing).
    std::vector<task> ready;
  };

  std::string
  to_string (const pull_report&);

  std::string
  to_string (const transfer_report&);

  std::string
  to_string (const sweep_report&);

  std::string
  to_string (const status_report&);

  // Relay path of a task's artifact. Deterministic and distinct for distinct
  // hash-like ids.
  //
  fs::path
  relay_path (const fs::path& artifacts_dir, const std::string& task_id);

  // The lifecycle engine.
  //
  // Drives tasks and artifacts through the store, the seedbox and the
  // transfer executor. The scheduler, the command surface and the control
  // channel all go through here.
  //
  template <typename T = lifecycle_engine_traits<>>
  class basic_lifecycle_engine
  {
  public:
    using traits_type = T;
    using store_type = typename traits_type::store_type;
    using executor_type = typename traits_type::executor_type;
    using seedbox_type = typename traits_type::seedbox_type;

    basic_lifecycle_engine (std::shared_ptr<store_type> s,
                            std::shared_ptr<executor_type> x,
                            std::shared_ptr<seedbox_type> q,
                            engine_config c);

    basic_lifecycle_engine (const basic_lifecycle_engine&) = delete;
    basic_lifecycle_engine& operator= (const basic_lifecycle_engine&) = delete;

    void
    set_verbose (bool v);

    const engine_config&
    config () const noexcept
    {
      return config_;
    }

    store_type&
    store () noexcept
    {
      return *store_;
    }

    // Jobs.
    //

    // Merge the tagged seedbox downloads added after the import horizon.
    //
    asio::awaitable<pull_report>
    pull ();

    // Retry Pending artifacts, then start artifacts for new Seeding tasks.
    //
    asio::awaitable<transfer_report>
    transfer ();

    // Finish interrupted claims, remove deletion leftovers, apply
    // retention.
    //
    sweep_report
    sweep ();

    status_report
    report ();

    // Claim flow.
    //

    std::vector<ready_entry>
    ready ();

    // Reserve a Ready artifact for the calling puller.
    //
    claim_grant
    claim (const std::string& task_id);

    // The puller has the content: Claimed, storage removed, Deleted.
    //
    confirm_result
    confirm (const std::string& task_id);

    // Ingestion.
    //
    asio::awaitable<std::optional<std::string>>
    ingest (const std::string& source);

  private:
    // Copy the task content to the artifact relay path and mark it Ready.
    //
    asio::awaitable<void>
    transfer_one (const task&, const artifact&, transfer_report&);

    std::shared_ptr<store_type> store_;
    std::shared_ptr<executor_type> executor_;
    std::shared_ptr<seedbox_type> seedbox_;
    engine_config config_;
    bool verbose_ = false;
  };

  using lifecycle_engine = basic_lifecycle_engine<>;
}

#include <anipler/lifecycle/lifecycle-engine.txx>
