#pragma once

#include <anipler/lifecycle/lifecycle-types.hxx>
#include <anipler/lifecycle/lifecycle-error.hxx>

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <filesystem>
#include <functional>

#include <odb/database.hxx>
#include <odb/transaction.hxx>
#include <odb/schema-catalog.hxx>
#include <odb/sqlite/database.hxx>

namespace anipler
{
  namespace fs = std::filesystem;

  template <typename S = std::string>
  struct lifecycle_store_traits
  {
    using string_type = S;
    using database_type = odb::sqlite::database;

    // Lives in the storage root, next to the artifacts directory.
    //
    static constexpr const char* db_name = "anipler.db";

    // The control channel reads while jobs write.
    //
    static constexpr bool wal = true;

    // Settings key of the import horizon (milliseconds).
    //
    static constexpr const char* horizon_key = "import_horizon";
  };

  // The lifecycle store.
  //
  // Sole owner of the task and artifact records. Every mutating call runs in
  // its own IMMEDIATE transaction so a caller never observes a half-applied
  // transition and two writers cannot interleave a read-modify-write.
  //
  template <typename T = lifecycle_store_traits<>>
  class basic_lifecycle_store
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using database_type = typename traits_type::database_type;

    // Source of wall clock time in milliseconds since epoch.
    //
    using clock_type = std::function<std::int64_t ()>;

    // Open (creating if necessary) the store in the storage root. If the
    // root is empty the store is kept in memory.
    //
    explicit
    basic_lifecycle_store (const fs::path& root);

    basic_lifecycle_store (const basic_lifecycle_store&) = delete;
    basic_lifecycle_store& operator= (const basic_lifecycle_store&) = delete;

    // Database path or empty if in memory.
    //
    const fs::path&
    path () const noexcept;

    database_type&
    db () noexcept;

    // Replace the time source. Monotonic tracking starts over.
    //
    void
    set_clock (clock_type c);

    // Current store time. Never goes backwards within one store instance.
    //
    std::int64_t
    now ();

    // Tasks.
    //

    // Upsert the facts by id. Return the number of tasks that were created
    // or had a field changed; a bare last_seen_at refresh does not count.
    //
    std::size_t
    merge_tasks (const std::vector<task_fact>& fs);

    std::optional<task>
    find_task (const string_type& id);

    std::vector<task>
    tasks ();

    // Seeding tasks that never had an artifact, oldest first.
    //
    std::vector<task>
    list_seeding_without_artifact ();

    // Artifacts.
    //

    // Create the Pending artifact. Throw conflict if the task already has
    // one or the relay path is taken, not_found if the task is unknown.
    //
    artifact
    begin_artifact (const string_type& task_id, const string_type& relay_path);

    std::optional<artifact>
    find_artifact (const string_type& task_id);

    artifact
    mark_ready (const string_type& task_id);

    artifact
    mark_claimed (const string_type& task_id);

    artifact
    mark_deleted (const string_type& task_id);

    // Record a puller reservation on a Ready artifact. Throw conflict if it
    // is no longer Ready or if another reservation is younger than the lease
    // (milliseconds).
    //
    artifact
    reserve (const string_type& task_id, std::int64_t lease);

    std::vector<artifact>
    list_ready ();

    std::vector<artifact>
    list_pending ();

    std::vector<artifact>
    list_claimed_unreclaimed ();

    // Erase Deleted artifacts (and their tasks) whose deleted_at and task
    // last_seen_at are both older than the retention (milliseconds) and
    // whose task was left out of a seedbox listing merged after the
    // deletion. Return the number of artifacts erased.
    //
    std::size_t
    purge_deleted (std::int64_t retention);

    // Job audit.
    //
    unsigned long long
    begin_job_run (const string_type& job);

    void
    finish_job_run (unsigned long long id, const string_type& outcome);

    std::vector<job_run>
    job_runs ();

    // Settings.
    //
    std::optional<string_type>
    setting_value (const string_type& key);

    void
    setting_value (const string_type& key, const string_type& value);

    // Time (milliseconds) the store was first created. Downloads added
    // before it are not relayed.
    //
    std::int64_t
    import_horizon ();

    // Maintenance.
    //

    // PRAGMA integrity_check.
    //
    bool
    check ();

    void
    vacuum ();

  private:
    void
    init (const fs::path& root);

    void
    schema ();

    void
    pragmas ();

    std::vector<artifact>
    list (artifact_readiness r);

    // Load the artifact for a transition or throw not_found.
    //
    std::shared_ptr<artifact>
    load_artifact (const string_type& task_id);

    fs::path path_;
    std::unique_ptr<database_type> db_;
    clock_type clock_;
    std::int64_t last_ = 0;
  };

  using lifecycle_store = basic_lifecycle_store<>;

  // System clock in milliseconds since epoch.
  //
  std::int64_t
  system_time_ms ();
}

#include <anipler/lifecycle/lifecycle-store.ixx>
#include <anipler/lifecycle/lifecycle-store.txx>
