#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <optional>

#include <odb/core.hxx>
#include <odb/nullable.hxx>

namespace anipler
{
  // Remote download status. Only ever moves forward.
  //
  enum class task_status
  {
    downloading,
    seeding      // Complete, still shared by the seedbox.
  };

  inline std::ostream&
  operator<< (std::ostream& os, task_status s)
  {
    switch (s)
    {
      case task_status::downloading: return os << "downloading";
      case task_status::seeding:     return os << "seeding";
    }
    return os;
  }

  // Relay-side readiness of an artifact.
  //
  // The order of the enumerators is the order of the lifecycle and the
  // transitions only ever go to the next one.
  //
  enum class artifact_readiness
  {
    pending,  // Copy in progress or to be retried.
    ready,    // On the relay, advertised to the puller.
    claimed,  // Puller has the content, relay storage to be reclaimed.
    deleted   // Relay storage reclaimed. Terminal.
  };

  inline std::ostream&
  operator<< (std::ostream& os, artifact_readiness r)
  {
    switch (r)
    {
      case artifact_readiness::pending: return os << "pending";
      case artifact_readiness::ready:   return os << "ready";
      case artifact_readiness::claimed: return os << "claimed";
      case artifact_readiness::deleted: return os << "deleted";
    }
    return os;
  }

  // What the seedbox currently says about one of its downloads. Absent
  // members leave the stored value alone on merge.
  //
  struct task_fact
  {
    std::string id;
    std::optional<task_status> status;
    std::optional<std::string> content_path;
    std::optional<std::string> name;
    std::optional<std::int64_t> size;
    std::optional<std::int64_t> added_on; // Seconds since epoch.
  };

  // All timestamps below are milliseconds since the UNIX epoch as assigned
  // by the store.
  //

  #pragma db object table("tasks")
  class task
  {
  public:
    task () = default;

    explicit
    task (std::string id)
      : id_ (std::move (id)) {}

    const std::string&
    id () const noexcept { return id_; }

    task_status
    status () const noexcept { return status_; }

    const std::string&
    content_path () const noexcept { return content_path_; }

    const std::string&
    name () const noexcept { return name_; }

    std::int64_t
    size () const noexcept { return size_; }

    std::int64_t
    added_on () const noexcept { return added_on_; }

    std::int64_t
    last_seen_at () const noexcept { return last_seen_at_; }

    void
    set_status (task_status s) { status_ = s; }

    void
    set_content_path (std::string p) { content_path_ = std::move (p); }

    void
    set_name (std::string n) { name_ = std::move (n); }

    void
    set_size (std::int64_t s) { size_ = s; }

    void
    set_added_on (std::int64_t t) { added_on_ = t; }

    void
    set_last_seen_at (std::int64_t t) { last_seen_at_ = t; }

  private:
    friend class odb::access;

    #pragma db id
    std::string id_;

    #pragma db not_null index
    task_status status_ = task_status::downloading;

    std::string content_path_;
    std::string name_;
    std::int64_t size_ = 0;
    std::int64_t added_on_ = 0;

    #pragma db not_null
    std::int64_t last_seen_at_ = 0;
  };

  #pragma db object table("artifacts")
  class artifact
  {
  public:
    artifact () = default;

    artifact (std::string task_id, std::string relay_path, std::int64_t t)
      : task_id_ (std::move (task_id)),
        relay_path_ (std::move (relay_path)),
        begun_at_ (t) {}

    const std::string&
    task_id () const noexcept { return task_id_; }

    artifact_readiness
    readiness () const noexcept { return readiness_; }

    const std::string&
    relay_path () const noexcept { return relay_path_; }

    std::int64_t
    begun_at () const noexcept { return begun_at_; }

    const odb::nullable<std::int64_t>&
    ready_at () const noexcept { return ready_at_; }

    const odb::nullable<std::int64_t>&
    claimed_at () const noexcept { return claimed_at_; }

    const odb::nullable<std::int64_t>&
    deleted_at () const noexcept { return deleted_at_; }

    // Time of the last puller reservation (see claim). Not a readiness
    // change.
    //
    const odb::nullable<std::int64_t>&
    reserved_at () const noexcept { return reserved_at_; }

    void
    set_readiness (artifact_readiness r) { readiness_ = r; }

    void
    set_ready_at (std::int64_t t) { ready_at_ = t; }

    void
    set_claimed_at (std::int64_t t) { claimed_at_ = t; }

    void
    set_deleted_at (std::int64_t t) { deleted_at_ = t; }

    void
    set_reserved_at (std::int64_t t) { reserved_at_ = t; }

  private:
    friend class odb::access;

    #pragma db id
    std::string task_id_;

    #pragma db not_null index
    artifact_readiness readiness_ = artifact_readiness::pending;

    #pragma db not_null unique
    std::string relay_path_;

    #pragma db not_null
    std::int64_t begun_at_ = 0;

    odb::nullable<std::int64_t> ready_at_;
    odb::nullable<std::int64_t> claimed_at_;
    odb::nullable<std::int64_t> deleted_at_;
    odb::nullable<std::int64_t> reserved_at_;
  };

  // One scheduler run, for observability only.
  //
  #pragma db object table("job_runs")
  class job_run
  {
  public:
    job_run () = default;

    job_run (std::string job, std::int64_t t)
      : job_ (std::move (job)), started_at_ (t) {}

    unsigned long long
    id () const noexcept { return id_; }

    const std::string&
    job () const noexcept { return job_; }

    std::int64_t
    started_at () const noexcept { return started_at_; }

    const odb::nullable<std::int64_t>&
    finished_at () const noexcept { return finished_at_; }

    const std::string&
    outcome () const noexcept { return outcome_; }

    void
    finish (std::int64_t t, std::string o)
    {
      finished_at_ = t;
      outcome_ = std::move (o);
    }

  private:
    friend class odb::access;

    #pragma db id auto
    unsigned long long id_ = 0;

    #pragma db not_null index
    std::string job_;

    #pragma db not_null
    std::int64_t started_at_ = 0;

    odb::nullable<std::int64_t> finished_at_;
    std::string outcome_;
  };

  #pragma db object table("settings")
  class setting
  {
  public:
    setting () = default;

    setting (std::string k, std::string v)
      : key_ (std::move (k)), value_ (std::move (v)) {}

    const std::string&
    key () const noexcept { return key_; }

    const std::string&
    value () const noexcept { return value_; }

    void
    set_value (std::string v) { value_ = std::move (v); }

  private:
    friend class odb::access;

    #pragma db id
    std::string key_;

    #pragma db not_null
    std::string value_;
  };
}
