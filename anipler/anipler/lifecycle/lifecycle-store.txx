#include <sqlite3.h>

#include <odb/query.hxx>
#include <odb/result.hxx>
#include <odb/sqlite/connection.hxx>
#include <odb/sqlite/connection-factory.hxx>

#include <anipler/lifecycle/lifecycle-types-odb.hxx>

namespace anipler
{
  // Format "artifact <id> is <readiness>, expected <readiness>".
  //
  std::string
  transition_message (const artifact&, artifact_readiness expected);

  template <typename T>
  basic_lifecycle_store<T>::
  basic_lifecycle_store (const fs::path& root)
    : clock_ (&system_time_ms)
  {
    init (root);
  }

  template <typename T>
  void basic_lifecycle_store<T>::
  init (const fs::path& root)
  {
    std::string name (":memory:");

    if (!root.empty ())
    {
      std::error_code ec;
      fs::create_directories (root, ec);

      if (ec)
        throw lifecycle_error (error_kind::fatal,
                               "unable to create storage directory " +
                               root.string () + ": " + ec.message ());

      path_ = root / traits_type::db_name;
      name = path_.string ();
    }

    // A single connection: the daemon is single-threaded and an in-memory
    // database only exists for the connection that created it.
    //
    std::unique_ptr<odb::sqlite::connection_factory> f (
      new odb::sqlite::single_connection_factory);

    db_ = std::make_unique<database_type> (
      name,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
      false /* foreign_keys */,
      "",
      std::move (f));

    pragmas ();
    schema ();

    if (!setting_value (traits_type::horizon_key))
      setting_value (traits_type::horizon_key, std::to_string (now ()));
  }

  template <typename T>
  void basic_lifecycle_store<T>::
  schema ()
  {
    // create_schema() fails on existing tables so peek at sqlite_master
    // first.
    //
    bool exists (false);
    {
      odb::transaction t (db_->begin ());

      odb::sqlite::connection& c (
        static_cast<odb::sqlite::connection&> (t.connection ()));

      sqlite3_stmt* s (nullptr);
      const char* q (
        "SELECT name FROM sqlite_master WHERE type='table' AND name='artifacts'");

      if (sqlite3_prepare_v2 (c.handle (), q, -1, &s, nullptr) != SQLITE_OK)
        throw lifecycle_error (error_kind::fatal,
                               std::string ("unable to inspect schema: ") +
                               sqlite3_errmsg (c.handle ()));

      exists = sqlite3_step (s) == SQLITE_ROW;
      sqlite3_finalize (s);

      t.commit ();
    }

    if (!exists)
    {
      odb::transaction t (db_->begin ());
      odb::schema_catalog::create_schema (*db_);
      t.commit ();
    }
  }

  template <typename T>
  void basic_lifecycle_store<T>::
  pragmas ()
  {
    // Journal and synchronous modes cannot be changed inside a transaction
    // so go through the raw handle.
    //
    odb::connection_ptr c (db_->connection ());
    sqlite3* h (static_cast<odb::sqlite::connection&> (*c).handle ());

    auto exec = [h] (const char* p)
    {
      char* m (nullptr);
      if (sqlite3_exec (h, p, nullptr, nullptr, &m) != SQLITE_OK)
      {
        std::string e (m != nullptr ? m : "unknown error");
        sqlite3_free (m);
        throw lifecycle_error (error_kind::fatal,
                               std::string ("unable to apply ") + p + ": " + e);
      }
    };

    if (traits_type::wal && !path_.empty ())
      exec ("PRAGMA journal_mode=WAL");

    // Unlike a cache, losing a committed transition here means a file gets
    // relayed twice or deleted early.
    //
    exec ("PRAGMA synchronous=FULL");
    exec ("PRAGMA busy_timeout=5000");
  }

  template <typename T>
  std::size_t basic_lifecycle_store<T>::
  merge_tasks (const std::vector<task_fact>& fs)
  {
    std::size_t r (0);
    std::int64_t ts (now ());

    odb::transaction t (db_->begin_immediate ());

    for (const task_fact& f: fs)
    {
      if (f.id.empty ())
        continue;

      std::shared_ptr<task> e (db_->template find<task> (f.id));

      if (!e)
      {
        task n (f.id);

        if (f.status)       n.set_status (*f.status);
        if (f.content_path) n.set_content_path (*f.content_path);
        if (f.name)         n.set_name (*f.name);
        if (f.size)         n.set_size (*f.size);
        if (f.added_on)     n.set_added_on (*f.added_on);

        n.set_last_seen_at (ts);
        db_->persist (n);
        ++r;
        continue;
      }

      bool ch (false);

      // The seedbox may briefly report an older status (rechecks, restarts);
      // that never takes a task back.
      //
      if (f.status && *f.status > e->status ())
      {
        e->set_status (*f.status);
        ch = true;
      }

      if (f.content_path && *f.content_path != e->content_path ())
      {
        e->set_content_path (*f.content_path);
        ch = true;
      }

      if (f.name && *f.name != e->name ())
      {
        e->set_name (*f.name);
        ch = true;
      }

      if (f.size && *f.size != e->size ())
      {
        e->set_size (*f.size);
        ch = true;
      }

      if (f.added_on && *f.added_on != e->added_on ())
      {
        e->set_added_on (*f.added_on);
        ch = true;
      }

      e->set_last_seen_at (ts);
      db_->update (*e);

      if (ch)
        ++r;
    }

    t.commit ();
    return r;
  }

  template <typename T>
  std::optional<task> basic_lifecycle_store<T>::
  find_task (const string_type& id)
  {
    odb::transaction t (db_->begin ());
    std::shared_ptr<task> k (db_->template find<task> (id));
    t.commit ();

    return k ? std::optional<task> (*k) : std::nullopt;
  }

  template <typename T>
  std::vector<task> basic_lifecycle_store<T>::
  tasks ()
  {
    using query = odb::query<task>;

    std::vector<task> r;

    odb::transaction t (db_->begin ());
    odb::result<task> res (
      db_->template query<task> ("ORDER BY" + query::added_on));

    for (auto& k: res)
      r.push_back (k);

    t.commit ();
    return r;
  }

  template <typename T>
  std::vector<task> basic_lifecycle_store<T>::
  list_seeding_without_artifact ()
  {
    using query = odb::query<task>;

    std::vector<task> ss;
    std::vector<task> r;

    odb::transaction t (db_->begin ());

    // Drain the result before issuing the per-row lookups.
    //
    {
      odb::result<task> res (
        db_->template query<task> (
          (query::status == task_status::seeding) +
          "ORDER BY" + query::added_on));

      for (auto& k: res)
        ss.push_back (k);
    }

    for (task& k: ss)
    {
      if (!db_->template find<artifact> (k.id ()))
        r.push_back (std::move (k));
    }

    t.commit ();
    return r;
  }

  template <typename T>
  artifact basic_lifecycle_store<T>::
  begin_artifact (const string_type& id, const string_type& p)
  {
    using query = odb::query<artifact>;

    odb::transaction t (db_->begin_immediate ());

    if (!db_->template find<task> (id))
      throw lifecycle_error (error_kind::not_found,
                             "task " + id + " not found");

    if (db_->template find<artifact> (id))
      throw lifecycle_error (error_kind::conflict,
                             "artifact for task " + id + " already exists");

    {
      odb::result<artifact> res (
        db_->template query<artifact> (query::relay_path == p));

      if (!res.empty ())
        throw lifecycle_error (error_kind::conflict,
                               "relay path " + p + " already assigned");
    }

    artifact a (id, p, now ());
    db_->persist (a);

    t.commit ();
    return a;
  }

  template <typename T>
  std::optional<artifact> basic_lifecycle_store<T>::
  find_artifact (const string_type& id)
  {
    odb::transaction t (db_->begin ());
    std::shared_ptr<artifact> a (db_->template find<artifact> (id));
    t.commit ();

    return a ? std::optional<artifact> (*a) : std::nullopt;
  }

  template <typename T>
  std::shared_ptr<artifact> basic_lifecycle_store<T>::
  load_artifact (const string_type& id)
  {
    std::shared_ptr<artifact> a (db_->template find<artifact> (id));

    if (!a)
      throw lifecycle_error (error_kind::not_found,
                             "no artifact for task " + id);

    return a;
  }

  template <typename T>
  artifact basic_lifecycle_store<T>::
  mark_ready (const string_type& id)
  {
    odb::transaction t (db_->begin_immediate ());

    std::shared_ptr<artifact> a (load_artifact (id));

    if (a->readiness () != artifact_readiness::pending)
      throw lifecycle_error (
        error_kind::invalid_transition,
        transition_message (*a, artifact_readiness::pending));

    a->set_readiness (artifact_readiness::ready);
    a->set_ready_at (now ());
    db_->update (*a);

    t.commit ();
    return *a;
  }

  template <typename T>
  artifact basic_lifecycle_store<T>::
  mark_claimed (const string_type& id)
  {
    odb::transaction t (db_->begin_immediate ());

    std::shared_ptr<artifact> a (load_artifact (id));

    if (a->readiness () != artifact_readiness::ready)
      throw lifecycle_error (
        error_kind::invalid_transition,
        transition_message (*a, artifact_readiness::ready));

    a->set_readiness (artifact_readiness::claimed);
    a->set_claimed_at (now ());
    db_->update (*a);

    t.commit ();
    return *a;
  }

  template <typename T>
  artifact basic_lifecycle_store<T>::
  mark_deleted (const string_type& id)
  {
    odb::transaction t (db_->begin_immediate ());

    std::shared_ptr<artifact> a (load_artifact (id));

    if (a->readiness () != artifact_readiness::claimed)
      throw lifecycle_error (
        error_kind::invalid_transition,
        transition_message (*a, artifact_readiness::claimed));

    a->set_readiness (artifact_readiness::deleted);
    a->set_deleted_at (now ());
    db_->update (*a);

    t.commit ();
    return *a;
  }

  template <typename T>
  artifact basic_lifecycle_store<T>::
  reserve (const string_type& id, std::int64_t lease)
  {
    odb::transaction t (db_->begin_immediate ());

    std::shared_ptr<artifact> a (load_artifact (id));

    // A Pending artifact is not advertised so, as far as the puller is
    // concerned, it does not exist yet.
    //
    if (a->readiness () == artifact_readiness::pending)
      throw lifecycle_error (error_kind::not_found,
                             "artifact for task " + id + " is not ready");

    if (a->readiness () != artifact_readiness::ready)
      throw lifecycle_error (error_kind::conflict,
                             "artifact for task " + id + " already claimed");

    std::int64_t ts (now ());

    if (!a->reserved_at ().null () && ts - *a->reserved_at () < lease)
      throw lifecycle_error (error_kind::conflict,
                             "artifact for task " + id +
                             " is reserved by another puller");

    a->set_reserved_at (ts);
    db_->update (*a);

    t.commit ();
    return *a;
  }

  template <typename T>
  std::vector<artifact> basic_lifecycle_store<T>::
  list (artifact_readiness s)
  {
    using query = odb::query<artifact>;

    std::vector<artifact> r;

    odb::transaction t (db_->begin ());
    odb::result<artifact> res (
      db_->template query<artifact> (
        (query::readiness == s) + "ORDER BY" + query::begun_at));

    for (auto& a: res)
      r.push_back (a);

    t.commit ();
    return r;
  }

  template <typename T>
  std::size_t basic_lifecycle_store<T>::
  purge_deleted (std::int64_t retention)
  {
    using query = odb::query<artifact>;

    if (retention <= 0)
      return 0;

    std::int64_t th (now () - retention);
    std::size_t n (0);

    odb::transaction t (db_->begin_immediate ());

    // Every pull stamps the tasks it lists with the same time so the
    // newest last_seen_at is when the seedbox was last listed.
    //
    std::int64_t latest (0);
    {
      using task_query = odb::query<task>;

      odb::result<task> res (
        db_->template query<task> (
          "ORDER BY" + task_query::last_seen_at + "DESC LIMIT 1"));

      for (auto& k: res)
        latest = k.last_seen_at ();
    }

    std::vector<artifact> ds;
    {
      odb::result<artifact> res (
        db_->template query<artifact> (
          query::readiness == artifact_readiness::deleted));

      for (auto& a: res)
        ds.push_back (a);
    }

    for (const artifact& a: ds)
    {
      if (a.deleted_at ().null () || *a.deleted_at () >= th)
        continue;

      // Keep the row while the seedbox may still list the id, otherwise
      // the next pull merges it as a new task and relays it again. That is
      // until a listing taken after the deletion left it out.
      //
      std::shared_ptr<task> k (db_->template find<task> (a.task_id ()));

      if (k && (k->last_seen_at () >= th       ||
                k->last_seen_at () >= latest   ||
                latest <= *a.deleted_at ()))
        continue;

      db_->template erase<artifact> (a.task_id ());

      if (k)
        db_->template erase<task> (a.task_id ());

      ++n;
    }

    t.commit ();
    return n;
  }

  template <typename T>
  unsigned long long basic_lifecycle_store<T>::
  begin_job_run (const string_type& job)
  {
    odb::transaction t (db_->begin_immediate ());

    job_run r (job, now ());
    db_->persist (r);

    t.commit ();
    return r.id ();
  }

  template <typename T>
  void basic_lifecycle_store<T>::
  finish_job_run (unsigned long long id, const string_type& outcome)
  {
    odb::transaction t (db_->begin_immediate ());

    std::shared_ptr<job_run> r (db_->template find<job_run> (id));

    if (!r)
      throw lifecycle_error (error_kind::not_found,
                             "job run " + std::to_string (id) + " not found");

    r->finish (now (), outcome);
    db_->update (*r);

    t.commit ();
  }

  template <typename T>
  std::vector<job_run> basic_lifecycle_store<T>::
  job_runs ()
  {
    using query = odb::query<job_run>;

    std::vector<job_run> r;

    odb::transaction t (db_->begin ());
    odb::result<job_run> res (
      db_->template query<job_run> ("ORDER BY" + query::id));

    for (auto& j: res)
      r.push_back (j);

    t.commit ();
    return r;
  }

  template <typename T>
  std::optional<typename basic_lifecycle_store<T>::string_type>
  basic_lifecycle_store<T>::
  setting_value (const string_type& k)
  {
    odb::transaction t (db_->begin ());
    std::shared_ptr<setting> s (db_->template find<setting> (k));
    t.commit ();

    return s ? std::optional<string_type> (s->value ()) : std::nullopt;
  }

  template <typename T>
  void basic_lifecycle_store<T>::
  setting_value (const string_type& k, const string_type& v)
  {
    odb::transaction t (db_->begin_immediate ());

    std::shared_ptr<setting> e (db_->template find<setting> (k));

    if (e)
    {
      e->set_value (v);
      db_->update (*e);
    }
    else
    {
      setting s (k, v);
      db_->persist (s);
    }

    t.commit ();
  }

  template <typename T>
  std::int64_t basic_lifecycle_store<T>::
  import_horizon ()
  {
    std::optional<string_type> v (setting_value (traits_type::horizon_key));

    if (!v)
      return 0;

    try
    {
      return std::stoll (*v);
    }
    catch (const std::exception&)
    {
      throw lifecycle_error (error_kind::fatal,
                             "invalid import horizon '" + *v + "'");
    }
  }

  template <typename T>
  bool basic_lifecycle_store<T>::
  check ()
  {
    odb::transaction t (db_->begin ());
    bool ok (false);

    odb::sqlite::connection& c (
      static_cast<odb::sqlite::connection&> (t.connection ()));

    sqlite3_stmt* s (nullptr);

    if (sqlite3_prepare_v2 (c.handle (),
                            "PRAGMA integrity_check",
                            -1,
                            &s,
                            nullptr) == SQLITE_OK)
    {
      if (sqlite3_step (s) == SQLITE_ROW)
      {
        const char* r (
          reinterpret_cast<const char*> (sqlite3_column_text (s, 0)));

        ok = r != nullptr && std::string (r) == "ok";
      }
      sqlite3_finalize (s);
    }

    t.commit ();
    return ok;
  }

  template <typename T>
  void basic_lifecycle_store<T>::
  vacuum ()
  {
    // VACUUM cannot run inside a transaction.
    //
    odb::connection_ptr c (db_->connection ());
    c->execute ("VACUUM");
  }
}
