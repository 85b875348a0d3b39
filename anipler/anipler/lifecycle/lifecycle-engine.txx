#include <iostream>

namespace anipler
{
  template <typename T>
  basic_lifecycle_engine<T>::
  basic_lifecycle_engine (std::shared_ptr<store_type> s,
                          std::shared_ptr<executor_type> x,
                          std::shared_ptr<seedbox_type> q,
                          engine_config c)
    : store_ (std::move (s)),
      executor_ (std::move (x)),
      seedbox_ (std::move (q)),
      config_ (std::move (c))
  {
  }

  template <typename T>
  void basic_lifecycle_engine<T>::
  set_verbose (bool v)
  {
    verbose_ = v;
  }

  template <typename T>
  asio::awaitable<pull_report> basic_lifecycle_engine<T>::
  pull ()
  {
    std::vector<torrent_info> ts (co_await seedbox_->list (config_.tag));

    // The horizon is kept in milliseconds, the seedbox reports seconds.
    //
    std::int64_t h (store_->import_horizon () / 1000);

    pull_report r;
    r.listed = ts.size ();

    std::vector<task_fact> fs;
    for (const torrent_info& t: ts)
    {
      if (t.added_on < h)
      {
        if (verbose_)
          std::cout << "ignoring " << t.name << " (" << t.hash
                    << "): added before the import horizon" << "\n";

        ++r.ignored;
        continue;
      }

      fs.push_back (to_task_fact (t));
    }

    r.merged = store_->merge_tasks (fs);
    co_return r;
  }

  template <typename T>
  asio::awaitable<transfer_report> basic_lifecycle_engine<T>::
  transfer ()
  {
    transfer_report r;

    // Earlier failures first. The scheduled run is the retry.
    //
    for (const artifact& a: store_->list_pending ())
    {
      std::optional<task> k (store_->find_task (a.task_id ()));

      if (!k)
      {
        std::cerr << "warning: pending artifact " << a.task_id ()
                  << " has no task" << std::endl;
        ++r.failed;
        continue;
      }

      co_await transfer_one (*k, a, r);
    }

    for (const task& k: store_->list_seeding_without_artifact ())
    {
      std::optional<artifact> a;

      try
      {
        a = store_->begin_artifact (
          k.id (), relay_path (config_.artifacts_dir, k.id ()).string ());
      }
      catch (const lifecycle_error& e)
      {
        // Someone else started it first.
        //
        if (e.kind () != error_kind::conflict)
          throw;

        std::cerr << "warning: " << e.what () << std::endl;
        ++r.skipped;
        continue;
      }

      co_await transfer_one (k, *a, r);
    }

    r.pending = store_->list_pending ().size ();
    co_return r;
  }

  template <typename T>
  asio::awaitable<void> basic_lifecycle_engine<T>::
  transfer_one (const task& k, const artifact& a, transfer_report& r)
  {
    std::string l (k.name ().empty () ? k.id () : k.name ());

    if (k.content_path ().empty ())
    {
      ++r.failed;
      r.failures.push_back (l + ": no content path");
      co_return;
    }

    copy_request q;
    q.endpoint = config_.seedbox_endpoint;
    q.source = k.content_path ();
    q.destination = a.relay_path ();
    q.options = config_.copy;

    transfer_outcome o (co_await executor_->copy (q));

    switch (o.status)
    {
    case transfer_status::success:
      {
        try
        {
          store_->mark_ready (k.id ());
        }
        catch (const lifecycle_error& e)
        {
          if (e.kind () != error_kind::invalid_transition)
            throw;

          std::cerr << "warning: " << e.what () << std::endl;
          ++r.skipped;
          break;
        }

        if (verbose_)
          std::cout << "transferred " << l << " to " << a.relay_path ()
                    << "\n";

        ++r.transferred;
        break;
      }
    case transfer_status::busy:
      {
        ++r.skipped;
        break;
      }
    case transfer_status::cancelled:
      {
        ++r.cancelled;
        r.failures.push_back (l + ": " + o.reason);
        break;
      }
    case transfer_status::failure:
      {
        std::cerr << "warning: transfer of " << l << " failed: " << o.reason
                  << std::endl;

        ++r.failed;
        r.failures.push_back (l + ": " + o.reason);
        break;
      }
    }
  }

  template <typename T>
  sweep_report basic_lifecycle_engine<T>::
  sweep ()
  {
    sweep_report r;

    // Claimed means the puller has the content; whatever happened to the
    // storage since, it only has to be gone before the artifact is Deleted.
    //
    for (const artifact& a: store_->list_claimed_unreclaimed ())
    {
      transfer_outcome o (executor_->remove (a.relay_path ()));

      if (!o.ok ())
      {
        std::cerr << "warning: unable to reclaim " << a.relay_path () << ": "
                  << o << std::endl;
        ++r.failed;
        continue;
      }

      try
      {
        store_->mark_deleted (a.task_id ());
        ++r.reclaimed;
      }
      catch (const lifecycle_error& e)
      {
        if (e.kind () != error_kind::invalid_transition)
          throw;

        std::cerr << "warning: " << e.what () << std::endl;
      }
    }

    r.leftovers = executor_->purge_leftovers (config_.artifacts_dir);
    r.purged = store_->purge_deleted (config_.deleted_retention);
    return r;
  }

  template <typename T>
  status_report basic_lifecycle_engine<T>::
  report ()
  {
    status_report r;
    r.awaiting = store_->list_seeding_without_artifact ();

    auto tasks_of = [this] (const std::vector<artifact>& as)
    {
      std::vector<task> ks;

      for (const artifact& a: as)
      {
        if (std::optional<task> k = store_->find_task (a.task_id ()))
          ks.push_back (std::move (*k));
      }

      return ks;
    };

    r.pending = tasks_of (store_->list_pending ());
    r.ready = tasks_of (store_->list_ready ());
    return r;
  }

  template <typename T>
  std::vector<ready_entry> basic_lifecycle_engine<T>::
  ready ()
  {
    std::vector<ready_entry> r;

    for (const artifact& a: store_->list_ready ())
    {
      ready_entry e;
      e.task_id = a.task_id ();
      e.name = a.task_id ();

      if (std::optional<task> k = store_->find_task (a.task_id ()))
      {
        if (!k->name ().empty ())
          e.name = k->name ();

        e.size = k->size ();
      }

      r.push_back (std::move (e));
    }

    return r;
  }

  template <typename T>
  claim_grant basic_lifecycle_engine<T>::
  claim (const std::string& id)
  {
    artifact a (store_->reserve (id, config_.claim_lease));

    claim_grant g;
    g.task_id = id;
    g.relay_endpoint = config_.relay_endpoint;
    g.relay_path = a.relay_path ();
    g.name = id;

    if (std::optional<task> k = store_->find_task (id))
    {
      if (!k->name ().empty ())
        g.name = k->name ();
    }

    if (verbose_)
      std::cout << "claimed " << g.name << " (" << id << ")" << "\n";

    return g;
  }

  template <typename T>
  confirm_result basic_lifecycle_engine<T>::
  confirm (const std::string& id)
  {
    std::optional<artifact> a (store_->find_artifact (id));

    if (!a || a->readiness () == artifact_readiness::pending)
      throw lifecycle_error (error_kind::not_found,
                             "no ready artifact for task " + id);

    if (a->readiness () == artifact_readiness::deleted)
      throw lifecycle_error (error_kind::conflict,
                             "artifact for task " + id + " already deleted");

    // Claimed already means an earlier confirm was interrupted; carry on
    // from there.
    //
    if (a->readiness () == artifact_readiness::ready)
      store_->mark_claimed (id);

    confirm_result r;
    r.task_id = id;

    transfer_outcome o (executor_->remove (a->relay_path ()));

    if (!o.ok ())
    {
      // The receipt is recorded; the sweep job reclaims the storage.
      //
      std::cerr << "warning: unable to remove " << a->relay_path () << ": "
                << o << std::endl;
      return r;
    }

    store_->mark_deleted (id);
    r.reclaimed = true;

    if (verbose_)
      std::cout << "confirmed " << id << ", removed " << a->relay_path ()
                << "\n";

    return r;
  }

  template <typename T>
  asio::awaitable<std::optional<std::string>> basic_lifecycle_engine<T>::
  ingest (const std::string& source)
  {
    co_return co_await seedbox_->add (source, config_.tag);
  }
}
