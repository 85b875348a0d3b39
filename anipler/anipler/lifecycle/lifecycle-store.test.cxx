#include <anipler/lifecycle/lifecycle-store.hxx>

#include <cassert>
#include <iostream>
#include <filesystem>

using namespace std;
using namespace anipler;

namespace fs = std::filesystem;

template <typename F>
static void
expect (error_kind k, F&& f)
{
  try
  {
    f ();
    assert (false);
  }
  catch (const lifecycle_error& e)
  {
    assert (e.kind () == k);
  }
}

static task_fact
fact (const string& id, task_status s, const string& name = "")
{
  task_fact f;
  f.id = id;
  f.status = s;
  f.content_path = "/downloads/" + id;
  if (!name.empty ())
    f.name = name;
  f.size = 1024;
  f.added_on = 100;
  return f;
}

// Drive the store clock by hand so timestamps are predictable.
//
struct manual_clock
{
  shared_ptr<int64_t> t = make_shared<int64_t> (1000);

  int64_t
  operator() () const { return *t; }
};

static void
test_merge ()
{
  lifecycle_store s ("");
  manual_clock c;
  s.set_clock (c);

  assert (s.merge_tasks ({fact ("T1", task_status::downloading, "one")}) == 1);

  auto k (s.find_task ("T1"));
  assert (k && k->status () == task_status::downloading);
  assert (k->name () == "one");
  assert (k->last_seen_at () == 1000);

  // Same fact again: nothing changes except the refresh.
  //
  *c.t = 2000;
  assert (s.merge_tasks ({fact ("T1", task_status::downloading, "one")}) == 0);
  k = s.find_task ("T1");
  assert (k->last_seen_at () == 2000);
  assert (k->name () == "one");

  // Advance to seeding, then try to regress.
  //
  assert (s.merge_tasks ({fact ("T1", task_status::seeding)}) == 1);
  assert (s.merge_tasks ({fact ("T1", task_status::downloading)}) == 0);
  assert (s.find_task ("T1")->status () == task_status::seeding);

  // Absent fields stay put.
  //
  task_fact bare;
  bare.id = "T1";
  s.merge_tasks ({bare});
  k = s.find_task ("T1");
  assert (k->name () == "one");
  assert (k->content_path () == "/downloads/T1");
  assert (k->size () == 1024);

  // Facts without an id are dropped.
  //
  assert (s.merge_tasks ({task_fact ()}) == 0);
  assert (s.tasks ().size () == 1);
}

static void
test_candidates ()
{
  lifecycle_store s ("");

  s.merge_tasks ({fact ("T1", task_status::seeding),
                  fact ("T2", task_status::downloading),
                  fact ("T3", task_status::seeding)});

  auto cs (s.list_seeding_without_artifact ());
  assert (cs.size () == 2);

  s.begin_artifact ("T1", "/relay/T1");

  cs = s.list_seeding_without_artifact ();
  assert (cs.size () == 1 && cs[0].id () == "T3");
}

static void
test_begin ()
{
  lifecycle_store s ("");

  s.merge_tasks ({fact ("T1", task_status::seeding),
                  fact ("T2", task_status::seeding)});

  artifact a (s.begin_artifact ("T1", "/relay/T1"));
  assert (a.readiness () == artifact_readiness::pending);
  assert (a.ready_at ().null ());

  // Second begin for the same task and reuse of a path both conflict.
  //
  expect (error_kind::conflict, [&] { s.begin_artifact ("T1", "/relay/x"); });
  expect (error_kind::conflict, [&] { s.begin_artifact ("T2", "/relay/T1"); });
  expect (error_kind::not_found, [&] { s.begin_artifact ("T9", "/relay/T9"); });

  assert (s.list_pending ().size () == 1);
}

static void
test_transitions ()
{
  lifecycle_store s ("");
  manual_clock c;
  s.set_clock (c);

  s.merge_tasks ({fact ("T1", task_status::seeding)});

  expect (error_kind::not_found, [&] { s.mark_ready ("T1"); });

  s.begin_artifact ("T1", "/relay/T1");

  // No skipping.
  //
  expect (error_kind::invalid_transition, [&] { s.mark_claimed ("T1"); });
  expect (error_kind::invalid_transition, [&] { s.mark_deleted ("T1"); });

  *c.t = 1100;
  artifact a (s.mark_ready ("T1"));
  assert (a.readiness () == artifact_readiness::ready);
  assert (*a.ready_at () == 1100);
  assert (a.relay_path () == "/relay/T1");
  assert (s.list_ready ().size () == 1);

  // No going back or repeating.
  //
  expect (error_kind::invalid_transition, [&] { s.mark_ready ("T1"); });

  *c.t = 1200;
  a = s.mark_claimed ("T1");
  assert (*a.claimed_at () == 1200);
  assert (s.list_claimed_unreclaimed ().size () == 1);
  assert (s.list_ready ().empty ());

  *c.t = 1300;
  a = s.mark_deleted ("T1");
  assert (a.readiness () == artifact_readiness::deleted);
  assert (*a.deleted_at () == 1300);
  assert (*a.ready_at () == 1100);
  assert (a.relay_path () == "/relay/T1");

  expect (error_kind::invalid_transition, [&] { s.mark_deleted ("T1"); });
  expect (error_kind::invalid_transition, [&] { s.mark_ready ("T1"); });

  // A deleted artifact still keeps the task out of the candidates.
  //
  assert (s.list_seeding_without_artifact ().empty ());
}

static void
test_clock ()
{
  lifecycle_store s ("");
  manual_clock c;
  s.set_clock (c);

  assert (s.now () == 1000);

  // Wall clock stepping back is absorbed.
  //
  *c.t = 500;
  assert (s.now () == 1000);

  *c.t = 1500;
  assert (s.now () == 1500);
}

static void
test_reserve ()
{
  lifecycle_store s ("");
  manual_clock c;
  s.set_clock (c);

  s.merge_tasks ({fact ("T1", task_status::seeding)});
  s.begin_artifact ("T1", "/relay/T1");

  expect (error_kind::not_found, [&] { s.reserve ("T1", 100); });

  s.mark_ready ("T1");

  artifact a (s.reserve ("T1", 100));
  assert (*a.reserved_at () == 1000);
  assert (a.readiness () == artifact_readiness::ready);

  // Held by the first reservation.
  //
  *c.t = 1050;
  expect (error_kind::conflict, [&] { s.reserve ("T1", 100); });

  // Lease ran out: the first puller is presumed gone.
  //
  *c.t = 1100;
  a = s.reserve ("T1", 100);
  assert (*a.reserved_at () == 1100);

  s.mark_claimed ("T1");
  expect (error_kind::conflict, [&] { s.reserve ("T1", 100); });
  expect (error_kind::not_found, [&] { s.reserve ("T9", 100); });
}

static void
test_purge ()
{
  lifecycle_store s ("");
  manual_clock c;
  s.set_clock (c);

  s.merge_tasks ({fact ("T1", task_status::seeding),
                  fact ("T2", task_status::seeding)});

  for (const char* id: {"T1", "T2"})
  {
    s.begin_artifact (id, string ("/relay/") + id);
    s.mark_ready (id);
    s.mark_claimed (id);
    s.mark_deleted (id);
  }

  // Retention disabled.
  //
  *c.t = 100000;
  assert (s.purge_deleted (0) == 0);

  // T2 is still being reported by the seedbox.
  //
  *c.t = 50000;
  s.merge_tasks ({fact ("T2", task_status::seeding)});

  *c.t = 100000;
  assert (s.purge_deleted (60000) == 1);
  assert (!s.find_artifact ("T1"));
  assert (!s.find_task ("T1"));
  assert (s.find_artifact ("T2"));

  // Long after the retention T2 is still in the latest listing: purging it
  // would relay it again on the next pull.
  //
  *c.t = 200000;
  assert (s.purge_deleted (60000) == 0);
  assert (s.find_artifact ("T2") && s.find_task ("T2"));

  // A listing without it.
  //
  *c.t = 210000;
  s.merge_tasks ({fact ("T3", task_status::downloading)});
  assert (s.purge_deleted (60000) == 1);
  assert (!s.find_artifact ("T2") && !s.find_task ("T2"));
  assert (s.find_task ("T3"));
}

static void
test_jobs ()
{
  lifecycle_store s ("");

  auto id (s.begin_job_run ("pull"));
  auto rs (s.job_runs ());
  assert (rs.size () == 1);
  assert (rs[0].job () == "pull");
  assert (rs[0].finished_at ().null ());

  s.finish_job_run (id, "merged 3");
  rs = s.job_runs ();
  assert (!rs[0].finished_at ().null ());
  assert (rs[0].outcome () == "merged 3");

  expect (error_kind::not_found, [&] { s.finish_job_run (id + 10, "x"); });
}

static void
test_persistence ()
{
  fs::path d (fs::temp_directory_path () / "anipler-store-test");
  fs::remove_all (d);

  int64_t h (0);
  {
    lifecycle_store s (d);
    assert (s.path () == d / "anipler.db");
    assert (s.check ());

    h = s.import_horizon ();
    assert (h > 0);

    s.merge_tasks ({fact ("T1", task_status::seeding)});
    s.begin_artifact ("T1", (d / "artifacts" / "T1").string ());
    s.mark_ready ("T1");
  }

  // Reopen: records survive and the horizon is not reset.
  //
  {
    lifecycle_store s (d);
    assert (s.import_horizon () == h);
    assert (s.list_ready ().size () == 1);
    assert (s.find_task ("T1")->status () == task_status::seeding);

    s.setting_value ("k", "v1");
    s.setting_value ("k", "v2");
    assert (*s.setting_value ("k") == "v2");
    assert (!s.setting_value ("missing"));

    s.vacuum ();
    assert (s.check ());
  }

  fs::remove_all (d);
}

int
main ()
{
  test_merge ();
  test_candidates ();
  test_begin ();
  test_transitions ();
  test_clock ();
  test_reserve ();
  test_purge ();
  test_jobs ();
  test_persistence ();
}
