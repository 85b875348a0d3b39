#include <anipler/lifecycle/lifecycle-store.hxx>

#include <chrono>
#include <sstream>

#include <anipler/lifecycle/lifecycle-types-odb.hxx>

namespace anipler
{
  std::int64_t
  system_time_ms ()
  {
    using namespace std::chrono;

    return duration_cast<milliseconds> (
      system_clock::now ().time_since_epoch ()).count ();
  }

  std::string
  transition_message (const artifact& a, artifact_readiness e)
  {
    std::ostringstream os;
    os << "artifact for task " << a.task_id () << " is " << a.readiness ()
       << ", expected " << e;
    return os.str ();
  }

  template class basic_lifecycle_store<lifecycle_store_traits<>>;
}
