#include <anipler/lifecycle/lifecycle-engine.hxx>

#include <cctype>
#include <sstream>

using namespace std;

namespace anipler
{
  string
  to_string (const pull_report& r)
  {
    ostringstream os;
    os << "listed " << r.listed << " torrents, merged " << r.merged;

    if (r.ignored != 0)
      os << ", ignored " << r.ignored << " older than the import horizon";

    return os.str ();
  }

  string
  to_string (const transfer_report& r)
  {
    ostringstream os;
    os << "transferred " << r.transferred << ", failed " << r.failed;

    if (r.cancelled != 0)
      os << ", cancelled " << r.cancelled;

    if (r.skipped != 0)
      os << ", skipped " << r.skipped;

    os << ", pending " << r.pending;

    for (const string& f: r.failures)
      os << "\n- " << f;

    return os.str ();
  }

  string
  to_string (const sweep_report& r)
  {
    ostringstream os;
    os << "reclaimed " << r.reclaimed << ", failed " << r.failed;

    if (r.leftovers != 0)
      os << ", removed " << r.leftovers << " leftovers";

    if (r.purged != 0)
      os << ", purged " << r.purged << " records";

    return os.str ();
  }

  static void
  list_tasks (ostringstream& os, const char* title, const vector<task>& ks)
  {
    if (ks.empty ())
      return;

    if (os.tellp () != 0)
      os << "\n";

    os << title << ":\n";

    for (const task& k: ks)
      os << "\n- " << (k.name ().empty () ? k.id () : k.name ())
         << "\n  (" << k.id () << ")\n";
  }

  string
  to_string (const status_report& r)
  {
    ostringstream os;

    list_tasks (os, "Ready torrents", r.awaiting);
    list_tasks (os, "Pending transfers", r.pending);
    list_tasks (os, "Available artifacts", r.ready);

    string s (os.str ());
    return s.empty () ? "No torrents or artifacts available" : s;
  }

  fs::path
  relay_path (const fs::path& dir, const string& id)
  {
    string n;
    n.reserve (id.size ());

    for (char c: id)
    {
      unsigned char u (static_cast<unsigned char> (c));
      n += isalnum (u) || c == '-' || c == '_' || c == '.' ? c : '_';
    }

    // Keep clear of hidden names (staging and dot entries).
    //
    if (n.empty () || n.front () == '.')
      n.insert (n.begin (), '_');

    return dir / n;
  }

  template class basic_lifecycle_engine<lifecycle_engine_traits<>>;
}
