#include <anipler/anipler-config.hxx>

#include <charconv>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <anipler/lifecycle/lifecycle-error.hxx>

using namespace std;

namespace anipler
{
  optional<string>
  process_env (const char* n)
  {
    if (const char* v = getenv (n))
      return string (v);

    return nullopt;
  }

  pair<string, uint16_t>
  parse_listen_address (const string& a)
  {
    size_t p (a.rfind (':'));

    if (p == string::npos || p == 0 || p + 1 == a.size ())
      throw invalid_argument ("expected <host>:<port> instead of '" + a + "'");

    string h (a, 0, p);

    // [::1]:8080
    //
    if (h.size () > 1 && h.front () == '[' && h.back () == ']')
      h = h.substr (1, h.size () - 2);

    unsigned long v (0);
    const char* b (a.data () + p + 1);
    const char* e (a.data () + a.size ());
    auto r (from_chars (b, e, v));

    if (r.ec != errc () || r.ptr != e || v > 65535)
      throw invalid_argument ("invalid port in '" + a + "'");

    return {move (h), static_cast<uint16_t> (v)};
  }

  namespace
  {
    // Environment reader that turns every problem into a fatal error
    // naming the variable.
    //
    class reader
    {
    public:
      explicit
      reader (const env_lookup& l): lookup_ (l) {}

      optional<string>
      get (const char* n) const
      {
        optional<string> v (lookup_ (n));

        if (v && v->empty ())
          v = nullopt;

        return v;
      }

      string
      require (const char* n) const
      {
        if (optional<string> v = get (n))
          return *v;

        throw lifecycle_error (error_kind::fatal,
                               string (n) + " is not set");
      }

      string
      value (const char* n, const string& d) const
      {
        optional<string> v (get (n));
        return v ? *v : d;
      }

      int64_t
      number (const char* n, int64_t d) const
      {
        optional<string> v (get (n));

        if (!v)
          return d;

        int64_t r (0);
        const char* b (v->data ());
        const char* e (v->data () + v->size ());
        auto x (from_chars (b, e, r));

        if (x.ec != errc () || x.ptr != e || r < 0)
          throw lifecycle_error (error_kind::fatal,
                                 string (n) + ": invalid number '" + *v + "'");

        return r;
      }

      // Read seconds, return milliseconds.
      //
      int64_t
      millis (const char* n, int64_t d) const
      {
        int64_t r (number (n, d));

        if (r > numeric_limits<int64_t>::max () / 1000)
          throw lifecycle_error (error_kind::fatal,
                                 string (n) + ": value " + to_string (r) +
                                 " is out of range");

        return r * 1000;
      }

      bool
      flag (const char* n) const
      {
        optional<string> v (get (n));

        if (!v || *v == "0" || *v == "false")
          return false;

        if (*v == "1" || *v == "true")
          return true;

        throw lifecycle_error (error_kind::fatal,
                               string (n) + ": expected true or false");
      }

    private:
      const env_lookup& lookup_;
    };
  }

  daemon_config
  load_daemon_config (const options& o, const env_lookup& l)
  {
    reader env (l);
    daemon_config c;

    c.verbose = o.verbose ();
    c.dry_run = o.dry_run () || env.flag ("ANIPLER_DRY_RUN");
    c.stateless = o.stateless () || env.flag ("ANIPLER_STATELESS");

    c.storage = o.storage_specified ()
      ? fs::path (o.storage ())
      : fs::path (env.require ("ANIPLER_STORAGE_PATH"));

    if (c.storage.empty ())
      throw lifecycle_error (error_kind::fatal, "empty storage path");

    string a (o.listen_specified ()
              ? o.listen ()
              : env.value ("ANIPLER_API_ADDR", "127.0.0.1:8080"));

    try
    {
      tie (c.listen_host, c.listen_port) = parse_listen_address (a);
    }
    catch (const invalid_argument& e)
    {
      throw lifecycle_error (error_kind::fatal,
                             string ("listen address: ") + e.what ());
    }

    c.api_key = env.require ("ANIPLER_API_KEY");

    c.qbit_url      = env.require ("ANIPLER_QBIT_URL");
    c.qbit_username = env.value ("ANIPLER_QBIT_USERNAME", "");
    c.qbit_password = env.value ("ANIPLER_QBIT_PASSWORD", "");

    engine_config& e (c.engine);
    e.artifacts_dir = c.storage / "artifacts";
    e.seedbox_endpoint = env.require ("ANIPLER_SEEDBOX_SSH_HOST");
    e.relay_endpoint = env.value ("ANIPLER_RELAY_ENDPOINT", "");
    e.tag = env.value ("ANIPLER_QBIT_TAG", "anipler");

    int64_t rl (env.number ("ANIPLER_RSYNC_SPEED_LIMIT", 0));

    if (rl > numeric_limits<uint32_t>::max ())
      throw lifecycle_error (error_kind::fatal,
                             "ANIPLER_RSYNC_SPEED_LIMIT is out of range");

    e.copy.rate_limit = static_cast<uint32_t> (rl);
    e.copy.timeout = chrono::seconds (env.number ("ANIPLER_RSYNC_TIMEOUT", 0));
    e.copy.connect_timeout =
      chrono::seconds (env.number ("ANIPLER_SSH_CONNECT_TIMEOUT", 30));
    e.copy.ssh_key = env.value ("ANIPLER_SEEDBOX_SSH_KEY", "");

    e.claim_lease = env.millis ("ANIPLER_CLAIM_LEASE", 21600);
    e.deleted_retention = env.millis ("ANIPLER_DELETED_RETENTION", 0);

    auto interval = [&env] (const char* n, int64_t d)
    {
      int64_t v (env.number (n, d));

      if (v == 0)
        throw lifecycle_error (error_kind::fatal, string (n) + " must be positive");

      return chrono::seconds (v);
    };

    c.pull_interval     = interval ("ANIPLER_PULL_INTERVAL", 3600);
    c.transfer_interval = interval ("ANIPLER_TRANSFER_INTERVAL", 7200);
    c.sweep_interval    = interval ("ANIPLER_SWEEP_INTERVAL", 900);

    // The chat surface needs both, or neither.
    //
    if (!o.no_bot ())
    {
      if (optional<string> t = env.get ("ANIPLER_TELEGRAM_BOT_TOKEN"))
      {
        string id (env.require ("ANIPLER_TELEGRAM_CHAT_ID"));

        int64_t v (0);
        auto x (from_chars (id.data (), id.data () + id.size (), v));

        if (x.ec != errc () || x.ptr != id.data () + id.size () || v == 0)
          throw lifecycle_error (error_kind::fatal,
                                 "ANIPLER_TELEGRAM_CHAT_ID: invalid chat id '" +
                                 id + "'");

        c.bot_token = move (*t);
        c.chat_id = v;
      }
    }

    return c;
  }
}
