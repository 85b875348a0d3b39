#include <chrono>
#include <cstdlib>
#include <iostream>
#include <exception>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>

#include <anipler/lifecycle/lifecycle-error.hxx>
#include <anipler/transfer/transfer-executor.hxx>

#include <puller/puller-client.hxx>
#include <puller/puller-options.hxx>
#include <puller/puller-sync.hxx>

#include <anipler/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace puller
{
  // Option value, or the environment variable if the option is absent.
  //
  static string
  setting (bool specified, const string& value, const char* env, bool required)
  {
    if (specified)
      return value;

    if (const char* v = getenv (env); v != nullptr && *v != '\0')
      return v;

    if (required)
      throw anipler::lifecycle_error (
        anipler::error_kind::fatal,
        string (env) + " is not set and no option was given");

    return string ();
  }
}

int
main (int argc, char* argv[])
{
  using namespace puller;

  try
  {
    cli::argv_file_scanner scan (argc, argv, "--options-file");
    options opt (scan);

    if (opt.version ())
    {
      cout << "anipler-puller " << ANIPLER_VERSION_ID << "\n";
      return 0;
    }

    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: anipler-puller [options]" << "\n"
        << "options:"                        << "\n";

      opt.print_usage (o);

      return 0;
    }

    string url (setting (opt.api_url_specified (), opt.api_url (),
                         "ANIPLER_API_URL", true));
    string key (setting (opt.api_key_specified (), opt.api_key (),
                         "ANIPLER_API_KEY", true));

    sync_config c;
    c.ssh_host = setting (opt.ssh_host_specified (), opt.ssh_host (),
                          "ANIPLER_SSH_HOST", false);
    c.destination = fs::absolute (fs::path (opt.destination ()));
    c.copy.rate_limit = opt.speed_limit ();
    c.copy.timeout = chrono::seconds (opt.timeout ());
    c.copy.ssh_key = opt.ssh_key ();

    if (!fs::is_directory (c.destination))
    {
      cerr << "error: destination " << c.destination.string ()
           << " is not a directory" << endl;
      return 1;
    }

    asio::io_context ioc;

    relay_client rc (ioc, url, key);
    rc.set_verbose (opt.verbose ());

    anipler::transfer_executor x (ioc);
    x.set_verbose (opt.verbose ());

    int exit_code (0);

    asio::co_spawn (
      ioc,
      sync_artifacts (rc, x, c),
      [&exit_code] (exception_ptr ex, sync_report r)
      {
        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << endl;
          }

          exit_code = 1;
          return;
        }

        cout << to_string (r) << endl;

        if (r.failed != 0)
          exit_code = 1;
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
