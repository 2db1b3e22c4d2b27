#include <thread>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <algorithm>
#include <exception>
#include <filesystem>

#ifdef _WIN32
#  include <io.h>
#  include <cstdio>
#else
#  include <unistd.h>
#endif

#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/co_spawn.hpp>

#include <mfdl/mfdl-options.hxx>
#include <mfdl/mfdl-download.hxx>
#include <mfdl/mfdl-progress.hxx>
#include <mfdl/mfdl-completion.hxx>

#include <mfdl/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace mfdl
{
  // Replace a leading ~ with the home directory. Leave ~user alone.
  //
  static fs::path
  expand_home (const string& p)
  {
    if (p.empty () || p[0] != '~' || (p.size () > 1 && p[1] != '/'))
      return fs::path (p);

#ifdef _WIN32
    const char* h (getenv ("USERPROFILE"));
#else
    const char* h (getenv ("HOME"));
#endif

    if (h == nullptr || *h == '\0')
      throw runtime_error ("unable to expand '" + p + "': home directory "
                           "is unknown");

    return p.size () > 2 ? fs::path (h) / p.substr (2) : fs::path (h);
  }

  static bool
  stdout_terminal ()
  {
#ifdef _WIN32
    return _isatty (_fileno (stdout)) != 0;
#else
    return isatty (STDOUT_FILENO) != 0;
#endif
  }

  // Run the downloads and stop the display, whatever the outcome, before
  // the caller gets to write to the terminal.
  //
  static asio::awaitable<download_summary>
  run (download_coordinator& dc, progress_coordinator* pc)
  {
    download_summary s;
    exception_ptr e;

    try
    {
      s = co_await dc.execute_all ();
    }
    catch (const exception&)
    {
      e = current_exception ();
    }

    if (pc != nullptr)
      co_await pc->stop ();

    if (e)
      rethrow_exception (e);

    co_return s;
  }
}

int
main (int argc, char* argv[])
{
  using namespace mfdl;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "mfdl " << MFDL_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: mfdl [options] --urls <list>" << "\n"
        << "options:"                            << "\n";

      opt.print_usage (o);

      return 0;
    }

    // Handle --completion. It has nothing to do with downloading so the
    // other options are not even looked at.
    //
    if (opt.completion_specified ())
    {
      print_completion (cout, to_completion_shell (opt.completion ()));
      return 0;
    }

    if (!opt.urls_specified ())
    {
      cerr << "error: no URLs specified" << "\n"
           << "  info: use --urls to specify a comma-separated list" << endl;
      return 1;
    }

    vector<string> rejected;
    vector<string> urls (split_url_list (opt.urls (), &rejected));

    for (const string& r: rejected)
      cerr << "warning: ignoring invalid URL '" << r << "'" << endl;

    if (urls.empty ())
    {
      cerr << "error: no valid URLs in '" << opt.urls () << "'" << endl;
      return 1;
    }

    if (opt.workers () == 0)
    {
      cerr << "error: --workers must be greater than 0" << endl;
      return 1;
    }

    if (opt.max_retries () == 0)
    {
      cerr << "error: --max-retries must be greater than 0" << endl;
      return 1;
    }

    optional<uint32_t> connect_ms (
      timeout_milliseconds (opt.connect_timeout ()));
    optional<uint32_t> request_ms (timeout_milliseconds (opt.timeout ()));

    if (!connect_ms)
    {
      cerr << "error: --connect-timeout value " << opt.connect_timeout ()
           << " is too large" << endl;
      return 1;
    }

    if (!request_ms)
    {
      cerr << "error: --timeout value " << opt.timeout () << " is too large"
           << endl;
      return 1;
    }

    // Map the command line options to the engine and client configuration.
    //
    download_options dopt;
    dopt.destination = expand_home (opt.dest ());
    dopt.workers = opt.workers ();
    dopt.clean = opt.clean ();
    dopt.retry.max_attempts = opt.max_retries ();

    http_client_traits<> copt;
    copt.connect_timeout = *connect_ms;
    copt.request_timeout = *request_ms;
    copt.verify_ssl = !opt.insecure ();

    bool show (!opt.no_progress () && stdout_terminal ());

    // The downloads themselves are mostly waiting on the network, so there
    // is no point in more threads than either workers or cores.
    //
    size_t threads (
      min<size_t> (dopt.workers,
                   max<size_t> (1, thread::hardware_concurrency ())));

    asio::io_context ioc (static_cast<int> (threads));

    progress_coordinator pc (ioc);
    download_coordinator dc (ioc,
                             dopt,
                             copt,
                             show ? &pc : nullptr,
                             opt.verbose ());

    for (string& u: urls)
      dc.queue_download (move (u));

    // A display that cannot start means a broken setup, not something to
    // carry on without.
    //
    if (show)
      pc.start ();

    optional<download_summary> summary;
    exception_ptr failure;

    asio::co_spawn (
      asio::make_strand (ioc),
      run (dc, show ? &pc : nullptr),
      [&summary, &failure] (exception_ptr e, download_summary s)
      {
        if (e)
          failure = e;
        else
          summary = move (s);
      });

    {
      vector<jthread> pool;
      pool.reserve (threads - 1);

      for (size_t i (1); i < threads; ++i)
        pool.emplace_back ([&ioc] {ioc.run ();});

      ioc.run ();
    }

    if (failure)
      rethrow_exception (failure);

    const download_summary& s (*summary);

    // The display only showed the most recent failures so list them all
    // now that it is gone.
    //
    if (show)
    {
      for (const download_error& e: s.errors)
        cerr << "error: " << e << endl;
    }

    cerr << "info: downloaded " << s.files << " files of size "
         << human_size (s.total_bytes) << " to "
         << dopt.destination.string () << " using " << dopt.workers
         << " workers" << endl;

    if (s.failed != 0)
      cerr << "warning: " << s.failed << " of " << s.files
           << " downloads failed" << endl;

    return 0;
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
