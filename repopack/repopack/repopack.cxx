#include <string>
#include <cstdint>
#include <cstdlib>
#include <csignal>
#include <utility>
#include <optional>
#include <iostream>
#include <exception>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include <repopack/repopack-error.hxx>
#include <repopack/repopack-fetch.hxx>
#include <repopack/repopack-options.hxx>
#include <repopack/output/output-writer.hxx>

#include <repopack/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace repopack
{
  // Exit status of a run that was interrupted (128 + SIGINT).
  //
  static const int cancelled_status (130);

  enum class verbosity
  {
    quiet,
    normal,
    verbose
  };

  // Map the command line to the fetch settings.
  //
  static fetch_settings
  make_settings (const options& opt, string locator)
  {
    fetch_settings s;
    s.locator = move (locator);

    if (opt.token_specified ())
      s.token = opt.token ();
    else if (const char* t = getenv ("GITHUB_TOKEN"))
      s.token = string (t);

    // An empty token is as good as none.
    //
    if (s.token && s.token->empty ())
      s.token = nullopt;

    s.output = fs::path (opt.output ());
    s.jobs = opt.jobs ();
    s.dry_run = opt.dry_run ();
    s.resume = opt.resume ();

    if (opt.api_url_specified ())
      s.api_url = opt.api_url ();

    if (opt.raw_url_specified ())
      s.raw_url = opt.raw_url ();

    if (opt.media_url_specified ())
      s.media_url = opt.media_url ();

    // The options are in seconds, the transport wants milliseconds.
    //
    s.http.connect_timeout = opt.connect_timeout () * 1000;
    s.http.request_timeout = opt.request_timeout () * 1000;
    s.http.user_agent = "repopack/" REPOPACK_VERSION_ID;

    if (opt.ca_file_specified ())
      s.http.ssl_cert_file = opt.ca_file ();

    return s;
  }

  // List what would be written where.
  //
  static void
  print_plan (ostream& o, const fetch_report& r, const fs::path& output)
  {
    string anchor (r.locator.anchor ());

    for (const string& f: r.files)
    {
      try
      {
        o << f << " -> " << output_path (anchor, f, output).string () << '\n';
      }
      catch (const path_traversal& e)
      {
        o << f << " -> (skipped: " << e.what () << ")\n";
      }
    }
  }

  // Failure causes are not repeated here: in the verbose mode they are
  // printed as the files complete.
  //
  static void
  print_summary (ostream& o, const download_result& r, const fs::path& output)
  {
    o << "downloaded " << r.downloaded << " of " << r.total << " file(s) to "
      << fs::absolute (output).lexically_normal ().string ();

    if (r.skipped != 0)
      o << ", " << r.skipped << " skipped";

    if (r.failed != 0)
      o << ", " << r.failed << " failed";

    o << '\n';
  }

  static void
  print_quota (ostream& o, const github_rate_limit& rl)
  {
    o << "info: " << rl.remaining;

    if (rl.limit != 0)
      o << " of " << rl.limit;

    o << " API request(s) remaining";

    if (uint64_t s = rl.seconds_until_reset ())
      o << ", resets in " << (s + 59) / 60 << " minute(s)";

    o << '\n';
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace repopack;

  try
  {
    // Leave the locator in argv.
    //
    options opt (argc,
                 argv,
                 true,
                 cli::unknown_mode::fail,
                 cli::unknown_mode::skip);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "repopack " << REPOPACK_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: repopack [options] <locator>" << "\n"
        << "options:"                            << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (argc != 2)
    {
      cerr << "error: " << (argc < 2 ? "missing" : "more than one")
           << " repository locator" << "\n"
           << "  info: run 'repopack --help' for more information" << endl;
      return 1;
    }

    if (opt.verbose () && opt.quiet ())
    {
      cerr << "error: --verbose and --quiet are mutually exclusive" << endl;
      return 1;
    }

    if (opt.jobs () == 0)
    {
      cerr << "error: --jobs must be at least 1" << endl;
      return 1;
    }

    verbosity v (opt.quiet ()   ? verbosity::quiet   :
                 opt.verbose () ? verbosity::verbose :
                                  verbosity::normal);

    // Every file costs at least one request against the same quota.
    //
    if (opt.jobs () > 100 && v != verbosity::quiet)
      cerr << "warning: " << opt.jobs () << " parallel downloads will likely "
           << "hit the rate limit" << endl;

    fetch_settings s (make_settings (opt, argv[1]));
    fs::path output (s.output);

    asio::io_context ioc;
    cancellation cancel;
    fetch_coordinator fc (ioc, move (s));

    fc.set_listing_callback (
      [v] (const repo_locator& l, const vector<string>& files)
      {
        if (v == verbosity::verbose)
          cout << "fetching " << l << ": " << files.size () << " file(s)"
               << endl;
      });

    fc.set_completion_callback (
      [v] (const file_outcome& o, size_t n, size_t total)
      {
        if (v != verbosity::verbose)
          return;

        cout << '[' << n << '/' << total << "] " << o.path;

        if (o.kind != outcome_kind::downloaded)
          cout << " (" << o.kind << ')';

        if (o.failure)
          cout << ": " << o.failure->message;

        cout << endl;
      });

    // Interrupt.
    //
    // Request the cancellation and let the transfers in progress finish. The
    // run returns as soon as it notices. Only the first signal is ours: the
    // default disposition is restored so that another one terminates us.
    //
    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    signals.async_wait (
      [&signals, &cancel, v] (const boost::system::error_code& ec, int)
      {
        if (ec)
          return;

        signals.clear ();

        if (cancel.request () && v != verbosity::quiet)
          cerr << "\ninfo: interrupted, waiting for transfers in progress"
               << endl;
      });

    optional<fetch_report> report;
    exception_ptr failure;

    asio::co_spawn (
      ioc,
      fc.run (cancel),
      [&report, &failure, &signals] (exception_ptr ex, fetch_report r)
      {
        if (ex)
          failure = ex;
        else
          report = move (r);

        // Don't stop the context: cancelled units may still be writing.
        //
        signals.cancel ();
      });

    ioc.run ();

    if (failure)
      rethrow_exception (failure);

    if (!report->result)
    {
      if (v != verbosity::quiet)
        print_plan (cout, *report, output);

      if (v == verbosity::verbose && report->rate_limit)
        print_quota (cout, *report->rate_limit);

      return 0;
    }

    const download_result& r (*report->result);

    if (v != verbosity::quiet)
      print_summary (cout, r, output);

    if (v == verbosity::verbose && report->rate_limit)
      print_quota (cout, *report->rate_limit);

    if (r.cancelled)
    {
      cerr << "error: cancelled, " << r.incomplete () << " of " << r.total
           << " file(s) incomplete" << endl;

      return cancelled_status;
    }

    if (r.failed != 0 && v == verbosity::normal)
      cerr << "warning: " << r.failed << " file(s) failed to download" << "\n"
           << "  info: run with --verbose for details" << endl;

    return 0;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const repopack::error& ex)
  {
    cerr << "error: " << ex.what () << "\n";

    if (!ex.hint ().empty ())
      cerr << "  info: " << ex.hint () << "\n";

    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
