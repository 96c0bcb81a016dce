#include <repopack/download/download-orchestrator.hxx>
#include <repopack/http/http-stub.test.hxx>
#include <repopack/repopack-error.hxx>

#include <set>
#include <chrono>
#include <cassert>
#include <fstream>
#include <iostream>
#include <iterator>
#include <algorithm>
#include <stdexcept>
#include <filesystem>

#include <boost/asio/steady_timer.hpp>

using namespace std;
using namespace repopack;

namespace fs = std::filesystem;

// Fetcher that takes a millisecond per file, keeps track of how many fetches
// are in flight, and can request the cancellation on the n-th call.
//
struct fake_fetcher
{
  explicit
  fake_fetcher (asio::io_context& c): ioc (c) {}

  asio::awaitable<string>
  fetch (string path, const repo_locator&)
  {
    ++calls;

    if (cancel != nullptr && calls == cancel_at)
      cancel->request ();

    ++active;
    peak = max (peak, active);

    asio::steady_timer t (ioc, chrono::milliseconds (1));
    co_await t.async_wait (asio::use_awaitable);

    --active;

    if (failing.count (path) != 0)
      throw download_failed (path, "HTTP 500 Internal Server Error");

    co_return "content of " + path;
  }

  asio::io_context& ioc;
  set<string> failing;

  cancellation* cancel = nullptr;
  size_t cancel_at = 0;

  size_t calls = 0;
  size_t active = 0;
  size_t peak = 0;
};

using orchestrator = basic_download_orchestrator<fake_fetcher>;

static string
read_file (const fs::path& p)
{
  ifstream ifs (p, ios::binary);
  return string (istreambuf_iterator<char> (ifs), istreambuf_iterator<char> ());
}

static fs::path
scratch (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("repopack-download-test-" + n));
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static repo_locator
locator ()
{
  repo_locator l;
  l.owner = "owner";
  l.repo = "repo";
  l.ref = "main";
  l.dir = "docs";
  return l;
}

static vector<string>
files (size_t n)
{
  vector<string> r;
  for (size_t i (0); i != n; ++i)
    r.push_back ("docs/f" + to_string (i) + ".txt");
  return r;
}

static download_options
options (const fs::path& out, size_t n, bool resume)
{
  download_options o;
  o.output = out;
  o.anchor = "docs";
  o.concurrency = n;
  o.resume = resume;
  return o;
}

static void
test_resume ()
{
  fs::path d (scratch ("resume"));

  fs::create_directories (d / "docs");
  for (size_t i (0); i != 4; ++i)
    ofstream (d / "docs" / ("f" + to_string (i) + ".txt")) << "old";

  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;

  repo_locator l (locator ());
  download_result r (
    run_await (ioc, o.run (l, files (10), options (d, 3, true), c)));

  assert (r.total == 10);
  assert (r.skipped == 4);
  assert (r.downloaded == 6);
  assert (r.failed == 0);
  assert (r.failures.empty ());
  assert (!r.cancelled);
  assert (r.incomplete () == 0);

  assert (f.calls == 6);
  assert (f.peak >= 1 && f.peak <= 3);

  // Skipped files are left alone.
  //
  assert (read_file (d / "docs" / "f0.txt") == "old");
  assert (read_file (d / "docs" / "f9.txt") == "content of docs/f9.txt");

  fs::remove_all (d);
}

static void
test_no_resume ()
{
  fs::path d (scratch ("no-resume"));

  fs::create_directories (d / "docs");
  ofstream (d / "docs" / "f0.txt") << "old";

  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;

  repo_locator l (locator ());
  download_result r (
    run_await (ioc, o.run (l, files (3), options (d, 1, false), c)));

  assert (r.downloaded == 3 && r.skipped == 0);
  assert (f.peak == 1);
  assert (read_file (d / "docs" / "f0.txt") == "content of docs/f0.txt");

  fs::remove_all (d);
}

static void
test_failures ()
{
  fs::path d (scratch ("failures"));

  asio::io_context ioc;
  fake_fetcher f (ioc);
  f.failing.insert ("docs/b.txt");
  orchestrator o (ioc, f);
  cancellation c;

  // The last one does not fall under the anchor.
  //
  repo_locator l (locator ());
  download_result r (
    run_await (ioc,
               o.run (l,
                      {"docs/a.txt", "docs/b.txt", "docs/c.txt", "other/x.txt"},
                      options (d, 2, false),
                      c)));

  assert (r.downloaded == 2);
  assert (r.failed == 2);
  assert (r.failures.size () == 2);
  assert (r.incomplete () == 2);
  assert (!r.cancelled);

  for (const download_failure& df: r.failures)
  {
    if (df.path == "docs/b.txt")
      assert (df.kind == error_kind::download_failed);
    else
    {
      assert (df.path == "other/x.txt");
      assert (df.kind == error_kind::path_traversal);
    }
  }

  assert (fs::exists (d / "docs" / "a.txt"));
  assert (!fs::exists (d / "docs" / "b.txt"));
  assert (!fs::exists (d / "x.txt"));

  fs::remove_all (d);
}

static void
test_cancel ()
{
  fs::path d (scratch ("cancel"));

  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;

  f.cancel = &c;
  f.cancel_at = 2;

  repo_locator l (locator ());
  download_result r (
    run_await (ioc, o.run (l, files (10), options (d, 3, false), c)));

  assert (r.cancelled);
  assert (r.downloaded + r.skipped + r.failed <= 10);
  assert (r.incomplete () == 10 - r.downloaded - r.skipped);
  assert (r.incomplete () >= 7);

  // Only the units that had a slot when it happened got to fetch and they
  // ran to completion.
  //
  assert (f.calls <= 3);
  assert (f.active == 0);

  fs::remove_all (d);
}

static void
test_cancel_before ()
{
  fs::path d (scratch ("cancel-before"));

  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;
  assert (c.request ());
  assert (!c.request ());

  repo_locator l (locator ());
  download_result r (
    run_await (ioc, o.run (l, files (5), options (d, 3, false), c)));

  assert (r.cancelled);
  assert (r.cancelled_count == 5);
  assert (r.incomplete () == 5);
  assert (f.calls == 0);

  fs::remove_all (d);
}

static void
test_progress ()
{
  fs::path d (scratch ("progress"));

  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;

  vector<size_t> done;
  set<string> seen;
  o.set_completion_callback (
    [&done, &seen] (const file_outcome& fo, size_t n, size_t total)
    {
      assert (total == 4);
      assert (fo.kind == outcome_kind::downloaded);
      assert (fs::exists (fo.target));
      done.push_back (n);
      seen.insert (fo.path);
    });

  repo_locator l (locator ());
  run_await (ioc, o.run (l, files (4), options (d, 2, false), c));

  assert ((done == vector<size_t> {1, 2, 3, 4}));
  assert (seen.size () == 4);

  fs::remove_all (d);
}

static void
test_empty ()
{
  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;

  repo_locator l (locator ());
  download_result r (
    run_await (ioc, o.run (l, {}, options ("unused", 3, false), c)));

  assert (r.total == 0 && r.incomplete () == 0);
  assert (!r.cancelled);

  // Interrupted before anything was listed.
  //
  assert (c.request ());
  r = run_await (ioc, o.run (l, {}, options ("unused", 3, false), c));
  assert (r.total == 0);
  assert (r.cancelled);
}

static void
test_invalid ()
{
  asio::io_context ioc;
  fake_fetcher f (ioc);
  orchestrator o (ioc, f);
  cancellation c;

  repo_locator l (locator ());

  try
  {
    run_await (ioc, o.run (l, files (1), options ("unused", 0, false), c));
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

int
main ()
{
  test_resume ();
  test_no_resume ();
  test_failures ();
  test_cancel ();
  test_cancel_before ();
  test_progress ();
  test_empty ();
  test_invalid ();
}
