#include <repopack/github/github-api.hxx>
#include <repopack/http/http-stub.test.hxx>
#include <repopack/repopack-error.hxx>

#include <chrono>
#include <string>
#include <cstdint>
#include <cassert>
#include <iostream>

using namespace std;
using namespace repopack;

using stub_api = basic_github_api<http_stub>;

static const string api ("https://api.github.com");
static const string tree_url (api + "/repos/o/r/git/trees/main?recursive=1");

static github_retry_policy
no_delay ()
{
  github_retry_policy p;
  p.base_delay = chrono::milliseconds (0);
  p.max_delay = chrono::milliseconds (0);
  return p;
}

static void
test_endpoint ()
{
  github_endpoint e;

  assert (e.repo ("o", "r") == api + "/repos/o/r");
  assert (e.tree ("o", "r", "feature/x") ==
          api + "/repos/o/r/git/trees/feature/x?recursive=1");

  assert (e.contents ("o", "r", "a dir/sub", "feature/x") ==
          api + "/repos/o/r/contents/a%20dir/sub?ref=feature%2Fx");
  assert (e.contents ("o", "r", "", "main") ==
          api + "/repos/o/r/contents?ref=main");

  assert (e.raw ("o", "r", "main", "docs/read me.md") ==
          "https://raw.githubusercontent.com/o/r/main/docs/read%20me.md");
  assert (e.media ("o", "r", "main", "big.bin") ==
          "https://media.githubusercontent.com/media/o/r/main/big.bin");

  // Self-hosted, trailing slashes tolerated.
  //
  github_endpoint s ("https://git.example.org/api/v3/",
                     "https://git.example.org/raw/",
                     "https://git.example.org/media");
  assert (s.repo ("o", "r") == "https://git.example.org/api/v3/repos/o/r");
  assert (s.raw ("o", "r", "v1", "f") == "https://git.example.org/raw/o/r/v1/f");
}

static void
test_retry_delay ()
{
  github_retry_policy p;
  assert (p.delay (0) == chrono::milliseconds (500));
  assert (p.delay (1) == chrono::milliseconds (1000));
  assert (p.delay (2) == chrono::milliseconds (2000));
  assert (p.delay (10) == chrono::milliseconds (10000));
  assert (p.delay (100) == chrono::milliseconds (10000));
}

static void
test_tree ()
{
  asio::io_context ioc;
  http_stub http;
  stub_api a (http);
  a.set_token ("secret");

  http_headers h;
  h.set ("X-RateLimit-Limit", "5000");
  h.set ("X-RateLimit-Remaining", "4999");
  h.set ("X-RateLimit-Reset", "1700000000");
  h.set ("X-RateLimit-Used", "1");

  http.add (tree_url,
            make_response (http_status::ok,
                           R"({"sha":"abc","truncated":false,"tree":[
                                {"type":"tree","path":"docs"},
                                {"type":"blob","path":"docs/a.md","size":3}]})",
                           h));

  string o ("o"), r ("r"), ref ("main");
  github_tree t (run_await (ioc, a.get_tree (o, r, ref)));

  assert (!t.truncated);
  assert (t.entries.size () == 2);
  assert (t.entries[1].type == "blob");
  assert (t.entries[1].path == "docs/a.md");

  // Credentials and API headers went out.
  //
  const http_request& q (http.requests ().back ());
  assert (q.get_header ("Authorization") == "Bearer secret");
  assert (q.get_header ("Accept") == "application/vnd.github+json");
  assert (q.get_header ("X-GitHub-Api-Version") == "2022-11-28");
  assert (q.get_header ("User-Agent") == "repopack/0.1.0");

  assert (a.rate_limit ());
  assert (a.rate_limit ()->limit == 5000);
  assert (a.rate_limit ()->remaining == 4999);
  assert (a.rate_limit ()->reset == 1700000000u);
  assert (!a.rate_limit ()->is_exceeded ());
}

static void
test_contents ()
{
  asio::io_context ioc;
  http_stub http;
  stub_api a (http);

  string o ("o"), r ("r"), dir ("docs"), ref ("main");

  http.add (api + "/repos/o/r/contents/docs?ref=main",
            make_response (http_status::ok,
                           R"([{"type":"file","path":"docs/a.md"},
                               {"type":"dir","path":"docs/sub"},
                               {"type":"symlink","path":"docs/link"}])"));

  vector<github_entry> es (run_await (ioc, a.get_contents (o, r, dir, ref)));
  assert (es.size () == 3);
  assert (es[0].type == "file");
  assert (es[1].type == "dir");
  assert (es[1].path == "docs/sub");

  // A file comes back as a single object.
  //
  string file ("docs/a.md");
  http.add (api + "/repos/o/r/contents/docs/a.md?ref=main",
            make_response (http_status::ok,
                           R"({"type":"file","path":"docs/a.md"})"));

  es = run_await (ioc, a.get_contents (o, r, file, ref));
  assert (es.size () == 1);
  assert (es[0].path == "docs/a.md");

  // No credential, no header.
  //
  assert (!http.requests ().back ().has_header ("Authorization"));
}

static void
test_repository ()
{
  asio::io_context ioc;
  http_stub http;
  stub_api a (http);

  http.add (api + "/repos/o/r",
            make_response (http_status::ok,
                           R"({"full_name":"o/r","private":false,
                               "default_branch":"trunk"})"));

  string o ("o"), r ("r");
  github_repository repo (run_await (ioc, a.get_repository (o, r)));
  assert (repo.full_name == "o/r");
  assert (repo.default_branch == "trunk");
}

// Return the error kind that fetching the tree results in.
//
static error_kind
tree_error (http_response resp)
{
  asio::io_context ioc;
  http_stub http;
  stub_api a (http);
  a.set_retry_policy (no_delay ());

  http.add (tree_url, move (resp));

  string o ("o"), r ("r"), ref ("main");

  try
  {
    run_await (ioc, a.get_tree (o, r, ref));
  }
  catch (const error& e)
  {
    return e.kind ();
  }

  assert (false);
  return error_kind::io_error;
}

static void
test_status ()
{
  assert (tree_error (http_response (http_status::unauthorized)) ==
          error_kind::auth_required);

  assert (tree_error (http_response (http_status::forbidden)) ==
          error_kind::auth_required);

  http_headers h;
  h.set ("X-RateLimit-Remaining", "0");
  h.set ("X-RateLimit-Reset", "1700000000");
  assert (tree_error (make_response (http_status::forbidden, "", h)) ==
          error_kind::rate_limited);

  h.set ("X-RateLimit-Remaining", "12");
  assert (tree_error (make_response (http_status::forbidden, "", h)) ==
          error_kind::auth_required);

  assert (tree_error (http_response (http_status::too_many_requests)) ==
          error_kind::rate_limited);

  assert (tree_error (http_response (http_status::not_found)) ==
          error_kind::not_found);

  assert (tree_error (http_response (http_status::internal_server_error)) ==
          error_kind::transport_failure);

  // Malformed and unexpected payloads.
  //
  assert (tree_error (make_response (http_status::ok, "{not json")) ==
          error_kind::transport_failure);

  assert (tree_error (make_response (http_status::ok, R"({"sha":"x"})")) ==
          error_kind::transport_failure);
}

static void
test_details ()
{
  asio::io_context ioc;
  http_stub http;
  stub_api a (http);

  string o ("o"), r ("r"), ref ("main");

  http_headers h;
  h.set ("X-RateLimit-Remaining", "0");
  h.set ("X-RateLimit-Reset", "1700000000");
  http.add (tree_url, make_response (http_status::forbidden, "", h));

  try
  {
    run_await (ioc, a.get_tree (o, r, ref));
    assert (false);
  }
  catch (const rate_limited& e)
  {
    // Long gone, so no wait in the hint.
    //
    assert (e.reset () == "1700000000");
    assert (e.wait () && *e.wait () == 0);
    assert (e.hint ().find ("resets in") == string::npos);
  }

  // The reset is an hour from now.
  //
  uint64_t now (chrono::duration_cast<chrono::seconds> (
                  chrono::system_clock::now ().time_since_epoch ()).count ());

  http_headers soon;
  soon.set ("X-RateLimit-Limit", "60");
  soon.set ("X-RateLimit-Remaining", "0");
  soon.set ("X-RateLimit-Reset", to_string (now + 3600));

  string later ("later");
  http.add (api + "/repos/o/r/git/trees/later?recursive=1",
            make_response (http_status::forbidden, "", soon));

  try
  {
    run_await (ioc, a.get_tree (o, r, later));
    assert (false);
  }
  catch (const rate_limited& e)
  {
    assert (e.reset () == to_string (now + 3600));
    assert (e.wait () && *e.wait () > 3500 && *e.wait () <= 3600);
    assert (e.hint ().find ("resets in 60 minute(s)") != string::npos);
  }

  // The snapshot is taken from error responses too.
  //
  assert (a.rate_limit ());
  assert (a.rate_limit ()->limit == 60);
  assert (a.rate_limit ()->is_exceeded ());

  // Exhausted without saying when it resets.
  //
  http_headers bare;
  bare.set ("X-RateLimit-Remaining", "0");

  string unknown ("unknown");
  http.add (api + "/repos/o/r/git/trees/unknown?recursive=1",
            make_response (http_status::forbidden, "", bare));

  try
  {
    run_await (ioc, a.get_tree (o, r, unknown));
    assert (false);
  }
  catch (const rate_limited& e)
  {
    assert (e.reset () == "unknown");
    assert (!e.wait ());
  }

  http_headers ra;
  ra.set ("Retry-After", "60");
  string other ("other");
  http.add (api + "/repos/o/r/git/trees/other?recursive=1",
            make_response (http_status::too_many_requests, "", ra));

  try
  {
    run_await (ioc, a.get_tree (o, r, other));
    assert (false);
  }
  catch (const rate_limited& e)
  {
    assert (e.reset () == "60");
  }

  string missing ("missing");
  try
  {
    run_await (ioc, a.get_tree (o, r, missing));
    assert (false);
  }
  catch (const not_found& e)
  {
    assert (e.owner () == "o" && e.repo () == "r");
  }
}

static void
test_retry ()
{
  asio::io_context ioc;
  http_stub http;
  stub_api a (http);
  a.set_retry_policy (no_delay ());

  string o ("o"), r ("r"), ref ("main"), p ("f.txt");
  string raw ("https://raw.githubusercontent.com/o/r/main/f.txt");

  // Two gateway hiccups, then the content.
  //
  http.add (raw, http_response (http_status::service_unavailable));
  http.add (raw, http_response (http_status::bad_gateway));
  http.add (raw, make_response (http_status::ok, "content"));

  http_response resp (run_await (ioc, a.get_raw (o, r, ref, p)));
  assert (resp.is_success ());
  assert (*resp.body == "content");
  assert (http.count (raw) == 3);

  // A dropped connection is retried too.
  //
  string q ("g.txt");
  string graw ("https://raw.githubusercontent.com/o/r/main/g.txt");
  http.add_failure (graw);
  http.add (graw, make_response (http_status::ok, "g"));

  resp = run_await (ioc, a.get_raw (o, r, ref, q));
  assert (*resp.body == "g");
  assert (http.count (graw) == 2);

  // Give up after the configured number of retries and hand back the last
  // response.
  //
  string z ("z.txt");
  string zraw ("https://raw.githubusercontent.com/o/r/main/z.txt");
  http.add (zraw, http_response (http_status::gateway_timeout));

  resp = run_await (ioc, a.get_raw (o, r, ref, z));
  assert (resp.status == http_status::gateway_timeout);
  assert (http.count (zraw) == 4);

  // Same for the network: the failure surfaces as transport_failure.
  //
  string n ("n.txt");
  string nraw ("https://raw.githubusercontent.com/o/r/main/n.txt");
  http.add_failure (nraw);

  try
  {
    run_await (ioc, a.get_raw (o, r, ref, n));
    assert (false);
  }
  catch (const transport_failure& e)
  {
    assert (e.status () == 0);
    assert (e.url () == nraw);
  }
  assert (http.count (nraw) == 4);

  // Not transient: no retry.
  //
  string m ("m.txt");
  string mraw ("https://raw.githubusercontent.com/o/r/main/m.txt");
  http.add (mraw, http_response (http_status::too_many_requests));

  resp = run_await (ioc, a.get_raw (o, r, ref, m));
  assert (resp.status == http_status::too_many_requests);
  assert (http.count (mraw) == 1);
}

int
main ()
{
  test_endpoint ();
  test_retry_delay ();
  test_tree ();
  test_contents ();
  test_repository ();
  test_status ();
  test_details ();
  test_retry ();
}
