#include <repopack/http/http-url.hxx>
#include <repopack/http/http-request.hxx>
#include <repopack/http/http-response.hxx>

#include <cassert>
#include <iostream>

using namespace std;
using namespace repopack;

static void
test_parse ()
{
  url_parts u (parse_url ("https://api.github.com/repos/o/r?ref=main"));
  assert (u.scheme == "https");
  assert (u.host == "api.github.com");
  assert (u.port == "443");
  assert (u.target == "/repos/o/r?ref=main");

  // Explicit port and no path.
  //
  u = parse_url ("http://localhost:8080");
  assert (u.host == "localhost");
  assert (u.port == "8080");
  assert (u.target == "/");

  // Query directly after the authority.
  //
  u = parse_url ("http://example.org?x=1");
  assert (u.host == "example.org");
  assert (u.target == "/?x=1");

  // No scheme means plain http.
  //
  u = parse_url ("example.org/a");
  assert (u.scheme == "http");
  assert (u.port == "80");
  assert (u.target == "/a");

  assert (url_origin (parse_url ("https://h/x")) == "https://h");
  assert (url_origin (parse_url ("http://h:81/x")) == "http://h:81");
}

static void
test_encode ()
{
  assert (percent_encode ("plain-name_1.txt~") == "plain-name_1.txt~");
  assert (percent_encode ("a b") == "a%20b");
  assert (percent_encode ("a/b") == "a%2Fb");
  assert (percent_encode ("a/b", true) == "a/b");
  assert (percent_encode ("feature/x y", true) == "feature/x%20y");
  assert (percent_encode ("100%") == "100%25");
  assert (percent_encode ("#?&") == "%23%3F%26");

  // Non-ASCII goes out byte by byte.
  //
  assert (percent_encode ("\xC3\xA9") == "%C3%A9");
}

static void
test_decode ()
{
  assert (percent_decode ("path%20with%20spaces") == "path with spaces");
  assert (percent_decode ("a%2Fb") == "a/b");
  assert (percent_decode ("a%2fb") == "a/b");
  assert (percent_decode ("%C3%A9") == "\xC3\xA9");

  // Malformed escapes are kept.
  //
  assert (percent_decode ("100%") == "100%");
  assert (percent_decode ("%zz") == "%zz");
  assert (percent_decode ("%4") == "%4");

  // Decoding what we encoded gives back the original.
  //
  string s ("dir with spaces/and#hash");
  assert (percent_decode (percent_encode (s, true)) == s);
}

static void
test_request ()
{
  http_request r (http_method::get, "https://example.org:8443/a/b?c=d");
  assert (r.target () == "/a/b?c=d");

  r.normalize ();
  assert (r.get_header ("host") == "example.org:8443");

  r.set_bearer_token ("tok");
  assert (r.get_header ("AUTHORIZATION") == "Bearer tok");

  http_request e (http_method::get, "https://example.org");
  assert (e.target () == "/");
}

static void
test_response ()
{
  http_response r (http_status::ok);
  assert (!r.content_length ());

  r.headers.set ("content-length", "134");
  assert (r.content_length () == 134u);

  r.headers.set ("Content-Length", "13x");
  assert (!r.content_length ());

  r.headers.set ("Content-Length", "-1");
  assert (!r.content_length ());

  http_response n (http_status::not_found);
  assert (!n.is_success ());
  assert (n.status_line () == "404 Not Found");
}

int
main ()
{
  test_parse ();
  test_encode ();
  test_decode ();
  test_request ();
  test_response ();
}
