#include <repopack/github/github-endpoint.hxx>

#include <utility>

#include <repopack/http/http-url.hxx>

using namespace std;

namespace repopack
{
  static string
  strip_slashes (string s)
  {
    while (!s.empty () && s.back () == '/')
      s.pop_back ();

    return s;
  }

  github_endpoint::
  github_endpoint (string api, string raw, string media)
    : api_ (strip_slashes (move (api))),
      raw_ (strip_slashes (move (raw))),
      media_ (strip_slashes (move (media)))
  {
  }

  string github_endpoint::
  repo (const string& owner, const string& repo) const
  {
    return build (api_,
                  "/repos/", percent_encode (owner),
                  "/", percent_encode (repo));
  }

  string github_endpoint::
  tree (const string& owner, const string& repo, const string& ref) const
  {
    return build (api_,
                  "/repos/", percent_encode (owner),
                  "/", percent_encode (repo),
                  "/git/trees/", percent_encode (ref, true),
                  "?recursive=1");
  }

  string github_endpoint::
  contents (const string& owner,
            const string& repo,
            const string& dir,
            const string& ref) const
  {
    return build (api_,
                  "/repos/", percent_encode (owner),
                  "/", percent_encode (repo),
                  "/contents", dir.empty () ? "" : "/",
                  percent_encode (dir, true),
                  "?ref=", percent_encode (ref));
  }

  string github_endpoint::
  raw (const string& owner,
       const string& repo,
       const string& ref,
       const string& path) const
  {
    return build (raw_,
                  "/", percent_encode (owner),
                  "/", percent_encode (repo),
                  "/", percent_encode (ref, true),
                  "/", percent_encode (path, true));
  }

  string github_endpoint::
  media (const string& owner,
         const string& repo,
         const string& ref,
         const string& path) const
  {
    return build (media_,
                  "/", percent_encode (owner),
                  "/", percent_encode (repo),
                  "/", percent_encode (ref, true),
                  "/", percent_encode (path, true));
  }
}
