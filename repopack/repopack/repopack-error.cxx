#include <repopack/repopack-error.hxx>

using namespace std;

namespace repopack
{
  string
  to_string (error_kind k)
  {
    switch (k)
    {
      case error_kind::invalid_locator:   return "invalid locator";
      case error_kind::auth_required:     return "authentication required";
      case error_kind::rate_limited:      return "rate limited";
      case error_kind::not_found:         return "not found";
      case error_kind::transport_failure: return "transport failure";
      case error_kind::download_failed:   return "download failed";
      case error_kind::path_traversal:    return "path traversal";
      case error_kind::io_error:          return "i/o error";
    }
    return "unknown error";
  }

  invalid_locator::
  invalid_locator (string l, const string& reason)
    : error (error_kind::invalid_locator,
             "invalid repository locator '" + l + "': " + reason,
             "expected <host>/<owner>/<repo>[/tree/<ref>[/<dir>]]"),
      locator_ (move (l))
  {
  }

  auth_required::
  auth_required (const string& resource)
    : error (error_kind::auth_required,
             "authentication required to access " + resource,
             "pass --token or set GITHUB_TOKEN")
  {
  }

  static string
  rate_limit_hint (const optional<uint64_t>& wait)
  {
    string r ("authenticate with --token to raise the limit");

    if (wait && *wait != 0)
    {
      // Round up: "0 minute(s)" would be confusing.
      //
      r = "the limit resets in " + std::to_string ((*wait + 59) / 60) +
          " minute(s), or " + r;
    }

    return r;
  }

  rate_limited::
  rate_limited (string reset, optional<uint64_t> wait)
    : error (error_kind::rate_limited,
             "API rate limit exceeded (resets at " + reset + ")",
             rate_limit_hint (wait)),
      reset_ (move (reset)),
      wait_ (wait)
  {
  }

  not_found::
  not_found (string owner, string repo)
    : error (error_kind::not_found,
             "repository " + owner + '/' + repo + " or its ref not found",
             "check the locator, private repositories need a token"),
      owner_ (move (owner)),
      repo_ (move (repo))
  {
  }

  transport_failure::
  transport_failure (string url, uint16_t status, const string& detail)
    : error (error_kind::transport_failure,
             "request to " + url + " failed: " + detail),
      url_ (move (url)),
      status_ (status)
  {
  }

  download_failed::
  download_failed (string path, string cause)
    : error (error_kind::download_failed,
             "unable to download " + path + ": " + cause),
      path_ (move (path)),
      cause_ (move (cause))
  {
  }

  path_traversal::
  path_traversal (string path, const string& detail)
    : error (error_kind::path_traversal,
             "refusing to write " + path + ": " + detail),
      path_ (move (path))
  {
  }

  io_error::
  io_error (string path, error_code ec)
    : error (error_kind::io_error,
             "unable to write " + path + ": " + ec.message ()),
      path_ (move (path)),
      code_ (ec)
  {
  }
}
