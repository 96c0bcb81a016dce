#include <repopack/github/github-types.hxx>

#include <chrono>
#include <charconv>
#include <stdexcept>

using namespace std;

namespace repopack
{
  uint64_t github_rate_limit::
  seconds_until_reset () const
  {
    if (reset == 0)
      return 0;

    // The reset member is a wall-clock timestamp so system_clock it is.
    //
    auto now (chrono::duration_cast<chrono::seconds> (
                chrono::system_clock::now ().time_since_epoch ()).count ());

    auto n (static_cast<uint64_t> (now));
    return reset > n ? reset - n : 0;
  }

  template <typename T>
  static bool
  parse_number (const optional<string>& v, T& r)
  {
    if (!v)
      return false;

    auto e (v->data () + v->size ());
    auto p (from_chars (v->data (), e, r));
    return p.ec == errc () && p.ptr == e;
  }

  optional<github_rate_limit> github_rate_limit::
  parse (const http_headers& h)
  {
    github_rate_limit r;

    if (!parse_number (h.get ("x-ratelimit-remaining"), r.remaining))
      return nullopt;

    if (!parse_number (h.get ("x-ratelimit-reset"), r.reset))
      r.reset = 0;

    if (!parse_number (h.get ("x-ratelimit-limit"), r.limit))
      r.limit = 0;

    if (!parse_number (h.get ("x-ratelimit-used"), r.used))
      r.used = 0;

    return r;
  }

  github_repository github_api_traits::
  parse_repository (const json::value& jv)
  {
    const json::object& o (jv.as_object ());

    github_repository r;
    r.full_name = json::value_to<string> (o.at ("full_name"));

    if (o.contains ("default_branch") && !o.at ("default_branch").is_null ())
      r.default_branch = json::value_to<string> (o.at ("default_branch"));

    if (r.default_branch.empty ())
      throw invalid_argument ("repository has no default branch");

    return r;
  }

  static github_entry
  parse_entry (const json::value& jv)
  {
    const json::object& o (jv.as_object ());

    github_entry r;
    r.type = json::value_to<string> (o.at ("type"));
    r.path = json::value_to<string> (o.at ("path"));

    return r;
  }

  github_tree github_api_traits::
  parse_tree (const json::value& jv)
  {
    const json::object& o (jv.as_object ());

    github_tree r;

    if (o.contains ("truncated"))
      r.truncated = json::value_to<bool> (o.at ("truncated"));

    for (const json::value& e: o.at ("tree").as_array ())
      r.entries.push_back (parse_entry (e));

    return r;
  }

  vector<github_entry> github_api_traits::
  parse_contents (const json::value& jv)
  {
    vector<github_entry> r;

    if (jv.is_array ())
    {
      for (const json::value& e: jv.as_array ())
        r.push_back (parse_entry (e));
    }
    else
      r.push_back (parse_entry (jv));

    return r;
  }
}
