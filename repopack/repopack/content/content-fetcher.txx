#include <utility>
#include <optional>

#include <repopack/repopack-error.hxx>

namespace repopack
{
  template <typename A>
  std::string basic_content_fetcher<A>::
  body (const std::string& path, response_type& r)
  {
    if (!r.is_success ())
      throw download_failed (path, "HTTP " + r.status_line ());

    return r.body ? std::move (*r.body) : std::string ();
  }

  template <typename A>
  asio::awaitable<std::string> basic_content_fetcher<A>::
  fetch (std::string path, const repo_locator& l)
  {
    std::optional<response_type> r;

    try
    {
      r = co_await api_.get_raw (l.owner, l.repo, *l.ref, path);
    }
    catch (const error& e)
    {
      throw download_failed (path, e.what ());
    }

    std::optional<std::uint64_t> n (r->content_length ());
    std::string b (body (path, *r));

    // Don't bother looking at the body unless the size says it could be a
    // pointer.
    //
    if (!n || !lfs_pointer::candidate (*n) || !lfs_pointer::matches (b))
      co_return b;

    try
    {
      r = co_await api_.get_media (l.owner, l.repo, *l.ref, path);
    }
    catch (const error& e)
    {
      throw download_failed (path, std::string ("media: ") + e.what ());
    }

    co_return body (path, *r);
  }
}
