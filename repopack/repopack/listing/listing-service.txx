#include <optional>
#include <exception>

#include <repopack/repopack-error.hxx>
#include <repopack/http/http-url.hxx>

namespace repopack
{
  template <typename A>
  asio::awaitable<std::vector<std::string>> basic_listing_service<A>::
  list (repo_locator& l, const cancellation* c)
  {
    // Only a ref that came from the locator can be ambiguous. The default
    // branch is what the server says it is.
    //
    bool probe (l.ref.has_value ());

    if (!probe)
    {
      auto repo (co_await api_.get_repository (l.owner, l.repo));
      l.ref = repo.default_branch;
    }

    ref_probe p (make_probe (*l.ref, percent_decode (l.dir)));

    std::optional<typename api_type::tree_type> tree;
    std::exception_ptr missing;

    while (p.state == probe_state::probing)
    {
      probe_outcome o (probe_outcome::found);

      try
      {
        tree = co_await api_.get_tree (l.owner, l.repo, p.ref);
      }
      catch (const not_found&)
      {
        if (!probe)
          throw;

        missing = std::current_exception ();
        o = probe_outcome::not_found;
      }

      p = transition (p, o);
    }

    if (p.state == probe_state::exhausted)
      std::rethrow_exception (missing);

    l.ref = p.ref;
    l.dir = p.dir ();

    std::string prefix (l.dir.empty () ? std::string () : l.dir + '/');

    std::vector<std::string> r;
    for (const auto& e: tree->entries)
    {
      if (e.type == "blob" && e.path.compare (0, prefix.size (), prefix) == 0)
        r.push_back (e.path);
    }

    if (r.empty () && tree->truncated)
      co_await walk (l, l.dir, r, c);

    co_return r;
  }

  template <typename A>
  asio::awaitable<void> basic_listing_service<A>::
  walk (const repo_locator& l,
        const std::string& dir,
        std::vector<std::string>& r,
        const cancellation* c)
  {
    if (c != nullptr && c->requested ())
      co_return;

    std::vector<entry_type> es (
      co_await api_.get_contents (l.owner, l.repo, dir, *l.ref));

    // Symlinks and submodules are not files we can fetch.
    //
    for (const entry_type& e: es)
    {
      if (e.type == "file")
        r.push_back (e.path);
      else if (e.type == "dir")
        co_await walk (l, e.path, r, c);
    }
  }
}
