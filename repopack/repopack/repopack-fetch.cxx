#include <repopack/repopack-fetch.hxx>

#include <utility>

#include <repopack/github/github-api.hxx>
#include <repopack/listing/listing-service.hxx>
#include <repopack/content/content-fetcher.hxx>
#include <repopack/download/download-orchestrator.hxx>

using namespace std;

namespace repopack
{
  struct fetch_coordinator::impl
  {
    using listing_type = basic_listing_service<github_api>;
    using fetcher_type = basic_content_fetcher<github_api>;
    using orchestrator_type = basic_download_orchestrator<fetcher_type>;

    impl (asio::io_context& ioc, fetch_settings s)
      : settings (move (s)),
        http (ioc, settings.http),
        api (http, github_endpoint (settings.api_url,
                                    settings.raw_url,
                                    settings.media_url)),
        listing (api),
        fetcher (api),
        downloads (ioc, fetcher)
    {
      if (settings.token && !settings.token->empty ())
        api.set_token (*settings.token);
    }

    fetch_settings settings;

    http_client http;
    github_api api;
    listing_type listing;
    fetcher_type fetcher;
    orchestrator_type downloads;

    listing_callback on_listing;
  };

  fetch_coordinator::
  fetch_coordinator (asio::io_context& ioc, fetch_settings s)
    : impl_ (make_unique<impl> (ioc, move (s)))
  {
  }

  fetch_coordinator::
  ~fetch_coordinator () = default;

  void fetch_coordinator::
  set_listing_callback (listing_callback cb)
  {
    impl_->on_listing = move (cb);
  }

  void fetch_coordinator::
  set_completion_callback (completion_callback cb)
  {
    impl_->downloads.set_completion_callback (move (cb));
  }

  asio::awaitable<fetch_report> fetch_coordinator::
  run (cancellation& c)
  {
    const fetch_settings& s (impl_->settings);

    fetch_report r;
    r.locator = parse_locator (s.locator);
    r.files = co_await impl_->listing.list (r.locator, &c);
    r.rate_limit = impl_->api.rate_limit ();

    if (impl_->on_listing)
      impl_->on_listing (r.locator, r.files);

    if (s.dry_run && !c.requested ())
      co_return r;

    // Re-root at the requested directory's own name. For the repository root
    // the anchor is empty and the paths are kept as is.
    //
    download_options o;
    o.output = s.output;
    o.anchor = r.locator.anchor ();
    o.concurrency = s.jobs;
    o.resume = s.resume;

    r.result = co_await impl_->downloads.run (r.locator, r.files, move (o), c);
    r.rate_limit = impl_->api.rate_limit ();

    co_return r;
  }
}
