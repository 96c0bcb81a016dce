#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <repopack/http/http-client.hxx>
#include <repopack/github/github-types.hxx>
#include <repopack/github/github-endpoint.hxx>
#include <repopack/locator/locator.hxx>
#include <repopack/download/download-types.hxx>

namespace repopack
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  // Everything a fetch needs, as mapped from the command line.
  //
  struct fetch_settings
  {
    std::string locator;
    std::optional<std::string> token;

    fs::path output {"."};
    std::size_t jobs {5};

    bool dry_run {false};
    bool resume {false};

    std::string api_url {github_endpoint::default_api_base};
    std::string raw_url {github_endpoint::default_raw_base};
    std::string media_url {github_endpoint::default_media_base};

    http_client_traits<> http;
  };

  struct fetch_report
  {
    // As resolved by the listing.
    //
    repo_locator locator;

    std::vector<std::string> files;

    // Absent on dry run.
    //
    std::optional<download_result> result;

    // API quota as of the last response that reported it.
    //
    std::optional<github_rate_limit> rate_limit;
  };

  // Fetch pipeline: parse the locator, list the directory, and download the
  // files.
  //
  class fetch_coordinator
  {
  public:
    // Called once the listing is done, before anything is downloaded.
    //
    using listing_callback =
      std::function<void (const repo_locator&, const std::vector<std::string>&)>;

    using completion_callback =
      std::function<void (const file_outcome&,
                          std::size_t done,
                          std::size_t total)>;

    fetch_coordinator (asio::io_context& ioc, fetch_settings s);
    ~fetch_coordinator ();

    fetch_coordinator (const fetch_coordinator&) = delete;
    fetch_coordinator& operator= (const fetch_coordinator&) = delete;

    void
    set_listing_callback (listing_callback cb);

    void
    set_completion_callback (completion_callback cb);

    // Throw invalid_locator before any I/O, or any of the listing errors.
    // Per-file errors end up in the result. If cancelled during the listing,
    // the files found so far are reported as cancelled, even on dry run.
    //
    asio::awaitable<fetch_report>
    run (cancellation& c);

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };
}
