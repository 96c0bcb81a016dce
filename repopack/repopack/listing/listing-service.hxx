#pragma once

#include <string>
#include <vector>

#include <boost/asio.hpp>

#include <repopack/locator/locator.hxx>
#include <repopack/listing/listing-probe.hxx>
#include <repopack/download/download-types.hxx>

namespace repopack
{
  namespace asio = boost::asio;

  // File listing of a remote directory.
  //
  // The API type provides get_repository(), get_tree(), and get_contents()
  // (see basic_github_api).
  //
  template <typename A>
  class basic_listing_service
  {
  public:
    using api_type   = A;
    using entry_type = api_type::entry_type;

    explicit
    basic_listing_service (api_type& a): api_ (a) {}

    // Return the paths (relative to the repository root) of the files under
    // the locator's directory.
    //
    // The locator is completed in place: a missing ref is resolved to the
    // default branch, the directory is percent-decoded, and, if the ref was
    // given, leading directory segments may be moved onto it while probing
    // for a slash-containing ref.
    //
    // The recursive tree is used first. If it comes back truncated without
    // any file under the directory, the directory is walked one level at a
    // time instead. The walk can take a while for large directories and
    // stops early, returning what it has found so far, once the cancellation
    // is requested.
    //
    // Throw auth_required, rate_limited, not_found, or transport_failure.
    //
    asio::awaitable<std::vector<std::string>>
    list (repo_locator& l, const cancellation* c = nullptr);

  private:
    asio::awaitable<void>
    walk (const repo_locator& l,
          const std::string& dir,
          std::vector<std::string>& r,
          const cancellation* c);

  private:
    api_type& api_;
  };
}

#include <repopack/listing/listing-service.txx>
