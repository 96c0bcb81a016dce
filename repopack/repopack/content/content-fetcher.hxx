#pragma once

#include <string>
#include <cstdint>

#include <boost/asio.hpp>

#include <repopack/locator/locator.hxx>

namespace repopack
{
  namespace asio = boost::asio;

  // Git LFS pointer detection.
  //
  // A pointer file is a short text stub of the form:
  //
  // version https://git-lfs.github.com/spec/v1
  // oid sha256:<64 hex digits>
  // size <n>
  //
  // Which puts its size in a narrow window. Only content whose announced
  // size (Content-Length) is inside that window is looked at.
  //
  struct lfs_pointer
  {
    static constexpr std::uint64_t min_size = 128;
    static constexpr std::uint64_t max_size = 140;

    static constexpr const char signature[] =
      "version https://git-lfs.github.com/spec/v1";

    static bool
    candidate (std::uint64_t size) noexcept
    {
      return size >= min_size && size <= max_size;
    }

    static bool
    matches (const std::string& body) noexcept
    {
      return body.compare (0, sizeof (signature) - 1, signature) == 0;
    }
  };

  // Fetch file content, resolving LFS pointers to the actual objects.
  //
  // The API type provides get_raw() and get_media() (see basic_github_api).
  //
  template <typename A>
  class basic_content_fetcher
  {
  public:
    using api_type = A;

    explicit
    basic_content_fetcher (api_type& a): api_ (a) {}

    // Return the content of the file at path (relative to the repository
    // root) at the locator's ref. The ref must have been resolved (see
    // basic_listing_service::list()).
    //
    // Throw download_failed on any failure, including a non-success status
    // of either request.
    //
    asio::awaitable<std::string>
    fetch (std::string path, const repo_locator& l);

  private:
    using response_type = api_type::response_type;

    // Return the body of a successful response or throw download_failed.
    //
    static std::string
    body (const std::string& path, response_type& r);

  private:
    api_type& api_;
  };
}

#include <repopack/content/content-fetcher.txx>
