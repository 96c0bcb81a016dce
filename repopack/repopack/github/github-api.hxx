#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>

#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <repopack/http/http-client.hxx>
#include <repopack/github/github-types.hxx>
#include <repopack/github/github-endpoint.hxx>

namespace repopack
{
  namespace asio = boost::asio;
  namespace json = boost::json;

  // Retry policy for transient failures.
  //
  // Network errors and 502/503/504 are retried with exponential backoff.
  // Rate limiting (429) is not: waiting it out is the user's call.
  //
  struct github_retry_policy
  {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay {500};
    std::chrono::milliseconds max_delay {10000};

    // Delay before the retry following the attempt (0-based).
    //
    std::chrono::milliseconds
    delay (std::uint32_t attempt) const
    {
      std::chrono::milliseconds d (base_delay);

      for (std::uint32_t i (0); i != attempt && d < max_delay; ++i)
        d *= 2;

      return d < max_delay ? d : max_delay;
    }

    static bool
    transient (http_status s)
    {
      return s == http_status::bad_gateway ||
             s == http_status::service_unavailable ||
             s == http_status::gateway_timeout;
    }
  };

  // GitHub API client.
  //
  // The HTTP client is a template parameter so that it can be replaced with
  // an in-memory one. All it needs is:
  //
  // asio::awaitable<http_response> request (const http_request&);
  //
  // API calls map failure statuses to the repopack error taxonomy (see
  // check()). Content calls (raw, media) return the response as is and
  // leave the interpretation to the caller. In both cases a network failure
  // that persists through the retries is reported as transport_failure.
  //
  template <typename C = http_client, typename T = github_api_traits>
  class basic_github_api
  {
  public:
    using client_type     = C;
    using traits_type     = T;
    using request_type    = http_request;
    using response_type   = http_response;
    using endpoint_type   = github_endpoint;
    using repository_type = traits_type::repository_type;
    using entry_type      = traits_type::entry_type;
    using tree_type       = traits_type::tree_type;

    explicit
    basic_github_api (client_type& c, endpoint_type e = endpoint_type ())
      : client_ (c), endpoint_ (std::move (e)) {}

    basic_github_api (const basic_github_api&) = delete;
    basic_github_api& operator= (const basic_github_api&) = delete;

    // Bearer token sent with every request.
    //
    void
    set_token (std::string token) {token_ = std::move (token);}

    void
    set_retry_policy (github_retry_policy p) {retry_ = p;}

    const endpoint_type&
    endpoint () const noexcept {return endpoint_;}

    // Rate limit as of the last response that carried one.
    //
    const std::optional<github_rate_limit>&
    rate_limit () const noexcept {return rate_limit_;}

    // Repository metadata (for the default branch).
    //
    asio::awaitable<repository_type>
    get_repository (std::string owner, std::string repo);

    // Recursive tree of the ref. Throw not_found if the ref does not exist.
    //
    asio::awaitable<tree_type>
    get_tree (std::string owner, std::string repo, std::string ref);

    // One level of a directory.
    //
    asio::awaitable<std::vector<entry_type>>
    get_contents (std::string owner,
                  std::string repo,
                  std::string dir,
                  std::string ref);

    // File content.
    //
    asio::awaitable<response_type>
    get_raw (std::string owner,
             std::string repo,
             std::string ref,
             std::string path);

    // Large file storage content behind a pointer stub.
    //
    asio::awaitable<response_type>
    get_media (std::string owner,
               std::string repo,
               std::string ref,
               std::string path);

  private:
    // Send with credentials and retries.
    //
    asio::awaitable<response_type>
    execute (request_type req);

    // Send an API request, check the status, and parse the body.
    //
    asio::awaitable<json::value>
    fetch_json (const std::string& url,
                const std::string& owner,
                const std::string& repo);

    // Throw the error corresponding to a non-success API response.
    //
    static void
    check (const response_type& r,
           const std::string& url,
           const std::string& owner,
           const std::string& repo);

    // Run the parse function, reporting a payload of unexpected shape as a
    // transport failure.
    //
    template <typename F>
    static auto
    decode (const std::string& url, F&& f) -> decltype (f ());

  private:
    client_type& client_;
    endpoint_type endpoint_;
    std::optional<std::string> token_;
    std::optional<github_rate_limit> rate_limit_;
    github_retry_policy retry_;
  };

  using github_api = basic_github_api<>;
}

#include <repopack/github/github-api.txx>
