#include <utility>
#include <exception>
#include <stdexcept>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <repopack/repopack-error.hxx>
#include <repopack/http/http-json.hxx>

namespace repopack
{
  template <typename C, typename T>
  asio::awaitable<typename basic_github_api<C, T>::response_type>
  basic_github_api<C, T>::
  execute (request_type req)
  {
    if (!req.has_header ("User-Agent"))
      req.set_user_agent (traits_type::user_agent ());

    if (token_)
      req.set_bearer_token (*token_);

    req.normalize ();

    for (std::uint32_t attempt (0);; ++attempt)
    {
      std::optional<response_type> r;
      std::string failure;

      // Note that we cannot co_await in a handler so we only note what
      // happened here and back off below.
      //
      try
      {
        r = co_await client_.request (req);
      }
      catch (const boost::system::system_error& e)
      {
        failure = e.what ();
      }
      catch (const std::runtime_error& e)
      {
        // Redirect loops and such: retrying won't help.
        //
        throw transport_failure (req.url, 0, e.what ());
      }

      if (r)
      {
        if (auto rl = github_rate_limit::parse (r->headers))
          rate_limit_ = *rl;

        if (!github_retry_policy::transient (r->status) ||
            attempt >= retry_.max_retries)
          co_return std::move (*r);
      }
      else if (attempt >= retry_.max_retries)
        throw transport_failure (req.url, 0, failure);

      asio::steady_timer t (co_await asio::this_coro::executor,
                            retry_.delay (attempt));

      co_await t.async_wait (asio::use_awaitable);
    }
  }

  template <typename C, typename T>
  void basic_github_api<C, T>::
  check (const response_type& r,
         const std::string& url,
         const std::string& owner,
         const std::string& repo)
  {
    if (r.is_success ())
      return;

    switch (r.status)
    {
    case http_status::unauthorized:
      throw auth_required (owner + '/' + repo);

    case http_status::forbidden:
      {
        // The same status is used for an exhausted quota and for a
        // resource we are not allowed to see. The headers tell them apart.
        //
        auto rl (github_rate_limit::parse (r.headers));

        if (rl && rl->is_exceeded ())
        {
          if (rl->reset == 0)
            throw rate_limited ("unknown");

          throw rate_limited (std::to_string (rl->reset),
                              rl->seconds_until_reset ());
        }

        throw auth_required (owner + '/' + repo);
      }

    case http_status::too_many_requests:
      throw rate_limited (r.get_header ("Retry-After").value_or ("unknown"));

    case http_status::not_found:
      throw not_found (owner, repo);

    default:
      throw transport_failure (url, r.status_code (), "HTTP " + r.status_line ());
    }
  }

  template <typename C, typename T>
  template <typename F>
  auto basic_github_api<C, T>::
  decode (const std::string& url, F&& f) -> decltype (f ())
  {
    try
    {
      return f ();
    }
    catch (const std::exception& e)
    {
      throw transport_failure (url,
                               static_cast<std::uint16_t> (http_status::ok),
                               std::string ("unexpected response: ") +
                               e.what ());
    }
  }

  template <typename C, typename T>
  asio::awaitable<json::value> basic_github_api<C, T>::
  fetch_json (const std::string& url,
              const std::string& owner,
              const std::string& repo)
  {
    request_type req (http_method::get, url);
    req.set_header ("Accept", traits_type::media_type ());
    req.set_header ("X-GitHub-Api-Version", traits_type::api_version ());

    response_type r (co_await execute (std::move (req)));

    check (r, url, owner, repo);

    co_return decode (url, [&r] {return parse_json (r);});
  }

  template <typename C, typename T>
  asio::awaitable<typename basic_github_api<C, T>::repository_type>
  basic_github_api<C, T>::
  get_repository (std::string owner, std::string repo)
  {
    std::string url (endpoint_.repo (owner, repo));
    json::value jv (co_await fetch_json (url, owner, repo));

    co_return decode (url, [&jv] {return traits_type::parse_repository (jv);});
  }

  template <typename C, typename T>
  asio::awaitable<typename basic_github_api<C, T>::tree_type>
  basic_github_api<C, T>::
  get_tree (std::string owner, std::string repo, std::string ref)
  {
    std::string url (endpoint_.tree (owner, repo, ref));
    json::value jv (co_await fetch_json (url, owner, repo));

    co_return decode (url, [&jv] {return traits_type::parse_tree (jv);});
  }

  template <typename C, typename T>
  asio::awaitable<std::vector<typename basic_github_api<C, T>::entry_type>>
  basic_github_api<C, T>::
  get_contents (std::string owner,
                std::string repo,
                std::string dir,
                std::string ref)
  {
    std::string url (endpoint_.contents (owner, repo, dir, ref));
    json::value jv (co_await fetch_json (url, owner, repo));

    co_return decode (url, [&jv] {return traits_type::parse_contents (jv);});
  }

  template <typename C, typename T>
  asio::awaitable<typename basic_github_api<C, T>::response_type>
  basic_github_api<C, T>::
  get_raw (std::string owner,
           std::string repo,
           std::string ref,
           std::string path)
  {
    request_type req (http_method::get,
                      endpoint_.raw (owner, repo, ref, path));

    co_return co_await execute (std::move (req));
  }

  template <typename C, typename T>
  asio::awaitable<typename basic_github_api<C, T>::response_type>
  basic_github_api<C, T>::
  get_media (std::string owner,
             std::string repo,
             std::string ref,
             std::string path)
  {
    request_type req (http_method::get,
                      endpoint_.media (owner, repo, ref, path));

    co_return co_await execute (std::move (req));
  }
}
