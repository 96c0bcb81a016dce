#pragma once

#include <string>
#include <memory>
#include <limits>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <repopack/http/http-types.hxx>
#include <repopack/http/http-url.hxx>
#include <repopack/http/http-request.hxx>
#include <repopack/http/http-response.hxx>

namespace repopack
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Request timeout in milliseconds (0 = no timeout). Covers writing the
    // request and reading the whole response.
    //
    std::uint32_t request_timeout = 30000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    bool follow_redirects = true;

    // Whether to verify the peer certificate and host name.
    //
    bool verify_ssl = true;

    // CA bundle to verify against (empty = system defaults).
    //
    string_type ssl_cert_file;

    // Used unless the request sets its own.
    //
    string_type user_agent = string_type ("repopack/0.1.0");

    // Upper bound on the response body size. Files can be large so we don't
    // want Beast's 8MB default here.
    //
    std::uint64_t body_limit = std::numeric_limits<std::uint64_t>::max ();
  };

  // HTTP client session context.
  //
  // Holds what is shared by every connection: the I/O context, the options,
  // and the TLS context.
  //
  template <typename T = http_client_traits<>>
  class basic_http_session
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    basic_http_session (asio::io_context& ioc, const traits_type& traits)
      : ioc_ (ioc), traits_ (traits), ssl_ctx_ (ssl::context::tls_client)
    {
      configure_ssl ();
    }

    basic_http_session (const basic_http_session&) = delete;
    basic_http_session& operator= (const basic_http_session&) = delete;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    ssl::context&
    ssl_context () noexcept
    {
      return ssl_ctx_;
    }

  private:
    void
    configure_ssl ();

  private:
    asio::io_context& ioc_;
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  // HTTP client.
  //
  // Issues one request per connection using Boost.Beast and coroutines.
  // Network, TLS, and timeout failures are reported by throwing
  // boost::system::system_error; any response, whatever its status, is
  // returned.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;
    using session_type  = basic_http_session<traits_type>;

    explicit
    basic_http_client (asio::io_context& ioc,
                       const traits_type& traits = traits_type ())
      : session_ (std::make_unique<session_type> (ioc, traits)) {}

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    // Perform an HTTP request, following redirects if enabled.
    //
    asio::awaitable<response_type>
    request (const request_type& req);

    // Perform a GET request with the default headers.
    //
    asio::awaitable<response_type>
    get (const string_type& url);

  private:
    asio::awaitable<response_type>
    request_impl (request_type req, std::uint8_t redirect_count);

    asio::awaitable<response_type>
    request_ssl (const request_type& req, const url_parts& parts);

    asio::awaitable<response_type>
    request_tcp (const request_type& req, const url_parts& parts);

    // Write the request and read the response over an established stream.
    //
    template <typename Stream>
    asio::awaitable<response_type>
    exchange (Stream& s, const request_type& req, const url_parts& parts);

  private:
    std::unique_ptr<session_type> session_;
  };

  using http_session = basic_http_session<>;
  using http_client  = basic_http_client<>;
}

#include <repopack/http/http-client.ixx>
#include <repopack/http/http-client.txx>
