#include <chrono>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace repopack
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  inline http::verb
  to_beast_verb (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return http::verb::get;
      case http_method::head: return http::verb::head;
    }
    return http::verb::get;
  }

  // Arm (or disarm, for 0) the stream timer.
  //
  inline void
  expire_after (beast::tcp_stream& s, std::uint32_t ms)
  {
    if (ms != 0)
      s.expires_after (std::chrono::milliseconds (ms));
    else
      s.expires_never ();
  }

  // Execute a request with automatic redirect handling.
  //
  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_impl (request_type req, std::uint8_t redirect_count)
  {
    const auto& traits (session_->traits ());

    if (!req.has_header (string_type ("User-Agent")))
      req.set_user_agent (traits.user_agent);

    req.normalize ();

    url_parts parts (parse_url (req.url));

    response_type r (parts.scheme == "https"
                     ? co_await request_ssl (req, parts)
                     : co_await request_tcp (req, parts));

    if (!traits.follow_redirects || !r.is_redirection ())
      co_return r;

    auto loc (r.location ());

    if (!loc || loc->empty ())
      co_return r;

    if (redirect_count >= traits.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + req.url);

    // Relative locations are resolved against the current origin.
    //
    string_type url (*loc);
    if (url.front () == '/')
      url = url_origin (parts) + url;

    url_parts next_parts (parse_url (url));

    // Note that we must explicitly update the Host header for the new
    // location. Failing that, the copied headers retain the old Host and the
    // CDN we are redirected to answers with an error.
    //
    // The credential is only meant for the host we were asked to talk to.
    // Media downloads get redirected to signed storage URLs that reject an
    // extra Authorization header.
    //
    request_type next (req.method, url, req.version);
    next.headers = req.headers;
    next.headers.remove (string_type ("Host"));

    if (next_parts.host != parts.host)
      next.headers.remove (string_type ("Authorization"));

    // For '303 See Other', RFC 7231 says we must change the method to GET.
    //
    if (r.status == http_status::see_other)
      next.method = http_method::get;

    co_return co_await request_impl (std::move (next), redirect_count + 1);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_ssl (const request_type& req, const url_parts& parts)
  {
    using stream_type = beast::ssl_stream<beast::tcp_stream>;

    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (
      parts.host, parts.port, asio::use_awaitable));

    stream_type s (ctx, session_->ssl_context ());

    // Set the SNI hostname. Beast doesn't wrap this so we drop down to the
    // OpenSSL C API using the native handle.
    //
    if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
    {
      beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                            asio::error::get_ssl_category ());

      throw beast::system_error (ec, "unable to set SNI hostname");
    }

    if (tr.verify_ssl)
      s.set_verify_callback (ssl::host_name_verification (parts.host));

    auto& layer (beast::get_lowest_layer (s));
    expire_after (layer, tr.connect_timeout);

    co_await layer.async_connect (addrs, asio::use_awaitable);
    co_await s.async_handshake (ssl::stream_base::client, asio::use_awaitable);

    response_type r (co_await exchange (s, req, parts));

    // Many servers simply close the connection without a proper TLS
    // shutdown and waiting for one can block until the timeout. So we just
    // close the socket.
    //
    beast::error_code ec;
    layer.socket ().shutdown (tcp::socket::shutdown_both, ec);

    co_return r;
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request_tcp (const request_type& req, const url_parts& parts)
  {
    auto& ctx (session_->io_context ());
    const auto& tr (session_->traits ());

    tcp::resolver rslv (ctx);
    auto addrs (co_await rslv.async_resolve (
      parts.host, parts.port, asio::use_awaitable));

    beast::tcp_stream s (ctx);

    expire_after (s, tr.connect_timeout);
    co_await s.async_connect (addrs, asio::use_awaitable);

    response_type r (co_await exchange (s, req, parts));

    beast::error_code ec;
    s.socket ().shutdown (tcp::socket::shutdown_both, ec);

    co_return r;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (Stream& s, const request_type& req, const url_parts& parts)
  {
    const auto& tr (session_->traits ());
    auto& layer (beast::get_lowest_layer (s));

    http::request<http::empty_body> br;
    br.method (to_beast_verb (req.method));
    br.target (parts.target);
    br.version (req.version.number ());

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    expire_after (layer, tr.request_timeout);
    co_await http::async_write (s, br, asio::use_awaitable);

    beast::flat_buffer b;
    http::response_parser<http::string_body> p;
    p.body_limit (tr.body_limit);

    // HEAD responses announce a length but carry no body.
    //
    if (req.method == http_method::head)
      p.skip (true);

    co_await http::async_read (s, b, p, asio::use_awaitable);

    auto& bres (p.get ());

    response_type r;
    r.status  = static_cast<http_status> (bres.result_int ());
    r.version = http_version (bres.version () / 10, bres.version () % 10);
    r.reason  = string_type (bres.reason ());

    for (const auto& h: bres)
      r.headers.add (string_type (h.name_string ()),
                     string_type (h.value ()));

    r.body = std::move (bres.body ());

    co_return r;
  }
}
