#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <repopack/http/http-types.hxx>

namespace repopack
{
  // HTTP response.
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    http_status              status;
    http_version             version;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    basic_http_response () : status (http_status::ok) {}

    explicit
    basic_http_response (http_status s) : status (s) {}

    basic_http_response (http_status s, headers_type h, body_type b)
      : status (s), headers (std::move (h)), body (std::move (b)) {}

    bool
    is_success () const noexcept
    {
      return status_code () >= 200 && status_code () < 300;
    }

    bool
    is_redirection () const noexcept
    {
      return status_code () >= 300 && status_code () < 400;
    }

    std::uint16_t
    status_code () const noexcept
    {
      return static_cast<std::uint16_t> (status);
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    // Parse the Content-Length header. Return nullopt if it is missing or
    // malformed.
    //
    std::optional<std::uint64_t>
    content_length () const;

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    // Status line summary, for example "404 Not Found". Falls back to our
    // reason phrase if the server did not send one.
    //
    string_type
    status_line () const;
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    return o << r.version << ' ' << r.status_line ();
  }

  using http_response = basic_http_response<std::string>;
}

#include <repopack/http/http-response.ixx>
