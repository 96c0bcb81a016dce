#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <optional>

#include <repopack/http/http-types.hxx>

namespace repopack
{
  // HTTP request.
  //
  // Requests we send never carry a body, so there is no body type here.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method;
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () : method (http_method::get) {}

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    // Get the request target (path and query component of the URL).
    //
    string_type
    target () const;

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    bool
    has_header (const string_type& name) const
    {
      return headers.contains (name);
    }

    void
    set_user_agent (string_type ua)
    {
      set_header (string_type ("User-Agent"), std::move (ua));
    }

    void
    set_bearer_token (const string_type& token)
    {
      set_header (string_type ("Authorization"),
                  string_type ("Bearer ") + token);
    }

    // Add the Host header derived from the URL unless already present.
    //
    void
    normalize ();
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S>& r) -> decltype (o)
  {
    return o << to_string (r.method) << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}

#include <repopack/http/http-request.ixx>
