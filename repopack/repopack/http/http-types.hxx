#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace repopack
{
  // HTTP method.
  //
  // We only ever read from the remote, so this is deliberately short.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes we act upon are named. Anything else the server sends
  // still round-trips through the underlying integer.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    request_timeout       = 408,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  // Return the reason phrase or "Unknown".
  //
  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Case-insensitive comparison of header names.
  //
  bool
  header_name_equal (const std::string&, const std::string&) noexcept;

  // Header field as received or to be sent.
  //
  template <typename S>
  struct basic_http_field
  {
    S name;
    S value;
  };

  // Header fields in the order they were added.
  //
  // Names are matched case-insensitively. A name may appear more than once
  // in a response (Set-Cookie, Link) so add() keeps duplicates while set()
  // does not.
  //
  template <typename S>
  class basic_http_headers
  {
  public:
    using string_type    = S;
    using field_type     = basic_http_field<string_type>;
    using const_iterator = typename std::vector<field_type>::const_iterator;

    // Replace the value of the first field with this name, dropping any
    // others, or append a new one.
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value)
    {
      fields_.push_back (field_type {std::move (name), std::move (value)});
    }

    // First value of the field or nullopt.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return find (name) != fields_.end ();
    }

    void
    remove (const string_type& name);

    const_iterator
    begin () const noexcept {return fields_.begin ();}

    const_iterator
    end () const noexcept {return fields_.end ();}

  private:
    const_iterator
    find (const string_type& name) const;

  private:
    std::vector<field_type> fields_;
  };

  using http_headers = basic_http_headers<std::string>;

  // HTTP protocol version, 1.1 unless said otherwise.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    // Version as Beast encodes it (11 for 1.1).
    //
    unsigned
    number () const noexcept {return major * 10u + minor;}

    // HTTP/1.1
    //
    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }
}

#include <repopack/http/http-types.ixx>
