#pragma once

#include <string>

namespace repopack
{
  // URL parts.
  //
  struct url_parts
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path, query, and fragment. Never empty.
  };

  // Split a scheme://host[:port]/target URL into its components.
  //
  // Note that we are doing this manually to avoid a dependency on a full URI
  // library. This handles the URLs we build and the ones servers redirect us
  // to, but not the exotic stuff (IPv6 literals, user info). The scheme
  // defaults to http and the port to the scheme's default.
  //
  url_parts
  parse_url (const std::string&);

  // Return scheme://host[:port] for the URL, that is, everything but the
  // target. Used to resolve relative redirect locations.
  //
  std::string
  url_origin (const url_parts&);

  // Percent-encode everything except the RFC 3986 unreserved characters. If
  // keep_slash is true, then '/' is also passed through, which is what we
  // want for path components made of several segments.
  //
  std::string
  percent_encode (const std::string&, bool keep_slash = false);

  // Decode %XX escapes. A '%' that is not followed by two hex digits is kept
  // as is.
  //
  std::string
  percent_decode (const std::string&);
}
