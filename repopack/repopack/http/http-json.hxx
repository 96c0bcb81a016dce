#pragma once

#include <boost/json.hpp>

#include <repopack/http/http-response.hxx>

namespace repopack
{
  // Parse the response body as a JSON document.
  //
  // Throw std::runtime_error if there is no body or it does not parse. The
  // diagnostics quote the beginning of the body since a proxy or captive
  // portal answering with HTML is the usual suspect.
  //
  template <typename S>
  boost::json::value
  parse_json (const basic_http_response<S>&);
}

#include <repopack/http/http-json.ixx>
