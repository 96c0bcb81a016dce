#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <boost/json.hpp>

#include <repopack/http/http-types.hxx>

namespace repopack
{
  namespace json = boost::json;

  // GitHub repository (only what we use of it).
  //
  struct github_repository
  {
    std::string full_name;
    std::string default_branch;

    bool
    empty () const {return full_name.empty ();}
  };

  // Entry of a git tree or of a directory's contents.
  //
  // In trees the type is "blob", "tree", or "commit" (submodule). In
  // contents it is "file", "dir", "symlink", or "submodule".
  //
  struct github_entry
  {
    std::string type;
    std::string path;
  };

  // Recursive git tree listing. The API stops at an entry count ceiling in
  // which case truncated is set and entries is partial.
  //
  struct github_tree
  {
    std::vector<github_entry> entries;
    bool truncated = false;
  };

  // GitHub API rate limit information.
  //
  struct github_rate_limit
  {
    std::uint32_t limit = 0;     // Maximum number of requests per hour.
    std::uint32_t remaining = 0; // Number of requests remaining.
    std::uint64_t reset = 0;     // Unix timestamp when the limit resets.
    std::uint32_t used = 0;      // Number of requests used.

    bool
    is_exceeded () const {return remaining == 0;}

    // Zero if the reset time is unknown or already passed.
    //
    std::uint64_t
    seconds_until_reset () const;

    // Extract from the x-ratelimit-* response headers. Return nullopt if
    // the server did not say how many requests remain. The rest is filled
    // in if present and left zero otherwise.
    //
    static std::optional<github_rate_limit>
    parse (const http_headers&);
  };

  // Parsing and protocol constants.
  //
  // The parse functions let Boost.JSON's exceptions through if the payload
  // does not have the expected shape.
  //
  struct github_api_traits
  {
    using repository_type = github_repository;
    using entry_type      = github_entry;
    using tree_type       = github_tree;

    static repository_type
    parse_repository (const json::value&);

    static tree_type
    parse_tree (const json::value&);

    // The contents endpoint returns an array for a directory and a single
    // object for a file.
    //
    static std::vector<entry_type>
    parse_contents (const json::value&);

    static std::string
    user_agent ()
    {
      return "repopack/0.1.0";
    }

    static std::string
    media_type ()
    {
      return "application/vnd.github+json";
    }

    static std::string
    api_version ()
    {
      return "2022-11-28";
    }
  };
}
