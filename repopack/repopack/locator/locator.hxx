#pragma once

#include <string>
#include <ostream>
#include <optional>

namespace repopack
{
  // Remote directory locator.
  //
  // The ref is absent if the locator did not name one, in which case the
  // repository's default branch is resolved before listing. The directory
  // never has leading or trailing separators and is empty for the
  // repository root.
  //
  // Note that the listing may move leading directory segments onto the ref
  // while it works out where a slash-containing ref ends.
  //
  struct repo_locator
  {
    std::string owner;
    std::string repo;
    std::optional<std::string> ref;
    std::string dir;

    // Last segment of the directory or empty if it is the root. Output paths
    // are re-rooted at this segment.
    //
    std::string
    anchor () const;

    // owner/repo[@ref][:dir]
    //
    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const repo_locator& l)
  {
    return o << l.string ();
  }

  // Parse a locator of the form:
  //
  // [scheme://host/]<owner>/<repo>[/tree/<ref>[/<dir>]]
  // [scheme://host/]<owner>/<repo>[/<dir>]
  //
  // The host is not validated so that self-hosted instances with the same
  // path layout work. Query and fragment are ignored. Throw invalid_locator
  // if there is no owner/repo, if any segment after it is blob (a single
  // file view), or if tree is not followed by a ref.
  //
  repo_locator
  parse_locator (const std::string&);
}
