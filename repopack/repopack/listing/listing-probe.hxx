#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>

namespace repopack
{
  // Ref disambiguation.
  //
  // A locator like owner/repo/tree/feature/x/src can mean ref "feature" with
  // directory "x/src" or ref "feature/x" with directory "src" (or ...). Only
  // the remote can tell, so we probe: list with the current split and, if
  // the ref is not found, move the first directory segment onto the ref and
  // try again until the directory runs out.
  //
  // The transition function is pure so that the walk can be tested without
  // a network.
  //
  enum class probe_state
  {
    probing,   // Ref and dir are the next split to try.
    resolved,  // The last split was found.
    exhausted  // Not found and no segments left to move.
  };

  std::ostream&
  operator<< (std::ostream&, probe_state);

  enum class probe_outcome
  {
    found,
    not_found
  };

  struct ref_probe
  {
    probe_state state = probe_state::probing;
    std::string ref;
    std::vector<std::string> segments; // Remaining directory segments.
    std::size_t attempts = 0;          // Number of outcomes applied.

    // Remaining segments joined with '/'.
    //
    std::string
    dir () const;
  };

  // Start probing with the ref and directory as parsed.
  //
  ref_probe
  make_probe (std::string ref, const std::string& dir);

  // Apply the outcome of listing with the probe's current split. Applying
  // an outcome to a probe that is no longer probing returns it unchanged.
  //
  ref_probe
  transition (const ref_probe&, probe_outcome);
}
