#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <optional>
#include <functional>
#include <filesystem>

#include <repopack/repopack-error.hxx>

namespace repopack
{
  namespace fs = std::filesystem;

  // Per-file outcome.
  //
  enum class outcome_kind
  {
    downloaded, // Fetched and written
    skipped,    // Already present (resume)
    failed,     // Fetch or write error
    cancelled   // Never started
  };

  inline std::ostream&
  operator<< (std::ostream& os, outcome_kind k)
  {
    switch (k)
    {
    case outcome_kind::downloaded: return os << "downloaded";
    case outcome_kind::skipped:    return os << "skipped";
    case outcome_kind::failed:     return os << "failed";
    case outcome_kind::cancelled:  return os << "cancelled";
    }
    return os;
  }

  struct download_failure
  {
    std::string path;
    error_kind kind;
    std::string message;
  };

  struct file_outcome
  {
    std::string path;
    outcome_kind kind {outcome_kind::cancelled};

    // Set if failed.
    //
    std::optional<download_failure> failure;

    // Set if downloaded or skipped.
    //
    fs::path target;
  };

  // Aggregate of a run.
  //
  // Failures are in the order they were recorded which is not necessarily
  // the listing order.
  //
  struct download_result
  {
    std::size_t total {0};
    std::size_t downloaded {0};
    std::size_t skipped {0};
    std::size_t failed {0};

    // Files that never started because of the cancellation. Files that were
    // not even waited for are not counted here but are incomplete.
    //
    std::size_t cancelled_count {0};

    bool cancelled {false};

    std::vector<download_failure> failures;

    // Files that did not make it to the output, counting failed ones and the
    // ones never reached because of the cancellation.
    //
    std::size_t
    incomplete () const noexcept
    {
      return total - downloaded - skipped;
    }

    void
    record (const file_outcome&);
  };

  // Cooperative cancellation.
  //
  // The flag goes from false to true at most once. Units of work poll it;
  // subscribers are called when it is set, which should happen on the thread
  // that runs the download.
  //
  class cancellation
  {
  public:
    cancellation () = default;

    cancellation (const cancellation&) = delete;
    cancellation& operator= (const cancellation&) = delete;

    bool
    requested () const noexcept
    {
      return flag_.load ();
    }

    // Set the flag and notify the subscribers. Return false if it was
    // already set.
    //
    bool
    request ();

    // Call f once the flag is set (right away if it already is).
    //
    void
    subscribe (std::function<void ()> f);

  private:
    std::atomic<bool> flag_ {false};
    std::vector<std::function<void ()>> subscribers_;
  };

  struct download_options
  {
    // Output root.
    //
    fs::path output;

    // Re-root repository paths at this component (see find_relative_path()).
    //
    std::string anchor;

    std::size_t concurrency {5};

    // Skip files that already exist under the output root.
    //
    bool resume {false};
  };
}
