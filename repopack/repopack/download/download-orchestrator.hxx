#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>

#include <repopack/locator/locator.hxx>
#include <repopack/download/download-types.hxx>
#include <repopack/download/download-limiter.hxx>

namespace repopack
{
  namespace asio = boost::asio;

  // Download orchestrator.
  //
  // Each file is a unit of work spawned on the context: check for
  // cancellation, wait for a slot, check again, then either skip it (resume)
  // or fetch and save it. The outcomes are aggregated in the order they
  // complete.
  //
  // The fetcher type provides:
  //
  // asio::awaitable<std::string> fetch (std::string, const repo_locator&);
  //
  // The context must be single-threaded.
  //
  template <typename F>
  class basic_download_orchestrator
  {
  public:
    using fetcher_type = F;

    // Called for every outcome recorded, with the number of outcomes so far.
    //
    using completion_callback =
      std::function<void (const file_outcome&,
                          std::size_t done,
                          std::size_t total)>;

    basic_download_orchestrator (asio::io_context& ioc, fetcher_type& f)
      : ioc_ (ioc), fetcher_ (f) {}

    basic_download_orchestrator (const basic_download_orchestrator&) = delete;
    basic_download_orchestrator& operator= (const basic_download_orchestrator&) = delete;

    void
    set_completion_callback (completion_callback cb)
    {
      on_complete_ = std::move (cb);
    }

    // Download the files (repository paths as returned by the listing) under
    // the output root. The locator must have its ref resolved.
    //
    // Per-file errors are recorded in the result. If the cancellation is
    // requested, stop waiting for the outstanding units and return what has
    // been recorded so far with the cancelled flag set. Units that already
    // started their transfer keep running on the context until they are
    // done, and so both the fetcher and the cancellation must outlive it.
    //
    // Throw std::invalid_argument if the concurrency is 0.
    //
    asio::awaitable<download_result>
    run (const repo_locator& l,
         std::vector<std::string> files,
         download_options o,
         cancellation& c);

  private:
    using outcome_channel =
      asio::experimental::channel<void (boost::system::error_code,
                                        file_outcome)>;

    struct run_state
    {
      run_state (asio::io_context& ioc,
                 const repo_locator& l,
                 download_options o,
                 fetcher_type& f,
                 cancellation& c,
                 std::size_t n)
        : locator (l),
          options (std::move (o)),
          fetcher (f),
          cancel (c),
          limiter (ioc.get_executor (), options.concurrency),
          outcomes (ioc.get_executor (), n) {}

      repo_locator locator;
      download_options options;
      fetcher_type& fetcher;
      cancellation& cancel;
      download_limiter limiter;
      outcome_channel outcomes;
    };

    static asio::awaitable<void>
    unit (std::shared_ptr<run_state> s, std::string path);

    // Skip or fetch and save, recording the result in the outcome.
    //
    static asio::awaitable<void>
    process (run_state& s, file_outcome& o);

    void
    record (download_result& r, const file_outcome& o);

  private:
    asio::io_context& ioc_;
    fetcher_type& fetcher_;
    completion_callback on_complete_;
  };
}

#include <repopack/download/download-orchestrator.txx>
