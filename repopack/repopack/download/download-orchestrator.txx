#include <utility>
#include <exception>
#include <system_error>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <repopack/repopack-error.hxx>
#include <repopack/output/output-writer.hxx>

namespace repopack
{
  template <typename F>
  void basic_download_orchestrator<F>::
  record (download_result& r, const file_outcome& o)
  {
    r.record (o);

    if (on_complete_)
      on_complete_ (o,
                    r.downloaded + r.skipped + r.failed + r.cancelled_count,
                    r.total);
  }

  template <typename F>
  asio::awaitable<download_result> basic_download_orchestrator<F>::
  run (const repo_locator& l,
       std::vector<std::string> files,
       download_options o,
       cancellation& c)
  {
    download_result r;
    r.total = files.size ();

    // Nothing to wait for if we were stopped before we started.
    //
    if (c.requested ())
    {
      for (std::string& p: files)
        record (r, file_outcome {std::move (p), outcome_kind::cancelled});

      r.cancelled = true;
      co_return r;
    }

    if (files.empty ())
      co_return r;

    auto s (std::make_shared<run_state> (
              ioc_, l, std::move (o), fetcher_, c, files.size ()));

    // Wake up the receive below on cancellation. The units may outlive the
    // run and the cancellation the units.
    //
    std::weak_ptr<run_state> w (s);
    c.subscribe ([w] ()
    {
      if (auto s = w.lock ())
        s->outcomes.cancel ();
    });

    for (std::string& p: files)
      asio::co_spawn (ioc_, unit (s, std::move (p)), asio::detached);

    while (r.downloaded + r.skipped + r.failed + r.cancelled_count != r.total)
    {
      if (c.requested ())
        break;

      boost::system::error_code ec;
      file_outcome fo (
        co_await s->outcomes.async_receive (
          asio::redirect_error (asio::use_awaitable, ec)));

      // Cancelled.
      //
      if (ec)
        break;

      record (r, fo);
    }

    // Take whatever completed while we were being cancelled but don't wait
    // for anything else.
    //
    if (c.requested ())
    {
      r.cancelled = true;

      for (bool more (true); more; )
      {
        more = s->outcomes.try_receive (
          [this, &r] (boost::system::error_code ec, file_outcome fo)
          {
            if (!ec)
              record (r, fo);
          });
      }
    }

    co_return r;
  }

  template <typename F>
  asio::awaitable<void> basic_download_orchestrator<F>::
  unit (std::shared_ptr<run_state> s, std::string path)
  {
    file_outcome o {std::move (path), outcome_kind::cancelled};

    if (!s->cancel.requested ())
    {
      co_await s->limiter.acquire ();
      download_slot slot (s->limiter);

      // The cancellation may have been requested while we were waiting.
      //
      if (!s->cancel.requested ())
        co_await process (*s, o);
    }

    // The buffer has room for every outcome so this never suspends, even
    // if the run is no longer listening.
    //
    co_await s->outcomes.async_send (boost::system::error_code (),
                                     std::move (o),
                                     asio::use_awaitable);
  }

  template <typename F>
  asio::awaitable<void> basic_download_orchestrator<F>::
  process (run_state& s, file_outcome& o)
  {
    const download_options& opt (s.options);

    try
    {
      if (opt.resume)
      {
        fs::path t (output_path (opt.anchor, o.path, opt.output));

        std::error_code ec;
        if (fs::exists (t, ec))
        {
          o.kind = outcome_kind::skipped;
          o.target = std::move (t);
          co_return;
        }
      }

      std::string content (co_await s.fetcher.fetch (o.path, s.locator));

      o.target = save_file (opt.anchor, o.path, content, opt.output);
      o.kind = outcome_kind::downloaded;
    }
    catch (const error& e)
    {
      o.kind = outcome_kind::failed;
      o.failure = download_failure {o.path, e.kind (), e.what ()};
    }
    catch (const std::exception& e)
    {
      o.kind = outcome_kind::failed;
      o.failure = download_failure {o.path,
                                    error_kind::download_failed,
                                    e.what ()};
    }
  }
}
