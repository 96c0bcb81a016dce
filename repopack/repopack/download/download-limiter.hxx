#pragma once

#include <cstddef>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/asio/experimental/channel.hpp>

namespace repopack
{
  namespace asio = boost::asio;

  // Counting semaphore for coroutines on a single-threaded context.
  //
  // Implemented as a buffered channel: acquiring sends a token (and suspends
  // while the buffer is full), releasing takes one out.
  //
  class download_limiter
  {
  public:
    using executor_type = asio::any_io_executor;

    download_limiter (executor_type ex, std::size_t n)
      : tokens_ (ex, check (n)) {}

    download_limiter (const download_limiter&) = delete;
    download_limiter& operator= (const download_limiter&) = delete;

    asio::awaitable<void>
    acquire ()
    {
      co_await tokens_.async_send (boost::system::error_code (),
                                   asio::use_awaitable);
    }

    // Only called by the holder of a slot so there is always a token to
    // take out.
    //
    void
    release () noexcept
    {
      static_cast<void> (
        tokens_.try_receive ([] (boost::system::error_code) {}));
    }

  private:
    static std::size_t
    check (std::size_t n)
    {
      if (n == 0)
        throw std::invalid_argument ("concurrency limit must be positive");

      return n;
    }

  private:
    asio::experimental::channel<void (boost::system::error_code)> tokens_;
  };

  // Slot held for the lifetime of the object.
  //
  class download_slot
  {
  public:
    explicit
    download_slot (download_limiter& l): limiter_ (&l) {}

    download_slot (const download_slot&) = delete;
    download_slot& operator= (const download_slot&) = delete;

    ~download_slot () {release ();}

    // Release early.
    //
    void
    release () noexcept
    {
      if (limiter_ != nullptr)
      {
        limiter_->release ();
        limiter_ = nullptr;
      }
    }

  private:
    download_limiter* limiter_;
  };
}
