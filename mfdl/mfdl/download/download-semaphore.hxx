#pragma once

#include <mutex>
#include <deque>
#include <memory>
#include <utility> // std::exchange (used by boost/asio/awaitable.hpp)
#include <cstddef>

#include <boost/asio.hpp>

namespace mfdl
{
  namespace asio = boost::asio;

  // Counting semaphore for coroutines.
  //
  // Hands out up to the specified number of permits; further acquire() calls
  // suspend (without blocking the thread) until a permit is released, and
  // are served in FIFO order. The permit is an RAII guard so it is released
  // however the holder exits, exceptions included.
  //
  // Waiting is implemented with a per-waiter timer that never expires and
  // is cancelled by the releasing side. The cancellation is posted to the
  // waiter's executor, so acquire() must be called from a coroutine whose
  // executor serializes its handlers (a strand or a single-threaded
  // io_context).
  //
  class async_semaphore
  {
  public:
    class permit
    {
    public:
      permit () = default;

      explicit
      permit (async_semaphore& s) noexcept: sem_ (&s) {}

      permit (permit&& p) noexcept: sem_ (p.sem_) {p.sem_ = nullptr;}

      permit&
      operator= (permit&& p) noexcept
      {
        if (this != &p)
        {
          reset ();
          sem_ = p.sem_;
          p.sem_ = nullptr;
        }
        return *this;
      }

      permit (const permit&) = delete;
      permit& operator= (const permit&) = delete;

      ~permit () {reset ();}

      // Release the permit early.
      //
      void
      reset () noexcept
      {
        if (sem_ != nullptr)
        {
          sem_->release ();
          sem_ = nullptr;
        }
      }

      explicit
      operator bool () const noexcept
      {
        return sem_ != nullptr;
      }

    private:
      async_semaphore* sem_ = nullptr;
    };

    explicit
    async_semaphore (std::size_t permits);

    async_semaphore (const async_semaphore&) = delete;
    async_semaphore& operator= (const async_semaphore&) = delete;

    asio::awaitable<permit>
    acquire ();

    std::size_t
    capacity () const noexcept
    {
      return capacity_;
    }

    // Number of permits currently held.
    //
    std::size_t
    in_use () const;

    // Highest number of permits ever held at the same time.
    //
    std::size_t
    peak () const;

    std::size_t
    waiting () const;

  private:
    void
    release () noexcept;

    struct waiter
    {
      explicit
      waiter (const asio::any_io_executor& ex)
        : timer (ex, asio::steady_timer::time_point::max ()) {}

      asio::steady_timer timer;
      bool granted = false;
    };

    // Record one more permit as held. Call with the mutex locked.
    //
    void
    take () noexcept;

  private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::size_t available_;
    std::size_t peak_ = 0;
    std::deque<std::shared_ptr<waiter>> waiters_;
  };
}
