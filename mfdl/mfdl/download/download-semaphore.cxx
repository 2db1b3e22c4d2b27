#include <mfdl/download/download-semaphore.hxx>

#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

using namespace std;

namespace mfdl
{
  async_semaphore::
  async_semaphore (size_t n)
    : capacity_ (n), available_ (n)
  {
    if (n == 0)
      throw invalid_argument ("semaphore must have at least one permit");
  }

  void async_semaphore::
  take () noexcept
  {
    size_t u (capacity_ - available_);
    if (u > peak_)
      peak_ = u;
  }

  asio::awaitable<async_semaphore::permit> async_semaphore::
  acquire ()
  {
    auto ex (co_await asio::this_coro::executor);
    shared_ptr<waiter> w;

    {
      lock_guard<mutex> l (mutex_);

      if (available_ != 0 && waiters_.empty ())
      {
        --available_;
        take ();
        co_return permit (*this);
      }

      w = make_shared<waiter> (ex);
      waiters_.push_back (w);
    }

    // Wait for release() to hand our permit over. The timer never expires on
    // its own, so any wake-up is a cancellation; we still re-check the flag
    // in case of a stray one.
    //
    for (;;)
    {
      boost::system::error_code ec;
      co_await w->timer.async_wait (
        asio::redirect_error (asio::use_awaitable, ec));

      lock_guard<mutex> l (mutex_);
      if (w->granted)
        break;
    }

    co_return permit (*this);
  }

  void async_semaphore::
  release () noexcept
  {
    shared_ptr<waiter> w;

    {
      lock_guard<mutex> l (mutex_);

      if (waiters_.empty ())
      {
        ++available_;
        return;
      }

      // Transfer the permit directly to the first waiter: the number in use
      // does not change.
      //
      w = move (waiters_.front ());
      waiters_.pop_front ();
      w->granted = true;
    }

    asio::post (w->timer.get_executor (), [w] {w->timer.cancel ();});
  }

  size_t async_semaphore::
  in_use () const
  {
    lock_guard<mutex> l (mutex_);
    return capacity_ - available_;
  }

  size_t async_semaphore::
  peak () const
  {
    lock_guard<mutex> l (mutex_);
    return peak_;
  }

  size_t async_semaphore::
  waiting () const
  {
    lock_guard<mutex> l (mutex_);
    return waiters_.size ();
  }
}
