#include <utility>
#include <algorithm>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

namespace mfdl
{
  template <typename T>
  basic_progress_manager<T>::
  basic_progress_manager (asio::io_context& ioc)
    : strand_ (asio::make_strand (ioc)),
      timer_ (strand_)
  {
  }

  template <typename T>
  basic_progress_manager<T>::
  ~basic_progress_manager ()
  {
    if (running_.exchange (false, std::memory_order_relaxed))
    {
      timer_.cancel ();
      renderer_.stop ();
    }
  }

  template <typename T>
  void basic_progress_manager<T>::
  start ()
  {
    if (running_.exchange (true, std::memory_order_relaxed))
      return;

    try
    {
      renderer_.start ();
    }
    catch (const std::system_error&)
    {
      running_.store (false, std::memory_order_relaxed);
      throw;
    }

    asio::co_spawn (strand_, tick_loop (), asio::detached);
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  stop ()
  {
    if (!running_.exchange (false, std::memory_order_relaxed))
      co_return;

    // Hop onto the strand to stop the ticks and push the final numbers.
    //
    co_await asio::co_spawn (
      strand_,
      [this] () -> asio::awaitable<void>
      {
        timer_.cancel ();
        sample ();
        renderer_.show (view ());
        co_return;
      },
      asio::use_awaitable);

    renderer_.stop ();
  }

  template <typename T>
  std::shared_ptr<typename basic_progress_manager<T>::row_type>
  basic_progress_manager<T>::
  add_row (string_type l)
  {
    auto r (std::make_shared<row_type> (std::move (l)));

    asio::post (strand_, [this, r] {rows_.push_back (r);});
    return r;
  }

  template <typename T>
  void basic_progress_manager<T>::
  finish_row (std::shared_ptr<row_type> r,
              string_type s,
              bool f,
              std::chrono::milliseconds d)
  {
    asio::post (strand_,
                [this, r = std::move (r), s = std::move (s), f, d] () mutable
    {
      r->status_ = std::move (s);
      r->phase_ = f ? progress_phase::failed : progress_phase::finished;

      asio::co_spawn (strand_, expire (std::move (r), d), asio::detached);
    });
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  expire (std::shared_ptr<row_type> r, std::chrono::milliseconds d)
  {
    if (d.count () > 0)
    {
      asio::steady_timer t (strand_, d);

      // Cancelled or not, the row goes.
      //
      boost::system::error_code ec;
      co_await t.async_wait (asio::redirect_error (asio::use_awaitable, ec));
    }

    remove_row (std::move (r));
  }

  template <typename T>
  void basic_progress_manager<T>::
  remove_row (std::shared_ptr<row_type> r)
  {
    asio::post (strand_, [this, r]
    {
      auto i (std::find (rows_.begin (), rows_.end (), r));

      if (i != rows_.end ())
      {
        rows_.erase (i);
        removed_bytes_ += r->counters_.received.load (std::memory_order_relaxed);
      }
    });
  }

  template <typename T>
  void basic_progress_manager<T>::
  note (string_type m)
  {
    asio::post (strand_, [this, m = std::move (m)] () mutable
    {
      notes_.push_back (std::move (m));

      while (notes_.size () > renderer_type::traits_type::max_notes)
        notes_.pop_front ();
    });
  }

  template <typename T>
  void basic_progress_manager<T>::
  set_totals (std::size_t d, std::size_t n, std::uint64_t b) noexcept
  {
    // The aggregate notifies from whichever strand changed it, so a stale
    // snapshot may arrive after a newer one.
    //
    raise_to (files_done_, d);
    raise_to (files_total_, n);
    raise_to (total_bytes_, b);
  }

  template <typename T>
  asio::awaitable<void> basic_progress_manager<T>::
  tick_loop ()
  {
    while (running_.load (std::memory_order_relaxed))
    {
      sample ();
      renderer_.show (view ());

      timer_.expires_after (traits_type::tick_period);

      boost::system::error_code ec;
      co_await timer_.async_wait (asio::redirect_error (asio::use_awaitable, ec));

      if (ec == asio::error::operation_aborted)
        break;
    }
  }

  template <typename T>
  void basic_progress_manager<T>::
  sample ()
  {
    std::uint64_t n (removed_bytes_);

    for (const auto& r: rows_)
    {
      std::uint64_t c (r->counters_.received.load (std::memory_order_relaxed));
      n += c;

      if (r->phase_ == progress_phase::transferring)
        r->meter_.sample (c);
    }

    received_ = n;
    meter_.sample (n);

    // A resumed file, or one whose size only became known mid-transfer, may
    // take us past the total we were told about.
    //
    raise_to (total_bytes_, n);
  }

  template <typename T>
  typename basic_progress_manager<T>::view_type basic_progress_manager<T>::
  view () const
  {
    view_type v;
    v.rows.reserve (rows_.size ());

    for (const auto& r: rows_)
    {
      const transfer_counters& c (r->counters_);

      transfer_snapshot t;
      t.received = c.received.load (std::memory_order_relaxed);
      t.expected = c.expected.load (std::memory_order_relaxed);
      t.phase = r->phase_;
      t.rate = r->phase_ == progress_phase::transferring
        ? r->meter_.rate ()
        : 0.0;

      v.rows.push_back (typename view_type::row {r->label_, r->status_, t});
    }

    v.files_done = files_done_.load (std::memory_order_relaxed);
    v.files_total = files_total_.load (std::memory_order_relaxed);

    v.overall.received = received_;
    v.overall.expected = total_bytes_.load (std::memory_order_relaxed);
    v.overall.rate = meter_.rate ();
    v.overall.phase = v.files_total != 0 && v.files_done == v.files_total
      ? progress_phase::finished
      : progress_phase::transferring;

    v.notes.assign (notes_.begin (), notes_.end ());
    return v;
  }
}
