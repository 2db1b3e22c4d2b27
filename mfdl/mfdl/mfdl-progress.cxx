#include <mfdl/mfdl-progress.hxx>

using namespace std;

namespace mfdl
{
  progress_coordinator::
  progress_coordinator (asio::io_context& ioc)
    : manager_ (make_unique<progress_manager> (ioc))
  {
  }

  void progress_coordinator::
  start ()
  {
    manager_->start ();
  }

  asio::awaitable<void> progress_coordinator::
  stop ()
  {
    co_await manager_->stop ();
  }

  bool progress_coordinator::
  running () const noexcept
  {
    return manager_->running ();
  }

  shared_ptr<progress_coordinator::row_type> progress_coordinator::
  add_row (string l)
  {
    return manager_->add_row (move (l));
  }

  void progress_coordinator::
  update_row (row_type& r, uint64_t n, uint64_t e)
  {
    transfer_counters& c (r.counters ());
    c.received.store (n, memory_order_relaxed);

    // The size may only become known part way through.
    //
    if (e != 0)
      c.expected.store (e, memory_order_relaxed);
  }

  void progress_coordinator::
  finish_row (shared_ptr<row_type> r, string s, bool f)
  {
    manager_->finish_row (move (r), move (s), f, linger_period);
  }

  void progress_coordinator::
  update_totals (size_t d, size_t n, uint64_t b)
  {
    manager_->set_totals (d, n, b);
  }

  void progress_coordinator::
  note (string m)
  {
    manager_->note (move (m));
  }
}
