#include <mfdl/download/download-semaphore.hxx>

#include <cassert>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <stdexcept>
#include <iostream>

#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;
using namespace mfdl;

namespace asio = boost::asio;

struct counters
{
  atomic<size_t> active {0};
  atomic<size_t> peak {0};
  atomic<size_t> done {0};
};

static asio::awaitable<void>
hold (async_semaphore& s, counters& c, chrono::milliseconds d)
{
  async_semaphore::permit p (co_await s.acquire ());
  assert (p);

  size_t n (++c.active);
  for (size_t m (c.peak.load ()); n > m && !c.peak.compare_exchange_weak (m, n); )
    ;

  asio::steady_timer t (co_await asio::this_coro::executor, d);
  co_await t.async_wait (asio::use_awaitable);

  --c.active;
  ++c.done;
}

// Throws while holding the permit: the permit must still be returned.
//
static asio::awaitable<void>
hold_and_throw (async_semaphore& s)
{
  async_semaphore::permit p (co_await s.acquire ());
  throw runtime_error ("boom");
}

static void
run (asio::io_context& ioc, size_t threads)
{
  vector<thread> ts;
  for (size_t i (1); i < threads; ++i)
    ts.emplace_back ([&ioc] {ioc.run ();});

  ioc.run ();

  for (thread& t: ts)
    t.join ();
}

// With two permits and five holders at most two are ever active, and all
// five eventually get their turn.
//
static void
test_bound ()
{
  asio::io_context ioc;
  async_semaphore s (2);
  counters c;

  for (size_t i (0); i != 5; ++i)
    asio::co_spawn (asio::make_strand (ioc),
                    hold (s, c, chrono::milliseconds (20)),
                    asio::detached);

  run (ioc, 4);

  assert (c.done == 5);
  assert (c.peak <= 2);
  assert (s.peak () == 2);
  assert (s.in_use () == 0);
  assert (s.waiting () == 0);
}

static void
test_single ()
{
  asio::io_context ioc;
  async_semaphore s (1);
  counters c;

  for (size_t i (0); i != 10; ++i)
    asio::co_spawn (asio::make_strand (ioc),
                    hold (s, c, chrono::milliseconds (1)),
                    asio::detached);

  run (ioc, 3);

  assert (c.done == 10);
  assert (c.peak == 1);
  assert (s.peak () == 1);
}

static void
test_exception ()
{
  asio::io_context ioc;
  async_semaphore s (1);
  counters c;
  size_t failed (0);

  for (size_t i (0); i != 3; ++i)
    asio::co_spawn (asio::make_strand (ioc),
                    hold_and_throw (s),
                    [&failed] (exception_ptr e) {if (e) ++failed;});

  asio::co_spawn (asio::make_strand (ioc),
                  hold (s, c, chrono::milliseconds (1)),
                  asio::detached);

  run (ioc, 1);

  assert (failed == 3);
  assert (c.done == 1);
  assert (s.in_use () == 0);
}

static void
test_permit ()
{
  asio::io_context ioc;
  async_semaphore s (1);

  asio::co_spawn (
    ioc,
    [&s] () -> asio::awaitable<void>
    {
      async_semaphore::permit p (co_await s.acquire ());
      assert (s.in_use () == 1);

      // Moving does not release.
      //
      async_semaphore::permit q (move (p));
      assert (!p && q);
      assert (s.in_use () == 1);

      q.reset ();
      assert (!q);
      assert (s.in_use () == 0);

      // Releasing twice is harmless.
      //
      q.reset ();
      assert (s.in_use () == 0);
    },
    asio::detached);

  ioc.run ();
  assert (s.peak () == 1);
}

static void
test_invalid ()
{
  try
  {
    async_semaphore s (0);
    assert (false);
  }
  catch (const invalid_argument&)
  {
  }
}

int
main ()
{
  test_bound ();
  test_single ();
  test_exception ();
  test_permit ();
  test_invalid ();
}
