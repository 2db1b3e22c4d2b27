#include <mfdl/progress/progress-types.hxx>

#include <atomic>
#include <thread>
#include <vector>
#include <cassert>
#include <cstddef>
#include <cstdint>

using namespace std;
using namespace mfdl;

// A stale update arriving after a newer one leaves the newer value.
//
static void
test_raise_to ()
{
  atomic<size_t> a {0};

  raise_to (a, size_t (3));
  assert (a == 3);

  raise_to (a, size_t (2));
  assert (a == 3);

  raise_to (a, size_t (3));
  assert (a == 3);

  raise_to (a, size_t (7));
  assert (a == 7);
}

// Writers on several threads, each counting up but interleaved arbitrarily,
// end at the largest value any of them wrote and never go back on the way.
//
static void
test_raise_to_concurrent ()
{
  atomic<uint64_t> a {0};
  atomic<bool> backwards {false};

  const size_t threads (4);
  const uint64_t steps (10000);

  vector<thread> ts;
  for (size_t t (0); t != threads; ++t)
  {
    ts.emplace_back ([&a, &backwards, t, threads, steps] ()
    {
      uint64_t seen (0);

      for (uint64_t i (0); i != steps; ++i)
      {
        raise_to<uint64_t> (a, i * threads + t);

        uint64_t v (a.load ());
        if (v < seen)
          backwards = true;
        seen = v;
      }
    });
  }

  for (thread& t: ts)
    t.join ();

  assert (!backwards);
  assert (a == (steps - 1) * threads + (threads - 1));
}

int
main ()
{
  test_raise_to ();
  test_raise_to_concurrent ();
}
