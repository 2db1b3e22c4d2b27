#include <mfdl/progress/progress-format.hxx>
#include <mfdl/progress/progress-types.hxx>

#include <chrono>
#include <cassert>

using namespace std;
using namespace mfdl;

using traits = progress_format;

static void
test_size ()
{
  assert (traits::size (0) == "0 B");
  assert (traits::size (500) == "500 B");
  assert (traits::size (1023) == "1023 B");
  assert (traits::size (1024) == "1.0 KiB");
  assert (traits::size (1536) == "1.5 KiB");
  assert (traits::size (5ULL * 1024 * 1024) == "5.0 MiB");
  assert (traits::size (3ULL * 1024 * 1024 * 1024) == "3.0 GiB");

  // Past the largest unit we keep counting in it.
  //
  assert (traits::size (2048ULL << 40) == "2048.0 TiB");
}

static void
test_rate ()
{
  assert (traits::rate (0.0) == "0 B/s");
  assert (traits::rate (-5.0) == "0 B/s");
  assert (traits::rate (500.0) == "500 B/s");
  assert (traits::rate (2048.0) == "2.0 KiB/s");
  assert (traits::rate (1.5 * 1024 * 1024) == "1.5 MiB/s");
}

static void
test_duration ()
{
  using chrono::seconds;

  assert (traits::duration (seconds (0)) == "0s");
  assert (traits::duration (seconds (42)) == "42s");
  assert (traits::duration (seconds (60)) == "1m00s");
  assert (traits::duration (seconds (185)) == "3m05s");
  assert (traits::duration (seconds (3720)) == "1h02m");
  assert (traits::duration (seconds (-3)) == "0s");
}

static void
test_snapshot ()
{
  transfer_snapshot s;
  s.received = 250;
  s.expected = 1000;
  s.rate = 50.0;

  assert (s.known ());
  assert (s.fraction () == 0.25);
  assert (s.remaining () && *s.remaining () == chrono::seconds (15));

  // Resumed files can have more than they were expected to.
  //
  s.received = 1500;
  assert (s.fraction () == 1.0);
  assert (!s.remaining ());

  // Size unknown.
  //
  s.expected = 0;
  assert (!s.known ());
  assert (s.fraction () == 0.0);
  assert (!s.remaining ());

  // Finished is complete whatever the counters say.
  //
  s.phase = progress_phase::finished;
  assert (s.fraction () == 1.0);

  // Not moving: no estimate.
  //
  transfer_snapshot z;
  z.expected = 10;
  assert (!z.remaining ());
}

int
main ()
{
  test_size ();
  test_rate ();
  test_duration ();
  test_snapshot ();
}
