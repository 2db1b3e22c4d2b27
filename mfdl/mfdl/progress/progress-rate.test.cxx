#include <mfdl/progress/progress-rate.hxx>

#include <chrono>
#include <cassert>

using namespace std;
using namespace mfdl;

using chrono::milliseconds;

static const rate_meter::time_point t0 (chrono::steady_clock::now ());

static rate_meter::time_point
at (int ms)
{
  return t0 + milliseconds (ms);
}

static void
test_first ()
{
  rate_meter m;
  assert (m.rate () == 0.0);

  // One sample says nothing about the rate.
  //
  m.sample (1000, at (0));
  assert (m.rate () == 0.0);

  m.sample (2000, at (1000));
  assert (m.rate () == 1000.0);
}

static void
test_interval ()
{
  rate_meter m (0.2, milliseconds (500));

  m.sample (0, at (0));
  m.sample (100000, at (100)); // Too soon, ignored.
  assert (m.rate () == 0.0);

  // Measured against the last accepted sample.
  //
  m.sample (500, at (500));
  assert (m.rate () == 1000.0);
}

static void
test_smoothing ()
{
  rate_meter m (0.5, milliseconds (0));

  m.sample (0, at (0));
  m.sample (1000, at (1000));
  assert (m.rate () == 1000.0);

  m.sample (4000, at (2000));
  assert (m.rate () == 2000.0); // Halfway between 1000 and 3000.

  // Going backwards counts as standing still.
  //
  m.sample (0, at (3000));
  assert (m.rate () == 1000.0);
}

static void
test_reset ()
{
  rate_meter m;

  m.sample (0, at (0));
  m.sample (1000, at (1000));
  assert (m.rate () != 0.0);

  m.reset ();
  assert (m.rate () == 0.0);

  m.sample (5000, at (2000));
  assert (m.rate () == 0.0);
}

int
main ()
{
  test_first ();
  test_interval ();
  test_smoothing ();
  test_reset ();
}
