#include <mfdl/download/download-retry.hxx>

#include <limits>
#include <algorithm>

using namespace std;

namespace mfdl
{
  static uint64_t
  random_seed ()
  {
    random_device rd;
    return (static_cast<uint64_t> (rd ()) << 32) ^ rd ();
  }

  retry_backoff::
  retry_backoff (const retry_policy& p)
    : retry_backoff (p, random_seed ())
  {
  }

  retry_backoff::
  retry_backoff (const retry_policy& p, uint64_t seed)
    : policy_ (p), rng_ (seed)
  {
  }

  retry_backoff::duration retry_backoff::
  capped (duration d) const noexcept
  {
    return clamp (d, duration::zero (), policy_.backoff_cap);
  }

  retry_backoff::duration retry_backoff::
  scaled (duration lo, duration hi, size_t attempt)
  {
    if (hi < lo)
      swap (lo, hi);

    uniform_int_distribution<duration::rep> d (lo.count (), hi.count ());
    duration::rep j (d (rng_));

    // Scale by 2^(attempt-1), saturating instead of overflowing.
    //
    size_t s (attempt > 0 ? attempt - 1 : 0);

    for (; s != 0 && j < policy_.backoff_cap.count (); --s)
    {
      if (j > numeric_limits<duration::rep>::max () / 2)
        break;

      j *= 2;
    }

    return capped (duration (j));
  }

  retry_backoff::duration retry_backoff::
  probe_delay (size_t attempt)
  {
    return scaled (policy_.probe_jitter_min,
                   policy_.probe_jitter_max,
                   attempt);
  }

  retry_backoff::duration retry_backoff::
  fetch_delay (size_t attempt, optional<chrono::seconds> ra)
  {
    if (ra)
    {
      // Guard against absurd values before converting to milliseconds.
      //
      chrono::seconds cap (
        chrono::duration_cast<chrono::seconds> (policy_.backoff_cap) +
        chrono::seconds (1));

      return capped (chrono::duration_cast<duration> (min (*ra, cap)));
    }

    return scaled (policy_.fetch_jitter_min,
                   policy_.fetch_jitter_max,
                   attempt);
  }
}
