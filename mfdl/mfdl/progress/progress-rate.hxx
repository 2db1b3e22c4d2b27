#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace mfdl
{
  // Transfer rate estimate over a byte counter.
  //
  // Samples taken closer together than the interval are ignored and the
  // rest are folded into an exponentially weighted moving average, which
  // keeps the displayed rate from jumping around with every chunk. Not
  // thread-safe.
  //
  template <typename C = std::chrono::steady_clock>
  class basic_rate_meter
  {
  public:
    using clock_type = C;
    using time_point = typename clock_type::time_point;
    using duration = typename clock_type::duration;

    explicit
    basic_rate_meter (double smoothing = 0.2,
                      duration interval = std::chrono::milliseconds (500));

    void
    sample (std::uint64_t bytes)
    {
      sample (bytes, clock_type::now ());
    }

    void
    sample (std::uint64_t bytes, time_point now);

    // Bytes per second, 0 until there are two samples far enough apart.
    //
    double
    rate () const noexcept
    {
      return rate_;
    }

    void
    reset () noexcept;

  private:
    double smoothing_;
    duration interval_;

    std::optional<time_point> last_time_;
    std::uint64_t last_bytes_ = 0;

    double rate_ = 0.0;
    bool measured_ = false;
  };

  using rate_meter = basic_rate_meter<>;
}

#include <mfdl/progress/progress-rate.txx>
