#pragma once

#include <chrono>
#include <random>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace mfdl
{
  // Throttling (429) retry policy.
  //
  // Both the size probe and the fetch retry in a loop bounded by
  // max_attempts. The delay before retry n (1-based) is a uniform jitter
  // drawn from the respective range and scaled by 2^(n-1), never exceeding
  // backoff_cap. A server-provided Retry-After replaces the jitter for
  // fetches (but is still capped).
  //
  struct retry_policy
  {
    std::size_t max_attempts {10};

    std::chrono::milliseconds probe_jitter_min {500};
    std::chrono::milliseconds probe_jitter_max {1500};

    std::chrono::milliseconds fetch_jitter_min {1000};
    std::chrono::milliseconds fetch_jitter_max {3000};

    std::chrono::milliseconds backoff_cap {30000};
  };

  // Per-download delay calculator. Not thread-safe: each download owns one.
  //
  class retry_backoff
  {
  public:
    using duration = std::chrono::milliseconds;

    explicit
    retry_backoff (const retry_policy&);

    retry_backoff (const retry_policy&, std::uint64_t seed);

    // Delay before retrying a throttled size probe.
    //
    duration
    probe_delay (std::size_t attempt);

    // Delay before restarting a download whose fetch was throttled.
    //
    duration
    fetch_delay (std::size_t attempt,
                 std::optional<std::chrono::seconds> retry_after);

    // True if the specified number of throttled attempts uses up the budget.
    //
    bool
    exhausted (std::size_t attempts) const noexcept
    {
      return attempts >= policy_.max_attempts;
    }

    const retry_policy&
    policy () const noexcept
    {
      return policy_;
    }

  private:
    duration
    scaled (duration min, duration max, std::size_t attempt);

    duration
    capped (duration d) const noexcept;

  private:
    retry_policy policy_;
    std::mt19937_64 rng_;
  };
}
