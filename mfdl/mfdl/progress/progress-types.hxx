#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace mfdl
{
  // Where a progress row is in its life.
  //
  enum class progress_phase
  {
    transferring,
    finished,
    failed
  };

  // Byte counters of a transfer.
  //
  // Written by whoever moves the data and read by the progress manager,
  // usually on different threads.
  //
  struct transfer_counters
  {
    std::atomic<std::uint64_t> received {0};
    std::atomic<std::uint64_t> expected {0}; // 0 if unknown.

    transfer_counters () = default;

    transfer_counters (const transfer_counters&) = delete;
    transfer_counters& operator= (const transfer_counters&) = delete;
  };

  // Store v in a unless a already holds something larger. Counters fed by
  // observers on different threads only move forward this way, however
  // their updates interleave.
  //
  template <typename T>
  inline void
  raise_to (std::atomic<T>& a, T v) noexcept
  {
    T c (a.load (std::memory_order_relaxed));

    while (v > c &&
           !a.compare_exchange_weak (c, v, std::memory_order_relaxed))
      ;
  }

  // Point-in-time view of a transfer (or of all of them).
  //
  struct transfer_snapshot
  {
    std::uint64_t received {0};
    std::uint64_t expected {0};
    double rate {0.0}; // Bytes per second.
    progress_phase phase {progress_phase::transferring};

    bool
    known () const noexcept
    {
      return expected != 0;
    }

    // Completed fraction in the [0, 1] range. A finished transfer is always
    // complete and a resumed one may have more than it was expected to.
    //
    double
    fraction () const noexcept
    {
      if (phase == progress_phase::finished)
        return 1.0;

      if (expected == 0)
        return 0.0;

      return received >= expected
        ? 1.0
        : static_cast<double> (received) / static_cast<double> (expected);
    }

    std::optional<std::chrono::seconds>
    remaining () const noexcept
    {
      if (phase != progress_phase::transferring ||
          expected <= received                  ||
          rate <= 0.0)
        return std::nullopt;

      return std::chrono::seconds (
        static_cast<std::int64_t> (static_cast<double> (expected - received) /
                                   rate));
    }
  };
}
