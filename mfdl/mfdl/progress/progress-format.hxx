#pragma once

#include <chrono>
#include <string>
#include <cstddef>
#include <cstdint>

namespace mfdl
{
  // Human-readable rendering of progress quantities.
  //
  template <typename S = std::string>
  struct progress_format_traits
  {
    using string_type = S;

    // File size in IEC units ("500 B", "1.5 KiB", "3.0 GiB").
    //
    static string_type
    size (std::uint64_t bytes);

    // Transfer rate, same units per second.
    //
    static string_type
    rate (double bytes_per_second);

    // Time left ("42s", "3m05s", "1h02m").
    //
    static string_type
    duration (std::chrono::seconds);

  private:
    static string_type
    scaled (double value, const char* suffix);
  };

  using progress_format = progress_format_traits<>;
}

#include <mfdl/progress/progress-format.txx>
