#include <sstream>
#include <iomanip>
#include <iterator>

namespace mfdl
{
  template <typename S>
  S progress_format_traits<S>::
  size (std::uint64_t n)
  {
    return scaled (static_cast<double> (n), "");
  }

  template <typename S>
  S progress_format_traits<S>::
  rate (double bps)
  {
    return scaled (bps < 0.0 ? 0.0 : bps, "/s");
  }

  template <typename S>
  S progress_format_traits<S>::
  duration (std::chrono::seconds d)
  {
    std::int64_t n (d.count () < 0 ? 0 : d.count ());

    std::ostringstream o;
    o << std::setfill ('0');

    if (n < 60)
      o << n << 's';
    else if (n < 3600)
      o << n / 60 << 'm' << std::setw (2) << n % 60 << 's';
    else
      o << n / 3600 << 'h' << std::setw (2) << n % 3600 / 60 << 'm';

    return o.str ();
  }

  template <typename S>
  S progress_format_traits<S>::
  scaled (double v, const char* suffix)
  {
    static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};

    std::size_t i (0);
    for (; v >= 1024.0 && i + 1 != std::size (units); ++i)
      v /= 1024.0;

    // Whole bytes never get a fraction.
    //
    std::ostringstream o;
    o << std::fixed << std::setprecision (i == 0 ? 0 : 1)
      << v << ' ' << units[i] << suffix;

    return o.str ();
  }
}
