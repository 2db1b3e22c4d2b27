#include <charconv>
#include <system_error>

namespace mfdl
{
  // Unsigned decimal header value. Leading and trailing blanks are fine,
  // anything else that is not a digit is not.
  //
  template <typename S>
  inline std::optional<std::uint64_t>
  parse_header_number (const S& v)
  {
    std::size_t b (v.find_first_not_of (" \t"));

    if (b == S::npos)
      return std::nullopt;

    std::size_t e (v.find_last_not_of (" \t") + 1);

    std::uint64_t n;
    const char* l (v.data () + e);
    std::from_chars_result r (std::from_chars (v.data () + b, l, n));

    if (r.ec != std::errc () || r.ptr != l)
      return std::nullopt;

    return n;
  }

  template <typename S>
  inline std::optional<std::uint64_t> basic_http_response<S>::
  content_length () const
  {
    std::optional<string_type> v (headers.get ("Content-Length"));
    return v ? parse_header_number (*v) : std::nullopt;
  }

  template <typename S>
  inline std::optional<std::chrono::seconds> basic_http_response<S>::
  retry_after () const
  {
    std::optional<string_type> v (headers.get ("Retry-After"));

    if (v)
    {
      if (std::optional<std::uint64_t> n = parse_header_number (*v))
        return std::chrono::seconds (static_cast<std::int64_t> (*n));
    }

    return std::nullopt;
  }
}
