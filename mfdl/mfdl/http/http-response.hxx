#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <optional>

#include <mfdl/http/http-types.hxx>

namespace mfdl
{
  // Status line and headers of a response. The body, if any, is streamed
  // to whoever asked for it and never stored here.
  //
  template <typename S>
  struct basic_http_response
  {
    using string_type = S;
    using headers_type = basic_http_headers<string_type>;

    http_status status {http_status::ok};
    string_type reason;
    headers_type headers;
    unsigned version {11};

    basic_http_response () = default;

    explicit
    basic_http_response (http_status s): status (s) {}

    bool
    is_success () const noexcept
    {
      return code () / 100 == 2;
    }

    bool
    is_redirection () const noexcept
    {
      return code () / 100 == 3;
    }

    // 429 Too Many Requests.
    //
    bool
    is_throttled () const noexcept
    {
      return status == http_status::too_many_requests;
    }

    // Declared body length, nullopt if absent or malformed. For 206 it is
    // the length of the range, not of the whole resource.
    //
    std::optional<std::uint64_t>
    content_length () const;

    // Only the delta-seconds form is understood. For an HTTP-date we return
    // nullopt and the caller falls back to its own backoff.
    //
    std::optional<std::chrono::seconds>
    retry_after () const;

    std::optional<string_type>
    location () const
    {
      return headers.get ("Location");
    }

  private:
    unsigned
    code () const noexcept
    {
      return static_cast<unsigned> (status);
    }
  };

  // "HTTP/1.1 404 Not Found"
  //
  template <typename S>
  inline std::ostream&
  operator<< (std::ostream& o, const basic_http_response<S>& r)
  {
    o << "HTTP/" << r.version / 10 << '.' << r.version % 10 << ' ' << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string>;
}

#include <mfdl/http/http-response.ixx>
