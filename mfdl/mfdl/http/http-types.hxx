#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>

namespace mfdl
{
  // We only ever talk to file servers, so metadata probes and (ranged)
  // fetches are all there is.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // Only the codes the downloader reacts to are named. Anything else
  // received from the wire is still representable as the raw code.
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    not_found             = 404,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    service_unavailable   = 503
  };

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Header fields in the order they were added. Names are compared
  // case-insensitively and a name may appear more than once.
  //
  template <typename S>
  class basic_http_headers
  {
  public:
    using string_type = S;
    using value_type = std::pair<string_type, string_type>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    // Replace all fields with this name.
    //
    void
    set (string_type name, string_type value);

    void
    add (string_type name, string_type value);

    // Value of the first field with this name.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    void
    erase (const string_type& name);

    std::size_t
    size () const noexcept
    {
      return fields_.size ();
    }

    const_iterator begin () const noexcept { return fields_.begin (); }
    const_iterator end ()   const noexcept { return fields_.end (); }

  private:
    static bool
    same_name (const string_type&, const string_type&) noexcept;

  private:
    std::vector<value_type> fields_;
  };

  using http_headers = basic_http_headers<std::string>;

  // Non-success HTTP status that is fatal to the request that received it.
  //
  class http_error: public std::runtime_error
  {
  public:
    http_error (http_status s, const std::string& reason, std::string url);

    http_status
    status () const noexcept
    {
      return status_;
    }

    const std::string&
    url () const noexcept
    {
      return url_;
    }

  private:
    http_status status_;
    std::string url_;
  };
}

#include <mfdl/http/http-types.ixx>
