#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>
#include <stdexcept>
#include <filesystem>

namespace mfdl
{
  namespace fs = std::filesystem;

  // Download state enumeration.
  //
  // The first six are the steps of the per-file state machine in the order
  // they are normally visited; the last three are terminal.
  //
  enum class download_state
  {
    check_exists, // Looking for an already downloaded file
    probe_size,   // Asking the server for the total size
    resume_check, // Looking for a partial file to resume
    stream_fetch, // Issuing the (ranged) request
    stream_write, // Appending the body to the partial file
    finalize,     // Renaming the partial file into place
    skipped,      // Destination already existed
    finalized,    // Destination now exists
    failed        // Gave up with an error
  };

  inline bool
  terminal (download_state s) noexcept
  {
    return s == download_state::skipped   ||
           s == download_state::finalized ||
           s == download_state::failed;
  }

  inline std::ostream&
  operator<< (std::ostream& os, download_state s)
  {
    switch (s)
    {
    case download_state::check_exists: return os << "check-exists";
    case download_state::probe_size:   return os << "probe-size";
    case download_state::resume_check: return os << "resume-check";
    case download_state::stream_fetch: return os << "stream-fetch";
    case download_state::stream_write: return os << "stream-write";
    case download_state::finalize:     return os << "finalize";
    case download_state::skipped:      return os << "skipped";
    case download_state::finalized:    return os << "finalized";
    case download_state::failed:       return os << "failed";
    }
    return os;
  }

  // What the user is told about a finished download.
  //
  enum class download_outcome
  {
    exists,    // Destination was already there, nothing transferred
    resumed,   // Completed from a partial file
    completed, // Completed from scratch
    failed
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_outcome o)
  {
    switch (o)
    {
    case download_outcome::exists:    return os << "exists";
    case download_outcome::resumed:   return os << "resumed";
    case download_outcome::completed: return os << "done";
    case download_outcome::failed:    return os << "failed";
    }
    return os;
  }

  // Download error information.
  //
  enum class download_error_kind
  {
    url,       // Unusable URL
    http,      // Non-success status other than throttling
    throttled, // Still throttled after the retry budget ran out
    network,   // Resolve/connect/TLS/read failure
    io,        // Local filesystem failure
    other
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_error_kind k)
  {
    switch (k)
    {
    case download_error_kind::url:       return os << "url";
    case download_error_kind::http:      return os << "http";
    case download_error_kind::throttled: return os << "throttled";
    case download_error_kind::network:   return os << "network";
    case download_error_kind::io:        return os << "io";
    case download_error_kind::other:     return os << "error";
    }
    return os;
  }

  struct download_error
  {
    download_error_kind kind {download_error_kind::other};
    std::string message;
    std::string url;
    int error_code {0}; // HTTP status for http/throttled, 0 otherwise.

    download_error () = default;

    download_error (download_error_kind k,
                    std::string msg,
                    std::string u = "",
                    int code = 0)
      : kind (k),
        message (std::move (msg)),
        url (std::move (u)),
        error_code (code)
    {
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_error& e)
  {
    os << e.message;
    if (!e.url.empty ())
      os << " [url: " << e.url << "]";
    if (e.error_code != 0)
      os << " [code: " << e.error_code << "]";
    return os;
  }

  // Server kept answering 429 Too Many Requests past the retry budget.
  //
  class throttled_error: public std::runtime_error
  {
  public:
    throttled_error (const std::string& url, std::size_t attempts)
      : runtime_error ("still throttled after " + std::to_string (attempts) +
                       " attempts: " + url)
    {
    }
  };
}
