#pragma once

#include <mfdl/progress/progress.hxx>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>

namespace mfdl
{
  namespace asio = boost::asio;

  // The progress display as seen by the downloader: one row per file being
  // transferred plus a summary line and a few notes.
  //
  class progress_coordinator
  {
  public:
    using row_type = progress_row;

    // How long a finished row stays on screen.
    //
    static constexpr std::chrono::milliseconds linger_period {750};

    explicit
    progress_coordinator (asio::io_context&);

    progress_coordinator (const progress_coordinator&) = delete;
    progress_coordinator& operator= (const progress_coordinator&) = delete;

    // Throws if the display cannot be started.
    //
    void
    start ();

    asio::awaitable<void>
    stop ();

    bool
    running () const noexcept;

    std::shared_ptr<row_type>
    add_row (std::string label);

    // Leave zero expected bytes for unknown.
    //
    void
    update_row (row_type&, std::uint64_t received, std::uint64_t expected);

    void
    finish_row (std::shared_ptr<row_type>, std::string status, bool failed);

    void
    update_totals (std::size_t files_done,
                   std::size_t files_total,
                   std::uint64_t total_bytes);

    void
    note (std::string);

  private:
    std::unique_ptr<progress_manager> manager_;
  };
}
