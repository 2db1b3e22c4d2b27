#pragma once

#include <mfdl/progress/progress-types.hxx>
#include <mfdl/progress/progress-rate.hxx>
#include <mfdl/progress/progress-renderer.hxx>

#include <boost/asio.hpp>

#include <deque>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace mfdl
{
  namespace asio = boost::asio;

  template <typename S = std::string>
  struct progress_manager_traits
  {
    using string_type = S;
    using executor_type = asio::any_io_executor;
    using renderer_type =
      basic_progress_renderer<progress_renderer_traits<string_type>>;
    using meter_type = rate_meter;

    // How often the rates are sampled and the display redrawn.
    //
    static constexpr std::chrono::milliseconds tick_period {100};
  };

  template <typename T>
  class basic_progress_manager;

  // One row of the display, typically a file being downloaded.
  //
  // The counters may be updated from any thread. Everything else belongs to
  // the manager and is only touched on its strand.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_row
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_progress_row (string_type label)
      : label_ (std::move (label))
    {
    }

    const string_type&
    label () const noexcept
    {
      return label_;
    }

    transfer_counters&
    counters () noexcept
    {
      return counters_;
    }

  private:
    friend class basic_progress_manager<T>;

    string_type label_;
    transfer_counters counters_;

    string_type status_;
    progress_phase phase_ {progress_phase::transferring};
    typename traits_type::meter_type meter_;
  };

  // Progress display driver.
  //
  // Rows come and go on the manager's strand where a periodic tick samples
  // their counters and hands the resulting view to the renderer.
  //
  template <typename T = progress_manager_traits<>>
  class basic_progress_manager
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using executor_type = typename traits_type::executor_type;
    using renderer_type = typename traits_type::renderer_type;
    using view_type = typename renderer_type::view_type;
    using row_type = basic_progress_row<traits_type>;

    explicit
    basic_progress_manager (asio::io_context&);

    ~basic_progress_manager ();

    basic_progress_manager (const basic_progress_manager&) = delete;
    basic_progress_manager& operator= (const basic_progress_manager&) = delete;

    // Throws if the renderer cannot be started.
    //
    void
    start ();

    // Draw the final state and stop the renderer.
    //
    asio::awaitable<void>
    stop ();

    bool
    running () const noexcept
    {
      return running_.load (std::memory_order_relaxed);
    }

    std::shared_ptr<row_type>
    add_row (string_type label);

    // Show the row as finished with the specified status and drop it once
    // the linger period has passed.
    //
    void
    finish_row (std::shared_ptr<row_type>,
                string_type status,
                bool failed,
                std::chrono::milliseconds linger);

    void
    remove_row (std::shared_ptr<row_type>);

    // Add a line to the notes shown below the rows.
    //
    void
    note (string_type);

    // Set the summary counters. None of them ever goes down and the byte
    // total also grows with the bytes observed here.
    //
    void
    set_totals (std::size_t files_done,
                std::size_t files_total,
                std::uint64_t total_bytes) noexcept;

  private:
    asio::awaitable<void>
    tick_loop ();

    asio::awaitable<void>
    expire (std::shared_ptr<row_type>, std::chrono::milliseconds);

    // The following are only called on the strand.
    //
    void
    sample ();

    view_type
    view () const;

  private:
    asio::strand<executor_type> strand_;
    asio::steady_timer timer_;
    renderer_type renderer_;

    std::atomic<bool> running_ {false};

    std::atomic<std::size_t> files_done_ {0};
    std::atomic<std::size_t> files_total_ {0};
    std::atomic<std::uint64_t> total_bytes_ {0};

    // Strand only.
    //
    std::vector<std::shared_ptr<row_type>> rows_;
    std::deque<string_type> notes_;
    std::uint64_t removed_bytes_ = 0; // Received by rows no longer shown.
    std::uint64_t received_ = 0;
    typename traits_type::meter_type meter_;
  };

  using progress_row = basic_progress_row<>;
  using progress_manager = basic_progress_manager<>;
}

#include <mfdl/progress/progress-manager.txx>
