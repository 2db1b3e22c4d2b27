#pragma once

#include <mfdl/progress/progress-types.hxx>
#include <mfdl/progress/progress-format.hxx>

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <mutex>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <cstddef>

namespace mfdl
{
  // Everything that is on screen at one point in time.
  //
  template <typename S = std::string>
  struct basic_progress_view
  {
    using string_type = S;

    struct row
    {
      string_type label;
      string_type status; // Outcome once finished, empty before.
      transfer_snapshot transfer;
    };

    std::vector<row> rows;
    transfer_snapshot overall;
    std::size_t files_done {0};
    std::size_t files_total {0};
    std::vector<string_type> notes; // Oldest first.
  };

  template <typename S = std::string>
  struct progress_renderer_traits
  {
    using string_type = S;
    using format_type = progress_format_traits<string_type>;
    using view_type = basic_progress_view<string_type>;
    using row_type = typename view_type::row;

    static constexpr int label_width = 40;
    static constexpr int gauge_width = 20;

    // Maximum number of notes kept below the rows.
    //
    static constexpr std::size_t max_notes = 5;

    static ftxui::Element
    render_row (const row_type&);

    static ftxui::Element
    render_overall (const view_type&);

    static ftxui::Element
    render_notes (const std::vector<string_type>&);

    // Lay the whole view out in the specified number of lines. Rows that do
    // not fit are counted rather than shown.
    //
    static ftxui::Element
    render (const view_type&, int height);
  };

  // FTXUI-based progress display.
  //
  // The screen loop blocks, so it runs on its own thread. New views are
  // handed over under a lock and the screen is poked to redraw.
  //
  template <typename T = progress_renderer_traits<>>
  class basic_progress_renderer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using view_type = typename traits_type::view_type;

    basic_progress_renderer ();
    ~basic_progress_renderer ();

    basic_progress_renderer (const basic_progress_renderer&) = delete;
    basic_progress_renderer& operator= (const basic_progress_renderer&) = delete;

    // Throws std::system_error if the UI thread cannot be started.
    //
    void
    start ();

    // Exit the screen loop and wait for the last frame to be drawn.
    //
    void
    stop ();

    void
    show (view_type);

    bool
    running () const noexcept
    {
      return running_.load (std::memory_order_relaxed);
    }

  private:
    std::mutex mutex_;
    view_type view_;

    ftxui::ScreenInteractive screen_;
    ftxui::Component component_;

    std::atomic<bool> running_ {false};
    std::jthread ui_thread_;
  };

  using progress_view = basic_progress_view<>;
  using progress_renderer = basic_progress_renderer<>;
}

#include <mfdl/progress/progress-renderer.txx>
