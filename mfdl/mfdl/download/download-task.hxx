#pragma once

#include <memory>
#include <atomic>
#include <string>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <mfdl/download/download-job.hxx>
#include <mfdl/download/download-types.hxx>

namespace mfdl
{
  // Download task traits.
  //
  template <typename S = std::string>
  struct download_task_traits
  {
    using string_type = S;

    // Progress callback type: bytes present in the partial file so far and
    // the expected total (0 if unknown).
    //
    using progress_callback =
      std::function<void (std::uint64_t, std::uint64_t)>;

    // State change callback type.
    //
    using state_callback =
      std::function<void (download_state, download_state)>;
  };

  // One download job as it is driven through the state machine.
  //
  // The state and byte counters are atomic so that they can be observed
  // (for example, by the progress display) while the task runs. Everything
  // else is only written by the coroutine running the task and should be
  // read once it has reached a terminal state.
  //
  template <typename T = download_task_traits<>>
  class basic_download_task
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using progress_callback = typename traits_type::progress_callback;
    using state_callback = typename traits_type::state_callback;

    basic_download_task () = default;

    explicit
    basic_download_task (download_job j)
      : job (std::move (j))
    {
    }

    download_job job;

    download_outcome outcome {download_outcome::failed};
    download_error error;

    // Number of times the state machine was restarted because the fetch was
    // throttled.
    //
    std::size_t restarts {0};

    // Callbacks.
    //
    progress_callback on_progress;
    state_callback on_state_change;

    // Atomic state tracking.
    //
    std::atomic<download_state> state {download_state::check_exists};
    std::atomic<std::uint64_t> transferred_bytes {0};
    std::atomic<std::uint64_t> total_bytes {0};

    // State management.
    //
    void
    set_state (download_state new_state)
    {
      download_state old_state (state.exchange (new_state));
      if (old_state != new_state && on_state_change)
        on_state_change (old_state, new_state);
    }

    void
    update_progress (std::uint64_t transferred, std::uint64_t total = 0)
    {
      transferred_bytes.store (transferred);
      if (total > 0)
        total_bytes.store (total);

      if (on_progress)
        on_progress (transferred, total > 0 ? total : total_bytes.load ());
    }

    // Account for a chunk appended to the partial file.
    //
    void
    add_progress (std::size_t n)
    {
      std::uint64_t t (transferred_bytes.fetch_add (n) + n);

      if (on_progress)
        on_progress (t, total_bytes.load ());
    }

    void
    set_error (download_error err)
    {
      error = std::move (err);
      outcome = download_outcome::failed;
      set_state (download_state::failed);
    }

    // Status checks.
    //
    bool
    done () const
    {
      return terminal (state.load ());
    }

    bool
    failed () const
    {
      return state.load () == download_state::failed;
    }

    bool
    active () const
    {
      download_state s (state.load ());
      return s == download_state::stream_fetch ||
             s == download_state::stream_write;
    }
  };

  using download_task = basic_download_task<>;

  template <typename T = download_task_traits<>>
  inline std::shared_ptr<basic_download_task<T>>
  make_download_task (download_job j)
  {
    return std::make_shared<basic_download_task<T>> (std::move (j));
  }
}
