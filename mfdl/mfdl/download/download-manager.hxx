#pragma once

#include <vector>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <mfdl/download/download-job.hxx>
#include <mfdl/download/download-task.hxx>
#include <mfdl/download/download-types.hxx>
#include <mfdl/download/download-retry.hxx>
#include <mfdl/download/download-engine.hxx>
#include <mfdl/download/download-aggregate.hxx>
#include <mfdl/download/download-semaphore.hxx>

namespace mfdl
{
  namespace asio = boost::asio;
  namespace fs = std::filesystem;

  // Scheduler configuration.
  //
  struct download_options
  {
    fs::path destination {"."};

    // Maximum number of jobs running at the same time.
    //
    std::size_t workers {8};

    // Remove the destination directory before starting.
    //
    bool clean {false};

    retry_policy retry;
  };

  // Result of a run.
  //
  struct download_summary
  {
    std::size_t files {0};     // Jobs run.
    std::size_t completed {0}; // Downloaded from scratch.
    std::size_t resumed {0};   // Completed from a partial file.
    std::size_t skipped {0};   // Destination already existed.
    std::size_t failed {0};
    std::uint64_t total_bytes {0};
    std::vector<download_error> errors;

    std::size_t
    succeeded () const
    {
      return completed + resumed + skipped;
    }
  };

  // Download manager traits.
  //
  template <typename C, typename S = std::string>
  struct download_manager_traits
  {
    using client_type = C;
    using string_type = S;

    using task_traits = download_task_traits<string_type>;
    using task_type = basic_download_task<task_traits>;
    using engine_type = basic_download_engine<client_type, task_traits>;

    // Task completion callback.
    //
    using completion_callback =
      std::function<void (std::shared_ptr<task_type>)>;
  };

  // Scheduler.
  //
  // Runs one state machine per task with at most options.workers of them
  // past permit acquisition at any time. Each task runs as its own
  // coroutine on its own strand of the io_context, so the io_context may be
  // run by any number of threads. Tasks that share a destination path are
  // run one after the other within a single coroutine so that they never
  // write the same partial file concurrently.
  //
  template <typename C, typename T = download_manager_traits<C>>
  class basic_download_manager
  {
  public:
    using traits_type = T;
    using client_type = typename traits_type::client_type;
    using task_type = typename traits_type::task_type;
    using engine_type = typename traits_type::engine_type;
    using completion_callback = typename traits_type::completion_callback;

    basic_download_manager (asio::io_context& ioc,
                            client_type& client,
                            download_options opts);

    basic_download_manager (const basic_download_manager&) = delete;
    basic_download_manager& operator= (const basic_download_manager&) = delete;

    // Task management.
    //
    // The job's paths are derived from the URL and the destination
    // directory.
    //
    std::shared_ptr<task_type>
    add_task (std::string url);

    const std::vector<std::shared_ptr<task_type>>&
    tasks () const
    {
      return tasks_;
    }

    const download_options&
    options () const noexcept
    {
      return options_;
    }

    download_aggregate&
    aggregate () noexcept
    {
      return aggregate_;
    }

    const download_aggregate&
    aggregate () const noexcept
    {
      return aggregate_;
    }

    const async_semaphore&
    permits () const noexcept
    {
      return permits_;
    }

    // Called (on the task's strand) once a task reached its terminal state
    // and released its permit.
    //
    void
    set_task_completion_callback (completion_callback cb)
    {
      on_task_complete_ = std::move (cb);
    }

    // Prepare the destination directory, run every task to a terminal state,
    // and return the summary.
    //
    // Must be awaited on an executor that serializes its handlers (a strand
    // or a single-threaded io_context). Throws only if the destination
    // directory cannot be created, in which case no task is started.
    //
    asio::awaitable<download_summary>
    download_all ();

    download_summary
    summary () const;

  private:
    // Remove (if requested) and create the destination directory.
    //
    void
    prepare_destination ();

    // Tasks grouped by destination path, in the order they were added.
    //
    std::vector<std::vector<std::shared_ptr<task_type>>>
    chains () const;

    asio::awaitable<void>
    run_chain (std::vector<std::shared_ptr<task_type>> chain);

  private:
    asio::io_context& ioc_;
    download_options options_;
    download_aggregate aggregate_;
    async_semaphore permits_;
    engine_type engine_;

    std::vector<std::shared_ptr<task_type>> tasks_;
    completion_callback on_task_complete_;
  };
}

#include <mfdl/download/download-manager.txx>
