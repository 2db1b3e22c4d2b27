#pragma once

#include <mfdl/download/download.hxx>
#include <mfdl/http/http.hxx>
#include <mfdl/mfdl-progress.hxx>

#include <boost/asio.hpp>

#include <mutex>
#include <memory>
#include <string>
#include <cstdint>
#include <ostream>
#include <filesystem>
#include <unordered_map>

namespace mfdl
{
  namespace fs = std::filesystem;
  namespace asio = boost::asio;

  class download_coordinator
  {
  public:
    using manager_type = basic_download_manager<http_client>;
    using task_type = typename manager_type::task_type;

    // Constructors.
    //
    // If the progress coordinator is not NULL, it is kept informed about
    // every task and the aggregate. Otherwise, if verbose is true, a status
    // line is written to the output stream for each finished task.
    //
    download_coordinator (asio::io_context& ioc,
                          download_options opts,
                          http_client_traits<> client,
                          progress_coordinator* progress = nullptr,
                          bool verbose = false);

    download_coordinator (const download_coordinator&) = delete;
    download_coordinator& operator= (const download_coordinator&) = delete;

    // Queue a download of the URL into the destination directory. Must be
    // called before execute_all().
    //
    std::shared_ptr<task_type>
    queue_download (std::string url);

    // Run all queued downloads and return the summary. See
    // basic_download_manager::download_all() for the executor requirement.
    //
    asio::awaitable<download_summary>
    execute_all ();

  private:
    // Progress row of a task, created once it starts doing something.
    //
    using row_slot =
      std::shared_ptr<std::shared_ptr<progress_coordinator::row_type>>;

    void
    task_completed (const std::shared_ptr<task_type>&);

  private:
    std::unique_ptr<http_client> http_;
    std::unique_ptr<manager_type> manager_;

    progress_coordinator* progress_;
    bool verbose_;

    // Only populated while queuing and read-only while running.
    //
    std::unordered_map<const task_type*, row_slot> rows_;

    std::mutex output_mutex_;
  };

  // Print a download status line as "<status> <name>[: <error>]".
  //
  void
  print_status (std::ostream&, const download_task&);
}
