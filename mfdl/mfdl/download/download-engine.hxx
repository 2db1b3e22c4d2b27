#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>

#include <boost/asio.hpp>

#include <mfdl/download/download-job.hxx>
#include <mfdl/download/download-task.hxx>
#include <mfdl/download/download-types.hxx>
#include <mfdl/download/download-retry.hxx>
#include <mfdl/download/download-probe.hxx>
#include <mfdl/download/download-aggregate.hxx>

namespace mfdl
{
  namespace asio = boost::asio;

  // Per-file download state machine.
  //
  // Drives a task from check_exists to one of the terminal states:
  //
  //   check_exists -> skipped                        (destination exists)
  //   probe_size -> resume_check -> finalize          (partial is complete)
  //   ... -> stream_fetch -> stream_write -> finalize (normal transfer)
  //
  // A throttled fetch restarts the whole sequence from check_exists after the
  // backoff delay. The destination path is only ever written by renaming the
  // partial file into place.
  //
  // The client type C must provide, besides what basic_size_probe requires:
  //
  //   asio::awaitable<response_type>
  //   get_range (const std::string& url,
  //              std::uint64_t offset,
  //              header_handler on_header,
  //              data_handler on_data);
  //
  // with the semantics of basic_http_client::get_range().
  //
  template <typename C, typename T = download_task_traits<>>
  class basic_download_engine
  {
  public:
    using client_type = C;
    using response_type = typename client_type::response_type;
    using header_handler = typename client_type::header_handler;
    using data_handler = typename client_type::data_handler;
    using task_type = basic_download_task<T>;
    using probe_type = basic_size_probe<client_type>;

    basic_download_engine (client_type& c,
                           download_aggregate& a,
                           retry_policy p = retry_policy ())
      : client_ (c), aggregate_ (a), probe_ (c, a), policy_ (p) {}

    basic_download_engine (const basic_download_engine&) = delete;
    basic_download_engine& operator= (const basic_download_engine&) = delete;

    // Run the task to a terminal state.
    //
    // Never throws on account of the download itself: every failure is
    // captured in the task's error and reported to the aggregate tracker as
    // a failed file.
    //
    asio::awaitable<void>
    run (std::shared_ptr<task_type> task);

    const retry_policy&
    policy () const noexcept
    {
      return policy_;
    }

  private:
    // One pass through the state machine. Return true if the fetch was
    // throttled and the caller should start over.
    //
    asio::awaitable<bool>
    attempt (task_type& task, retry_backoff& backoff, std::size_t& throttled);

    // Move the partial file into place and finish the task.
    //
    void
    finalize (task_type& task, download_outcome outcome);

    void
    fail (task_type& task, download_error e);

  private:
    client_type& client_;
    download_aggregate& aggregate_;
    probe_type probe_;
    retry_policy policy_;
  };
}

#include <mfdl/download/download-engine.txx>
