#include <fstream>
#include <optional>
#include <system_error>

#include <boost/system/system_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <mfdl/http/http-types.hxx>

namespace mfdl
{
  template <typename C, typename T>
  asio::awaitable<void> basic_download_engine<C, T>::
  run (std::shared_ptr<task_type> task)
  {
    const download_job& j (task->job);

    if (!j.valid ())
    {
      fail (*task,
            download_error (download_error_kind::url,
                            "invalid download job",
                            j.url));
      co_return;
    }

    // The retry budget is per task and shared by the probe and the fetch
    // across restarts. Only throttled fetches are counted here; the probe
    // counts its own attempts.
    //
    retry_backoff backoff (policy_);
    std::size_t throttled (0);

    // Exceptions are turned into the task's error right here so that one
    // failed download never unwinds into the scheduler and its siblings.
    //
    try
    {
      while (co_await attempt (*task, backoff, throttled))
        ++task->restarts;
    }
    catch (const throttled_error& e)
    {
      fail (*task,
            download_error (download_error_kind::throttled,
                            e.what (),
                            j.url,
                            static_cast<int> (http_status::too_many_requests)));
    }
    catch (const http_error& e)
    {
      fail (*task,
            download_error (download_error_kind::http,
                            e.what (),
                            j.url,
                            static_cast<int> (e.status ())));
    }
    catch (const fs::filesystem_error& e)
    {
      fail (*task,
            download_error (download_error_kind::io, e.what (), j.url));
    }
    catch (const std::ios_base::failure& e)
    {
      fail (*task,
            download_error (download_error_kind::io,
                            "unable to write " + j.partial.string () + ": " +
                            e.what (),
                            j.url));
    }
    catch (const boost::system::system_error& e)
    {
      fail (*task,
            download_error (download_error_kind::network, e.what (), j.url));
    }
    catch (const std::invalid_argument& e)
    {
      fail (*task,
            download_error (download_error_kind::url, e.what (), j.url));
    }
    catch (const std::exception& e)
    {
      fail (*task,
            download_error (download_error_kind::other, e.what (), j.url));
    }
  }

  template <typename C, typename T>
  asio::awaitable<bool> basic_download_engine<C, T>::
  attempt (task_type& task, retry_backoff& backoff, std::size_t& throttled)
  {
    download_job& j (task.job);

    // Nothing to do if a previous run (or an earlier job for the same
    // destination) already produced the file.
    //
    task.set_state (download_state::check_exists);

    if (fs::exists (j.target))
    {
      task.outcome = download_outcome::exists;
      aggregate_.complete_file ();
      task.set_state (download_state::skipped);
      co_return false;
    }

    // Learn the size. Zero means unknown, in which case the fetch may still
    // tell us.
    //
    task.set_state (download_state::probe_size);

    j.expected_size = co_await probe_.probe (j.url, backoff);
    task.update_progress (0, j.expected_size);

    // Whatever is in the partial file is assumed to be the beginning of the
    // content.
    //
    task.set_state (download_state::resume_check);

    j.resume_offset = fs::exists (j.partial) ? fs::file_size (j.partial) : 0;

    // Everything is already there (or more, if the remote file shrank): no
    // need to ask for an empty range.
    //
    if (j.expected_size != 0 && j.resume_offset >= j.expected_size)
    {
      task.update_progress (j.resume_offset, j.expected_size);
      finalize (task, download_outcome::resumed);
      co_return false;
    }

    task.set_state (download_state::stream_fetch);

    // The partial file is opened in the header handler, once we know
    // whether to append or start over. Until then nothing on disk changes,
    // which keeps the partial file intact if the response is an error.
    //
    std::ofstream ofs;
    std::uint64_t base (j.resume_offset);

    header_handler on_header ([&task, &j, &ofs, &base, this]
                              (const response_type& r) -> bool
    {
      if (!r.is_success ())
        return false;

      // A plain 200 in response to a ranged request means the server ignored
      // the range and is sending the whole content, so the partial data has
      // to go.
      //
      if (base != 0 && r.status != http_status::partial_content)
        base = 0;

      // The probe could not tell the size. If this response can, fold it
      // into the aggregate now (for 206 the declared length is that of the
      // remaining range).
      //
      if (j.expected_size == 0)
      {
        if (std::optional<std::uint64_t> n = r.content_length ())
        {
          j.expected_size = base + *n;
          aggregate_.count (j.url, j.expected_size);
        }
      }

      // Write errors surface as ios_base::failure and end up as io errors.
      //
      ofs.exceptions (std::ofstream::badbit | std::ofstream::failbit);
      ofs.open (j.partial,
                std::ios::binary |
                (base != 0 ? std::ios::app : std::ios::trunc));

      task.set_state (download_state::stream_write);
      task.update_progress (base, j.expected_size);
      return true;
    });

    data_handler on_data ([&task, &ofs] (const char* d, std::size_t n)
    {
      ofs.write (d, static_cast<std::streamsize> (n));
      task.add_progress (n);
    });

    response_type r (
      co_await client_.get_range (j.url, j.resume_offset, on_header, on_data));

    // Throttled mid-flight: wait and have the caller start over from
    // check_exists. The restart re-probes and re-examines the partial file
    // (which the handler never opened for this response).
    //
    if (r.is_throttled ())
    {
      ++throttled;

      if (backoff.exhausted (throttled))
        throw throttled_error (j.url, throttled);

      asio::steady_timer t (co_await asio::this_coro::executor,
                            backoff.fetch_delay (throttled, r.retry_after ()));
      co_await t.async_wait (asio::use_awaitable);
      co_return true;
    }

    if (!r.is_success ())
      throw http_error (r.status, r.reason, j.url);

    ofs.close ();

    // The parser enforces the declared length of the response itself. What
    // it cannot see is a server that declared less than the probe did.
    //
    std::uint64_t n (task.transferred_bytes.load ());

    if (j.expected_size != 0 && n < j.expected_size)
      throw std::runtime_error ("transfer ended after " + std::to_string (n) +
                                " of " + std::to_string (j.expected_size) +
                                " bytes");

    finalize (task,
              base != 0 ? download_outcome::resumed
                        : download_outcome::completed);
    co_return false;
  }

  template <typename C, typename T>
  void basic_download_engine<C, T>::
  finalize (task_type& task, download_outcome outcome)
  {
    const download_job& j (task.job);

    task.set_state (download_state::finalize);

    // Atomic on POSIX within one filesystem, and the partial file is always
    // next to the target. Any earlier target is replaced.
    //
    fs::rename (j.partial, j.target);

    task.outcome = outcome;
    aggregate_.complete_file ();
    task.set_state (download_state::finalized);
  }

  template <typename C, typename T>
  void basic_download_engine<C, T>::
  fail (task_type& task, download_error e)
  {
    task.set_error (std::move (e));
    aggregate_.fail_file ();
  }
}
