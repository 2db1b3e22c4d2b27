#include <map>
#include <exception>
#include <system_error>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

namespace mfdl
{
  template <typename C, typename T>
  basic_download_manager<C, T>::
  basic_download_manager (asio::io_context& ioc,
                          client_type& client,
                          download_options opts)
    : ioc_ (ioc),
      options_ (std::move (opts)),
      permits_ (options_.workers),
      engine_ (client, aggregate_, options_.retry)
  {
  }

  template <typename C, typename T>
  std::shared_ptr<typename basic_download_manager<C, T>::task_type>
  basic_download_manager<C, T>::
  add_task (std::string url)
  {
    // The job is derived now (rather than when it runs) so that the caller
    // can hook into the task, and see where it will land, right away.
    //
    auto task (std::make_shared<task_type> (
      make_download_job (std::move (url), options_.destination)));

    tasks_.push_back (task);
    return task;
  }

  template <typename C, typename T>
  asio::awaitable<download_summary> basic_download_manager<C, T>::
  download_all ()
  {
    // The destination must be ready before any task touches the filesystem,
    // so this happens before the first task is even spawned.
    //
    prepare_destination ();

    aggregate_.set_total_files (tasks_.size ());

    auto ex (co_await asio::this_coro::executor);

    // Tasks writing to the same file are grouped into a chain that runs them
    // one after another. Different chains have nothing in common so each
    // gets its own strand and the permits bound how many make progress.
    //
    auto cs (chains ());

    // Completions are counted on our own executor; the timer never expires
    // and is cancelled once the last chain is done.
    //
    std::size_t pending (cs.size ());
    std::exception_ptr failure;
    asio::steady_timer done (ex, asio::steady_timer::time_point::max ());

    for (auto& c: cs)
    {
      asio::co_spawn (
        asio::make_strand (ioc_),
        run_chain (std::move (c)),
        [ex, &pending, &failure, &done] (std::exception_ptr e)
        {
          asio::post (ex, [e, &pending, &failure, &done] ()
          {
            if (e && !failure)
              failure = e;

            if (--pending == 0)
              done.cancel ();
          });
        });
    }

    // Completions are posted to our executor, which must be serialized (a
    // strand or a single thread), so the count cannot drop to zero between
    // the check and the start of the wait. The wait ends with
    // operation_aborted, which is expected.
    //
    while (pending != 0)
    {
      boost::system::error_code ec;
      co_await done.async_wait (asio::redirect_error (asio::use_awaitable, ec));
    }

    // Task failures never get here (they are captured by the engine). This
    // is something like a completion callback throwing.
    //
    if (failure)
      std::rethrow_exception (failure);

    co_return summary ();
  }

  template <typename C, typename T>
  asio::awaitable<void> basic_download_manager<C, T>::
  run_chain (std::vector<std::shared_ptr<task_type>> chain)
  {
    for (const auto& t: chain)
    {
      // Hold a permit for exactly the duration of the task. In particular,
      // it is released before the completion callback so that a slow
      // callback does not hold up other downloads.
      //
      {
        async_semaphore::permit p (co_await permits_.acquire ());
        co_await engine_.run (t);
      }

      if (on_task_complete_)
        on_task_complete_ (t);
    }
  }

  template <typename C, typename T>
  void basic_download_manager<C, T>::
  prepare_destination ()
  {
    const fs::path& d (options_.destination);

    // Best effort: a directory that does not exist is fine and anything that
    // could not be removed is reused.
    //
    if (options_.clean)
    {
      std::error_code ec;
      fs::remove_all (d, ec);
    }

    // Unlike removal, failure to create is fatal: nothing could be saved.
    //
    fs::create_directories (d);
  }

  template <typename C, typename T>
  std::vector<std::vector<std::shared_ptr<typename basic_download_manager<C, T>::task_type>>>
  basic_download_manager<C, T>::
  chains () const
  {
    std::vector<std::vector<std::shared_ptr<task_type>>> r;

    // Target path to its chain in r. Chains keep the order in which their
    // first task was added and tasks keep their order within a chain.
    //
    std::map<fs::path, std::size_t> index;

    for (const auto& t: tasks_)
    {
      auto i (index.emplace (t->job.target, r.size ()));

      if (i.second)
        r.emplace_back ();

      r[i.first->second].push_back (t);
    }

    return r;
  }

  template <typename C, typename T>
  download_summary basic_download_manager<C, T>::
  summary () const
  {
    download_summary s;
    s.files = tasks_.size ();
    s.total_bytes = aggregate_.total_bytes ();

    // A task that is not done can only be seen here if the run was cut
    // short, in which case it is not counted in any category.
    //
    for (const auto& t: tasks_)
    {
      if (!t->done ())
        continue;

      switch (t->outcome)
      {
      case download_outcome::exists:    ++s.skipped;   break;
      case download_outcome::resumed:   ++s.resumed;   break;
      case download_outcome::completed: ++s.completed; break;
      case download_outcome::failed:
        {
          ++s.failed;
          s.errors.push_back (t->error);
          break;
        }
      }
    }

    return s;
  }
}
