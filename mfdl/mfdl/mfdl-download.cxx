#include <mfdl/mfdl-download.hxx>

#include <sstream>
#include <iostream>

using namespace std;

namespace mfdl
{
  download_coordinator::
  download_coordinator (asio::io_context& ioc,
                        download_options opts,
                        http_client_traits<> ct,
                        progress_coordinator* pc,
                        bool v)
    : http_ (make_unique<http_client> (ct)),
      manager_ (make_unique<manager_type> (ioc, *http_, move (opts))),
      progress_ (pc),
      verbose_ (v)
  {
    manager_->set_task_completion_callback (
      [this] (shared_ptr<task_type> t)
    {
      task_completed (t);
    });

    // Keep the summary row in sync with the aggregate. The observer may be
    // called from several strands at once, which the progress manager
    // tolerates.
    //
    if (progress_ != nullptr)
    {
      progress_coordinator* p (progress_);

      manager_->aggregate ().set_observer (
        [p] (const aggregate_snapshot& s)
      {
        p->update_totals (s.completed_files + s.failed_files,
                          s.total_files,
                          s.total_bytes);
      });
    }
  }

  shared_ptr<download_coordinator::task_type> download_coordinator::
  queue_download (string url)
  {
    shared_ptr<task_type> t (manager_->add_task (move (url)));

    if (progress_ != nullptr)
    {
      // The row is only added once the task gets past the existence check
      // so that the display is not flooded with queued files.
      //
      row_slot r (make_shared<shared_ptr<progress_coordinator::row_type>> ());
      progress_coordinator* p (progress_);
      string n (t->job.name);

      t->on_state_change = [p, r, n] (download_state, download_state s)
      {
        if (s == download_state::probe_size && *r == nullptr)
          *r = p->add_row (n);
      };

      t->on_progress = [p, r] (uint64_t c, uint64_t e)
      {
        if (*r != nullptr)
          p->update_row (**r, c, e);
      };

      rows_.emplace (t.get (), move (r));
    }

    return t;
  }

  void download_coordinator::
  task_completed (const shared_ptr<task_type>& t)
  {
    const download_task& dt (*t);
    bool f (dt.outcome == download_outcome::failed);

    if (progress_ != nullptr)
    {
      auto i (rows_.find (t.get ()));
      if (i == rows_.end ())
        return;

      shared_ptr<progress_coordinator::row_type>& r (*i->second);

      // Skipped tasks never got a row: give them one just to show that the
      // file was already there.
      //
      if (r == nullptr)
        r = progress_->add_row (dt.job.name);

      progress_->update_row (*r,
                             dt.transferred_bytes.load (),
                             dt.total_bytes.load ());

      ostringstream s;
      s << dt.outcome;
      progress_->finish_row (r, s.str (), f);

      if (f)
      {
        ostringstream m;
        m << "error: " << dt.job.name << ": " << dt.error.message;
        progress_->note (m.str ());
      }

      return;
    }

    // Without the display, failures always go to stderr right away while
    // everything else is only shown on request.
    //
    if (f)
    {
      lock_guard<mutex> l (output_mutex_);
      cerr << "error: " << dt.error << endl;
    }
    else if (verbose_)
    {
      lock_guard<mutex> l (output_mutex_);
      print_status (cout, dt);
    }
  }

  asio::awaitable<download_summary> download_coordinator::
  execute_all ()
  {
    co_return co_await manager_->download_all ();
  }

  void
  print_status (ostream& o, const download_task& t)
  {
    o << t.outcome << ' ' << t.job.name;

    if (t.outcome == download_outcome::failed)
      o << ": " << t.error.message;

    o << endl;
  }
}
