#include <mfdl/download/download-aggregate.hxx>

#include <utility>

#include <mfdl/progress/progress-format.hxx>

using namespace std;

namespace mfdl
{
  download_aggregate::
  download_aggregate (size_t n)
  {
    state_.total_files = n;
  }

  bool download_aggregate::
  count (const string& url, uint64_t bytes)
  {
    aggregate_snapshot s;
    observer_type o;
    {
      lock_guard<mutex> l (mutex_);

      if (!counted_.insert (url).second)
        return false;

      state_.total_bytes += bytes;
      state_.counted_urls = counted_.size ();

      s = state_;
      o = observer_;
    }

    notify (s, o);
    return true;
  }

  bool download_aggregate::
  counted (const string& url) const
  {
    lock_guard<mutex> l (mutex_);
    return counted_.find (url) != counted_.end ();
  }

  void download_aggregate::
  complete_file ()
  {
    aggregate_snapshot s;
    observer_type o;
    {
      lock_guard<mutex> l (mutex_);
      ++state_.completed_files;
      s = state_;
      o = observer_;
    }

    notify (s, o);
  }

  void download_aggregate::
  fail_file ()
  {
    aggregate_snapshot s;
    observer_type o;
    {
      lock_guard<mutex> l (mutex_);
      ++state_.failed_files;
      s = state_;
      o = observer_;
    }

    notify (s, o);
  }

  void download_aggregate::
  set_total_files (size_t n)
  {
    aggregate_snapshot s;
    observer_type o;
    {
      lock_guard<mutex> l (mutex_);
      state_.total_files = n;
      s = state_;
      o = observer_;
    }

    notify (s, o);
  }

  uint64_t download_aggregate::
  total_bytes () const
  {
    lock_guard<mutex> l (mutex_);
    return state_.total_bytes;
  }

  size_t download_aggregate::
  completed_files () const
  {
    lock_guard<mutex> l (mutex_);
    return state_.completed_files;
  }

  aggregate_snapshot download_aggregate::
  snapshot () const
  {
    lock_guard<mutex> l (mutex_);
    return state_;
  }

  void download_aggregate::
  set_observer (observer_type o)
  {
    lock_guard<mutex> l (mutex_);
    observer_ = move (o);
  }

  void download_aggregate::
  notify (const aggregate_snapshot& s, const observer_type& o) const
  {
    if (o)
      o (s);
  }

  string
  human_size (uint64_t n)
  {
    return progress_format::size (n);
  }
}
