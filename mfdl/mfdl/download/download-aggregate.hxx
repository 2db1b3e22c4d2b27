#pragma once

#include <mutex>
#include <string>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_set>

namespace mfdl
{
  // Point-in-time view of the aggregate state.
  //
  struct aggregate_snapshot
  {
    std::uint64_t total_bytes {0};    // Sum of sizes of counted URLs.
    std::size_t   counted_urls {0};
    std::size_t   completed_files {0}; // Skipped or finalized.
    std::size_t   failed_files {0};
    std::size_t   total_files {0};
  };

  // State shared by all concurrent downloads of one run: the cumulative byte
  // total together with the set of URLs already counted towards it, and the
  // file counters.
  //
  // Every mutation happens inside a single critical section so that the
  // check-insert-add sequence of count() is atomic: however many downloads
  // race to report the size of the same URL, it is added exactly once.
  //
  class download_aggregate
  {
  public:
    // Called after every mutation with the resulting state. The call is made
    // outside the critical section and potentially from several threads at
    // once.
    //
    using observer_type = std::function<void (const aggregate_snapshot&)>;

    explicit
    download_aggregate (std::size_t total_files = 0);

    download_aggregate (const download_aggregate&) = delete;
    download_aggregate& operator= (const download_aggregate&) = delete;

    // Add the URL's size to the total unless the URL was already counted.
    // Return true if this call counted it.
    //
    bool
    count (const std::string& url, std::uint64_t bytes);

    bool
    counted (const std::string& url) const;

    // Advance the finished file counters.
    //
    void
    complete_file ();

    void
    fail_file ();

    void
    set_total_files (std::size_t n);

    std::uint64_t
    total_bytes () const;

    std::size_t
    completed_files () const;

    aggregate_snapshot
    snapshot () const;

    void
    set_observer (observer_type o);

  private:
    void
    notify (const aggregate_snapshot&, const observer_type&) const;

  private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> counted_;
    aggregate_snapshot state_;
    observer_type observer_;
  };

  // Render a byte count the way the summary line does.
  //
  std::string
  human_size (std::uint64_t bytes);
}
