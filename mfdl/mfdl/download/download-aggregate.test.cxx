#include <mfdl/download/download-aggregate.hxx>
#include <mfdl/download/download-job.hxx>

#include <cassert>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <iostream>

using namespace std;
using namespace mfdl;

static void
test_count_once ()
{
  download_aggregate a;

  // Same URL twice: 500, not 1000.
  //
  assert (a.count ("http://x/a.bin", 500));
  assert (!a.count ("http://x/a.bin", 500));
  assert (a.total_bytes () == 500);

  // A later report with a different size does not change anything either.
  //
  assert (!a.count ("http://x/a.bin", 700));
  assert (a.total_bytes () == 500);

  assert (a.count ("http://x/b.bin", 12));
  assert (a.total_bytes () == 512);

  assert (a.counted ("http://x/a.bin"));
  assert (!a.counted ("http://x/c.bin"));

  aggregate_snapshot s (a.snapshot ());
  assert (s.counted_urls == 2);
  assert (s.total_bytes == 512);
}

// A declared size of zero still marks the URL as counted.
//
static void
test_zero ()
{
  download_aggregate a;

  assert (a.count ("http://x/empty", 0));
  assert (a.counted ("http://x/empty"));
  assert (!a.count ("http://x/empty", 10));
  assert (a.total_bytes () == 0);
}

static void
test_files ()
{
  download_aggregate a (3);

  a.complete_file ();
  a.complete_file ();
  a.fail_file ();

  aggregate_snapshot s (a.snapshot ());
  assert (s.total_files == 3);
  assert (s.completed_files == 2);
  assert (s.failed_files == 1);
  assert (a.completed_files () == 2);

  a.set_total_files (5);
  assert (a.snapshot ().total_files == 5);
}

static void
test_observer ()
{
  download_aggregate a (2);

  vector<aggregate_snapshot> seen;
  a.set_observer ([&seen] (const aggregate_snapshot& s) {seen.push_back (s);});

  a.count ("http://x/a", 10);
  a.count ("http://x/a", 10); // Not counted, not observed.
  a.complete_file ();

  assert (seen.size () == 2);
  assert (seen[0].total_bytes == 10);
  assert (seen[1].completed_files == 1);

  // The observer is called outside the lock so it may look at the
  // aggregate itself.
  //
  size_t n (0);
  a.set_observer ([&a, &n] (const aggregate_snapshot&)
  {
    n = a.snapshot ().completed_files;
  });

  a.complete_file ();
  assert (n == 2);
}

// Many threads racing to count the same set of URLs must add each size
// exactly once.
//
static void
test_concurrent ()
{
  const size_t urls (64);
  const size_t threads (8);

  download_aggregate a;
  atomic<size_t> wins (0);

  vector<thread> ts;
  for (size_t t (0); t != threads; ++t)
  {
    ts.emplace_back ([&a, &wins, urls] ()
    {
      for (size_t i (0); i != urls; ++i)
      {
        if (a.count ("http://x/" + to_string (i), i + 1))
          ++wins;
      }
    });
  }

  for (thread& t: ts)
    t.join ();

  assert (wins == urls);
  assert (a.snapshot ().counted_urls == urls);
  assert (a.total_bytes () == urls * (urls + 1) / 2);
}

static void
test_human_size ()
{
  assert (human_size (0) == "0 B");
  assert (human_size (500) == "500 B");
  assert (human_size (1024) == "1.0 KiB");
  assert (human_size (1536) == "1.5 KiB");
  assert (human_size (5ULL * 1024 * 1024) == "5.0 MiB");
  assert (human_size (3ULL * 1024 * 1024 * 1024) == "3.0 GiB");
}

// Paths are a function of the URL and the directory; the partial file sits
// next to the destination.
//
static void
test_job ()
{
  download_job j (make_download_job ("http://x/dir/a.bin?sig=1", "/tmp/d"));

  assert (j.name == "a.bin");
  assert (j.target == fs::path ("/tmp/d") / "a.bin");
  assert (j.partial == fs::path ("/tmp/d") / "a.bin.part");
  assert (j.resume_offset == 0);
  assert (j.expected_size == 0);
  assert (j.valid ());

  // Different extensions never share a partial file.
  //
  download_job k (make_download_job ("http://x/a.zip", "/tmp/d"));
  assert (k.partial != j.partial);

  download_job f (make_download_job ("http://x/", "/tmp/d"));
  assert (f.name == "downloaded_file");

  assert (!download_job ().valid ());
}

int
main ()
{
  test_count_once ();
  test_zero ();
  test_files ();
  test_observer ();
  test_concurrent ();
  test_human_size ();
  test_job ();
}
