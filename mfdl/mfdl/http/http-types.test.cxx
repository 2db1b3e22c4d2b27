#include <mfdl/http/http-types.hxx>
#include <mfdl/http/http-url.hxx>
#include <mfdl/http/http-request.hxx>
#include <mfdl/http/http-response.hxx>

#include <cassert>
#include <chrono>
#include <string>
#include <vector>
#include <sstream>

using namespace std;
using namespace mfdl;

// Header lookup has to be case-insensitive: servers are free to send
// "content-length" or "CONTENT-LENGTH".
//
static void
test_headers ()
{
  http_headers h;

  h.set ("Content-Type", "text/plain");
  assert (h.size () == 1);
  assert (h.get ("content-type"));
  assert (*h.get ("CONTENT-TYPE") == "text/plain");

  // Replace rather than append.
  //
  h.set ("content-type", "application/octet-stream");
  assert (h.size () == 1);
  assert (*h.get ("Content-Type") == "application/octet-stream");

  // Duplicates are allowed with add(), get() returns the first.
  //
  h.add ("Set-Cookie", "a=1");
  h.add ("Set-Cookie", "b=2");
  assert (h.size () == 3);
  assert (*h.get ("set-cookie") == "a=1");

  h.erase ("SET-COOKIE");
  assert (h.size () == 1);
  assert (!h.get ("Set-Cookie"));
}

static void
test_content_length ()
{
  http_response r;
  assert (!r.content_length ());

  r.headers.set ("Content-Length", "500");
  assert (r.content_length () && *r.content_length () == 500);

  // Surrounding whitespace is tolerated, garbage is not.
  //
  r.headers.set ("content-length", "  1024 ");
  assert (*r.content_length () == 1024);

  r.headers.set ("Content-Length", "12abc");
  assert (!r.content_length ());

  r.headers.set ("Content-Length", "-1");
  assert (!r.content_length ());

  // Zero is a declared size, not an absent one.
  //
  r.headers.set ("Content-Length", "0");
  assert (r.content_length () && *r.content_length () == 0);

  // Larger than 4GiB.
  //
  r.headers.set ("Content-Length", "8589934592");
  assert (*r.content_length () == 8589934592ULL);
}

static void
test_retry_after ()
{
  http_response r (http_status::too_many_requests);
  assert (r.is_throttled ());
  assert (!r.is_success ());
  assert (!r.retry_after ());

  r.headers.set ("Retry-After", "3");
  assert (r.retry_after () && *r.retry_after () == chrono::seconds (3));

  // The HTTP-date form is not understood and the caller falls back to its
  // own backoff.
  //
  r.headers.set ("Retry-After", "Wed, 21 Oct 2015 07:28:00 GMT");
  assert (!r.retry_after ());
}

static void
test_status ()
{
  assert (http_response (http_status::ok).is_success ());
  assert (http_response (http_status::partial_content).is_success ());
  assert (http_response (http_status::found).is_redirection ());
  assert (!http_response (http_status::not_found).is_success ());
  assert (!http_response (http_status::not_found).is_throttled ());

  ostringstream o;
  o << http_status::range_not_satisfiable;
  assert (o.str () == "416");

  http_response r (http_status::not_found);
  r.reason = "Not Found";

  o.str ("");
  o << r;
  assert (o.str () == "HTTP/1.1 404 Not Found");

  // Codes we have no name for still classify.
  //
  assert (http_response (static_cast<http_status> (204)).is_success ());
  assert (!http_response (static_cast<http_status> (500)).is_success ());

  http_error e (http_status::not_found, "Not Found", "http://x/a.bin");
  assert (e.status () == http_status::not_found);
  assert (e.url () == "http://x/a.bin");
  assert (string (e.what ()).find ("404") != string::npos);
}

static void
test_request ()
{
  http_request r (http_method::get, "https://example.org:8443/a/b.bin?x=1#f");

  r.range_from (1024);
  assert (*r.headers.get ("range") == "bytes=1024-");

  // Back to the whole thing.
  //
  r.range_from (0);
  assert (!r.headers.get ("Range"));

  r.prepare ("mfdl/1.0");
  assert (*r.headers.get ("Host") == "example.org:8443");
  assert (*r.headers.get ("User-Agent") == "mfdl/1.0");

  // Default ports stay out of Host and existing fields are kept.
  //
  http_request d (http_method::head, "https://example.org/a");
  d.headers.set ("User-Agent", "custom");
  d.prepare ("mfdl/1.0");
  assert (*d.headers.get ("Host") == "example.org");
  assert (*d.headers.get ("User-Agent") == "custom");
}

static void
test_parse_url ()
{
  url_parts u (parse_url ("HTTPS://example.org/files/a.bin?v=2#top"));
  assert (u.scheme == "https");
  assert (u.host == "example.org");
  assert (u.port == "443");
  assert (u.target == "/files/a.bin?v=2");

  url_parts p (parse_url ("http://localhost:8080"));
  assert (p.host == "localhost");
  assert (p.port == "8080");
  assert (p.target == "/");

  url_parts q (parse_url ("http://x?y=1"));
  assert (q.host == "x");
  assert (q.target == "/?y=1");
}

static void
test_validate_url ()
{
  assert (*validate_url ("http://x/a.bin") == "http://x/a.bin");
  assert (*validate_url ("HTTPS://x") == "https://x/");
  assert (*validate_url ("http://x:81?q") == "http://x:81/?q");

  assert (!validate_url (""));
  assert (!validate_url ("x/a.bin"));
  assert (!validate_url ("ftp://x/a.bin"));
  assert (!validate_url ("http:///a.bin"));
  assert (!validate_url ("http://x:0/a"));
  assert (!validate_url ("http://x:65536/a"));
  assert (!validate_url ("http://x:8o/a"));
  assert (!validate_url ("http://user@x/a"));
  assert (!validate_url ("http://x/a b"));
}

static void
test_split_url_list ()
{
  vector<string> rej;
  vector<string> v (
    split_url_list (" http://x/a.bin, ,not a url,https://y/b.zip ,", &rej));

  assert (v.size () == 2);
  assert (v[0] == "http://x/a.bin");
  assert (v[1] == "https://y/b.zip");

  assert (rej.size () == 1);
  assert (rej[0] == "not a url");

  // Order and duplicates are preserved: deduplication is the aggregate's
  // business.
  //
  v = split_url_list ("http://x/a.bin,http://x/a.bin");
  assert (v.size () == 2);

  assert (split_url_list ("").empty ());
  assert (split_url_list (" , ,").empty ());
}

static void
test_url_filename ()
{
  assert (url_filename ("http://x/a.bin") == "a.bin");
  assert (url_filename ("http://x/dir/archive.tar.gz?sig=abc") ==
          "archive.tar.gz");
  assert (url_filename ("http://x/dir/file#frag") == "file");

  // No usable last segment.
  //
  assert (url_filename ("http://x") == "downloaded_file");
  assert (url_filename ("http://x/") == "downloaded_file");
  assert (url_filename ("http://x/dir/") == "downloaded_file");
  assert (url_filename ("http://x/..") == "downloaded_file");
}

int
main ()
{
  test_headers ();
  test_content_length ();
  test_retry_after ();
  test_status ();
  test_request ();
  test_parse_url ();
  test_validate_url ();
  test_split_url_list ();
  test_url_filename ();
}
