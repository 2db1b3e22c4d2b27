#include <mfdl/http/http-client.hxx>

#include <map>
#include <string>
#include <vector>
#include <limits>
#include <cstdint>
#include <cassert>
#include <utility>
#include <optional>
#include <exception>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

using namespace std;
using namespace mfdl;

static void
test_resolve_location ()
{
  const string base ("http://h/a/b.bin?x=/y");

  // Absolute locations are taken as is.
  //
  assert (resolve_location (base, "https://o/x") == "https://o/x");

  // Protocol-relative keeps the scheme.
  //
  assert (resolve_location (base, "//cdn/p") == "http://cdn/p");
  assert (resolve_location ("https://h/", "//cdn/p") == "https://cdn/p");

  // Absolute path replaces the whole target.
  //
  assert (resolve_location (base, "/p?q=1") == "http://h/p?q=1");

  // Relative path is relative to the directory, query notwithstanding.
  //
  assert (resolve_location (base, "c.bin") == "http://h/a/c.bin");
  assert (resolve_location ("http://h", "c.bin") == "http://h/c.bin");

  // Only a non-default port makes it into the new URL.
  //
  assert (resolve_location ("http://h:8080/a/b", "c") == "http://h:8080/a/c");
  assert (resolve_location ("https://h:443/a", "/b") == "https://h/b");
  assert (resolve_location ("https://h:80/a", "/b") == "https://h:80/b");
}

static void
test_timeout_milliseconds ()
{
  assert (timeout_milliseconds (0) == 0u);
  assert (timeout_milliseconds (30) == 30000u);

  // The largest number of seconds that still fits, and the first that
  // doesn't (as a 32-bit multiplication it would wrap to 704).
  //
  assert (timeout_milliseconds (4294967) == 4294967000u);
  assert (!timeout_milliseconds (4294968));
  assert (!timeout_milliseconds (numeric_limits<uint32_t>::max ()));
}

// HTTP/1.1 server on the loopback interface, one request per connection.
//
//   /files/start  302 to "data" (relative)
//   /files/data   the body, honoring "Range: bytes=N-"
//   /loop         302 to itself
//
// Anything else is 404.
//
class loopback_server
{
public:
  string body;

  map<string, size_t> hits;
  vector<string> ranges; // Range of each /files/data request, "" if none.
  vector<string> hosts;  // Host of each request.
  vector<string> agents; // User-Agent of each request.

  explicit
  loopback_server (asio::io_context& ioc)
    : acceptor_ (ioc, tcp::endpoint (asio::ip::make_address ("127.0.0.1"), 0))
  {
  }

  string
  authority () const
  {
    return "127.0.0.1:" + to_string (acceptor_.local_endpoint ().port ());
  }

  string
  url (const string& p) const
  {
    return "http://" + authority () + p;
  }

  void
  start ()
  {
    asio::co_spawn (acceptor_.get_executor (), accept (), asio::detached);
  }

  void
  stop ()
  {
    beast::error_code ec;
    acceptor_.close (ec);
  }

private:
  asio::awaitable<void>
  accept ()
  {
    for (;;)
    {
      beast::error_code ec;
      tcp::socket s (
        co_await acceptor_.async_accept (
          asio::redirect_error (asio::use_awaitable, ec)));

      if (ec)
        co_return;

      co_await serve (move (s));
    }
  }

  static string
  str (beast::string_view v)
  {
    return string (v.data (), v.size ());
  }

  asio::awaitable<void>
  serve (tcp::socket s)
  {
    beast::flat_buffer b;
    http::request<http::empty_body> req;
    co_await http::async_read (s, b, req, asio::use_awaitable);

    string t (str (req.target ()));
    ++hits[t];
    hosts.push_back (str (req[http::field::host]));
    agents.push_back (str (req[http::field::user_agent]));

    http::response<http::string_body> res (http::status::ok, 11);
    res.set (http::field::connection, "close");

    if (t == "/files/start")
    {
      res.result (http::status::found);
      res.set (http::field::location, "data");
    }
    else if (t == "/files/data")
    {
      string r (str (req[http::field::range]));
      ranges.push_back (r);

      if (r.compare (0, 6, "bytes=") == 0)
      {
        size_t o (stoul (r.substr (6)));
        res.result (http::status::partial_content);
        res.body () = body.substr (o);
      }
      else
        res.body () = body;
    }
    else if (t == "/loop")
    {
      res.result (http::status::found);
      res.set (http::field::location, "/loop");
    }
    else
      res.result (http::status::not_found);

    res.prepare_payload ();

    // A HEAD response declares the length but carries no body.
    //
    if (req.method () == http::verb::head)
    {
      http::response_serializer<http::string_body> sr (res);
      co_await http::async_write_header (s, sr, asio::use_awaitable);
    }
    else
      co_await http::async_write (s, res, asio::use_awaitable);

    beast::error_code ec;
    s.shutdown (tcp::socket::shutdown_send, ec);
  }

private:
  tcp::acceptor acceptor_;
};

static void
test_exchange ()
{
  asio::io_context ioc;

  loopback_server srv (ioc);
  srv.body = "0123456789abcdef";
  srv.start ();

  http_client_traits<> tr;
  tr.max_redirects = 3;

  http_client c (tr);

  optional<http_response> head;
  optional<http_response> get;
  optional<http_response> missing;
  string data;
  string loop_error;

  auto accept ([] (const http_response& r) {return r.is_success ();});
  auto collect ([&data] (const char* d, size_t n) {data.append (d, n);});

  exception_ptr f;

  asio::co_spawn (
    ioc,
    [&] () -> asio::awaitable<void>
    {
      head = co_await c.head (srv.url ("/files/start"));

      get = co_await c.get_range (srv.url ("/files/start"), 3,
                                  accept, collect);

      missing = co_await c.get_range (srv.url ("/nothing"), 0,
                                      accept, collect);

      try
      {
        co_await c.head (srv.url ("/loop"));
      }
      catch (const runtime_error& e)
      {
        loop_error = e.what ();
      }
    },
    [&f, &srv] (exception_ptr e)
    {
      f = e;
      srv.stop ();
    });

  ioc.run ();

  if (f)
    rethrow_exception (f);

  // HEAD follows the redirect and sees the length without a body.
  //
  assert (head);
  assert (head->status == http_status::ok);
  assert (head->content_length () && *head->content_length () == 16);

  // The ranged GET keeps its Range across the redirect.
  //
  assert (get);
  assert (get->status == http_status::partial_content);
  assert (data == "3456789abcdef");

  assert (srv.hits["/files/start"] == 2);
  assert (srv.hits["/files/data"] == 2);
  assert ((srv.ranges == vector<string> {"", "bytes=3-"}));

  // Errors other than redirects are handed back, not thrown.
  //
  assert (missing);
  assert (missing->status == http_status::not_found);

  // The first request plus max_redirects more, then give up.
  //
  assert (srv.hits["/loop"] == 4);
  assert (loop_error.find ("maximum redirects") != string::npos);

  // Every hop, redirected ones included, names the server and the client.
  //
  for (const string& h: srv.hosts)
    assert (h == srv.authority ());

  for (const string& a: srv.agents)
    assert (a.compare (0, 5, "mfdl/") == 0);
}

int
main ()
{
  test_resolve_location ();
  test_timeout_milliseconds ();
  test_exchange ();
}
