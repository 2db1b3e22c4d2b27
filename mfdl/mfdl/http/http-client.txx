#include <limits>
#include <utility>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace mfdl
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  // Resolve a (possibly relative) redirect location against the URL of the
  // request that produced it.
  //
  inline std::string
  resolve_location (const std::string& base, const std::string& loc)
  {
    if (loc.find ("://") != std::string::npos)
      return loc;

    url_parts b (parse_url (base));
    std::string origin (b.scheme + "://" + b.host);

    bool def ((b.scheme == "https" && b.port == "443") ||
              (b.scheme == "http"  && b.port == "80"));
    if (!def)
      origin += ':' + b.port;

    // Protocol-relative ("//host/path").
    //
    if (loc.size () > 1 && loc[0] == '/' && loc[1] == '/')
      return b.scheme + ':' + loc;

    if (!loc.empty () && loc[0] == '/')
      return origin + loc;

    // Relative to the directory of the current target.
    //
    std::string dir (b.target.substr (0, b.target.find ('?')));
    dir.erase (dir.rfind ('/') + 1);

    return origin + dir + loc;
  }

  template <typename T>
  template <typename Stream>
  asio::awaitable<std::pair<typename basic_http_client<T>::response_type, bool>>
  basic_http_client<T>::
  transfer (Stream& s,
            const request_type& req,
            const url_parts& parts,
            const header_handler& on_header,
            const data_handler& on_data)
  {
    using namespace std::chrono;
    using parser_type = http::response_parser<http::buffer_body>;

    const traits_type& tr (traits_);
    bool is_head (req.method == http_method::head);

    // Note that we need to access the lowest layer (the TCP socket) to set
    // timeouts, regardless of whether there is an SSL layer on top.
    //
    auto& layer (beast::get_lowest_layer (s));

    // Send the request.
    //
    http::request<http::empty_body> br;
    br.method (is_head ? http::verb::head : http::verb::get);
    br.target (parts.target);
    br.version (req.version);

    for (const auto& h: req.headers)
      br.set (h.first, h.second);

    br.set (http::field::connection, "close");

    layer.expires_after (milliseconds (tr.request_timeout));
    co_await http::async_write (s, br, asio::use_awaitable);

    // Read the response header.
    //
    // For HEAD the parser must be told that no body follows regardless of
    // what Content-Length says.
    //
    beast::flat_buffer b;
    parser_type p;
    p.body_limit (std::numeric_limits<std::uint64_t>::max ());

    if (is_head)
      p.skip (true);

    co_await http::async_read_header (s, b, p, asio::use_awaitable);

    const auto& m (p.get ());

    response_type r;
    r.status  = static_cast<http_status> (m.result_int ());
    r.version = m.version ();
    r.reason  = string_type (m.reason ().data (), m.reason ().size ());

    for (const auto& h: m)
    {
      auto n (h.name_string ());
      auto v (h.value ());
      r.headers.add (string_type (n.data (), n.size ()),
                     string_type (v.data (), v.size ()));
    }

    // Leave redirects to the caller which will reconnect elsewhere.
    //
    if (r.is_redirection () && r.location ())
      co_return std::make_pair (std::move (r), true);

    if (is_head || (on_header && !on_header (r)) || p.is_done ())
      co_return std::make_pair (std::move (r), false);

    // Stream the body in chunks.
    //
    // With buffer_body the parser reports need_buffer each time our buffer
    // fills up, which is the normal way of handing out a chunk rather than
    // an error.
    //
    char dbuf[8192];

    while (!p.is_done ())
    {
      p.get ().body ().data = dbuf;
      p.get ().body ().size = sizeof (dbuf);

      // Re-arm the timeout so that only a stalled transfer expires.
      //
      layer.expires_after (milliseconds (tr.request_timeout));

      beast::error_code ec;
      co_await http::async_read (s, b, p,
                                 asio::redirect_error (asio::use_awaitable, ec));

      if (ec == http::error::need_buffer)
        ec = {};

      if (ec)
        throw beast::system_error (ec, "failed to read response body");

      std::size_t n (sizeof (dbuf) - p.get ().body ().size);

      if (n > 0 && on_data)
        on_data (dbuf, n);
    }

    co_return std::make_pair (std::move (r), false);
  }

  template <typename T>
  asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  exchange (request_type req,
            const header_handler& on_header,
            const data_handler& on_data,
            std::uint8_t redirect_count)
  {
    using namespace std::chrono;

    const traits_type& tr (traits_);

    if (redirect_count > tr.max_redirects)
      throw std::runtime_error ("maximum redirects exceeded for " + req.url);

    url_parts parts (parse_url (req.url));

    if (parts.scheme != "http" && parts.scheme != "https")
      throw std::invalid_argument ("unsupported URL scheme: " + parts.scheme);

    bool ssl (parts.scheme == "https");

    // Everything below runs on the calling coroutine's executor (normally a
    // per-download strand).
    //
    auto ex (co_await asio::this_coro::executor);

    tcp::resolver rslv (ex);
    auto addrs (co_await rslv.async_resolve (parts.host,
                                             parts.port,
                                             asio::use_awaitable));

    std::pair<response_type, bool> r;

    if (ssl)
    {
      using stream_type = beast::ssl_stream<beast::tcp_stream>;
      stream_type s (ex, ssl_);

      // We must set the SNI hostname, otherwise many modern servers (like
      // Cloudflare) will reject the handshake.
      //
      // Note that since Beast doesn't wrap this functionality directly we
      // have to drop down to the OpenSSL C API using the native handle.
      //
      if (!SSL_set_tlsext_host_name (s.native_handle (), parts.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "failed to set SNI hostname");
      }

      if (tr.verify_ssl)
        s.set_verify_callback (ssl::host_name_verification (parts.host));

      auto& layer (beast::get_lowest_layer (s));
      layer.expires_after (milliseconds (tr.connect_timeout));

      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s.async_handshake (ssl::stream_base::client,
                                  asio::use_awaitable);

      r = co_await transfer (s, req, parts, on_header, on_data);

      // Many servers don't send close_notify properly and even attempting an
      // SSL shutdown can block until timeout, so we just close the socket.
      //
      beast::error_code ec;
      layer.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }
    else
    {
      beast::tcp_stream s (ex);
      s.expires_after (milliseconds (tr.connect_timeout));

      co_await s.async_connect (addrs, asio::use_awaitable);

      r = co_await transfer (s, req, parts, on_header, on_data);

      beast::error_code ec;
      s.socket ().shutdown (tcp::socket::shutdown_both, ec);
    }

    if (r.second)
    {
      // Construct the follow-up request. Our requests have no body so the
      // method and headers carry over as is (including Range), except for the
      // Host header which must match the new location.
      //
      request_type next (req.method,
                         resolve_location (req.url, *r.first.location ()));

      next.version = req.version;
      next.headers = req.headers;
      next.headers.erase ("Host");
      next.prepare (user_agent_);

      co_return co_await exchange (std::move (next),
                                   on_header,
                                   on_data,
                                   redirect_count + 1);
    }

    co_return std::move (r.first);
  }
}
