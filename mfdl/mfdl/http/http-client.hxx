#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <optional>
#include <functional>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <mfdl/http/http-types.hxx>
#include <mfdl/http/http-url.hxx>
#include <mfdl/http/http-request.hxx>
#include <mfdl/http/http-response.hxx>

namespace mfdl
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client configuration.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type   = S;
    using request_type  = basic_http_request<string_type>;
    using response_type = basic_http_response<string_type>;

    // Milliseconds to resolve, connect, and complete the TLS handshake.
    //
    std::uint32_t connect_timeout = 30000;

    // Milliseconds for each write or read on an established connection. It
    // is re-armed for every body chunk so that a large but steadily
    // progressing transfer never expires.
    //
    std::uint32_t request_timeout = 60000;

    std::uint8_t max_redirects = 10;

    // Verify the peer certificate and host name.
    //
    bool verify_ssl = true;

    // Empty means derive from the version.
    //
    string_type user_agent;
  };

  // Convert a timeout in seconds to the milliseconds of the traits above.
  // Return nullopt if the result does not fit.
  //
  std::optional<std::uint32_t>
  timeout_milliseconds (std::uint32_t seconds);

  // HTTP(S) client on top of Boost.Beast.
  //
  // Provides the two operations a file downloader needs: a metadata probe
  // and a streamed, optionally ranged fetch. Redirects are followed. Every
  // request uses a fresh connection on the calling coroutine's executor, so
  // one client can serve any number of concurrent coroutines.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client
  {
  public:
    using traits_type   = T;
    using string_type   = typename traits_type::string_type;
    using request_type  = typename traits_type::request_type;
    using response_type = typename traits_type::response_type;

    // Called with the final (post-redirect) response header. Return false
    // to leave the body unread.
    //
    using header_handler = std::function<bool (const response_type&)>;

    // Called for each chunk of the response body.
    //
    using data_handler = std::function<void (const char*, std::size_t)>;

    explicit
    basic_http_client (traits_type = traits_type ());

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    asio::awaitable<response_type>
    head (const string_type& url);

    // GET from the byte offset on (a Range header is only sent for a
    // non-zero offset), streaming the body to on_data if on_header accepts
    // the response.
    //
    asio::awaitable<response_type>
    get_range (const string_type& url,
               std::uint64_t offset,
               header_handler on_header,
               data_handler on_data);

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

  private:
    // Send the request and read the response, following redirects.
    //
    asio::awaitable<response_type>
    exchange (request_type,
              const header_handler&,
              const data_handler&,
              std::uint8_t redirects);

    // One request/response over an established stream (plain or TLS). The
    // second member is true if the response is a redirect to follow.
    //
    template <typename Stream>
    asio::awaitable<std::pair<response_type, bool>>
    transfer (Stream&,
              const request_type&,
              const url_parts&,
              const header_handler&,
              const data_handler&);

  private:
    traits_type traits_;
    string_type user_agent_;
    ssl::context ssl_;
  };

  using http_client = basic_http_client<>;
}

#include <mfdl/http/http-client.ixx>
#include <mfdl/http/http-client.txx>
