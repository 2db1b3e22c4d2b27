#pragma once

#include <string>
#include <cstdint>

#include <boost/asio.hpp>

#include <mfdl/download/download-retry.hxx>
#include <mfdl/download/download-aggregate.hxx>

namespace mfdl
{
  namespace asio = boost::asio;

  // Size probe.
  //
  // Learns the total size of a remote file with a HEAD request and reports
  // it to the aggregate tracker. The client type C must provide:
  //
  //   asio::awaitable<response_type> head (const std::string& url);
  //
  // where response_type is (or behaves like) basic_http_response.
  //
  template <typename C>
  class basic_size_probe
  {
  public:
    using client_type = C;

    basic_size_probe (client_type& c, download_aggregate& a)
      : client_ (c), aggregate_ (a) {}

    // Return the declared size of the URL's content or 0 if the server did
    // not declare one (or declared 0).
    //
    // A 429 response is retried after the backoff's probe delay until the
    // retry budget is exhausted, at which point throttled_error is thrown.
    // Any other non-success status throws http_error.
    //
    // If a non-zero size is declared, count it towards the aggregate total
    // (which ignores URLs that were already counted). Otherwise the URL stays
    // uncounted so that the fetch can still fold in the real length.
    //
    asio::awaitable<std::uint64_t>
    probe (const std::string& url, retry_backoff& backoff);

  private:
    client_type& client_;
    download_aggregate& aggregate_;
  };
}

#include <mfdl/download/download-probe.txx>
