#pragma once

#include <string>
#include <cstdint>
#include <utility>

#include <mfdl/http/http-types.hxx>

namespace mfdl
{
  // Outgoing request. The downloader never sends a body.
  //
  template <typename S>
  struct basic_http_request
  {
    using string_type = S;
    using headers_type = basic_http_headers<string_type>;

    http_method method {http_method::get};
    string_type url;
    headers_type headers;
    unsigned version {11}; // As in Beast: major * 10 + minor.

    basic_http_request () = default;

    basic_http_request (http_method m, string_type u)
      : method (m), url (std::move (u)) {}

    // Ask for everything from the byte offset on. Zero means the whole
    // resource, so no Range is sent at all.
    //
    void
    range_from (std::uint64_t offset);

    // Fill in Host (from the URL) and User-Agent unless already set. Call
    // again after changing the URL with Host erased.
    //
    void
    prepare (const string_type& user_agent);
  };

  using http_request = basic_http_request<std::string>;
}

#include <mfdl/http/http-request.ixx>
