#include <chrono>
#include <limits>

#include <mfdl/version.hxx>

namespace mfdl
{
  inline std::optional<std::uint32_t>
  timeout_milliseconds (std::uint32_t seconds)
  {
    using namespace std::chrono;

    // The multiplication happens in the 64-bit rep of milliseconds.
    //
    milliseconds::rep ms (duration_cast<milliseconds> (
                            std::chrono::seconds (seconds)).count ());

    if (ms > std::numeric_limits<std::uint32_t>::max ())
      return std::nullopt;

    return static_cast<std::uint32_t> (ms);
  }

  template <typename T>
  inline basic_http_client<T>::
  basic_http_client (traits_type t)
    : traits_ (std::move (t)),
      user_agent_ (traits_.user_agent.empty ()
                   ? string_type ("mfdl/") + MFDL_VERSION_ID
                   : traits_.user_agent),
      ssl_ (ssl::context::tls_client)
  {
    ssl_.set_default_verify_paths ();
    ssl_.set_verify_mode (traits_.verify_ssl
                          ? ssl::verify_peer
                          : ssl::verify_none);

    // Nothing older than TLS 1.2.
    //
    ssl_.set_options (ssl::context::default_workarounds |
                      ssl::context::no_sslv2 |
                      ssl::context::no_sslv3 |
                      ssl::context::no_tlsv1 |
                      ssl::context::no_tlsv1_1);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& url)
  {
    request_type r (http_method::head, url);
    r.prepare (user_agent_);

    co_return co_await exchange (std::move (r), nullptr, nullptr, 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get_range (const string_type& url,
             std::uint64_t offset,
             header_handler on_header,
             data_handler on_data)
  {
    request_type r (http_method::get, url);
    r.range_from (offset);
    r.prepare (user_agent_);

    co_return co_await exchange (std::move (r), on_header, on_data, 0);
  }
}
