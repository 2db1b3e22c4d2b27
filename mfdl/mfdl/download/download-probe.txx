#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <mfdl/http/http-types.hxx>
#include <mfdl/download/download-types.hxx>

namespace mfdl
{
  template <typename C>
  asio::awaitable<std::uint64_t> basic_size_probe<C>::
  probe (const std::string& url, retry_backoff& backoff)
  {
    for (std::size_t attempt (1);; ++attempt)
    {
      auto r (co_await client_.head (url));

      if (r.is_throttled ())
      {
        if (backoff.exhausted (attempt))
          throw throttled_error (url, attempt);

        asio::steady_timer t (co_await asio::this_coro::executor,
                              backoff.probe_delay (attempt));
        co_await t.async_wait (asio::use_awaitable);
        continue;
      }

      if (!r.is_success ())
        throw http_error (r.status, r.reason, url);

      std::optional<std::uint64_t> n (r.content_length ());

      // A declared zero is no better than no declaration (HEAD handlers
      // that never look at the body say 0). Leave the URL uncounted so
      // that the fetch can fold in what it actually declares, even if
      // that is 0 too.
      //
      if (!n || *n == 0)
        co_return 0;

      aggregate_.count (url, *n);
      co_return *n;
    }
  }
}
