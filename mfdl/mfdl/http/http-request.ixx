#include <mfdl/http/http-url.hxx>

namespace mfdl
{
  template <typename S>
  inline void basic_http_request<S>::
  range_from (std::uint64_t o)
  {
    if (o == 0)
      headers.erase ("Range");
    else
      headers.set ("Range", "bytes=" + std::to_string (o) + '-');
  }

  template <typename S>
  inline void basic_http_request<S>::
  prepare (const string_type& ua)
  {
    // The port only goes into Host if it is not the scheme's default.
    //
    if (!headers.get ("Host"))
    {
      url_parts u (parse_url (url));

      if (!u.host.empty ())
      {
        string_type h (u.host);

        if (u.port != (u.scheme == "https" ? "443" : "80"))
          h += ':' + u.port;

        headers.set ("Host", std::move (h));
      }
    }

    if (!headers.get ("User-Agent"))
      headers.set ("User-Agent", ua);
  }
}
