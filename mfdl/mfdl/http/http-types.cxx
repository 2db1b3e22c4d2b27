#include <mfdl/http/http-types.hxx>

#include <sstream>

using namespace std;

namespace mfdl
{
  string
  to_string (http_method m)
  {
    switch (m)
    {
    case http_method::get:  return "GET";
    case http_method::head: return "HEAD";
    }

    return string ();
  }

  // "HTTP 404 Not Found for <url>"
  //
  static string
  describe (http_status s, const string& reason, const string& url)
  {
    ostringstream o;
    o << "HTTP " << s;

    if (!reason.empty ())
      o << ' ' << reason;

    if (!url.empty ())
      o << " for " << url;

    return o.str ();
  }

  http_error::
  http_error (http_status s, const string& reason, string url)
    : runtime_error (describe (s, reason, url)),
      status_ (s),
      url_ (move (url))
  {
  }
}
