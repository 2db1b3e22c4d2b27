#include <mfdl/http/http-url.hxx>

#include <cctype>
#include <algorithm>

using namespace std;

namespace mfdl
{
  url_parts
  parse_url (const string& url)
  {
    url_parts r;
    size_t pos (0);

    // Parse scheme.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      r.scheme = url.substr (0, p);
      transform (r.scheme.begin (), r.scheme.end (), r.scheme.begin (),
                 [] (unsigned char c) {return tolower (c);});
      pos = p + 3;
    }
    else
      // Fallback to http if no scheme is specified.
      //
      r.scheme = "http";

    // Parse authority (host:port).
    //
    // The authority ends at the start of the path, the query, or the
    // fragment, whichever comes first.
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));
    size_t colon (auth.find (':'));

    if (colon != string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);
    }
    else
    {
      r.host = auth;
      r.port = (r.scheme == "https") ? "443" : "80";
    }

    // Parse target (path + query). The fragment never goes on the wire.
    //
    if (end < url.size () && url[end] != '#')
    {
      r.target = url.substr (end);

      size_t h (r.target.find ('#'));
      if (h != string::npos)
        r.target.erase (h);

      if (r.target.front () == '?')
        r.target.insert (0, 1, '/');
    }
    else
      r.target = "/";

    return r;
  }

  optional<string>
  validate_url (const string& s)
  {
    size_t p (s.find ("://"));
    if (p == string::npos || p == 0)
      return nullopt;

    url_parts u (parse_url (s));

    if (u.scheme != "http" && u.scheme != "https")
      return nullopt;

    if (u.host.empty ())
      return nullopt;

    // Reject user info and anything else we don't know how to connect to.
    //
    auto bad_host ([] (unsigned char c)
    {
      return !(isalnum (c) || c == '-' || c == '.' || c == '_');
    });

    if (any_of (u.host.begin (), u.host.end (), bad_host))
      return nullopt;

    if (u.port.empty () ||
        u.port.size () > 5 ||
        !all_of (u.port.begin (), u.port.end (),
                 [] (unsigned char c) {return isdigit (c);}) ||
        stoul (u.port) == 0 || stoul (u.port) > 65535)
      return nullopt;

    // Whitespace and control characters are not allowed anywhere.
    //
    if (any_of (s.begin (), s.end (),
                [] (unsigned char c) {return isspace (c) || iscntrl (c);}))
      return nullopt;

    // Normalize the scheme case and make sure there is at least a root path.
    //
    string r (u.scheme + "://" + s.substr (p + 3));
    size_t a (r.find_first_of ("/?#", u.scheme.size () + 3));

    if (a == string::npos)
      r += '/';
    else if (r[a] != '/')
      r.insert (a, 1, '/');

    return r;
  }

  vector<string>
  split_url_list (const string& l, vector<string>* rejected)
  {
    vector<string> r;

    for (size_t b (0); b <= l.size (); )
    {
      size_t e (l.find (',', b));
      if (e == string::npos)
        e = l.size ();

      string u (l.substr (b, e - b));
      b = e + 1;

      // Trim.
      //
      size_t f (u.find_first_not_of (" \t\r\n"));
      if (f == string::npos)
        continue;

      u = u.substr (f, u.find_last_not_of (" \t\r\n") - f + 1);

      if (auto v = validate_url (u))
        r.push_back (move (*v));
      else if (rejected != nullptr)
        rejected->push_back (move (u));
    }

    return r;
  }

  string
  url_filename (const string& url)
  {
    url_parts u (parse_url (url));

    string t (u.target);
    size_t q (t.find ('?'));
    if (q != string::npos)
      t.erase (q);

    size_t s (t.rfind ('/'));
    string n (s != string::npos ? t.substr (s + 1) : t);

    // Refuse names that would escape the destination directory.
    //
    if (n.empty () || n == "." || n == "..")
      return "downloaded_file";

    return n;
  }
}
