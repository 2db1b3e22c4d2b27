#include <cctype>
#include <algorithm>

namespace mfdl
{
  template <typename S>
  inline bool basic_http_headers<S>::
  same_name (const string_type& x, const string_type& y) noexcept
  {
    return x.size () == y.size () &&
           std::equal (x.begin (), x.end (), y.begin (),
                       [] (unsigned char a, unsigned char b)
                       {
                         return std::tolower (a) == std::tolower (b);
                       });
  }

  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    erase (n);
    fields_.emplace_back (std::move (n), std::move (v));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type n, string_type v)
  {
    fields_.emplace_back (std::move (n), std::move (v));
  }

  template <typename S>
  inline std::optional<S> basic_http_headers<S>::
  get (const string_type& n) const
  {
    for (const value_type& f: fields_)
    {
      if (same_name (f.first, n))
        return f.second;
    }

    return std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  erase (const string_type& n)
  {
    fields_.erase (std::remove_if (fields_.begin (), fields_.end (),
                                   [&n] (const value_type& f)
                                   {
                                     return same_name (f.first, n);
                                   }),
                   fields_.end ());
  }
}
