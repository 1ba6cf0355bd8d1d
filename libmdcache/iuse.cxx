// file      : libmdcache/iuse.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/iuse.hxx>

using namespace std;

namespace mdcache
{
  iuse iuse::
  parse (const string& s)
  {
    if (s.empty ())
      throw invalid_argument ("empty IUSE entry");

    optional<iuse_default> d;
    switch (s[0])
    {
    case '+': d = iuse_default::enabled;  break;
    case '-': d = iuse_default::disabled; break;
    }

    size_t p (d ? 1 : 0);

    if (p == s.size ())
      throw invalid_argument ("no flag name in IUSE entry '" + s + '\'');

    return iuse (string (s, p), d);
  }

  iuses
  parse_iuses (const string& s)
  {
    iuses r;
    for_each_word (s, [&s, &r] (size_t b, size_t e)
                   {
                     r.push_back (iuse::parse (string (s, b, e - b)));
                   });
    return r;
  }

  string
  to_string (const iuse& u)
  {
    if (!u.default_)
      return u.name;

    return (*u.default_ == iuse_default::enabled ? '+' : '-') + u.name;
  }
}
