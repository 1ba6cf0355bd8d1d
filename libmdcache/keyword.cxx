// file      : libmdcache/keyword.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/keyword.hxx>

using namespace std;

namespace mdcache
{
  keyword::
  keyword (const string& s)
  {
    if (s.empty ())
      throw invalid_argument ("empty keyword");

    if (s == "-*")
    {
      arch = "*";
      stability = mdcache::stability::disabled_all;
      return;
    }

    size_t p (0);
    switch (s[0])
    {
    case '~': stability = mdcache::stability::testing;  p = 1; break;
    case '-': stability = mdcache::stability::disabled; p = 1; break;
    default:  stability = mdcache::stability::stable;          break;
    }

    if (p == s.size ())
      throw invalid_argument ("no architecture in keyword '" + s + '\'');

    arch.assign (s, p, string::npos);
  }

  keywords
  parse_keywords (const string& s)
  {
    keywords r;
    for_each_word (s, [&s, &r] (size_t b, size_t e)
                   {
                     r.emplace_back (string (s, b, e - b));
                   });
    return r;
  }

  string
  to_string (const keyword& k)
  {
    switch (k.stability)
    {
    case stability::stable:       return k.arch;
    case stability::testing:      return '~' + k.arch;
    case stability::disabled:     return '-' + k.arch;
    case stability::disabled_all: return "-*";
    }

    assert (false);
    return string ();
  }
}
