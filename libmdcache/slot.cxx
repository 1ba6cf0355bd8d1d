// file      : libmdcache/slot.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/slot.hxx>

using namespace std;

namespace mdcache
{
  slot::
  slot (const string& s)
  {
    if (s.empty ())
      throw invalid_argument ("empty slot");

    size_t p (s.find ('/'));

    if (p == string::npos)
      name = s;
    else
    {
      name.assign (s, 0, p);
      subslot = string (s, p + 1);
    }
  }

  string
  to_string (const slot& s)
  {
    string r (s.name);

    if (s.subslot)
    {
      r += '/';
      r += *s.subslot;
    }

    return r;
  }
}
