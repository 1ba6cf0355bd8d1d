// file      : libmdcache/eapi.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/eapi.hxx>

using namespace std;

namespace mdcache
{
  eapi::
  eapi (const string& s)
  {
    // Only single-digit versions are currently defined.
    //
    if (s.size () != 1 || !digit (s[0]))
      throw invalid_argument ("unknown EAPI '" + s + '\'');

    value = static_cast<value_type> (s[0] - '0');
  }

  string
  to_string (eapi e)
  {
    return string (1, static_cast<char> ('0' + e.value));
  }
}
