// file      : libmdcache/expression.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/expression.hxx>

using namespace std;

namespace mdcache
{
  static string
  format (const string& d, size_t p, const char* c)
  {
    string r;

    if (c != nullptr)
    {
      r += c;
      r += ": ";
    }

    r += d;
    r += " at offset ";
    r += to_string (p);

    return r;
  }

  expression_parsing::
  expression_parsing (const string& d, size_t p, const char* c)
      : invalid_argument (format (d, p, c)),
        description (d),
        position (p),
        context (c)
  {
  }
}
