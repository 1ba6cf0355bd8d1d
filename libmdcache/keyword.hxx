// file      : libmdcache/keyword.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_KEYWORD_HXX
#define LIBMDCACHE_KEYWORD_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Architecture keyword (KEYWORDS value entry).
  //
  //  amd64  stable
  // ~amd64  testing
  // -amd64  disabled
  // -*      disabled on all architectures (arch is "*")
  //
  enum class stability {stable, testing, disabled, disabled_all};

  class LIBMDCACHE_SYMEXPORT keyword
  {
  public:
    string arch;
    mdcache::stability stability;

    keyword (string a, mdcache::stability s)
        : arch (move (a)), stability (s) {}

    // Throw std::invalid_argument if the representation is invalid.
    //
    explicit
    keyword (const string&);
  };

  using keywords = vector<keyword>;

  // Parse a space-separated KEYWORDS value. Throw std::invalid_argument if
  // any of the keywords is invalid.
  //
  LIBMDCACHE_SYMEXPORT keywords
  parse_keywords (const string&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const keyword&);

  inline ostream&
  operator<< (ostream& os, const keyword& k)
  {
    return os << to_string (k);
  }

  inline bool
  operator== (const keyword& x, const keyword& y)
  {
    return x.stability == y.stability && x.arch == y.arch;
  }

  inline bool
  operator!= (const keyword& x, const keyword& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_KEYWORD_HXX
