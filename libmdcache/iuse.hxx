// file      : libmdcache/iuse.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_IUSE_HXX
#define LIBMDCACHE_IUSE_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // USE flag declaration (IUSE value entry), optionally prefixed with the
  // default state: +flag (enabled) or -flag (disabled).
  //
  enum class iuse_default {enabled, disabled};

  class LIBMDCACHE_SYMEXPORT iuse
  {
  public:
    string name;
    optional<iuse_default> default_;

    explicit
    iuse (string n, optional<iuse_default> d = nullopt)
        : name (move (n)), default_ (d) {}

    // Parse the flag declaration. Throw std::invalid_argument if the
    // representation is invalid.
    //
    static iuse
    parse (const string&);
  };

  using iuses = vector<iuse>;

  // Parse a space-separated IUSE value.
  //
  LIBMDCACHE_SYMEXPORT iuses
  parse_iuses (const string&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const iuse&);

  inline ostream&
  operator<< (ostream& os, const iuse& u)
  {
    return os << to_string (u);
  }

  inline bool
  operator== (const iuse& x, const iuse& y)
  {
    return x.default_ == y.default_ && x.name == y.name;
  }

  inline bool
  operator!= (const iuse& x, const iuse& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_IUSE_HXX
