// file      : libmdcache/slot.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_SLOT_HXX
#define LIBMDCACHE_SLOT_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // SLOT value in the <slot>[/<subslot>] form.
  //
  class LIBMDCACHE_SYMEXPORT slot
  {
  public:
    string name;
    optional<string> subslot;

    slot () = default;

    slot (string n, optional<string> s)
        : name (move (n)), subslot (move (s)) {}

    // Split the value on the first `/`. Throw invalid_argument if the value
    // is empty.
    //
    explicit
    slot (const string&);
  };

  LIBMDCACHE_SYMEXPORT string
  to_string (const slot&);

  inline ostream&
  operator<< (ostream& os, const slot& s)
  {
    return os << to_string (s);
  }

  inline bool
  operator== (const slot& x, const slot& y)
  {
    return x.name == y.name && x.subslot == y.subslot;
  }

  inline bool
  operator!= (const slot& x, const slot& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_SLOT_HXX
