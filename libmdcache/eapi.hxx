// file      : libmdcache/eapi.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_EAPI_HXX
#define LIBMDCACHE_EAPI_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Ebuild API version (the EAPI value). Controls which metadata fields and
  // expression operators are meaningful for a package.
  //
  // Note that the has_*() predicates are advisory: the expression parsers
  // accept all the operators regardless of the version (see
  // cache_entry_flags::check_eapi for the opt-in validation).
  //
  class LIBMDCACHE_SYMEXPORT eapi
  {
  public:
    enum value_type {v0, v1, v2, v3, v4, v5, v6, v7, v8, v9};

    value_type value;

    // The default is the oldest version, which is also implied by a cache
    // entry without the EAPI value.
    //
    eapi (value_type v = v0): value (v) {}

    // Throw std::invalid_argument if the string is not a known version.
    //
    explicit
    eapi (const string&);

    operator value_type () const {return value;}

    // IUSE default prefixes (+flag, -flag).
    //
    bool has_iuse_defaults () const {return value >= v1;}

    // src_prepare and src_configure phases.
    //
    bool has_src_prepare () const {return value >= v2;}

    // SRC_URI renames (url -> filename).
    //
    bool has_src_uri_arrows () const {return value >= v2;}

    bool has_properties () const {return value >= v3;}

    bool has_required_use () const {return value >= v4;}
    bool has_pkg_pretend () const {return value >= v4;}

    // ?? groups in REQUIRED_USE.
    //
    bool has_at_most_one_of () const {return value >= v5;}

    // Sub-slots and slot operators.
    //
    bool has_slot_operators () const {return value >= v5;}

    bool has_bdepend () const {return value >= v7;}
    bool has_idepend () const {return value >= v8;}

    bool has_use_conditional_restrict () const {return value >= v8;}

    // fetch+ and mirror+ SRC_URI prefixes.
    //
    bool has_selective_uri_restrictions () const {return value >= v8;}
  };

  LIBMDCACHE_SYMEXPORT string
  to_string (eapi);

  inline ostream&
  operator<< (ostream& os, eapi e)
  {
    return os << to_string (e);
  }

  inline string
  to_string (eapi::value_type v)
  {
    return to_string (eapi (v));
  }

  inline ostream&
  operator<< (ostream& os, eapi::value_type v)
  {
    return os << eapi (v);
  }
}

#endif // LIBMDCACHE_EAPI_HXX
