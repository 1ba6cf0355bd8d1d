// file      : libmdcache/phase.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_PHASE_HXX
#define LIBMDCACHE_PHASE_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Ebuild phase function (DEFINED_PHASES value entry).
  //
  class LIBMDCACHE_SYMEXPORT phase
  {
  public:
    enum value_type
    {
      pkg_pretend,
      pkg_setup,
      src_unpack,
      src_prepare,
      src_configure,
      src_compile,
      src_test,
      src_install,
      pkg_preinst,
      pkg_postinst,
      pkg_prerm,
      pkg_postrm,
      pkg_config,
      pkg_info,
      pkg_nofetch
    };

    value_type value;

    phase (value_type v): value (v) {}

    // Accept both the short (compile) and the full (src_compile) names.
    // Throw std::invalid_argument if the name is not a known phase.
    //
    explicit
    phase (const string&);

    operator value_type () const {return value;}
  };

  using phases = vector<phase>;

  // Parse the DEFINED_PHASES value. Both the empty value and the `-`
  // placeholder mean no phases are defined.
  //
  LIBMDCACHE_SYMEXPORT phases
  parse_phases (const string&);

  // Return the short name, as used in DEFINED_PHASES.
  //
  LIBMDCACHE_SYMEXPORT string
  to_string (phase);

  inline ostream&
  operator<< (ostream& os, phase p)
  {
    return os << to_string (p);
  }

  // Bare enumerators would otherwise promote to int.
  //
  inline string
  to_string (phase::value_type v)
  {
    return to_string (phase (v));
  }

  inline ostream&
  operator<< (ostream& os, phase::value_type v)
  {
    return os << phase (v);
  }
}

#endif // LIBMDCACHE_PHASE_HXX
