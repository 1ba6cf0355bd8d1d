// file      : libmdcache/phase.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/phase.hxx>

#include <cstring> // strcmp(), strncmp()

using namespace std;

namespace mdcache
{
  // Short names in the phase::value_type order. Note that the full names
  // are the short ones prefixed with pkg_ or src_ (see below).
  //
  static const char* const phase_names[] = {
    "pretend",
    "setup",
    "unpack",
    "prepare",
    "configure",
    "compile",
    "test",
    "install",
    "preinst",
    "postinst",
    "prerm",
    "postrm",
    "config",
    "info",
    "nofetch"};

  static inline bool
  src_phase (phase::value_type v)
  {
    return v >= phase::src_unpack && v <= phase::src_install;
  }

  phase::
  phase (const string& s)
  {
    const char* n (s.c_str ());

    // Strip the pkg_/src_ prefix, if any, remembering which one it was.
    //
    optional<bool> src;
    if (strncmp (n, "pkg_", 4) == 0)
      src = false;
    else if (strncmp (n, "src_", 4) == 0)
      src = true;

    if (src)
      n += 4;

    const size_t count (sizeof (phase_names) / sizeof (phase_names[0]));

    for (size_t i (0); i != count; ++i)
    {
      if (strcmp (n, phase_names[i]) == 0)
      {
        value_type v (static_cast<value_type> (i));

        // The prefix must match the phase kind (no src_setup, etc).
        //
        if (src && *src != src_phase (v))
          break;

        value = v;
        return;
      }
    }

    throw invalid_argument ("unknown phase '" + s + '\'');
  }

  phases
  parse_phases (const string& s)
  {
    phases r;

    if (trim (string (s)) == "-")
      return r;

    for_each_word (s, [&s, &r] (size_t b, size_t e)
                   {
                     r.emplace_back (string (s, b, e - b));
                   });
    return r;
  }

  string
  to_string (phase p)
  {
    return phase_names[p.value];
  }
}
