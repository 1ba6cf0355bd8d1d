// file      : libmdcache/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_UTILITY_HXX
#define LIBMDCACHE_UTILITY_HXX

#include <string>      // to_string()
#include <utility>     // move()
#include <cassert>     // assert()

#include <libbutl/utility.hxx>  // alnum(), trim(), next_word(), etc

#include <libmdcache/types.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  using std::move;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::alnum;
  using butl::digit;

  using butl::trim;
  using butl::next_word;

  // Diagnostics verbosity level (see <libmdcache/diagnostics.hxx>). The
  // default is 1 (warnings only) and 0 disables all the diagnostics.
  //
  LIBMDCACHE_SYMEXPORT void
  init_diag (uint16_t verbosity);

  LIBMDCACHE_SYMEXPORT extern uint16_t verb;

  // Whitespace that separates expression entries and list items in cache
  // values.
  //
  inline bool
  space (char c) noexcept
  {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  }

  // Split a space-separated value into words, passing each word (as a
  // [b, e) range) to the specified function.
  //
  template <typename F>
  void
  for_each_word (const string& s, F&& f)
  {
    size_t b (0), e (0);
    while (next_word (s, b, e, ' ', '\t') != 0)
      f (b, e);
  }
}

#endif // LIBMDCACHE_UTILITY_HXX
