// file      : libmdcache/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_TYPES_HXX
#define LIBMDCACHE_TYPES_HXX

#include <vector>
#include <string>
#include <utility>   // pair
#include <cstddef>   // size_t
#include <cstdint>   // uint{16,64}_t
#include <ostream>
#include <stdexcept> // invalid_argument, runtime_error

#include <libbutl/optional.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  using std::uint16_t;
  using std::uint64_t;
  using std::size_t;

  using std::pair;
  using std::string;
  using std::vector;

  using strings = vector<string>;

  using std::ostream;

  // Value types throw invalid_argument and the cache entry parser throws
  // runtime_error-based cache_parsing.
  //
  using std::invalid_argument;
  using std::runtime_error;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;
}

#endif // LIBMDCACHE_TYPES_HXX
