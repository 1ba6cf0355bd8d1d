// file      : libmdcache/cache-entry.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace mdcache
{
  inline cache_entry_flags
  operator&= (cache_entry_flags& x, cache_entry_flags y)
  {
    return x = static_cast<cache_entry_flags> (
      static_cast<uint16_t> (x) &
      static_cast<uint16_t> (y));
  }

  inline cache_entry_flags
  operator|= (cache_entry_flags& x, cache_entry_flags y)
  {
    return x = static_cast<cache_entry_flags> (
      static_cast<uint16_t> (x) |
      static_cast<uint16_t> (y));
  }

  inline cache_entry_flags
  operator& (cache_entry_flags x, cache_entry_flags y)
  {
    return x &= y;
  }

  inline cache_entry_flags
  operator| (cache_entry_flags x, cache_entry_flags y)
  {
    return x |= y;
  }
}
