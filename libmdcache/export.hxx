// file      : libmdcache/export.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_EXPORT_HXX
#define LIBMDCACHE_EXPORT_HXX

// Normally we don't export class templates (but do complete specializations),
// inline functions, and classes with only inline member functions. Exporting
// classes that inherit from non-exported/imported bases (e.g., std::string)
// will end up badly. The only known workarounds are to not inherit or to not
// export. Also, MinGW GCC doesn't like seeing non-exported functions being
// used before their inline definition. The workaround is to reorder code. In
// the end it's all trial and error.
//
#if defined(LIBMDCACHE_STATIC)         // Using static.
#  define LIBMDCACHE_SYMEXPORT
#elif defined(LIBMDCACHE_STATIC_BUILD) // Building static.
#  define LIBMDCACHE_SYMEXPORT
#elif defined(LIBMDCACHE_SHARED)       // Using shared.
#  ifdef _WIN32
#    define LIBMDCACHE_SYMEXPORT __declspec(dllimport)
#  else
#    define LIBMDCACHE_SYMEXPORT
#  endif
#elif defined(LIBMDCACHE_SHARED_BUILD) // Building shared.
#  ifdef _WIN32
#    define LIBMDCACHE_SYMEXPORT __declspec(dllexport)
#  else
#    define LIBMDCACHE_SYMEXPORT
#  endif
#else
// If none of the above macros are defined, then we assume we are being used
// by some third-party build system that cannot/doesn't signal the library
// type. Note that this fallback works for both static and shared but in case
// of shared will be sub-optimal compared to having dllimport.
//
#  define LIBMDCACHE_SYMEXPORT         // Using static or shared.
#endif

#endif // LIBMDCACHE_EXPORT_HXX
