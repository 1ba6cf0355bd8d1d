// file      : libmdcache/cache-entry.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_CACHE_ENTRY_HXX
#define LIBMDCACHE_CACHE_ENTRY_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/eapi.hxx>
#include <libmdcache/iuse.hxx>
#include <libmdcache/slot.hxx>
#include <libmdcache/phase.hxx>
#include <libmdcache/src-uri.hxx>
#include <libmdcache/keyword.hxx>
#include <libmdcache/license.hxx>
#include <libmdcache/restrict.hxx>
#include <libmdcache/dependency.hxx>
#include <libmdcache/required-use.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Cache record parsing error kind.
  //
  enum class cache_error
  {
    invalid_eapi,
    invalid_keyword,
    invalid_iuse,
    invalid_phase,
    invalid_src_uri,
    invalid_license,
    invalid_required_use,
    invalid_restrict,
    invalid_cache_entry,
    missing_field,
    dependency
  };

  LIBMDCACHE_SYMEXPORT string
  to_string (cache_error);

  inline ostream&
  operator<< (ostream& os, cache_error e)
  {
    return os << to_string (e);
  }

  // Thrown on the invalid cache record. The name is the offending key (empty
  // if unknown) and the line and column (both 1-based) point to the
  // offending value or are zero if there is no such value (missing field,
  // etc).
  //
  class LIBMDCACHE_SYMEXPORT cache_parsing: public runtime_error
  {
  public:
    cache_parsing (cache_error kind,
                   const string& name,
                   uint64_t line,
                   uint64_t column,
                   const string& description);

    cache_error kind;
    string name;
    uint64_t line;
    uint64_t column;
    string description;
  };

  enum class cache_entry_flags: uint16_t
  {
    none                = 0x00,

    forbid_unknown_keys = 0x01, // Fail on unknown key rather than ignore.
    check_eapi          = 0x02  // Verify values are supported by the EAPI.
  };

  inline cache_entry_flags
  operator& (cache_entry_flags, cache_entry_flags);

  inline cache_entry_flags
  operator| (cache_entry_flags, cache_entry_flags);

  inline cache_entry_flags
  operator&= (cache_entry_flags&, cache_entry_flags);

  inline cache_entry_flags
  operator|= (cache_entry_flags&, cache_entry_flags);

  // Package metadata as specified in the ebuild.
  //
  class LIBMDCACHE_SYMEXPORT ebuild_metadata
  {
  public:
    mdcache::eapi eapi;
    string description;
    mdcache::slot slot;

    strings homepage;
    src_uri_entries src_uri;
    optional<license_expr> license;
    mdcache::keywords keywords;
    iuses iuse;
    optional<required_use_expr> required_use;
    restrict_exprs restrict;
    restrict_exprs properties;

    dependency_entries depend;
    dependency_entries rdepend;
    dependency_entries bdepend;
    dependency_entries pdepend;
    dependency_entries idepend;

    strings inherited;
    phases defined_phases;
  };

  LIBMDCACHE_SYMEXPORT bool
  operator== (const ebuild_metadata&, const ebuild_metadata&);

  inline bool
  operator!= (const ebuild_metadata& x, const ebuild_metadata& y)
  {
    return !(x == y);
  }

  // Inherited eclass name and checksum.
  //
  using eclass_checksum = pair<string, string>;
  using eclass_checksums = vector<eclass_checksum>;

  // Metadata cache record (one md5-dict cache file).
  //
  class LIBMDCACHE_SYMEXPORT cache_entry
  {
  public:
    ebuild_metadata metadata;
    optional<string> md5;
    eclass_checksums eclasses;

    cache_entry () = default;

    // Parse the cache record text. The record is a list of KEY=VALUE lines
    // with blank lines ignored. DESCRIPTION and SLOT are mandatory, EAPI
    // defaults to 0, and the rest of the values default to empty.
    //
    // The dependency values are parsed with the specified parser or, if it
    // is NULL, with basic_dependency_parser.
    //
    // Throw cache_parsing if the record is invalid.
    //
    explicit
    cache_entry (const string&,
                 cache_entry_flags = cache_entry_flags::none,
                 const dependency_parser* = nullptr);

    // Write the record in the canonical key order, omitting empty optional
    // values.
    //
    void
    serialize (ostream&) const;
  };

  LIBMDCACHE_SYMEXPORT string
  to_string (const cache_entry&);

  inline ostream&
  operator<< (ostream& os, const cache_entry& e)
  {
    e.serialize (os);
    return os;
  }

  LIBMDCACHE_SYMEXPORT bool
  operator== (const cache_entry&, const cache_entry&);

  inline bool
  operator!= (const cache_entry& x, const cache_entry& y)
  {
    return !(x == y);
  }
}

#include <libmdcache/cache-entry.ixx>

#endif // LIBMDCACHE_CACHE_ENTRY_HXX
