// file      : libmdcache/src-uri.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_SRC_URI_HXX
#define LIBMDCACHE_SRC_URI_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Fetch restriction specified with the `fetch+` or `mirror+` URI prefix.
  //
  enum class uri_restriction {none, fetch, mirror};

  LIBMDCACHE_SYMEXPORT string
  to_string (uri_restriction);

  // SRC_URI entry.
  //
  // For example:
  //
  // https://example.org/foo-1.0.tar.gz
  // mirror+https://example.org/v1.0.tar.gz -> foo-1.0.tar.gz
  // doc? ( https://example.org/foo-doc-1.0.tar.gz )
  // ( https://example.org/a.tar.gz https://example.org/b.tar.gz )
  //
  class LIBMDCACHE_SYMEXPORT src_uri_entry
  {
  public:
    enum class kind_type {uri, use_conditional, group};

    kind_type kind;

    // URI entry.
    //
    // If the rename target is absent, then the filename is derived from the
    // URL (the last path component without the query). Otherwise, the
    // filename is empty.
    //
    string url;
    string filename;
    optional<string> target;
    uri_restriction restriction;

    // USE-conditional group.
    //
    string flag;
    bool negated;

    vector<src_uri_entry> children;

    src_uri_entry (string url,
                   optional<string> target,
                   uri_restriction = uri_restriction::none);

    src_uri_entry (string f, bool n, vector<src_uri_entry> cs)
        : kind (kind_type::use_conditional),
          restriction (uri_restriction::none),
          flag (move (f)),
          negated (n),
          children (move (cs)) {}

    explicit
    src_uri_entry (vector<src_uri_entry> cs)
        : kind (kind_type::group),
          restriction (uri_restriction::none),
          negated (false),
          children (move (cs)) {}

    // Return the name of the file the URI is fetched into.
    //
    const string&
    effective_filename () const {return target ? *target : filename;}
  };

  using src_uri_entries = vector<src_uri_entry>;

  // Return the filename part of the URL.
  //
  LIBMDCACHE_SYMEXPORT string
  url_filename (const string&);

  // Parse the SRC_URI value into the list of top-level entries. Throw
  // expression_parsing if the value is invalid.
  //
  LIBMDCACHE_SYMEXPORT src_uri_entries
  parse_src_uri (const string&);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const src_uri_entry&);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const src_uri_entries&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const src_uri_entry&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const src_uri_entries&);

  LIBMDCACHE_SYMEXPORT bool
  operator== (const src_uri_entry&, const src_uri_entry&);

  inline bool
  operator!= (const src_uri_entry& x, const src_uri_entry& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_SRC_URI_HXX
