// file      : libmdcache/dependency.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_DEPENDENCY_HXX
#define LIBMDCACHE_DEPENDENCY_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // DEPEND, RDEPEND, BDEPEND, PDEPEND, and IDEPEND entry.
  //
  // For example:
  //
  // >=dev-libs/openssl-1.1:0= || ( dev-lang/python:3.11 dev-lang/python:3.12 )
  // ssl? ( !net-misc/curl[-ssl(-)] )
  //
  class LIBMDCACHE_SYMEXPORT dependency_entry
  {
  public:
    enum class kind_type
    {
      package,         // Package dependency specification.
      any_of,          // || ( ... )
      use_conditional, // [!]flag? ( ... )
      all              // ( ... )
    };

    kind_type kind;
    string name;    // Package dependency specification or USE flag name.
    bool negated;
    vector<dependency_entry> children;

    explicit
    dependency_entry (string p)
        : kind (kind_type::package), name (move (p)), negated (false) {}

    dependency_entry (kind_type k, vector<dependency_entry> cs)
        : kind (k), negated (false), children (move (cs)) {}

    dependency_entry (string f, bool n, vector<dependency_entry> cs)
        : kind (kind_type::use_conditional),
          name (move (f)),
          negated (n),
          children (move (cs)) {}
  };

  using dependency_entries = vector<dependency_entry>;

  // Dependency class value parser. Throw invalid_argument (or a type derived
  // from it) if the value is invalid.
  //
  class LIBMDCACHE_SYMEXPORT dependency_parser
  {
  public:
    virtual dependency_entries
    parse (const string&) const = 0;

    virtual
    ~dependency_parser ();
  };

  // The default dependency parser. Only verifies that the package
  // specification has the category/name form (optionally preceded with the
  // blocker and the version operator) leaving the rest of it uninterpreted.
  // Throw expression_parsing if the value is invalid.
  //
  class LIBMDCACHE_SYMEXPORT basic_dependency_parser: public dependency_parser
  {
  public:
    virtual dependency_entries
    parse (const string&) const override;
  };

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const dependency_entry&);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const dependency_entries&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const dependency_entry&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const dependency_entries&);

  LIBMDCACHE_SYMEXPORT bool
  operator== (const dependency_entry&, const dependency_entry&);

  inline bool
  operator!= (const dependency_entry& x, const dependency_entry& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_DEPENDENCY_HXX
