// file      : libmdcache/license.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_LICENSE_HXX
#define LIBMDCACHE_LICENSE_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // LICENSE expression tree node.
  //
  // For example:
  //
  // GPL-2+ || ( MIT Apache-2.0 ) ssl? ( OpenSSL )
  //
  class LIBMDCACHE_SYMEXPORT license_expr
  {
  public:
    enum class kind_type
    {
      license,         // License name.
      any_of,          // || ( ... )
      use_conditional, // [!]flag? ( ... )
      all              // Implicit conjunction.
    };

    kind_type kind;
    string name;    // License name or USE flag name.
    bool negated;   // !flag? ( ... )
    vector<license_expr> children;

    // Create the empty conjunction.
    //
    license_expr (): kind (kind_type::all), negated (false) {}

    // Create the license.
    //
    explicit
    license_expr (string n)
        : kind (kind_type::license), name (move (n)), negated (false) {}

    // Create the any_of or all group.
    //
    license_expr (kind_type k, vector<license_expr> cs)
        : kind (k), negated (false), children (move (cs)) {}

    // Create the USE-conditional group.
    //
    license_expr (string f, bool n, vector<license_expr> cs)
        : kind (kind_type::use_conditional),
          name (move (f)),
          negated (n),
          children (move (cs)) {}

    bool
    empty () const {return kind == kind_type::all && children.empty ();}
  };

  // Parse the LICENSE value. If there are no entries, return the empty
  // conjunction. If there is a single top-level entry, return it as is.
  // Otherwise, return the conjunction of the top-level entries. Bare
  // parenthesized groups are merged into the enclosing entry list.
  //
  // Throw expression_parsing if the value is invalid.
  //
  LIBMDCACHE_SYMEXPORT license_expr
  parse_license (const string&);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const license_expr&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const license_expr&);

  LIBMDCACHE_SYMEXPORT bool
  operator== (const license_expr&, const license_expr&);

  inline bool
  operator!= (const license_expr& x, const license_expr& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_LICENSE_HXX
