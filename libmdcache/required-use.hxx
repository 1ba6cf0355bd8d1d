// file      : libmdcache/required-use.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_REQUIRED_USE_HXX
#define LIBMDCACHE_REQUIRED_USE_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // REQUIRED_USE expression tree node.
  //
  class LIBMDCACHE_SYMEXPORT required_use_expr
  {
  public:
    enum class kind_type
    {
      flag,            // [!]flag
      any_of,          // || ( ... )
      exactly_one,     // ^^ ( ... )
      at_most_one,     // ?? ( ... )
      use_conditional, // [!]flag? ( ... )
      all
    };

    kind_type kind;
    string name;
    bool negated;
    vector<required_use_expr> children;

    required_use_expr (): kind (kind_type::all), negated (false) {}

    required_use_expr (string n, bool neg)
        : kind (kind_type::flag), name (move (n)), negated (neg) {}

    required_use_expr (kind_type k, vector<required_use_expr> cs)
        : kind (k), negated (false), children (move (cs)) {}

    required_use_expr (string f, bool neg, vector<required_use_expr> cs)
        : kind (kind_type::use_conditional),
          name (move (f)),
          negated (neg),
          children (move (cs)) {}

    bool
    empty () const {return kind == kind_type::all && children.empty ();}

    // Return true if this node or any of its descendants satisfy the
    // predicate.
    //
    template <typename F>
    bool
    any (F&&) const;
  };

  // Parse the REQUIRED_USE value, collapsing the top level the same way as
  // parse_license(). Throw expression_parsing if the value is invalid.
  //
  LIBMDCACHE_SYMEXPORT required_use_expr
  parse_required_use (const string&);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const required_use_expr&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const required_use_expr&);

  LIBMDCACHE_SYMEXPORT bool
  operator== (const required_use_expr&, const required_use_expr&);

  inline bool
  operator!= (const required_use_expr& x, const required_use_expr& y)
  {
    return !(x == y);
  }

  template <typename F>
  inline bool required_use_expr::
  any (F&& f) const
  {
    if (f (*this))
      return true;

    for (const required_use_expr& c: children)
      if (c.any (f))
        return true;

    return false;
  }
}

#endif // LIBMDCACHE_REQUIRED_USE_HXX
