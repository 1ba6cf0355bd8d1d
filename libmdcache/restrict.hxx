// file      : libmdcache/restrict.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_RESTRICT_HXX
#define LIBMDCACHE_RESTRICT_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // RESTRICT (and PROPERTIES) entry: a bare token or a USE-conditional group
  // of entries.
  //
  class LIBMDCACHE_SYMEXPORT restrict_expr
  {
  public:
    enum class kind_type {token, use_conditional};

    kind_type kind;
    string name;    // Token or USE flag name.
    bool negated;
    vector<restrict_expr> children;

    explicit
    restrict_expr (string t)
        : kind (kind_type::token), name (move (t)), negated (false) {}

    restrict_expr (string f, bool n, vector<restrict_expr> cs)
        : kind (kind_type::use_conditional),
          name (move (f)),
          negated (n),
          children (move (cs)) {}
  };

  using restrict_exprs = vector<restrict_expr>;

  // Parse the RESTRICT or PROPERTIES value into the list of top-level
  // entries. Throw expression_parsing if the value is invalid.
  //
  // Note that a bare parenthesized group with a single entry is replaced
  // with that entry and with multiple (or no) entries with the empty token.
  //
  LIBMDCACHE_SYMEXPORT restrict_exprs
  parse_restrict (const string&);

  // Return the tokens in the order of appearance, ignoring the USE
  // conditions.
  //
  LIBMDCACHE_SYMEXPORT strings
  flat_tokens (const restrict_exprs&);

  // Return true if the token appears anywhere in the entries, regardless of
  // the USE conditions.
  //
  LIBMDCACHE_SYMEXPORT bool
  contains (const restrict_exprs&, const string& token);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const restrict_expr&);

  LIBMDCACHE_SYMEXPORT ostream&
  operator<< (ostream&, const restrict_exprs&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const restrict_expr&);

  LIBMDCACHE_SYMEXPORT string
  to_string (const restrict_exprs&);

  LIBMDCACHE_SYMEXPORT bool
  operator== (const restrict_expr&, const restrict_expr&);

  inline bool
  operator!= (const restrict_expr& x, const restrict_expr& y)
  {
    return !(x == y);
  }
}

#endif // LIBMDCACHE_RESTRICT_HXX
