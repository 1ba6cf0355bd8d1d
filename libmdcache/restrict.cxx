// file      : libmdcache/restrict.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/restrict.hxx>

#include <sstream>

#include <libmdcache/expression.hxx>

using namespace std;

namespace mdcache
{
  namespace
  {
    struct restrict_traits
    {
      using node_type = restrict_expr;

      static bool
      flag_char (char c)
      {
        return alnum (c) || c == '_' || c == '-' || c == '+';
      }

      static bool
      token_char (char c)
      {
        return alnum (c) || c == '-' || c == '_' || c == '.' || c == '+';
      }

      static const expression_operator<node_type>*
      find_operator (char)
      {
        return nullptr;
      }

      static bool
      atom (const string& s, size_t& p, vector<node_type>& r)
      {
        size_t e (scan_while (s, p, &token_char));

        if (e == p)
          return false;

        r.emplace_back (string (s, p, e - p));
        p = e;
        return true;
      }

      static const char* const group_context;

      static void
      group (vector<node_type>&& cs, vector<node_type>& r)
      {
        if (cs.size () == 1)
          r.push_back (move (cs.front ()));
        else
          r.emplace_back (string ());
      }

      static node_type
      make_conditional (string f, bool n, vector<node_type>&& cs)
      {
        return node_type (move (f), n, move (cs));
      }
    };

    const char* const restrict_traits::
    group_context ("paren group");
  }

  restrict_exprs
  parse_restrict (const string& s)
  {
    return expression_parser<restrict_traits> (s).parse ();
  }

  static void
  flatten (const restrict_exprs& es, strings& r)
  {
    for (const restrict_expr& e: es)
    {
      if (e.kind == restrict_expr::kind_type::token)
        r.push_back (e.name);
      else
        flatten (e.children, r);
    }
  }

  strings
  flat_tokens (const restrict_exprs& es)
  {
    strings r;
    flatten (es, r);
    return r;
  }

  bool
  contains (const restrict_exprs& es, const string& t)
  {
    for (const restrict_expr& e: es)
    {
      if (e.kind == restrict_expr::kind_type::token
          ? e.name == t
          : contains (e.children, t))
        return true;
    }

    return false;
  }

  ostream&
  operator<< (ostream& os, const restrict_expr& e)
  {
    if (e.kind == restrict_expr::kind_type::token)
      os << e.name;
    else
      print_conditional (os, e.name, e.negated, e.children);

    return os;
  }

  ostream&
  operator<< (ostream& os, const restrict_exprs& es)
  {
    print_entries (os, es);
    return os;
  }

  string
  to_string (const restrict_expr& e)
  {
    ostringstream os;
    os << e;
    return os.str ();
  }

  string
  to_string (const restrict_exprs& es)
  {
    ostringstream os;
    os << es;
    return os.str ();
  }

  bool
  operator== (const restrict_expr& x, const restrict_expr& y)
  {
    return x.kind     == y.kind     &&
           x.name     == y.name     &&
           x.negated  == y.negated  &&
           x.children == y.children;
  }
}
