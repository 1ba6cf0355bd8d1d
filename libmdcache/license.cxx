// file      : libmdcache/license.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/license.hxx>

#include <sstream>
#include <iterator> // make_move_iterator()

#include <libmdcache/expression.hxx>

using namespace std;

namespace mdcache
{
  namespace
  {
    struct license_traits
    {
      using node_type = license_expr;

      static bool
      flag_char (char c)
      {
        return alnum (c) || c == '_' || c == '-' || c == '+' || c == '@';
      }

      static bool
      name_char (char c)
      {
        return alnum (c) || c == '-' || c == '_' || c == '.' || c == '+';
      }

      static node_type
      any_of_group (vector<node_type>&& cs)
      {
        return node_type (license_expr::kind_type::any_of, move (cs));
      }

      static const expression_operator<node_type> any_of;

      static const expression_operator<node_type>*
      find_operator (char c)
      {
        return c == '|' ? &any_of : nullptr;
      }

      // A license name may contain but not start with `-`, `.`, or `+`.
      //
      static bool
      atom (const string& s, size_t& p, vector<node_type>& r)
      {
        size_t e (scan_while (s, p, &name_char));

        if (e == p || s[p] == '-' || s[p] == '.' || s[p] == '+')
          return false;

        r.emplace_back (string (s, p, e - p));
        p = e;
        return true;
      }

      static const char* const group_context;

      static void
      group (vector<node_type>&& cs, vector<node_type>& r)
      {
        r.insert (r.end (),
                  make_move_iterator (cs.begin ()),
                  make_move_iterator (cs.end ()));
      }

      static node_type
      make_conditional (string f, bool n, vector<node_type>&& cs)
      {
        return node_type (move (f), n, move (cs));
      }
    };

    const expression_operator<license_expr> license_traits::
    any_of {"||", &any_of_group, "'||' group"};

    const char* const license_traits::
    group_context ("closing ')'");
  }

  license_expr
  parse_license (const string& s)
  {
    vector<license_expr> es (expression_parser<license_traits> (s).parse ());

    switch (es.size ())
    {
    case 0:  return license_expr ();
    case 1:  return move (es.front ());
    default: return license_expr (license_expr::kind_type::all, move (es));
    }
  }

  ostream&
  operator<< (ostream& os, const license_expr& e)
  {
    using kind = license_expr::kind_type;

    switch (e.kind)
    {
    case kind::license: os << e.name;                        break;
    case kind::any_of:  print_group (os, "|| ", e.children); break;
    case kind::all:     print_entries (os, e.children);      break;
    case kind::use_conditional:
      {
        print_conditional (os, e.name, e.negated, e.children);
        break;
      }
    }

    return os;
  }

  string
  to_string (const license_expr& e)
  {
    ostringstream os;
    os << e;
    return os.str ();
  }

  bool
  operator== (const license_expr& x, const license_expr& y)
  {
    return x.kind     == y.kind     &&
           x.name     == y.name     &&
           x.negated  == y.negated  &&
           x.children == y.children;
  }
}
