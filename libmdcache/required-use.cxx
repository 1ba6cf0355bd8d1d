// file      : libmdcache/required-use.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/required-use.hxx>

#include <sstream>
#include <iterator> // make_move_iterator()

#include <libmdcache/expression.hxx>

using namespace std;

namespace mdcache
{
  namespace
  {
    using kind = required_use_expr::kind_type;

    struct required_use_traits
    {
      using node_type = required_use_expr;

      static bool
      flag_char (char c)
      {
        return alnum (c) || c == '_' || c == '-' || c == '+';
      }

      template <kind K>
      static node_type
      make_group (vector<node_type>&& cs)
      {
        return node_type (K, move (cs));
      }

      static const expression_operator<node_type> operators[3];

      static const expression_operator<node_type>*
      find_operator (char c)
      {
        switch (c)
        {
        case '|': return &operators[0];
        case '^': return &operators[1];
        case '?': return &operators[2];
        }

        return nullptr;
      }

      static bool
      atom (const string& s, size_t& p, vector<node_type>& r)
      {
        bool neg (s[p] == '!');

        size_t b (neg ? p + 1 : p);
        size_t e (scan_while (s, b, &flag_char));

        if (e == b)
          return false;

        r.emplace_back (string (s, b, e - b), neg);
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

    const expression_operator<required_use_expr>
    required_use_traits::operators[3] = {
      {"||", &make_group<kind::any_of>,      "'||' group"},
      {"^^", &make_group<kind::exactly_one>, "'^^' group"},
      {"??", &make_group<kind::at_most_one>, "'??' group"}};

    const char* const required_use_traits::
    group_context ("closing ')'");
  }

  required_use_expr
  parse_required_use (const string& s)
  {
    vector<required_use_expr> es (
      expression_parser<required_use_traits> (s).parse ());

    switch (es.size ())
    {
    case 0:  return required_use_expr ();
    case 1:  return move (es.front ());
    default: return required_use_expr (kind::all, move (es));
    }
  }

  ostream&
  operator<< (ostream& os, const required_use_expr& e)
  {
    switch (e.kind)
    {
    case kind::flag:
      {
        if (e.negated)
          os << '!';

        os << e.name;
        break;
      }
    case kind::any_of:      print_group (os, "|| ", e.children); break;
    case kind::exactly_one: print_group (os, "^^ ", e.children); break;
    case kind::at_most_one: print_group (os, "?? ", e.children); break;
    case kind::use_conditional:
      {
        print_conditional (os, e.name, e.negated, e.children);
        break;
      }
    case kind::all: print_entries (os, e.children); break;
    }

    return os;
  }

  string
  to_string (const required_use_expr& e)
  {
    ostringstream os;
    os << e;
    return os.str ();
  }

  bool
  operator== (const required_use_expr& x, const required_use_expr& y)
  {
    return x.kind     == y.kind     &&
           x.name     == y.name     &&
           x.negated  == y.negated  &&
           x.children == y.children;
  }
}
