// file      : libmdcache/dependency.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/dependency.hxx>

#include <sstream>

#include <libmdcache/expression.hxx>

using namespace std;

namespace mdcache
{
  dependency_parser::
  ~dependency_parser ()
  {
  }

  namespace
  {
    struct dependency_traits
    {
      using node_type = dependency_entry;
      using kind_type = dependency_entry::kind_type;

      static bool
      flag_char (char c)
      {
        return alnum (c) || c == '_' || c == '-' || c == '+';
      }

      static node_type
      any_of_group (vector<node_type>&& cs)
      {
        return node_type (kind_type::any_of, move (cs));
      }

      static const expression_operator<node_type> any_of;

      static const expression_operator<node_type>*
      find_operator (char c)
      {
        return c == '|' ? &any_of : nullptr;
      }

      // The package specification is a run of non-whitespace characters
      // that ends before a parenthesis unless it is inside the USE
      // dependency block (as in `foo/bar[baz(+)]`).
      //
      static bool
      atom (const string& s, size_t& p, vector<node_type>& r)
      {
        size_t n (s.size ());
        size_t e (p);

        for (size_t d (0); e != n; ++e)
        {
          char c (s[e]);

          if (space (c))
            break;

          if (c == '[')
            ++d;
          else if (c == ']')
          {
            if (d != 0)
              --d;
          }
          else if (d == 0 && (c == '(' || c == ')'))
            break;
        }

        if (e == p)
          return false;

        string a (s, p, e - p);

        // Skip the blocker and the version operator and make sure what
        // remains starts with <category>/<name>.
        //
        size_t b (0);

        if (a[b] == '!')
        {
          if (++b != a.size () && a[b] == '!')
            ++b;
        }

        b = a.find_first_not_of ("<>=~", b);

        size_t i (b != string::npos ? a.find ('/', b) : string::npos);

        if (i == string::npos || i == b || i + 1 == a.size () ||
            !(alnum (a[i + 1]) || a[i + 1] == '_'))
          throw expression_parsing (
            "invalid package dependency '" + a + '\'', p);

        r.emplace_back (move (a));
        p = e;
        return true;
      }

      static const char* const group_context;

      static void
      group (vector<node_type>&& cs, vector<node_type>& r)
      {
        r.push_back (node_type (kind_type::all, move (cs)));
      }

      static node_type
      make_conditional (string f, bool n, vector<node_type>&& cs)
      {
        return node_type (move (f), n, move (cs));
      }
    };

    const expression_operator<dependency_entry> dependency_traits::
    any_of {"||", &any_of_group, "'||' group"};

    const char* const dependency_traits::
    group_context ("closing ')'");
  }

  dependency_entries basic_dependency_parser::
  parse (const string& s) const
  {
    return expression_parser<dependency_traits> (s).parse ();
  }

  ostream&
  operator<< (ostream& os, const dependency_entry& e)
  {
    using kind = dependency_entry::kind_type;

    switch (e.kind)
    {
    case kind::package:         os << e.name;                        break;
    case kind::any_of:          print_group (os, "|| ", e.children); break;
    case kind::all:             print_group (os, "", e.children);    break;
    case kind::use_conditional:
      {
        print_conditional (os, e.name, e.negated, e.children);
        break;
      }
    }

    return os;
  }

  ostream&
  operator<< (ostream& os, const dependency_entries& es)
  {
    print_entries (os, es);
    return os;
  }

  string
  to_string (const dependency_entry& e)
  {
    ostringstream os;
    os << e;
    return os.str ();
  }

  string
  to_string (const dependency_entries& es)
  {
    ostringstream os;
    os << es;
    return os.str ();
  }

  bool
  operator== (const dependency_entry& x, const dependency_entry& y)
  {
    return x.kind     == y.kind     &&
           x.name     == y.name     &&
           x.negated  == y.negated  &&
           x.children == y.children;
  }
}
