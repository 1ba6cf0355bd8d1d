// file      : libmdcache/src-uri.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/src-uri.hxx>

#include <cstring> // strchr(), strlen()
#include <sstream>

#include <libmdcache/expression.hxx>

using namespace std;

namespace mdcache
{
  string
  to_string (uri_restriction r)
  {
    switch (r)
    {
    case uri_restriction::none:   return string ();
    case uri_restriction::fetch:  return "fetch";
    case uri_restriction::mirror: return "mirror";
    }

    assert (false);
    return string ();
  }

  string
  url_filename (const string& u)
  {
    size_t b (u.rfind ('/'));
    b = b != string::npos ? b + 1 : 0;

    return string (u, b, u.find ('?', b) - b);
  }

  src_uri_entry::
  src_uri_entry (string u, optional<string> t, uri_restriction r)
      : kind (kind_type::uri),
        url (move (u)),
        target (move (t)),
        restriction (r),
        negated (false)
  {
    if (!target)
      filename = url_filename (url);
  }

  namespace
  {
    struct src_uri_traits
    {
      using node_type = src_uri_entry;

      static bool
      flag_char (char c)
      {
        return alnum (c) || c == '_' || c == '-' || c == '+';
      }

      static bool
      uri_char (char c)
      {
        return alnum (c) || (c != '\0' && strchr (":/.-_~$&'*+,;=%@#?", c));
      }

      static bool
      filename_char (char c)
      {
        return alnum (c) || c == '.' || c == '-' || c == '_' || c == '+';
      }

      static const expression_operator<node_type>*
      find_operator (char)
      {
        return nullptr;
      }

      static bool
      prefix (const string& s, size_t p, const char* v)
      {
        return s.compare (p, strlen (v), v) == 0;
      }

      // [fetch+|mirror+]<url>[ -> <filename>]
      //
      static bool
      atom (const string& s, size_t& p, vector<node_type>& r)
      {
        size_t b (p);

        uri_restriction rs (uri_restriction::none);

        if (prefix (s, b, "fetch+"))
        {
          rs = uri_restriction::fetch;
          b += 6;
        }
        else if (prefix (s, b, "mirror+"))
        {
          rs = uri_restriction::mirror;
          b += 7;
        }

        size_t e (scan_while (s, b, &uri_char));

        if (e == b)
          return false;

        string u (s, b, e - b);

        // Rename is optional so if anything is missing, leave it for the
        // next entry.
        //
        optional<string> t;
        {
          size_t i (scan_while (s, e, &space));

          if (prefix (s, i, "->"))
          {
            i = scan_while (s, i + 2, &space);

            size_t j (scan_while (s, i, &filename_char));

            if (j != i)
            {
              t = string (s, i, j - i);
              e = j;
            }
          }
        }

        r.emplace_back (move (u), move (t), rs);
        p = e;
        return true;
      }

      static const char* const group_context;

      static void
      group (vector<node_type>&& cs, vector<node_type>& r)
      {
        r.push_back (node_type (move (cs)));
      }

      static node_type
      make_conditional (string f, bool n, vector<node_type>&& cs)
      {
        return node_type (move (f), n, move (cs));
      }
    };

    const char* const src_uri_traits::
    group_context ("closing ')'");
  }

  src_uri_entries
  parse_src_uri (const string& s)
  {
    return expression_parser<src_uri_traits> (s).parse ();
  }

  ostream&
  operator<< (ostream& os, const src_uri_entry& e)
  {
    using kind = src_uri_entry::kind_type;

    switch (e.kind)
    {
    case kind::uri:
      {
        if (e.restriction != uri_restriction::none)
          os << to_string (e.restriction) << '+';

        os << e.url;

        if (e.target)
          os << " -> " << *e.target;

        break;
      }
    case kind::use_conditional:
      {
        print_conditional (os, e.flag, e.negated, e.children);
        break;
      }
    case kind::group:
      {
        print_group (os, "", e.children);
        break;
      }
    }

    return os;
  }

  ostream&
  operator<< (ostream& os, const src_uri_entries& es)
  {
    print_entries (os, es);
    return os;
  }

  string
  to_string (const src_uri_entry& e)
  {
    ostringstream os;
    os << e;
    return os.str ();
  }

  string
  to_string (const src_uri_entries& es)
  {
    ostringstream os;
    os << es;
    return os.str ();
  }

  bool
  operator== (const src_uri_entry& x, const src_uri_entry& y)
  {
    return x.kind        == y.kind        &&
           x.url         == y.url         &&
           x.filename    == y.filename    &&
           x.target      == y.target      &&
           x.restriction == y.restriction &&
           x.flag        == y.flag        &&
           x.negated     == y.negated     &&
           x.children    == y.children;
  }
}
