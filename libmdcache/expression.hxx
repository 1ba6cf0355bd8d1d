// file      : libmdcache/expression.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_EXPRESSION_HXX
#define LIBMDCACHE_EXPRESSION_HXX

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Thrown on an invalid expression. The position is the offset in the
  // expression string where the problem was detected and the context, if
  // not NULL, names the group being parsed (for example, "USE conditional
  // group").
  //
  class LIBMDCACHE_SYMEXPORT expression_parsing: public invalid_argument
  {
  public:
    expression_parsing (const string& description,
                        size_t position,
                        const char* context = nullptr);

    string description;
    size_t position;
    const char* context;
  };

  // Group operator token (||, ^^, ??) that must be followed by a
  // parenthesized group and the function that makes the group node.
  //
  template <typename N>
  struct expression_operator
  {
    const char* token; // Two-character token.
    N (*make) (vector<N>&&);
    const char* context;
  };

  // Parser for the bracketed, USE-conditional expression language shared by
  // the LICENSE, REQUIRED_USE, RESTRICT/PROPERTIES, SRC_URI, and *DEPEND
  // values:
  //
  // expression  := entry*
  // entry       := group | operator-group | conditional | atom
  // group       := '(' entry* ')'
  // op-group    := <token> '(' entry* ')'
  // conditional := ['!'] <flag> '?' '(' entry* ')'
  //
  // Entries are separated by (optional) whitespace. The grammar-specific
  // parts are provided by the traits class which should have the following
  // interface:
  //
  // struct traits
  // {
  //   using node_type = ...;
  //
  //   // Characters allowed in the USE-conditional flag name.
  //   //
  //   static bool
  //   flag_char (char);
  //
  //   // Return the group operator that starts with the specified character
  //   // or NULL if there is none. Once an operator is selected this way, the
  //   // entry is either this operator group or no entry at all.
  //   //
  //   static const expression_operator<node_type>*
  //   find_operator (char);
  //
  //   // Parse the atom starting at the specified position, appending it to
  //   // the entry list and updating the position. Return false, leaving the
  //   // position unchanged, if this is not an atom.
  //   //
  //   static bool
  //   atom (const string&, size_t&, vector<node_type>&);
  //
  //   // Append the bare parenthesized group entries to the entry list.
  //   //
  //   static const char* const group_context;
  //
  //   static void
  //   group (vector<node_type>&&, vector<node_type>&);
  //
  //   static node_type
  //   make_conditional (string flag, bool negated, vector<node_type>&&);
  // };
  //
  // Note that the nesting depth is not limited and the group parsing is
  // recursive.
  //
  template <typename T>
  class expression_parser
  {
  public:
    using traits_type = T;
    using node_type = typename T::node_type;
    using operator_type = expression_operator<node_type>;
    using nodes = vector<node_type>;

    explicit
    expression_parser (const string& s): s_ (s), n_ (s.size ()), p_ (0) {}

    // Parse the whole string into the top-level entry list. Throw
    // expression_parsing if the string is not a valid expression.
    //
    nodes
    parse ();

  private:
    // Parse entries until the end of the string or an unrecognized entry
    // (which includes the closing parenthesis).
    //
    nodes
    entries ();

    bool
    entry (nodes&);

    bool
    conditional (nodes&);

    // Parse the mandatory parenthesized group.
    //
    nodes
    group (const char* context);

    void
    close (const char* context);

    void
    skip_spaces ()
    {
      for (; p_ != n_ && space (s_[p_]); ++p_) ;
    }

    // Return the word (whitespace-delimited) starting at the position, for
    // diagnostics.
    //
    string
    word (size_t p) const
    {
      size_t e (p);
      for (; e != n_ && !space (s_[e]); ++e) ;
      return string (s_, p, e - p);
    }

  private:
    const string& s_;
    size_t n_;
    size_t p_;
  };

  // Return the end of the run of characters starting at the specified
  // position that satisfy the predicate.
  //
  template <typename F>
  inline size_t
  scan_while (const string& s, size_t p, F f)
  {
    for (size_t n (s.size ()); p != n && f (s[p]); ++p) ;
    return p;
  }

  // Canonical rendering helpers: space-separated entries and the
  // `<prefix>( <entries> )` group form.
  //
  template <typename N>
  void
  print_entries (ostream&, const vector<N>&);

  template <typename N>
  void
  print_group (ostream&, const char* prefix, const vector<N>&);

  template <typename N>
  void
  print_conditional (ostream&, const string& flag, bool negated,
                     const vector<N>&);
}

#include <libmdcache/expression.txx>

#endif // LIBMDCACHE_EXPRESSION_HXX
