// file      : libmdcache/expression.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace mdcache
{
  template <typename T>
  auto expression_parser<T>::
  parse () -> nodes
  {
    nodes r (entries ());

    skip_spaces ();

    if (p_ != n_)
      throw expression_parsing ("unexpected '" + word (p_) + '\'', p_);

    return r;
  }

  template <typename T>
  auto expression_parser<T>::
  entries () -> nodes
  {
    nodes r;

    for (;;)
    {
      // If there is no entry, reposition to the preceding whitespace so
      // that the caller sees the input as it was.
      //
      size_t b (p_);
      skip_spaces ();

      if (p_ == n_ || !entry (r))
      {
        p_ = b;
        break;
      }
    }

    return r;
  }

  template <typename T>
  bool expression_parser<T>::
  entry (nodes& r)
  {
    char c (s_[p_]);

    if (c == '(')
    {
      ++p_;

      nodes cs (entries ());
      close (T::group_context);

      T::group (move (cs), r);
      return true;
    }

    if (const operator_type* o = T::find_operator (c))
    {
      if (s_.compare (p_, 2, o->token) != 0)
        return false;

      p_ += 2;
      skip_spaces ();

      r.push_back (o->make (group (o->context)));
      return true;
    }

    return conditional (r) || T::atom (s_, p_, r);
  }

  template <typename T>
  bool expression_parser<T>::
  conditional (nodes& r)
  {
    bool neg (s_[p_] == '!');

    size_t b (neg ? p_ + 1 : p_);
    size_t e (scan_while (s_, b, &T::flag_char));

    // Not a conditional unless the flag is immediately followed by '?' (in
    // which case this can still be an atom).
    //
    if (e == b || e == n_ || s_[e] != '?')
      return false;

    string f (s_, b, e - b);

    p_ = e + 1;
    skip_spaces ();

    r.push_back (
      T::make_conditional (move (f), neg, group ("USE conditional group")));

    return true;
  }

  template <typename T>
  auto expression_parser<T>::
  group (const char* context) -> nodes
  {
    if (p_ == n_)
      throw expression_parsing ("unterminated group", p_, context);

    if (s_[p_] != '(')
      throw expression_parsing (
        "'(' expected instead of '" + word (p_) + '\'', p_, context);

    ++p_;

    nodes r (entries ());
    close (context);
    return r;
  }

  template <typename T>
  void expression_parser<T>::
  close (const char* context)
  {
    skip_spaces ();

    if (p_ == n_)
      throw expression_parsing ("unterminated group", p_, context);

    if (s_[p_] != ')')
      throw expression_parsing (
        "')' expected instead of '" + word (p_) + '\'', p_, context);

    ++p_;
  }

  template <typename N>
  void
  print_entries (ostream& os, const vector<N>& ns)
  {
    for (auto b (ns.begin ()), i (b), e (ns.end ()); i != e; ++i)
    {
      if (i != b)
        os << ' ';

      os << *i;
    }
  }

  template <typename N>
  void
  print_group (ostream& os, const char* prefix, const vector<N>& ns)
  {
    os << prefix << "( ";
    print_entries (os, ns);
    os << " )";
  }

  template <typename N>
  void
  print_conditional (ostream& os,
                     const string& flag,
                     bool negated,
                     const vector<N>& ns)
  {
    if (negated)
      os << '!';

    os << flag << "? ";
    print_group (os, "", ns);
  }
}
