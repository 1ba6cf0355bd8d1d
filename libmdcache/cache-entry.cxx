// file      : libmdcache/cache-entry.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/cache-entry.hxx>

#include <sstream>

#include <libmdcache/expression.hxx>
#include <libmdcache/diagnostics.hxx>

using namespace std;

namespace mdcache
{
  // cache_error
  //
  string
  to_string (cache_error e)
  {
    switch (e)
    {
    case cache_error::invalid_eapi:         return "invalid EAPI";
    case cache_error::invalid_keyword:      return "invalid keyword";
    case cache_error::invalid_iuse:         return "invalid IUSE entry";
    case cache_error::invalid_phase:        return "invalid phase";
    case cache_error::invalid_src_uri:      return "invalid SRC_URI";
    case cache_error::invalid_license:      return "invalid LICENSE";
    case cache_error::invalid_required_use: return "invalid REQUIRED_USE";
    case cache_error::invalid_cache_entry:  return "invalid cache entry";
    case cache_error::missing_field:        return "missing required field";
    case cache_error::dependency:           return "dependency parse error";
    case cache_error::invalid_restrict:
      return "invalid RESTRICT/PROPERTIES";
    }

    assert (false);
    return string ();
  }

  // cache_parsing
  //
  static string
  format (cache_error k, uint64_t l, uint64_t c, const string& d)
  {
    string r;
    r += to_string (l);
    r += ':';
    r += to_string (c);
    r += ": ";
    r += to_string (k);
    r += ": ";
    r += d;
    return r;
  }

  cache_parsing::
  cache_parsing (cache_error k,
                 const string& n,
                 uint64_t l,
                 uint64_t c,
                 const string& d)
      : runtime_error (format (k, l, c, d)),
        kind (k),
        name (n),
        line (l),
        column (c),
        description (d)
  {
  }

  // Keys in the canonical (serialization) order.
  //
  enum key_index
  {
    k_defined_phases,
    k_depend,
    k_description,
    k_eapi,
    k_homepage,
    k_iuse,
    k_keywords,
    k_license,
    k_pdepend,
    k_rdepend,
    k_required_use,
    k_restrict,
    k_slot,
    k_src_uri,
    k_bdepend,
    k_idepend,
    k_properties,
    k_inherited,
    k_eclasses,
    k_md5,

    key_count
  };

  static const char* const key_names[key_count] = {
    "DEFINED_PHASES",
    "DEPEND",
    "DESCRIPTION",
    "EAPI",
    "HOMEPAGE",
    "IUSE",
    "KEYWORDS",
    "LICENSE",
    "PDEPEND",
    "RDEPEND",
    "REQUIRED_USE",
    "RESTRICT",
    "SLOT",
    "SRC_URI",
    "BDEPEND",
    "IDEPEND",
    "PROPERTIES",
    "INHERITED",
    "_eclasses_",
    "_md5_"};

  static optional<key_index>
  find_key (const string& k)
  {
    for (size_t i (0); i != key_count; ++i)
    {
      if (k == key_names[i])
        return static_cast<key_index> (i);
    }

    return nullopt;
  }

  // Raw key value and its location in the record. The line is zero if the
  // key is not present.
  //
  struct raw_value
  {
    string value;
    uint64_t line = 0;
    uint64_t column = 0;

    bool
    present () const {return line != 0;}
  };

  // Parse the raw value translating the value type and expression parsing
  // exceptions into cache_parsing.
  //
  template <typename F>
  static auto
  parse_value (cache_error k, key_index i, const raw_value& v, F&& f)
    -> decltype (f (v.value))
  {
    try
    {
      return f (v.value);
    }
    catch (const expression_parsing& e)
    {
      string d;
      if (e.context != nullptr)
      {
        d += e.context;
        d += ": ";
      }
      d += e.description;

      throw cache_parsing (k, key_names[i], v.line, v.column + e.position, d);
    }
    catch (const invalid_argument& e)
    {
      throw cache_parsing (k, key_names[i], v.line, v.column, e.what ());
    }
  }

  static strings
  parse_words (const string& s)
  {
    strings r;
    for_each_word (s, [&s, &r] (size_t b, size_t e)
                   {
                     r.emplace_back (s, b, e - b);
                   });
    return r;
  }

  template <typename F>
  static bool
  find_uri (const src_uri_entries& es, const F& f)
  {
    for (const src_uri_entry& e: es)
    {
      if (e.kind == src_uri_entry::kind_type::uri
          ? f (e)
          : find_uri (e.children, f))
        return true;
    }

    return false;
  }

  static bool
  conditional (const restrict_exprs& es)
  {
    for (const restrict_expr& e: es)
    {
      if (e.kind == restrict_expr::kind_type::use_conditional)
        return true;
    }

    return false;
  }

  // Verify that the metadata values are supported by the EAPI.
  //
  static void
  check_eapi (const ebuild_metadata& m, const raw_value* vs)
  {
    const eapi& ea (m.eapi);

    auto fail = [&ea, vs] (cache_error k, key_index i, const string& what)
    {
      const raw_value& v (vs[i]);

      throw cache_parsing (k,
                           key_names[i],
                           v.line,
                           v.column,
                           what + " is not supported in EAPI " +
                           to_string (ea));
    };

    if (!m.bdepend.empty () && !ea.has_bdepend ())
      fail (cache_error::invalid_cache_entry, k_bdepend, "BDEPEND");

    if (!m.idepend.empty () && !ea.has_idepend ())
      fail (cache_error::invalid_cache_entry, k_idepend, "IDEPEND");

    if (!m.properties.empty () && !ea.has_properties ())
      fail (cache_error::invalid_cache_entry, k_properties, "PROPERTIES");

    if (m.required_use)
    {
      if (!ea.has_required_use ())
        fail (cache_error::invalid_cache_entry,
              k_required_use,
              "REQUIRED_USE");

      if (!ea.has_at_most_one_of () &&
          m.required_use->any ([] (const required_use_expr& e)
                               {
                                 return e.kind ==
                                   required_use_expr::kind_type::at_most_one;
                               }))
        fail (cache_error::invalid_required_use,
              k_required_use,
              "'??' group");
    }

    if (!ea.has_use_conditional_restrict ())
    {
      if (conditional (m.restrict))
        fail (cache_error::invalid_restrict,
              k_restrict,
              "USE-conditional RESTRICT");

      if (conditional (m.properties))
        fail (cache_error::invalid_restrict,
              k_properties,
              "USE-conditional PROPERTIES");
    }

    if (!ea.has_src_uri_arrows () &&
        find_uri (m.src_uri, [] (const src_uri_entry& e)
                  {
                    return static_cast<bool> (e.target);
                  }))
      fail (cache_error::invalid_src_uri, k_src_uri, "'->' rename");

    if (!ea.has_selective_uri_restrictions () &&
        find_uri (m.src_uri, [] (const src_uri_entry& e)
                  {
                    return e.restriction != uri_restriction::none;
                  }))
      fail (cache_error::invalid_src_uri,
            k_src_uri,
            "fetch+/mirror+ restriction");

    for (phase p: m.defined_phases)
    {
      switch (p)
      {
      case phase::pkg_pretend:
        {
          if (!ea.has_pkg_pretend ())
            fail (cache_error::invalid_phase, k_defined_phases, "pretend");
          break;
        }
      case phase::src_prepare:
      case phase::src_configure:
        {
          if (!ea.has_src_prepare ())
            fail (cache_error::invalid_phase,
                  k_defined_phases,
                  to_string (p));
          break;
        }
      default: break;
      }
    }

    if (!ea.has_iuse_defaults ())
    {
      for (const iuse& u: m.iuse)
      {
        if (u.default_)
          fail (cache_error::invalid_iuse,
                k_iuse,
                "IUSE default '" + to_string (u) + '\'');
      }
    }

    if (m.slot.subslot && !ea.has_slot_operators ())
      fail (cache_error::invalid_cache_entry, k_slot, "sub-slot");
  }

  // cache_entry
  //
  cache_entry::
  cache_entry (const string& s,
               cache_entry_flags fl,
               const dependency_parser* dp)
  {
    tracer trace ("cache_entry");

    basic_dependency_parser bdp;
    if (dp == nullptr)
      dp = &bdp;

    raw_value vs[key_count];

    // Split the record into the KEY=VALUE lines and save the values.
    //
    uint64_t ln (0);
    for (size_t b (0), n (s.size ()); b < n; )
    {
      size_t e (s.find ('\n', b));
      if (e == string::npos)
        e = n;

      ++ln;

      // Trim the line.
      //
      size_t lb (b), le (e);
      for (; lb != le && space (s[lb]); ++lb) ;
      for (; le != lb && space (s[le - 1]); --le) ;

      size_t lc (lb - b + 1); // Line start column.

      if (lb != le)
      {
        size_t p (s.find ('=', lb));

        if (p >= le)
          throw cache_parsing (cache_error::invalid_cache_entry,
                               string (),
                               ln,
                               lc,
                               "expected '=' in '" +
                               string (s, lb, le - lb) + '\'');

        string k (s, lb, p - lb);

        if (optional<key_index> i = find_key (k))
        {
          raw_value& v (vs[*i]);

          if (v.present ())
            l5 ([&]{trace << "line " << ln << ": key " << k << " overrides "
                          << "value from line " << v.line;});

          v.value.assign (s, p + 1, le - p - 1);
          v.line = ln;
          v.column = p - b + 2;
        }
        else if ((fl & cache_entry_flags::forbid_unknown_keys) !=
                 cache_entry_flags::none)
          throw cache_parsing (cache_error::invalid_cache_entry,
                               k,
                               ln,
                               lc,
                               "unknown key '" + k + '\'');
        else
          l5 ([&]{trace << "line " << ln << ": ignoring unknown key " << k;});
      }

      b = e + 1;
    }

    ebuild_metadata& m (metadata);

    // EAPI.
    //
    if (vs[k_eapi].present ())
      m.eapi = parse_value (cache_error::invalid_eapi, k_eapi, vs[k_eapi],
                            [] (const string& v) {return eapi (v);});

    // DESCRIPTION (can be empty).
    //
    if (!vs[k_description].present ())
      throw cache_parsing (cache_error::missing_field,
                           key_names[k_description],
                           0,
                           0,
                           key_names[k_description]);

    m.description = move (vs[k_description].value);

    // SLOT (cannot be empty).
    //
    {
      const raw_value& v (vs[k_slot]);

      if (v.value.empty ())
        throw cache_parsing (cache_error::missing_field,
                             key_names[k_slot],
                             v.line,
                             v.column,
                             key_names[k_slot]);

      m.slot = mdcache::slot (v.value);
    }

    // The rest of the values are only parsed if not empty.
    //
    auto value = [&vs] (key_index i) -> const raw_value*
    {
      return !vs[i].value.empty () ? &vs[i] : nullptr;
    };

    if (const raw_value* v = value (k_homepage))
      m.homepage = parse_words (v->value);

    if (const raw_value* v = value (k_src_uri))
      m.src_uri = parse_value (cache_error::invalid_src_uri, k_src_uri, *v,
                               &parse_src_uri);

    // Note that the empty expression (for example, just `( )`) is treated
    // as absent.
    //
    if (const raw_value* v = value (k_license))
    {
      license_expr l (parse_value (cache_error::invalid_license,
                                   k_license,
                                   *v,
                                   &parse_license));
      if (!l.empty ())
        m.license = move (l);
    }

    if (const raw_value* v = value (k_keywords))
      m.keywords = parse_value (cache_error::invalid_keyword, k_keywords, *v,
                                &parse_keywords);

    if (const raw_value* v = value (k_iuse))
      m.iuse = parse_value (cache_error::invalid_iuse, k_iuse, *v,
                            &parse_iuses);

    if (const raw_value* v = value (k_required_use))
    {
      required_use_expr r (parse_value (cache_error::invalid_required_use,
                                        k_required_use,
                                        *v,
                                        &parse_required_use));
      if (!r.empty ())
        m.required_use = move (r);
    }

    if (const raw_value* v = value (k_restrict))
      m.restrict = parse_value (cache_error::invalid_restrict, k_restrict, *v,
                                &parse_restrict);

    if (const raw_value* v = value (k_properties))
      m.properties = parse_value (cache_error::invalid_restrict,
                                  k_properties,
                                  *v,
                                  &parse_restrict);

    // Dependencies.
    //
    auto parse_deps = [&value, dp] (key_index i, dependency_entries& r)
    {
      if (const raw_value* v = value (i))
        r = parse_value (cache_error::dependency, i, *v,
                         [dp] (const string& s) {return dp->parse (s);});
    };

    parse_deps (k_depend,  m.depend);
    parse_deps (k_rdepend, m.rdepend);
    parse_deps (k_bdepend, m.bdepend);
    parse_deps (k_pdepend, m.pdepend);
    parse_deps (k_idepend, m.idepend);

    if (const raw_value* v = value (k_inherited))
      m.inherited = parse_words (v->value);

    // Note that parse_phases() handles the `-` placeholder.
    //
    if (const raw_value* v = value (k_defined_phases))
      m.defined_phases = parse_value (cache_error::invalid_phase,
                                      k_defined_phases,
                                      *v,
                                      &parse_phases);

    // Cache-specific values.
    //
    if (vs[k_md5].present ())
      md5 = move (vs[k_md5].value);

    // Tab-separated list of eclass name/checksum pairs.
    //
    if (const raw_value* v = value (k_eclasses))
    {
      const string& ev (v->value);

      strings ts;
      for (size_t b (0);; )
      {
        size_t e (ev.find ('\t', b));
        ts.emplace_back (ev, b, e != string::npos ? e - b : e);

        if (e == string::npos)
          break;

        b = e + 1;
      }

      for (size_t i (0); i + 1 < ts.size (); i += 2)
        eclasses.emplace_back (move (ts[i]), move (ts[i + 1]));

      if (ts.size () % 2 != 0)
        l1 ([&]{warn << "line " << v->line << ": ignoring unpaired "
                     << "eclass " << ts.back ();});
    }

    if ((fl & cache_entry_flags::check_eapi) != cache_entry_flags::none)
      check_eapi (m, vs);
  }

  template <typename T>
  static void
  print_list (ostream& os, const vector<T>& vs)
  {
    for (auto b (vs.begin ()), i (b), e (vs.end ()); i != e; ++i)
    {
      if (i != b)
        os << ' ';

      os << *i;
    }
  }

  void cache_entry::
  serialize (ostream& os) const
  {
    const ebuild_metadata& m (metadata);

    // Write the optional list value.
    //
    auto list = [&os] (const char* k, const auto& vs)
    {
      if (!vs.empty ())
      {
        os << k << '=';
        print_list (os, vs);
        os << '\n';
      }
    };

    os << "DEFINED_PHASES=";
    if (m.defined_phases.empty ())
      os << '-';
    else
      print_list (os, m.defined_phases);
    os << '\n';

    list ("DEPEND", m.depend);

    os << "DESCRIPTION=" << m.description << '\n'
       << "EAPI=" << m.eapi << '\n';

    list ("HOMEPAGE", m.homepage);
    list ("IUSE", m.iuse);
    list ("KEYWORDS", m.keywords);

    if (m.license)
      os << "LICENSE=" << *m.license << '\n';

    list ("PDEPEND", m.pdepend);
    list ("RDEPEND", m.rdepend);

    if (m.required_use)
      os << "REQUIRED_USE=" << *m.required_use << '\n';

    list ("RESTRICT", m.restrict);

    os << "SLOT=" << m.slot << '\n';

    list ("SRC_URI", m.src_uri);
    list ("BDEPEND", m.bdepend);
    list ("IDEPEND", m.idepend);
    list ("PROPERTIES", m.properties);
    list ("INHERITED", m.inherited);

    if (!eclasses.empty ())
    {
      os << "_eclasses_=";

      for (auto b (eclasses.begin ()), i (b); i != eclasses.end (); ++i)
      {
        if (i != b)
          os << '\t';

        os << i->first << '\t' << i->second;
      }

      os << '\n';
    }

    if (md5)
      os << "_md5_=" << *md5 << '\n';
  }

  string
  to_string (const cache_entry& e)
  {
    ostringstream os;
    e.serialize (os);
    return os.str ();
  }

  bool
  operator== (const ebuild_metadata& x, const ebuild_metadata& y)
  {
    return x.eapi           == y.eapi           &&
           x.description    == y.description    &&
           x.slot           == y.slot           &&
           x.homepage       == y.homepage       &&
           x.src_uri        == y.src_uri        &&
           x.license        == y.license        &&
           x.keywords       == y.keywords       &&
           x.iuse           == y.iuse           &&
           x.required_use   == y.required_use   &&
           x.restrict       == y.restrict       &&
           x.properties     == y.properties     &&
           x.depend         == y.depend         &&
           x.rdepend        == y.rdepend        &&
           x.bdepend        == y.bdepend        &&
           x.pdepend        == y.pdepend        &&
           x.idepend        == y.idepend        &&
           x.inherited      == y.inherited      &&
           x.defined_phases == y.defined_phases;
  }

  bool
  operator== (const cache_entry& x, const cache_entry& y)
  {
    return x.metadata == y.metadata &&
           x.md5      == y.md5      &&
           x.eclasses == y.eclasses;
  }
}
