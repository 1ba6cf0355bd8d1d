// file      : libmdcache/cache-entry.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/cache-entry.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace mdcache
{
  static const string example (
    "DEFINED_PHASES=install test unpack\n"
    "DEPEND=>=sys-devel/clang-10.0.0_rc1:* dev-python/setuptools\n"
    "DESCRIPTION=Python bindings for sys-devel/clang\n"
    "EAPI=7\n"
    "HOMEPAGE=https://llvm.org/\n"
    "IUSE=test python_targets_python3_6 python_targets_python3_7\n"
    "KEYWORDS=~amd64 ~x86\n"
    "LICENSE=Apache-2.0-with-LLVM-exceptions UoI-NCSA\n"
    "RDEPEND=>=sys-devel/clang-10.0.0_rc1:*\n"
    "REQUIRED_USE=|| ( python_targets_python3_6 python_targets_python3_7 )\n"
    "RESTRICT=!test? ( test )\n"
    "SLOT=0\n"
    "SRC_URI=https://github.com/llvm/llvm-project/archive/"
    "llvmorg-10.0.0-rc1.tar.gz\n"
    "_eclasses_=llvm.org\t4e92abc\tmultibuild\t40fe1234\n"
    "_md5_=4539d849d3cea8ac84debad9b3154143\n");

  static optional<cache_parsing>
  fail (const string& s,
        cache_entry_flags fl = cache_entry_flags::none,
        const dependency_parser* dp = nullptr)
  {
    try
    {
      cache_entry e (s, fl, dp);
      return nullopt;
    }
    catch (const cache_parsing& e)
    {
      return e;
    }
  }

  static bool
  roundtrip (const string& s)
  {
    cache_entry e (s);
    return cache_entry (to_string (e)) == e;
  }

  // Dependency parser that accepts any words except those containing `bad`.
  //
  struct word_parser: dependency_parser
  {
    virtual dependency_entries
    parse (const string& s) const override
    {
      if (s.find ("bad") != string::npos)
        throw invalid_argument ("bad dependency");

      dependency_entries r;
      for_each_word (s, [&s, &r] (size_t b, size_t e)
                     {
                       r.emplace_back (string (s, b, e - b));
                     });
      return r;
    }
  };

  int
  main (int, char*[])
  {
    const cache_entry_flags check (cache_entry_flags::check_eapi);

    // Complete record.
    //
    {
      cache_entry e (example);
      const ebuild_metadata& m (e.metadata);

      assert (m.eapi == eapi::v7);
      assert (m.description == "Python bindings for sys-devel/clang");
      assert (m.slot.name == "0" && !m.slot.subslot);
      assert (m.homepage == strings ({"https://llvm.org/"}));

      assert (m.keywords.size () == 2);
      assert (m.keywords[0] == keyword ("amd64", stability::testing));

      assert (m.iuse.size () == 3);
      assert (m.iuse[0] == iuse ("test"));

      assert (m.license && m.license->children.size () == 2);
      assert (m.required_use &&
              m.required_use->kind == required_use_expr::kind_type::any_of);

      assert (m.restrict.size () == 1 && contains (m.restrict, "test"));
      assert (m.properties.empty ());

      assert (m.src_uri.size () == 1);
      assert (m.src_uri[0].filename == "llvmorg-10.0.0-rc1.tar.gz");

      assert (m.depend.size () == 2);
      assert (m.rdepend.size () == 1);
      assert (m.bdepend.empty () && m.pdepend.empty () && m.idepend.empty ());
      assert (m.inherited.empty ());

      assert (m.defined_phases.size () == 3);
      assert (m.defined_phases[0] == phase::src_install);

      assert (e.md5 && *e.md5 == "4539d849d3cea8ac84debad9b3154143");

      assert (e.eclasses.size () == 2);
      assert (e.eclasses[0] == eclass_checksum ("llvm.org", "4e92abc"));
      assert (e.eclasses[1] == eclass_checksum ("multibuild", "40fe1234"));

      // The example is in the canonical form.
      //
      assert (to_string (e) == example);

      ostringstream os;
      os << e;
      assert (os.str () == example);

      assert (cache_entry (to_string (e)) == e);
    }

    // Minimal record.
    //
    {
      cache_entry e ("EAPI=7\n"
                     "DESCRIPTION=Example\n"
                     "SLOT=0\n"
                     "KEYWORDS=~amd64\n"
                     "DEFINED_PHASES=compile install\n");

      const ebuild_metadata& m (e.metadata);

      assert (m.eapi == eapi::v7);
      assert (m.description == "Example");
      assert (m.slot == slot ("0", nullopt));
      assert (m.keywords.size () == 1);
      assert (m.keywords[0].arch == "amd64");
      assert (m.keywords[0].stability == stability::testing);
      assert (m.defined_phases.size () == 2);
      assert (m.defined_phases[0] == phase::src_compile);
      assert (m.defined_phases[1] == phase::src_install);

      assert (!m.license && !m.required_use && !e.md5);
      assert (e.eclasses.empty ());

      assert (to_string (e) == "DEFINED_PHASES=compile install\n"
                               "DESCRIPTION=Example\n"
                               "EAPI=7\n"
                               "KEYWORDS=~amd64\n"
                               "SLOT=0\n");
    }

    // Defaults.
    //
    {
      cache_entry e ("DESCRIPTION=Example\nSLOT=0\n");
      assert (e.metadata.eapi == eapi::v0);
      assert (!e.metadata.eapi.has_bdepend ());
      assert (e.metadata.defined_phases.empty ());

      assert (to_string (e) == "DEFINED_PHASES=-\n"
                               "DESCRIPTION=Example\n"
                               "EAPI=0\n"
                               "SLOT=0\n");

      // Blank lines, surrounding whitespace, and CRLF.
      //
      cache_entry c ("\n  DESCRIPTION=Example  \r\n\r\n\tSLOT=0\r\n\n");
      assert (c == e);

      // Empty description is fine.
      //
      assert (cache_entry ("DESCRIPTION=\nSLOT=0").metadata.description == "");

      // Empty values are the same as absent.
      //
      cache_entry z ("DESCRIPTION=Example\nSLOT=0\nLICENSE=\nSRC_URI=\n"
                     "DEPEND=\nIUSE=\nDEFINED_PHASES=\n_eclasses_=\n");
      assert (z == e);

      // So is the empty expression.
      //
      cache_entry l ("DESCRIPTION=x\nSLOT=0\nLICENSE=( )");
      assert (!l.metadata.license);
    }

    // Sentinel phases.
    //
    {
      cache_entry e ("DESCRIPTION=x\nSLOT=0\nDEFINED_PHASES=-\n");
      assert (e.metadata.defined_phases.empty ());
      assert (e == cache_entry ("DESCRIPTION=x\nSLOT=0\n"));
    }

    // Slot.
    //
    {
      cache_entry e ("DESCRIPTION=x\nSLOT=2/2.1\n");
      assert (e.metadata.slot.name == "2");
      assert (e.metadata.slot.subslot && *e.metadata.slot.subslot == "2.1");
      assert (to_string (e.metadata.slot) == "2/2.1");
      assert (roundtrip ("DESCRIPTION=x\nSLOT=2/2.1\n"));

      assert (cache_entry ("DESCRIPTION=x\nSLOT=0/").metadata.slot.subslot);
    }

    // Eclass pairing.
    //
    {
      auto ecs = [] (const string& v)
      {
        return cache_entry ("DESCRIPTION=x\nSLOT=0\n_eclasses_=" + v).eclasses;
      };

      eclass_checksums r (ecs ("a\t1\tb\t2"));
      assert (r.size () == 2);
      assert (r[0] == eclass_checksum ("a", "1"));
      assert (r[1] == eclass_checksum ("b", "2"));

      r = ecs ("a\t1\tb");
      assert (r.size () == 1 && r[0] == eclass_checksum ("a", "1"));

      assert (ecs ("").empty ());
      assert (ecs ("a").empty ());

      r = ecs ("a\t\tb\t2");
      assert (r.size () == 2 && r[0].second.empty ());
    }

    // Last value wins and unknown keys are ignored.
    //
    {
      cache_entry e ("DESCRIPTION=x\nSLOT=1\nSLOT=2\nFOO=bar\nslot=3\n");
      assert (e.metadata.slot.name == "2");

      optional<cache_parsing> f (
        fail ("DESCRIPTION=x\nSLOT=1\nFOO=bar\n",
              cache_entry_flags::forbid_unknown_keys));

      assert (f && f->kind == cache_error::invalid_cache_entry);
      assert (f->name == "FOO" && f->line == 3 && f->column == 1);
    }

    // Record round-trip.
    //
    {
      assert (roundtrip (example));

      assert (roundtrip (
        "EAPI=8\n"
        "DESCRIPTION=All the fields\n"
        "SLOT=0/1.2\n"
        "HOMEPAGE=https://example.org/ https://example.net/\n"
        "SRC_URI=fetch+https://x/y.tar.gz mirror+https://x/v2.tgz -> z.tgz "
        "doc? ( ( https://x/doc.tgz ) )\n"
        "LICENSE=|| ( MIT BSD ) ssl? ( OpenSSL )\n"
        "KEYWORDS=amd64 ~arm64 -sparc -*\n"
        "IUSE=+ssl -doc test\n"
        "REQUIRED_USE=?? ( ssl gnutls ) doc? ( !test )\n"
        "RESTRICT=mirror test? ( test )\n"
        "PROPERTIES=live\n"
        "DEPEND=ssl? ( dev-libs/openssl:= )\n"
        "RDEPEND=|| ( a/b c/d )\n"
        "BDEPEND=virtual/pkgconfig\n"
        "PDEPEND=( x/y z/w )\n"
        "IDEPEND=!!sys-apps/foo\n"
        "INHERITED=toolchain-funcs multilib\n"
        "DEFINED_PHASES=pretend setup prepare configure compile test install\n"
        "_eclasses_=toolchain-funcs\tabc\tmultilib\tdef\n"
        "_md5_=0123456789abcdef0123456789abcdef\n"));

      // Restriction prefix and rename survive.
      //
      cache_entry e (
        "DESCRIPTION=x\nSLOT=0\n"
        "SRC_URI=fetch+https://x/y.tar.gz https://x/y.tar.gz -> z.tar.gz\n");

      const src_uri_entries& us (e.metadata.src_uri);
      assert (us.size () == 2);
      assert (us[0].restriction == uri_restriction::fetch);
      assert (us[1].target && us[1].filename.empty ());
      assert (to_string (us) ==
              "fetch+https://x/y.tar.gz https://x/y.tar.gz -> z.tar.gz");
      assert (cache_entry (to_string (e)) == e);
    }

    // A bare RESTRICT/PROPERTIES group of several tokens is kept as the empty
    // token, which is written as is and is lost on re-parsing.
    //
    {
      cache_entry e ("DESCRIPTION=x\nSLOT=0\nRESTRICT=( a b )\n"
                     "PROPERTIES=x ( a b )\n");

      const ebuild_metadata& m (e.metadata);
      assert (m.restrict == restrict_exprs ({restrict_expr ("")}));
      assert (m.properties.size () == 2);
      assert (m.properties[0] == restrict_expr ("x"));
      assert (m.properties[1] == restrict_expr (""));

      string s (to_string (e));
      assert (s.find ("\nRESTRICT=\n") != string::npos);
      assert (s.find ("\nPROPERTIES=x \n") != string::npos);

      cache_entry r (s);
      assert (r.metadata.restrict.empty ());
      assert (r.metadata.properties == restrict_exprs ({restrict_expr ("x")}));

      // Single token group is the token itself.
      //
      cache_entry t ("DESCRIPTION=x\nSLOT=0\nRESTRICT=( a )\n");
      assert (t.metadata.restrict == restrict_exprs ({restrict_expr ("a")}));
      assert (cache_entry (to_string (t)) == t);
    }

    // Mandatory fields.
    //
    {
      optional<cache_parsing> f (fail ("SLOT=0\n"));
      assert (f && f->kind == cache_error::missing_field);
      assert (f->name == "DESCRIPTION" && f->line == 0);
      assert (string (f->what ()) ==
              "0:0: missing required field: DESCRIPTION");

      f = fail ("DESCRIPTION=x\n");
      assert (f && f->kind == cache_error::missing_field);
      assert (f->name == "SLOT");

      f = fail ("DESCRIPTION=x\nSLOT=\n");
      assert (f && f->kind == cache_error::missing_field);
      assert (f->name == "SLOT" && f->line == 2 && f->column == 6);

      assert (fail ("") && fail ("")->kind == cache_error::missing_field);
    }

    // Invalid lines and values.
    //
    {
      optional<cache_parsing> f (fail ("DESCRIPTION=x\n  SLOT 0\n"));
      assert (f && f->kind == cache_error::invalid_cache_entry);
      assert (f->line == 2 && f->column == 3);

      f = fail ("EAPI=7\nDESCRIPTION=x\nSLOT=0\nLICENSE=MIT +BSD\n");
      assert (f && f->kind == cache_error::invalid_license);
      assert (f->name == "LICENSE" && f->line == 4 && f->column == 13);
      assert (string (f->what ()) ==
              "4:13: invalid LICENSE: unexpected '+BSD'");

      f = fail ("DESCRIPTION=x\nSLOT=0\nLICENSE=a? ( b");
      assert (f && f->kind == cache_error::invalid_license);
      assert (f->description ==
              "USE conditional group: unterminated group");

      auto kind = [] (const string& kv) -> cache_error
      {
        optional<cache_parsing> f (fail ("DESCRIPTION=x\nSLOT=0\n" + kv));
        assert (f);
        return f->kind;
      };

      assert (kind ("EAPI=x")              == cache_error::invalid_eapi);
      assert (kind ("EAPI=")               == cache_error::invalid_eapi);
      assert (kind ("KEYWORDS=amd64 ~")    == cache_error::invalid_keyword);
      assert (kind ("IUSE=+")              == cache_error::invalid_iuse);
      assert (kind ("SRC_URI=fetch+")      == cache_error::invalid_src_uri);
      assert (kind ("RESTRICT=|| ( a )")   == cache_error::invalid_restrict);
      assert (kind ("PROPERTIES=a? b")     == cache_error::invalid_restrict);
      assert (kind ("DEPEND=foo")          == cache_error::dependency);
      assert (kind ("IDEPEND=a/b )")       == cache_error::dependency);

      assert (kind ("DEFINED_PHASES=build") == cache_error::invalid_phase);
      assert (kind ("REQUIRED_USE=|| a") == cache_error::invalid_required_use);
    }

    // Custom dependency parser.
    //
    {
      word_parser wp;

      cache_entry e ("DESCRIPTION=x\nSLOT=0\nDEPEND=foo bar\n",
                     cache_entry_flags::none,
                     &wp);

      assert (e.metadata.depend.size () == 2);
      assert (e.metadata.depend[1].name == "bar");

      optional<cache_parsing> f (
        fail ("DESCRIPTION=x\nSLOT=0\nRDEPEND=good bad\n",
              cache_entry_flags::none,
              &wp));

      assert (f && f->kind == cache_error::dependency);
      assert (f->name == "RDEPEND" && f->line == 3 && f->column == 9);
      assert (f->description == "bad dependency");
    }

    // EAPI checks.
    //
    {
      auto ok = [check] (const string& kv) -> bool
      {
        return !fail ("DESCRIPTION=x\nSLOT=0\n" + kv, check);
      };

      auto bad = [check] (const string& kv) -> optional<cache_parsing>
      {
        return fail ("DESCRIPTION=x\nSLOT=0\n" + kv, check);
      };

      // Permissive by default.
      //
      assert (!fail ("DESCRIPTION=x\nSLOT=0\nEAPI=6\nBDEPEND=a/b\n"));

      optional<cache_parsing> f (bad ("EAPI=6\nBDEPEND=a/b"));
      assert (f && f->kind == cache_error::invalid_cache_entry);
      assert (f->name == "BDEPEND" && f->line == 4);
      assert (f->description == "BDEPEND is not supported in EAPI 6");

      assert (ok ("EAPI=7\nBDEPEND=a/b"));

      assert (bad ("EAPI=7\nIDEPEND=a/b"));
      assert (ok ("EAPI=8\nIDEPEND=a/b"));

      assert (bad ("EAPI=2\nPROPERTIES=live"));
      assert (ok ("EAPI=3\nPROPERTIES=live"));

      f = bad ("EAPI=3\nREQUIRED_USE=a");
      assert (f && f->kind == cache_error::invalid_cache_entry);
      assert (f->name == "REQUIRED_USE");

      f = bad ("EAPI=4\nREQUIRED_USE=?? ( a b )");
      assert (f && f->kind == cache_error::invalid_required_use);
      assert (ok ("EAPI=5\nREQUIRED_USE=?? ( a b )"));
      assert (ok ("EAPI=4\nREQUIRED_USE=^^ ( a b )"));

      f = bad ("EAPI=7\nRESTRICT=!test? ( test )");
      assert (f && f->kind == cache_error::invalid_restrict);
      assert (f->name == "RESTRICT");
      assert (ok ("EAPI=7\nRESTRICT=test"));
      assert (ok ("EAPI=8\nRESTRICT=!test? ( test )"));

      f = bad ("EAPI=7\nPROPERTIES=test? ( test_network )");
      assert (f && f->name == "PROPERTIES");

      f = bad ("EAPI=1\nSRC_URI=https://x/a -> b");
      assert (f && f->kind == cache_error::invalid_src_uri);
      assert (ok ("EAPI=2\nSRC_URI=https://x/a -> b"));

      f = bad ("EAPI=7\nSRC_URI=doc? ( mirror+https://x/a )");
      assert (f && f->kind == cache_error::invalid_src_uri);
      assert (ok ("EAPI=8\nSRC_URI=doc? ( mirror+https://x/a )"));

      f = bad ("EAPI=3\nDEFINED_PHASES=setup pretend");
      assert (f && f->kind == cache_error::invalid_phase);
      assert (ok ("EAPI=4\nDEFINED_PHASES=setup pretend"));

      assert (bad ("EAPI=1\nDEFINED_PHASES=prepare"));
      assert (bad ("EAPI=1\nDEFINED_PHASES=src_configure"));
      assert (ok ("EAPI=2\nDEFINED_PHASES=prepare configure"));
      assert (ok ("EAPI=0\nDEFINED_PHASES=compile install"));

      f = bad ("IUSE=+ssl");
      assert (f && f->kind == cache_error::invalid_iuse);
      assert (ok ("IUSE=ssl"));
      assert (ok ("EAPI=1\nIUSE=+ssl"));

      f = bad ("EAPI=4\nSLOT=0/1");
      assert (f && f->kind == cache_error::invalid_cache_entry);
      assert (f->name == "SLOT");
      assert (ok ("EAPI=5\nSLOT=0/1"));

      // The example record has USE-conditional RESTRICT.
      //
      f = fail (example, check);
      assert (f && f->kind == cache_error::invalid_restrict);
      assert (f->name == "RESTRICT" && f->line == 11 && f->column == 10);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return mdcache::main (argc, argv);
}
