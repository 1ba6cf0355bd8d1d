// file      : libmdcache/diagnostics.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/cache-entry.hxx>
#include <libmdcache/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace mdcache
{
  int
  main (int, char*[])
  {
    ostringstream ds;
    ostream* os (diag_stream);
    diag_stream = &ds;

    auto out = [&ds] ()
    {
      string r (ds.str ());
      ds.str (string ());
      return trim (move (r));
    };

    const string r ("DESCRIPTION=x\n"
                    "SLOT=0\n"
                    "FOO=bar\n"
                    "SLOT=1\n"
                    "_eclasses_=a\t1\tb\n");

    // By default only the dropped eclass is reported.
    //
    {
      init_diag (1);

      cache_entry e (r);
      assert (e.eclasses.size () == 1);
      assert (out () == "warning: line 5: ignoring unpaired eclass b");

      cache_entry p ("DESCRIPTION=x\nSLOT=0\n_eclasses_=a\t1\tb\t2\n");
      assert (out ().empty ());
    }

    // Ignored and overridden keys are traced at level 5.
    //
    {
      init_diag (5);

      cache_entry e (r);
      assert (e.metadata.slot.name == "1");

      string s (out ());
      assert (s.find ("trace: cache_entry: line 3: ignoring unknown key "
                      "FOO") != string::npos);
      assert (s.find ("trace: cache_entry: line 4: key SLOT overrides value "
                      "from line 2") != string::npos);
      assert (s.find ("warning: line 5: ignoring unpaired eclass b") !=
              string::npos);

      // Verbosity does not affect the result.
      //
      init_diag (1);
      assert (cache_entry (r) == e);
      out ();
    }

    // Rejected keys are reported by the exception only.
    //
    {
      init_diag (5);

      try
      {
        cache_entry e ("DESCRIPTION=x\nSLOT=0\nFOO=bar\n",
                       cache_entry_flags::forbid_unknown_keys);
        assert (false);
      }
      catch (const cache_parsing& e)
      {
        assert (e.name == "FOO");
      }

      assert (out ().empty ());
    }

    // Level 0 disables everything.
    //
    {
      init_diag (0);

      cache_entry e (r);
      assert (out ().empty ());

      init_diag (1);
    }

    diag_stream = os;
    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return mdcache::main (argc, argv);
}
