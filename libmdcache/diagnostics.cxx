// file      : libmdcache/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libmdcache/diagnostics.hxx>

using namespace std;

namespace mdcache
{
  uint16_t verb = 1;

  void
  init_diag (uint16_t v)
  {
    verb = v;
  }

  void kind_prologue_base::
  operator() (const diag_record& r) const
  {
    r << kind_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const warn_mark warn ("warning");
}
