// file      : libmdcache/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBMDCACHE_DIAGNOSTICS_HXX
#define LIBMDCACHE_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <libmdcache/types.hxx>
#include <libmdcache/utility.hxx>

#include <libmdcache/export.hxx>

namespace mdcache
{
  // Invalid input is reported by throwing. The diagnostics stream
  // (butl::diag_stream, stderr by default) only receives:
  //
  // warning - input that was dropped rather than rejected (verbosity 1+)
  // trace   - parsing details, such as ignored keys (verbosity 5+)
  //
  // See init_diag() in <libmdcache/utility.hxx> for setting the level.
  //
  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}

  using butl::diag_stream;
  using butl::diag_epilogue;

  // The butl types are wrapped so that operator<< for the mdcache types is
  // found by ADL.
  //
  struct diag_record: butl::diag_record
  {
    diag_record () = default;

    template <typename T>
    const diag_record&
    operator<< (const T& x) const
    {
      os << x;
      return *this;
    }
  };

  template <typename B>
  struct diag_prologue: butl::diag_prologue<B>
  {
    using butl::diag_prologue<B>::diag_prologue;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      diag_record r;
      r.append (this->indent, this->epilogue);
      B::operator() (r);
      r << x;
      return r;
    }
  };

  template <typename B>
  struct diag_mark: butl::diag_mark<B>
  {
    using butl::diag_mark<B>::diag_mark;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      return B::operator() () << x;
    }
  };

  // Write the `<kind>: [<name>: ]` record prologue.
  //
  struct LIBMDCACHE_SYMEXPORT kind_prologue_base
  {
    kind_prologue_base (const char* kind, const char* name)
        : kind_ (kind), name_ (name) {}

    void
    operator() (const diag_record&) const;

  private:
    const char* kind_;
    const char* name_;
  };

  struct kind_mark_base
  {
    using prologue = diag_prologue<kind_prologue_base>;

    explicit
    kind_mark_base (const char* kind, const char* name = nullptr)
        : kind_ (kind), name_ (name) {}

    prologue
    operator() () const
    {
      return prologue (static_cast<diag_epilogue*> (nullptr), kind_, name_);
    }

  protected:
    const char* kind_;
    const char* name_;
  };

  using warn_mark = diag_mark<kind_mark_base>;

  LIBMDCACHE_SYMEXPORT extern const warn_mark warn;

  // Trace mark named after the traced function or class. For example:
  //
  // tracer trace ("cache_entry");
  // l5 ([&]{trace << "ignoring unknown key " << k;});
  //
  struct trace_mark_base: kind_mark_base
  {
    explicit
    trace_mark_base (const char* name): kind_mark_base ("trace", name) {}
  };

  using tracer = diag_mark<trace_mark_base>;
}

#endif // LIBMDCACHE_DIAGNOSTICS_HXX
