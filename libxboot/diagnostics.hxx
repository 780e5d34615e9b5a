// file      : libxboot/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_DIAGNOSTICS_HXX
#define LIBXBOOT_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  struct diag_record;

  // Throw this exception to terminate the current orchestration step. The
  // handler should assume that the diagnostics has already been issued.
  //
  class failed: public std::exception {};

  // Print low-verbosity diagnostics for filesystem and toolchain operations
  // in the forms:
  //
  // <prog> <path> <comb> <path>
  // <prog> <path>
  //
  // For example:
  //
  // mkdir _boot/
  // cp _build/install/default/ -> _build_install_native/
  // ln ocamlc -> x86_64-conda-linux-gnu-ocamlc
  // rmdir -r _build/
  //
  // If <comb> is not specified, then "->" is used by default.
  //
  LIBXBOOT_SYMEXPORT void
  print_diag (const char* prog, const path&);

  LIBXBOOT_SYMEXPORT void
  print_diag (const char* prog, const dir_path&);

  LIBXBOOT_SYMEXPORT void
  print_diag (const char* prog,
              const path& l, const path& r,
              const char* comb = nullptr);

  // Print process commmand line. If the number of elements is specified,
  // then it will print the piped multi-process command line, if present.
  //
  LIBXBOOT_SYMEXPORT void
  print_process (diag_record&,
                 const char* const* args, size_t n = 0);

  // As above but with process_env (environment overrides are printed before
  // the command line).
  //
  LIBXBOOT_SYMEXPORT void
  print_process (diag_record&,
                 const process_env&, const char* const* args, size_t n = 0);

  LIBXBOOT_SYMEXPORT void
  print_process (const process_env&, const char* const* args, size_t n = 0);

  // Program verbosity level (-v/--verbose plus --quiet).
  //
  // 0 - disabled
  // 1 - high-level information messages (phase banners)
  // 2 - essential underlying commands that are being executed
  // 3 - all underlying commands that are being executed
  // 4 - information helpful to the user (e.g., why a step was skipped)
  // 5 - information helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //

  // Forward-declarated in <libxboot/utility.hxx>.
  //
  // const uint16_t verb_never = 7;
  // extern uint16_t verb;

  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l3 (const F& f) {if (verb >= 3) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}
  template <typename F> inline void l6 (const F& f) {if (verb >= 6) f ();}

  // Stream verbosity level. Determined by the diagnostic type (e.g., trace
  // always has maximum verbosity) as well as the program verbosity. It is
  // used to decide whether to print relative or absolute paths.
  //
  // Currently we have the following program to stream verbosity mapping:
  //
  // fail/error/warn/info   <3:{0}  >=3:{1}
  // trace                  *:{1}
  //
  // A stream that hasn't been (yet) assigned any verbosity explicitly (e.g.,
  // ostringstream) defaults to maximum.
  //
  struct stream_verbosity
  {
    // 0 - print relative.
    // 1 - print absolute.
    //
    uint16_t path;

    constexpr explicit
    stream_verbosity (uint16_t p = 0): path (p) {}
  };

  constexpr stream_verbosity stream_verb_max {1};

  // Default program to stream verbosity mapping, as outlined above.
  //
  inline stream_verbosity
  stream_verb_map ()
  {
    return stream_verbosity (verb < 3 ? 0 : 1);
  }

  LIBXBOOT_SYMEXPORT extern const int stream_verb_index;

  inline stream_verbosity
  stream_verb (ostream& os)
  {
    long v (os.iword (stream_verb_index));
    return v == 0
      ? stream_verb_max
      : stream_verbosity (static_cast<uint16_t> (v - 1));
  }

  inline void
  stream_verb (ostream& os, stream_verbosity v)
  {
    os.iword (stream_verb_index) = static_cast<long> (v.path) + 1;
  }

  // Diagnostic facility.
  //
  // Note that this is the "complex" case we we derive from (rather than
  // alias) a number of butl::diag_* types and provide custom operator<<
  // "overrides" in order to make ADL look in the xboot rather than butl
  // namespace.
  //
  using butl::diag_stream;
  using butl::diag_epilogue;
  using butl::diag_frame;

  template <typename> struct diag_prologue;
  template <typename> struct diag_mark;

  struct diag_record: butl::diag_record
  {
    template <typename T>
    const diag_record&
    operator<< (const T& x) const
    {
      os << x;
      return *this;
    }

    diag_record () = default;

    template <typename B>
    explicit
    diag_record (const diag_prologue<B>& p): diag_record () { *this << p;}

    template <typename B>
    explicit
    diag_record (const diag_mark<B>& m): diag_record () { *this << m;}
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

    friend const diag_record&
    operator<< (const diag_record& r, const diag_prologue& p)
    {
      r.append (p.indent, p.epilogue);
      p (r);
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

    friend const diag_record&
    operator<< (const diag_record& r, const diag_mark& m)
    {
      return r << m ();
    }
  };

  template <typename B>
  struct diag_noreturn_end: butl::diag_noreturn_end<B>
  {
    diag_noreturn_end () {} // For Clang 3.7 (const needs user default ctor).

    using butl::diag_noreturn_end<B>::diag_noreturn_end;

    [[noreturn]] friend void
    operator<< (const diag_record& r, const diag_noreturn_end& e)
    {
      assert (r.full ());
      e.B::operator() (r);
    }
  };

  // Note: diag frames are not applied to text/trace diagnostics.
  //
  template <typename F>
  struct diag_frame_impl: diag_frame
  {
    explicit
    diag_frame_impl (F f): diag_frame (&thunk), func_ (move (f)) {}

  private:
    static void
    thunk (const diag_frame& f, const butl::diag_record& r)
    {
      static_cast<const diag_frame_impl&> (f).func_ (
        static_cast<const diag_record&> (r));
    }

    const F func_;
  };

  template <typename F>
  inline diag_frame_impl<F>
  make_diag_frame (F f)
  {
    return diag_frame_impl<F> (move (f));
  }

  struct LIBXBOOT_SYMEXPORT simple_prologue_base
  {
    explicit
    simple_prologue_base (const char* type,
                          const char* mod,
                          const char* name,
                          stream_verbosity sverb)
        : type_ (type), mod_ (mod), name_ (name), sverb_ (sverb) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* mod_;
    const char* name_;
    const stream_verbosity sverb_;
  };

  struct basic_mark_base
  {
    using simple_prologue = diag_prologue<simple_prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     diag_epilogue* epilogue = &diag_frame::apply,
                     stream_verbosity (*sverb) () = &stream_verb_map,
                     const char* mod = nullptr,
                     const char* name = nullptr)
        : sverb_ (sverb),
          type_ (type), mod_ (mod), name_ (name),
          epilogue_ (epilogue) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (epilogue_, type_, mod_, name_, sverb_ ());
    }

  protected:
    stream_verbosity (*sverb_) ();
    const char* type_;
    const char* mod_;
    const char* name_;
    diag_epilogue* const epilogue_;
  };
  using basic_mark = diag_mark<basic_mark_base>;

  LIBXBOOT_SYMEXPORT extern const basic_mark error;
  LIBXBOOT_SYMEXPORT extern const basic_mark warn;
  LIBXBOOT_SYMEXPORT extern const basic_mark info;
  LIBXBOOT_SYMEXPORT extern const basic_mark text;

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : trace_mark_base (nullptr, name) {}

    trace_mark_base (const char* mod, const char* name)
        : basic_mark_base ("trace",
                           nullptr, // No diag stack.
                           []() {return stream_verb_max;},
                           mod,
                           name) {}
  };
  using trace_mark = diag_mark<trace_mark_base>;
  using tracer = trace_mark;

  // fail
  //
  struct fail_mark_base: basic_mark_base
  {
    explicit
    fail_mark_base (const char* type)
        : basic_mark_base (type,
                           [](const butl::diag_record& r, butl::diag_writer* w)
                           {
                             diag_frame::apply (r);
                             r.flush (w);
                             throw failed ();
                           },
                           &stream_verb_map,
                           nullptr,
                           nullptr) {}
  };
  using fail_mark = diag_mark<fail_mark_base>;

  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // If we just throw then the record's destructor will see an active
      // exception and will not flush the record.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = diag_noreturn_end<fail_end_base>;

  LIBXBOOT_SYMEXPORT extern const fail_mark fail;
  LIBXBOOT_SYMEXPORT extern const fail_end  endf;
}

#endif // LIBXBOOT_DIAGNOSTICS_HXX
