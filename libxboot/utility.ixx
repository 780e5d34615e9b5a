// file      : libxboot/utility.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace xboot
{
  // Note: also used in the run() implementation.
  //
  LIBXBOOT_SYMEXPORT bool
  run_finish_impl (const char* const*,
                   process&,
                   bool fail,
                   const string&,
                   uint16_t,
                   bool = false);

  inline bool
  run_finish_code (const char* const* args,
                   process& pr,
                   uint16_t v,
                   bool on)
  {
    return run_finish_impl (args, pr, false, string (), v, on);
  }

  inline bool
  run_finish_code (const cstrings& args,
                   process& pr,
                   uint16_t v,
                   bool on)
  {
    return run_finish_code (args.data (), pr, v, on);
  }

  LIBXBOOT_SYMEXPORT bool
  run (uint16_t verbosity,
       const process_env&,
       const char* const* args,
       uint16_t finish_verbosity,
       const function<bool (string&, bool)>&,
       bool error);

  template <typename T, typename F>
  inline T
  run (uint16_t verbosity,
       const process_env& pe,
       const char* const* args,
       F&& f,
       bool err)
  {
    T r;
    if (!run (verbosity,
              pe, args,
              verbosity - 1,
              [&r, &f] (string& l, bool last) // Small function optimmization.
              {
                r = f (l, last);
                return r.empty ();
              },
              err))
      r = T ();

    return r;
  }
}
