// file      : libxboot/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_UTILITY_HXX
#define LIBXBOOT_UTILITY_HXX

#include <utility>     // move()
#include <cassert>     // assert()
#include <algorithm>   // *

#include <libbutl/utility.hxx>  // trim(), getenv(), setenv(), etc

#include <libxboot/types.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  using std::move;

  // <libbutl/utility.hxx>
  //
  using butl::trim;

  using butl::getenv;

  // Perform process-wide initializations/adjustments/workarounds. Should be
  // called once early in main(). Currently ignores SIGPIPE.
  //
  LIBXBOOT_SYMEXPORT void
  init_process ();

  // Diagnostics state (verbosity level, etc; see <libxboot/diagnostics.hxx>).
  //
  // Initialize the diagnostics state. Should be called once early in main().
  // Default values are for unit tests.
  //
  LIBXBOOT_SYMEXPORT void
  init_diag (uint16_t verbosity);

  const uint16_t verb_never = 7;
  LIBXBOOT_SYMEXPORT extern uint16_t verb;

  // Global state.
  //
  // Initialize the global state. Should be called once early in main().
  //
  LIBXBOOT_SYMEXPORT void
  init ();

  // Work/home directories (must be initialized in main()) and relative path
  // calculation.
  //
  LIBXBOOT_SYMEXPORT extern dir_path work;
  LIBXBOOT_SYMEXPORT extern dir_path home;

  // By default this points to work. If it is empty, then relative() below
  // returns the original path.
  //
  LIBXBOOT_SYMEXPORT extern const dir_path* relative_base;

  // If possible and beneficial, translate an absolute, normalized path into
  // relative to the relative_base directory, which is normally work.
  //
  template <typename K>
  basic_path<char, K>
  relative (const basic_path<char, K>&);

  // In addition to calling relative(), this function also uses shorter
  // notations such as '~/'. For directories the result includes the trailing
  // slash. If the path is the same as base, returns "./" if current is true
  // and empty string otherwise.
  //
  LIBXBOOT_SYMEXPORT string
  diag_relative (const path&, bool current = true);

  // Basic process utilities.
  //
  // The run*() functions with process_path/_env assume that you are printing
  // the process command line yourself.

  // Search for a process executable. Issue diagnostics and throw failed in
  // case of an error.
  //
  LIBXBOOT_SYMEXPORT process_path
  run_search (const path&,
              bool init = false,
              const dir_path& fallback = dir_path (),
              bool path_only = false);

  LIBXBOOT_SYMEXPORT process_path
  run_try_search (const path&,
                  bool init = false,
                  const dir_path& fallback = dir_path (),
                  bool path_only = false);

  // Start a process with the specified arguments. Issue diagnostics and throw
  // failed in case of an error. If out is -1, then redirect stdout to a pipe.
  // Print the process command line (including the environment overrides) if
  // the verbosity level is at least the one specified.
  //
  LIBXBOOT_SYMEXPORT process
  run_start (uint16_t verbosity,
             const process_env&, // Implicit-constructible from process_path.
             const char* const* args,
             int in = 0,
             int out = 1,
             int err = 2);

  inline process
  run_start (uint16_t verbosity,
             const process_env& pe,
             const cstrings& args,
             int in = 0,
             int out = 1,
             int err = 2)
  {
    return run_start (verbosity, pe, args.data (), in, out, err);
  }

  // Wait for process termination returning true if the process exited
  // normally with a zero code and false otherwise.
  //
  LIBXBOOT_SYMEXPORT bool
  run_wait (const char* const* args, process&);

  // Wait for process termination returning false if the process has exited
  // normally with a non-zero code. If it exited abnormally, then issue
  // diagnostics and throw failed. Additionally, if the verbosity level is
  // between 1 and the specified value, then print the command line as info
  // after the error.
  //
  // Note that the normal non-0 exit diagnostics is omitted by default
  // assuming appropriate custom diagnostics will be issued, if required.
  //
  bool
  run_finish_code (const char* const* args,
                   process&,
                   uint16_t verbosity,
                   bool omit_normal = true);

  bool
  run_finish_code (const cstrings& args,
                   process&,
                   uint16_t verbosity,
                   bool omit_normal = true);

  // Start the process as above and then call the specified function on each
  // trimmed line of the output until it returns a non-empty object T (tested
  // with T::empty()) which is then returned to the caller.
  //
  // If error is false, then don't fail if the process exits normally but with
  // non-0 code (an empty T instance is returned in this case). The function
  // signature should be:
  //
  // T (string& line, bool last)
  //
  template <typename T, typename F>
  T
  run (uint16_t verbosity,
       const process_env&, // Implicit-constructible from process_path.
       const char* const* args,
       F&&,
       bool error = true);

  // Concatenate the program path and arguments into a shallow NULL-terminated
  // vector of C-strings.
  //
  LIBXBOOT_SYMEXPORT cstrings
  process_args (const char* program, const strings& args);

  // Empty string for use as default arguments, etc.
  //
  LIBXBOOT_SYMEXPORT extern const string empty_string;
}

#include <libxboot/utility.ixx>
#include <libxboot/utility.txx>

#endif // LIBXBOOT_UTILITY_HXX
