// file      : libxboot/environment.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_ENVIRONMENT_HXX
#define LIBXBOOT_ENVIRONMENT_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Environment for the child processes: a set of variable overrides on top
  // of the current process environment. The overrides are only materialized
  // (in the NAME=VALUE form) when a process is started; the current process
  // environment is never modified.
  //
  class LIBXBOOT_SYMEXPORT environment
  {
  public:
    // Return the variable value: the override, if any, and the current
    // process environment value otherwise.
    //
    optional<string>
    get (const string& name) const;

    void
    set (const string& name, string value);

    void
    unset (const string& name);

    // Prepend the value to the list variable using the specified separator.
    // If the variable is unset or empty, then the result still ends with
    // the separator.
    //
    void
    prepend (const string& name, const string& value, const char* sep = ":");

    // Return the overrides as NAME=VALUE (or NAME for unset) strings, ordered
    // by name.
    //
    strings
    vars () const;

    bool
    empty () const {return overrides_.empty ();}

  private:
    map<string, optional<string>> overrides_;
  };

  // Environment variables as a NULL-terminated array of C-strings suitable
  // for process_env. The environment is materialized on construction and
  // must not be modified while this object is in use.
  //
  class LIBXBOOT_SYMEXPORT environment_vars
  {
  public:
    explicit
    environment_vars (const environment&);

    environment_vars (const environment_vars&) = delete;
    environment_vars& operator= (const environment_vars&) = delete;

    const char* const*
    data () const {return cvars_.data ();}

  private:
    strings vars_;
    cstrings cvars_;
  };

  // Run the program in the specified working directory with the environment
  // overrides applied, printing the command line (prefixed with the
  // overrides) at verbosity level 2. Return false if the program exited
  // normally with non-zero code, in which case no diagnostics is issued, and
  // fail on abnormal termination.
  //
  LIBXBOOT_SYMEXPORT bool
  run (const environment&,
       const dir_path& cwd,
       const process_path&,
       const strings& args);

  // Driver setup that precedes any cross-compilation strategy: make the
  // linker find the target libraries before the build ones and, on macOS,
  // do the same for the dynamic loader. For non-Unix targets also make the
  // build prefix tools available.
  //
  LIBXBOOT_SYMEXPORT void
  compose_driver_environment (const build_context&, environment&);

  // Environment for building the native bootstrap executable: point the
  // compiler runtime root to the target prefix and make sure the linker
  // search path (and, on macOS, the dynamic loader fallback path) lists the
  // target runtime and library directories before the build prefix library
  // directory. Directories already in the path (for example, from the driver
  // setup above) are not repeated.
  //
  LIBXBOOT_SYMEXPORT void
  compose_bootstrap_environment (const build_context&, environment&);

  // Environment for running the bootstrap executable with the cross
  // toolchain: the cross tool variables (<P>CC, <P>MKEXE, <P>MKDLL, <P>AR,
  // <P>AS, <P>LD) and, if the cross runtime for the toolchain triple exists
  // in the build prefix, the runtime root and linker search paths for it.
  //
  LIBXBOOT_SYMEXPORT void
  configure_cross_environment (const build_context&, environment&);
}

#endif // LIBXBOOT_ENVIRONMENT_HXX
