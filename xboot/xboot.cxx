// file      : xboot/xboot.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>  // cout
#include <exception> // terminate(), set_terminate(), terminate_handler

#include <libbutl/backtrace.hxx> // backtrace()

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>
#include <libxboot/version.hxx>

#include <libxboot/context.hxx>
#include <libxboot/install.hxx>
#include <libxboot/package.hxx>
#include <libxboot/platform.hxx>
#include <libxboot/diagnostics.hxx>
#include <libxboot/environment.hxx>
#include <libxboot/orchestrator.hxx>

#include <xboot/xboot-options.hxx>

using namespace butl;
using namespace std;

namespace xboot
{
  int
  main (int argc, char* argv[]);

  // Return the diagnostics verbosity level from the -v/-V/--verbose/--quiet
  // options.
  //
  static uint16_t
  verbosity (const xboot_options& ops)
  {
    return ops.verbose_specified ()
      ? ops.verbose ()
      : ops.V () ? 3 : ops.v () ? 2 : ops.quiet () ? 0 : 1;
  }

  // Collect the build context values specified on the command line.
  //
  static context_overrides
  context_options (const xboot_options& ops)
  {
    context_overrides r;

    if (ops.build_platform_specified ())
      r.build_platform = ops.build_platform ();

    if (ops.target_platform_specified ())
      r.target_platform = ops.target_platform ();

    if (ops.prefix_specified ())
      r.prefix = ops.prefix ();

    if (ops.build_prefix_specified ())
      r.build_prefix = ops.build_prefix ();

    if (ops.toolchain_host_specified ())
      r.toolchain_host = ops.toolchain_host ();

    if (ops.cross ())
      r.cross = true;
    else if (ops.native ())
      r.cross = false;

    if (ops.src_dir_specified ())
      r.src_dir = ops.src_dir ();

    return r;
  }
}

// Print backtrace if terminating due to an unhandled exception. Note that
// custom_terminate is non-static and not a lambda to reduce the noise.
//
static terminate_handler default_terminate;

void
custom_terminate ()
{
  *diag_stream << backtrace ();

  if (default_terminate != nullptr)
    default_terminate ();
}

int xboot::
main (int argc, char* argv[])
{
  default_terminate = set_terminate (custom_terminate);

  tracer trace ("main");

  int r (0);

  try
  {
    init_process ();

    // Parse the command line.
    //
    xboot_options ops;

    try
    {
      cli::argv_file_scanner scan (argc, argv, "--options-file");
      ops.parse (scan);

      if (scan.more ())
        fail << "unexpected argument '" << scan.next () << "'";

      if (ops.cross () && ops.native ())
        fail << "both --cross and --native specified";

      if (ops.verbose_specified () && ops.verbose () > 6)
        fail << "invalid verbosity level " << ops.verbose ();
    }
    catch (const cli::exception& e)
    {
      fail << e;
    }

    // Handle --version.
    //
    if (ops.version ())
    {
      auto& o (cout);

      o << "xboot " << LIBXBOOT_VERSION_ID << endl
        << "libbutl " << LIBBUTL_VERSION_ID << endl
        << "Copyright (c) " << XBOOT_COPYRIGHT << "." << endl
        << "This is free software released under the MIT license." << endl;

      return 0;
    }

    // Initialize the diagnostics state.
    //
    init_diag (verbosity (ops));

    // Handle --help.
    //
    if (ops.help ())
    {
      xboot_options::print_usage (cout);
      return 0;
    }

    // Initialize the global state.
    //
    init ();

    // Trace some overall environment information.
    //
    if (verb >= 5)
    {
      optional<string> p (getenv ("PATH"));

      trace << "work: " << work;
      trace << "home: " << home;
      trace << "path: " << (p ? *p : "<NULL>");
    }

    package pkg (default_package (ops.package ()));

    if (ops.bootstrap_compiler_specified ())
      pkg.bootstrap_compiler = ops.bootstrap_compiler ();

    if (ops.build_system_specified ())
      pkg.build_system = ops.build_system ();

    build_context c (resolve_context (context_options (ops), move (pkg)));

    l4 ([&]{info << "target platform " << c.target_platform <<
                info << "build platform " << c.build_platform <<
                info << "prefix " << c.prefix <<
                info << "build prefix " << c.build_prefix <<
                info << "install prefix " << c.install_prefix <<
                info << "source directory " << c.src_dir;});

    environment env;
    compose_driver_environment (c, env);

    if (is_cross_compiling (c))
    {
      strategy s (cross_compile (c, env, !ops.no_fast_path ()));
      l1 ([&]{text << "cross-compiled " << c.package.name << " for "
                   << c.target_platform << " (" << s << " strategy)";});
    }
    else
      native_build (c, env);

    install_fixups f;

    if (ops.activation_dir_specified ())
      f.activation_dir = ops.activation_dir ();

    f.version_record = !ops.no_version_record ();
    f.strip = !ops.no_strip ();

    post_install (c, env, f);
  }
  catch (const failed&)
  {
    // Diagnostics has already been issued.
    //
    r = 1;
  }

  return r;
}

int
main (int argc, char* argv[])
{
  return xboot::main (argc, argv);
}
