// file      : libxboot/context.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbutl/utility.hxx> // setenv(), unsetenv()

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/package.hxx>
#include <libxboot/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace xboot
{
  static void
  reset_environment ()
  {
    for (const char* v: {"target_platform",
                         "build_platform",
                         "PREFIX",
                         "BUILD_PREFIX",
                         "CONDA_TOOLCHAIN_HOST",
                         "CONDA_BUILD_CROSS_COMPILATION",
                         "SRC_DIR"})
      butl::unsetenv (v);
  }

  // Return true if resolving the context fails.
  //
  static bool
  fails (const context_overrides& o)
  {
    try
    {
      resolve_context (o, default_package ());
      return false;
    }
    catch (const failed&)
    {
      return true;
    }
  }

  int
  main (int, char*[])
  {
    init_diag (1);
    init ();

    using dir = dir_path;

    const context_overrides none;

    // Target platform is required.
    //
    reset_environment ();
    assert (fails (none));

    // Native build from the environment.
    //
    {
      reset_environment ();
      butl::setenv ("target_platform", "linux-64");
      butl::setenv ("PREFIX", "/opt/host");

      build_context c (resolve_context (none, default_package ()));

      assert (c.target_platform == "linux-64");
      assert (c.build_platform == "linux-64");
      assert (!c.cross);
      assert (c.prefix == dir ("/opt/host"));
      assert (c.build_prefix == c.prefix);
      assert (c.install_prefix == c.prefix);
      assert (c.toolchain_host.empty ());
      assert (c.src_dir == work);
      assert (c.package.name == "dune");
    }

    // Empty values are treated as unset.
    //
    {
      reset_environment ();
      butl::setenv ("target_platform", "linux-64");
      butl::setenv ("PREFIX", "/opt/host");
      butl::setenv ("BUILD_PREFIX", "");
      butl::setenv ("CONDA_TOOLCHAIN_HOST", "");
      butl::setenv ("SRC_DIR", "");

      build_context c (resolve_context (none, default_package ()));

      assert (c.build_prefix == c.prefix);
      assert (c.toolchain_host.empty ());
      assert (c.src_dir == work);
    }

    // Target prefix is required.
    //
    {
      reset_environment ();
      butl::setenv ("target_platform", "linux-64");
      assert (fails (none));
    }

    // Options override the environment.
    //
    {
      reset_environment ();
      butl::setenv ("target_platform", "linux-64");
      butl::setenv ("PREFIX", "/opt/host");
      butl::setenv ("SRC_DIR", "/src/env");

      context_overrides o;
      o.target_platform = "osx-arm64";
      o.build_platform = "osx-64";
      o.prefix = dir ("/opt/other");
      o.src_dir = dir ("/src/opt");

      build_context c (resolve_context (o, default_package ()));

      assert (c.target_platform == "osx-arm64");
      assert (c.build_platform == "osx-64");
      assert (c.prefix == dir ("/opt/other"));
      assert (c.src_dir == dir ("/src/opt"));
    }

    // Directories are completed and normalized.
    //
    {
      reset_environment ();
      butl::setenv ("target_platform", "linux-64");

      context_overrides o;
      o.prefix = dir ("host/../host/./");

      build_context c (resolve_context (o, default_package ()));

      assert (c.prefix.absolute ());
      assert (c.prefix.leaf () == dir ("host"));
    }

    // Cross-compilation from the environment.
    //
    auto cross_env = [] ()
    {
      reset_environment ();
      butl::setenv ("target_platform", "linux-aarch64");
      butl::setenv ("build_platform", "linux-64");
      butl::setenv ("PREFIX", "/opt/host");
      butl::setenv ("BUILD_PREFIX", "/opt/build");
      butl::setenv ("CONDA_TOOLCHAIN_HOST", "aarch64-conda-linux-gnu");
      butl::setenv ("CONDA_BUILD_CROSS_COMPILATION", "1");
    };

    {
      cross_env ();

      build_context c (resolve_context (none, default_package ()));

      assert (c.cross);
      assert (c.build_platform == "linux-64");
      assert (c.toolchain_host == "aarch64-conda-linux-gnu");

      assert (c.build_bin () == dir ("/opt/build/bin"));
      assert (c.target_lib () == dir ("/opt/host/lib"));
      assert (c.target_runtime () == dir ("/opt/host/lib/ocaml"));
      assert (c.cross_runtime () ==
              dir ("/opt/build/lib/ocaml-cross-compilers/"
                   "aarch64-conda-linux-gnu/lib/ocaml"));
    }

    // Only the value 1 enables cross-compilation.
    //
    {
      cross_env ();
      butl::setenv ("CONDA_BUILD_CROSS_COMPILATION", "true");

      build_context c (resolve_context (none, default_package ()));
      assert (!c.cross);
    }

    // The option overrides the flag.
    //
    {
      cross_env ();

      context_overrides o;
      o.cross = false;

      build_context c (resolve_context (o, default_package ()));
      assert (!c.cross);
    }

    // Cross-compilation requires distinct prefixes.
    //
    {
      cross_env ();
      butl::setenv ("BUILD_PREFIX", "/opt/host/");
      assert (fails (none));

      butl::unsetenv ("BUILD_PREFIX");
      assert (fails (none));
    }

    // Cross-compilation requires a valid toolchain triple.
    //
    {
      cross_env ();
      butl::unsetenv ("CONDA_TOOLCHAIN_HOST");
      assert (fails (none));

      butl::setenv ("CONDA_TOOLCHAIN_HOST", "aarch64");
      assert (fails (none));
    }

    // Non-Unix targets install into the Library/ subdirectory.
    //
    {
      reset_environment ();
      butl::setenv ("target_platform", "win-64");
      butl::setenv ("PREFIX", "/opt/host");

      build_context c (resolve_context (none, default_package ()));
      assert (c.install_prefix == dir ("/opt/host/Library"));
    }

    reset_environment ();
    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return xboot::main (argc, argv);
}
