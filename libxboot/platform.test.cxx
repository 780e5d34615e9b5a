// file      : libxboot/platform.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/package.hxx>
#include <libxboot/platform.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace xboot
{
  int
  main (int, char*[])
  {
    // Platform classes.
    //
    assert (is_linux ("linux-64"));
    assert (is_linux ("linux-aarch64"));
    assert (is_linux ("linux-ppc64le"));
    assert (!is_linux ("linux64"));
    assert (!is_linux ("osx-64"));

    assert (is_macos ("osx-64"));
    assert (is_macos ("osx-arm64"));
    assert (!is_macos ("osx64"));
    assert (!is_macos ("linux-64"));

    assert (is_non_unix ("win-64"));
    assert (is_non_unix ("emscripten-wasm32"));
    assert (is_non_unix (""));
    assert (!is_non_unix ("osx-arm64"));
    assert (!is_non_unix ("linux-aarch64"));

    // Exactly one class holds for any identifier.
    //
    for (const char* p: {"linux-64", "linux-aarch64", "osx-64", "osx-arm64",
                         "win-64", "win-arm64", "noarch", ""})
    {
      int n ((is_linux (p) ? 1 : 0) +
             (is_macos (p) ? 1 : 0) +
             (is_non_unix (p) ? 1 : 0));

      assert (n == 1);
    }

    // Cross-compilation flag.
    //
    assert (cross_flag ("1"));
    assert (!cross_flag ("0"));
    assert (!cross_flag (""));
    assert (!cross_flag ("true"));
    assert (!cross_flag ("yes"));
    assert (!cross_flag (" 1"));

    // Target C compiler.
    //
    assert (target_compiler ("linux-aarch64", "aarch64-conda-linux-gnu") ==
            "aarch64-conda-linux-gnu-gcc");
    assert (target_compiler ("linux-ppc64le",
                             "powerpc64le-conda-linux-gnu") ==
            "powerpc64le-conda-linux-gnu-gcc");
    assert (target_compiler ("osx-arm64", "arm64-apple-darwin20.0.0") ==
            "arm64-apple-darwin20.0.0-clang");
    assert (target_compiler ("osx-64", "") == "clang");
    assert (target_compiler ("linux-64", "") == "gcc");
    assert (target_compiler ("win-64", "") == "gcc");

    // Context overloads.
    //
    {
      build_context c;
      c.target_platform = "osx-arm64";
      c.toolchain_host = "arm64-apple-darwin20.0.0";
      c.package = default_package ();

      assert (is_macos (c) && !is_linux (c) && !is_non_unix (c));
      assert (!is_cross_compiling (c));
      assert (target_compiler (c) == "arm64-apple-darwin20.0.0-clang");

      c.cross = true;
      assert (is_cross_compiling (c));
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return xboot::main (argc, argv);
}
