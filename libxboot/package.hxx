// file      : libxboot/package.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_PACKAGE_HXX
#define LIBXBOOT_PACKAGE_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Description of the self-hosting build tool being bootstrapped. All the
  // relative paths are relative to the source directory.
  //
  struct package
  {
    string name;

    // Bootstrap executable. It is compiled with the bootstrap compiler from
    // the bootstrap sources and, when run, produces the bootstrap output
    // binary.
    //
    string   bootstrap_compiler;
    paths    bootstrap_sources;
    dir_path bootstrap_include;
    string   bootstrap_library;          // unix.cma
    string   bootstrap_library_include;  // +unix
    path     bootstrap_exe;              // _native_<name>boot
    path     bootstrap_output;           // _boot/<name>.exe

    // Self build profile used when building the install artifacts with an
    // existing binary of the tool.
    //
    string profile;

    // Compiler tools that are replaced with the cross versions.
    //
    strings tools;

    // Compiler runtime library subdirectory (<prefix>/lib/<runtime_subdir>)
    // and the variable that points to the runtime root.
    //
    string runtime_subdir;
    string runtime_var;

    // Prefix for the cross tool variables (<prefix>CC, <prefix>AR, etc).
    //
    string tool_var_prefix;

    // Root of the cross runtimes in the build prefix. The runtime for the
    // toolchain triple is in <root>/<triple>/lib/<runtime_subdir>.
    //
    dir_path cross_runtime_root;

    // Working state directories.
    //
    dir_path boot_dir;   // _boot
    dir_path build_dir;  // _build

    // Underlying build system and its full release target.
    //
    string build_system;
    string release_target;

    // Name of the file that records the compiler version.
    //
    string version_record;
  };

  // Return the package description with the defaults for the tool with the
  // specified name.
  //
  LIBXBOOT_SYMEXPORT package
  default_package (const string& name = "dune");
}

#endif // LIBXBOOT_PACKAGE_HXX
