// file      : libxboot/context.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_CONTEXT_HXX
#define LIBXBOOT_CONTEXT_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/package.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Build context: the configuration of a single run. All the directories
  // are absolute and normalized.
  //
  struct build_context
  {
    string build_platform;  // For example, linux-64.
    string target_platform; // For example, linux-aarch64, osx-arm64, win-64.

    dir_path prefix;         // Target prefix (host environment).
    dir_path build_prefix;   // Build prefix (build environment).
    dir_path install_prefix; // Where the package is installed.

    string toolchain_host;   // Toolchain triple (empty if unspecified).
    bool   cross = false;

    dir_path src_dir;        // Source (and working) directory.

    xboot::package package;

    // <build-prefix>/bin
    //
    dir_path
    build_bin () const {return build_prefix / dir_path ("bin");}

    // <prefix>/lib
    //
    dir_path
    target_lib () const {return prefix / dir_path ("lib");}

    // <prefix>/lib/<runtime-subdir>
    //
    dir_path
    target_runtime () const
    {
      return target_lib () / dir_path (package.runtime_subdir);
    }

    // <build-prefix>/<cross-runtime-root>/<triple>/lib/<runtime-subdir>
    //
    dir_path
    cross_runtime () const;

    // <src-dir>/<rel>
    //
    path
    src (const path& rel) const {return src_dir / rel;}

    dir_path
    src (const dir_path& rel) const {return src_dir / rel;}
  };

  // Values specified on the command line. Those that are absent are taken
  // from the environment (target_platform, build_platform, PREFIX,
  // BUILD_PREFIX, CONDA_TOOLCHAIN_HOST, CONDA_BUILD_CROSS_COMPILATION,
  // SRC_DIR) and then from defaults.
  //
  struct context_overrides
  {
    optional<string>   build_platform;
    optional<string>   target_platform;
    optional<dir_path> prefix;
    optional<dir_path> build_prefix;
    optional<string>   toolchain_host;
    optional<bool>     cross;
    optional<dir_path> src_dir;
  };

  // Resolve the build context. Issue diagnostics and fail if a required
  // value is missing or invalid, or if the target and build prefixes are not
  // distinct when cross-compiling.
  //
  LIBXBOOT_SYMEXPORT build_context
  resolve_context (const context_overrides&, package);
}

#endif // LIBXBOOT_CONTEXT_HXX
