// file      : libxboot/platform.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_PLATFORM_HXX
#define LIBXBOOT_PLATFORM_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Target platform predicates. The platform identifiers are in the
  // <os>-<arch> form (linux-64, osx-arm64, win-64, etc). Anything that is
  // neither Linux nor macOS is treated as non-Unix.
  //
  LIBXBOOT_SYMEXPORT bool
  is_macos (const string& target_platform);

  LIBXBOOT_SYMEXPORT bool
  is_linux (const string& target_platform);

  LIBXBOOT_SYMEXPORT bool
  is_non_unix (const string& target_platform);

  inline bool
  is_macos (const build_context& c) {return is_macos (c.target_platform);}

  inline bool
  is_linux (const build_context& c) {return is_linux (c.target_platform);}

  inline bool
  is_non_unix (const build_context& c)
  {
    return is_non_unix (c.target_platform);
  }

  inline bool
  is_cross_compiling (const build_context& c) {return c.cross;}

  // Return true if the cross-compilation flag value means enabled (only
  // "1" does).
  //
  LIBXBOOT_SYMEXPORT bool
  cross_flag (const string&);

  // Return the target C compiler name for the toolchain prefix (triple).
  // With the prefix, this is <prefix>-clang for Apple toolchains and
  // <prefix>-gcc otherwise. Without it, this is clang for macOS targets and
  // gcc otherwise.
  //
  LIBXBOOT_SYMEXPORT string
  target_compiler (const string& target_platform,
                   const string& toolchain_prefix);

  inline string
  target_compiler (const build_context& c)
  {
    return target_compiler (c.target_platform, c.toolchain_host);
  }
}

#endif // LIBXBOOT_PLATFORM_HXX
