// file      : libxboot/bootstrap.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_BOOTSTRAP_HXX
#define LIBXBOOT_BOOTSTRAP_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/environment.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Return the bootstrap compiler arguments (without the program) for
  // building the bootstrap executable: a complete executable that runs on
  // the build machine but is linked against the target prefix libraries.
  //
  LIBXBOOT_SYMEXPORT strings
  bootstrap_arguments (const build_context&);

  // Compose the bootstrap environment (see compose_bootstrap_environment())
  // and build the bootstrap executable in the source directory with the
  // native bootstrap compiler. Must be called before the toolchain swap.
  // Return false if the compiler exited with non-zero code.
  //
  LIBXBOOT_SYMEXPORT bool
  build_native_bootstrap (const build_context&, environment&);
}

#endif // LIBXBOOT_BOOTSTRAP_HXX
