// file      : libxboot/install.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_INSTALL_HXX
#define LIBXBOOT_INSTALL_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/environment.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Post-install fixups configuration.
  //
  struct install_fixups
  {
    // Directory with the <package>-{activate,deactivate}.{sh,bat} scripts.
    // If absent, the scripts are not installed.
    //
    optional<dir_path> activation_dir;

    bool version_record = true;
    bool strip = true;
  };

  // Move <install-prefix>/man/man{1,5}/* to share/man/man{1,5}/. Return the
  // number of man pages moved.
  //
  LIBXBOOT_SYMEXPORT size_t
  relocate_man_pages (const build_context&);

  // Move <install-prefix>/share/emacs/site-lisp/*.el to the package
  // subdirectory. Nothing to move is not an error.
  //
  LIBXBOOT_SYMEXPORT size_t
  relocate_editor_files (const build_context&);

  // Copy the activation scripts to <prefix>/etc/conda/{activate,deactivate}.d
  // (.bat scripts for non-Unix targets, .sh otherwise).
  //
  LIBXBOOT_SYMEXPORT void
  install_activation_scripts (const build_context&, const dir_path&);

  // Write the bootstrap compiler version to
  // <prefix>/etc/conda/test-files/<version-record>. Return the version.
  //
  LIBXBOOT_SYMEXPORT string
  record_compiler_version (const build_context&, const environment&);

  // Verify the installed binary exists (fail otherwise) and strip it on
  // Linux, if requested (warn on failure). Return the binary path.
  //
  LIBXBOOT_SYMEXPORT path
  verify_binary (const build_context&, const environment&, bool strip);

  // Perform all of the above in order.
  //
  LIBXBOOT_SYMEXPORT void
  post_install (const build_context&,
                const environment&,
                const install_fixups&);
}

#endif // LIBXBOOT_INSTALL_HXX
