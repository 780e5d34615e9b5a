// file      : libxboot/artifact.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_ARTIFACT_HXX
#define LIBXBOOT_ARTIFACT_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/filesystem.hxx> // permissions

#include <libxboot/export.hxx>

namespace xboot
{
  // Install artifact tree: the directory with the bin/, lib/<package>/,
  // doc/<package>/, man/man{1,5}/, and share/emacs/site-lisp/ subdirectories
  // plus the install metadata file that describes it.
  //
  struct artifact_tree
  {
    dir_path root;
    path     metadata;

    path
    binary (const package& p) const
    {
      return root / dir_path ("bin") / path (p.name);
    }
  };

  // Executable file mode (0755).
  //
  const permissions exec_perms (permissions::ru | permissions::wu |
                                permissions::xu |
                                permissions::rg | permissions::xg |
                                permissions::ro | permissions::xo);

  // The tree as produced by the build tool or the build system:
  // <build-dir>/install/default and <build-dir>/default/<package>.install.
  //
  LIBXBOOT_SYMEXPORT artifact_tree
  build_artifacts (const build_context&);

  // The snapshot location: _build_install_native and _<package>.install.saved
  // in the source directory.
  //
  LIBXBOOT_SYMEXPORT artifact_tree
  snapshot_artifacts (const build_context&);

  // Copy the build artifacts to the snapshot location dereferencing
  // symlinks. Fail if the tree or the metadata file does not exist.
  //
  LIBXBOOT_SYMEXPORT artifact_tree
  snapshot (const build_context&);

  // Replace the binary in the snapshot with the cross-compiled one (mode
  // 0755) leaving every other file untouched. Return the snapshot.
  //
  LIBXBOOT_SYMEXPORT artifact_tree
  reassemble (artifact_tree snapshot, const path& binary, const package&);

  // Move the snapshot back to the build artifacts location so that the tool
  // can install it.
  //
  LIBXBOOT_SYMEXPORT artifact_tree
  restore (const build_context&, const artifact_tree& snapshot);

  // Install the tree into the prefix manually: bin/<package> (mode 0755),
  // lib/<package>/, doc/<package>/*.md and doc/<package>/odoc-pages/
  // (optional), man/man1/ and man/man5/ (required), and
  // share/emacs/site-lisp/*.el (optional). Fail on the first missing
  // required artifact or failed copy.
  //
  LIBXBOOT_SYMEXPORT void
  install_artifacts (const artifact_tree&,
                     const dir_path& install_prefix,
                     const package&);
}

#endif // LIBXBOOT_ARTIFACT_HXX
