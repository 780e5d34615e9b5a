// file      : libxboot/filesystem.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_FILESYSTEM_HXX
#define LIBXBOOT_FILESYSTEM_HXX

#include <libbutl/filesystem.hxx>

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/export.hxx>

// Higher-level filesystem utilities built on top of <libbutl/filesystem.hxx>.
//
// Compared to the libbutl's versions, these handle errors and issue
// diagnostics. Most of them also print the corresponding command line
// equivalent at the specified verbosity level.
//
namespace xboot
{
  using butl::entry_type;
  using butl::permissions;

  using butl::auto_rmdir;

  // The dual interface wrapper for the {mk,rm}{file,dir}() functions below
  // that allows you to use it as a true/false return or a more detailed enum
  // from <libbutl/filesystem.hxx>.
  //
  template <typename T>
  struct fs_status
  {
    T v;
    fs_status (T v): v (v) {};
    operator T () const {return v;}
    explicit operator bool () const {return v == T::success;}
  };

  // Create the directory with parents and print the standard diagnostics
  // starting from the specified verbosity level. Nothing is printed if the
  // directory already exists.
  //
  using mkdir_status = butl::mkdir_status;

  LIBXBOOT_SYMEXPORT fs_status<mkdir_status>
  mkdir_p (const dir_path&, uint16_t verbosity = 2);

  // Rename a filesystem entry (file, symlink, or directory) overwriting the
  // destination file if exists.
  //
  LIBXBOOT_SYMEXPORT void
  move_entry (const path& from, const path& to, uint16_t verbosity = 2);

  // Remove the file or symlink (but not directory). Return not_exist if
  // there is nothing to remove.
  //
  using rmfile_status = butl::rmfile_status;

  LIBXBOOT_SYMEXPORT fs_status<rmfile_status>
  rmfile (const path&, uint16_t verbosity = 2);

  // Remove the directory recursively. Return not_exist if there is nothing to
  // remove and not_empty if the directory contains the working directory.
  //
  using rmdir_status = butl::rmdir_status;

  LIBXBOOT_SYMEXPORT fs_status<rmdir_status>
  rmtree (const dir_path&, uint16_t verbosity = 2);

  // Copy a regular file dereferencing the source if it is a symlink. The
  // destination is overwritten, if exists, and its permissions are set to
  // the specified ones or, if absent, to those of the source.
  //
  LIBXBOOT_SYMEXPORT void
  copy_file (const path& from,
          const path& to,
          optional<permissions> = nullopt,
          uint16_t verbosity = 2);

  // Copy a directory tree recursively (the equivalent of cp -rL), creating
  // the destination directory if necessary. Symlinks are dereferenced so the
  // copy contains only regular files and directories. Return the number of
  // files copied.
  //
  LIBXBOOT_SYMEXPORT size_t
  copy_tree (const dir_path& from, const dir_path& to, uint16_t verbosity = 2);

  // Create a symlink (the equivalent of ln -sf). An existing file or symlink
  // at the link path is replaced. The target is stored as specified, without
  // completing it.
  //
  LIBXBOOT_SYMEXPORT void
  make_symlink (const path& target, const path& link, uint16_t verbosity = 2);

  // Return the target of a symlink or fail.
  //
  LIBXBOOT_SYMEXPORT path
  symlink_target (const path&);

  // Check for a file, directory or filesystem entry existence. Print the
  // diagnostics and fail on system error, unless ignore_error is true.
  //
  LIBXBOOT_SYMEXPORT bool
  exists (const path&, bool follow_symlinks = true, bool ignore_error = false);

  LIBXBOOT_SYMEXPORT bool
  exists (const dir_path&, bool ignore_error = false);

  LIBXBOOT_SYMEXPORT bool
  entry_exists (const path&,
                bool follow_symlinks = false,
                bool ignore_error = false);

  // Return true if the path refers to a symlink (without following it).
  //
  LIBXBOOT_SYMEXPORT bool
  symlink_exists (const path&);

  // Return true if the path refers to an existing regular file (following
  // symlinks) that has at least one of the executable permission bits set.
  //
  LIBXBOOT_SYMEXPORT bool
  executable (const path&);

  // Return the paths of the directory entries (files, following symlinks)
  // that are regular files, sorted. If the extension is specified, then only
  // return files with this extension. Fail if the directory doesn't exist.
  //
  LIBXBOOT_SYMEXPORT paths
  dir_files (const dir_path&, const char* extension = nullptr);

  // Get/set a path permissions.
  //
  LIBXBOOT_SYMEXPORT permissions
  path_perms (const path&);

  LIBXBOOT_SYMEXPORT void
  path_perms (const path&, permissions);

  // Read the whole file as a string or write the string as the whole file
  // (overwriting). Fail on I/O error.
  //
  LIBXBOOT_SYMEXPORT string
  read_file (const path&);

  LIBXBOOT_SYMEXPORT void
  write_file (const path&, const string&, uint16_t verbosity = 2);
}

#endif // LIBXBOOT_FILESYSTEM_HXX
