// file      : libxboot/toolchain.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_TOOLCHAIN_HXX
#define LIBXBOOT_TOOLCHAIN_HXX

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Toolchain swapping: the native tools in the build prefix bin/ directory
  // are renamed aside (with the .build suffix) and their canonical names are
  // made symlinks to the cross versions. Only one generation is reachable
  // via the canonical name at any time.
  //
  enum class swap_status
  {
    absent,  // Nothing to swap (no entry with the canonical name).
    success  // Swapped (or was already swapped).
  };

  // Record of the renames and symlinks performed by a swap, in order.
  //
  struct swap_entry
  {
    path link;            // Canonical path, now a symlink.
    optional<path> saved; // Where the original entry was moved, if any.
  };

  class LIBXBOOT_SYMEXPORT swap_token
  {
  public:
    vector<swap_entry> entries;

    bool
    empty () const {return entries.empty ();}

    // Append the entries of another token.
    //
    void
    append (swap_token&&);
  };

  // Swap a single tool: if a file or symlink exists at <bin>/<name>, rename
  // it to <name>.build and create the <name> -> <target> symlink. Return
  // absent if there is no such entry. A tool that is already a symlink to
  // the target with the native entry preserved is left as is.
  //
  LIBXBOOT_SYMEXPORT swap_status
  swap_tool (const dir_path& bin,
             const string& name,
             const path& target,
             swap_token&);

  // Swap each tool and its .opt variant to <triple>-<name>. Missing tools
  // are skipped.
  //
  LIBXBOOT_SYMEXPORT swap_token
  swap_to_cross_compilers (const dir_path& bin,
                           const strings& tools,
                           const string& triple);

  // Make gcc and cc symlinks to the target C compiler, preserving the
  // existing entries as .build.
  //
  LIBXBOOT_SYMEXPORT swap_token
  setup_cross_c_compilers (const dir_path& bin, const string& target_cc);

  // Undo the swap in the reverse order: remove the created symlinks and
  // rename the preserved entries back. The token is cleared.
  //
  LIBXBOOT_SYMEXPORT void
  revert_swap (swap_token&);

  // Preserved entry path (<path>.build).
  //
  inline path
  saved_path (const path& p)
  {
    return p + ".build";
  }
}

#endif // LIBXBOOT_TOOLCHAIN_HXX
