// file      : libxboot/toolchain.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/toolchain.hxx>

#include <libxboot/filesystem.hxx>
#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  void swap_token::
  append (swap_token&& t)
  {
    for (swap_entry& e: t.entries)
      entries.push_back (move (e));

    t.entries.clear ();
  }

  // Point the canonical path to the target preserving the existing entry.
  // If create is false and there is no entry, then do nothing and return
  // absent.
  //
  static swap_status
  swap_path (const path& p, const path& tg, bool create, swap_token& t)
  {
    tracer trace ("swap_path");

    path s (saved_path (p));

    bool e (xboot::entry_exists (p));

    if (!e && !create)
    {
      l4 ([&]{trace << "no " << p << ", skipping";});
      return swap_status::absent;
    }

    // If this entry has already been swapped (for example, by a failed
    // previous strategy), then we must not overwrite the preserved native
    // entry with the symlink.
    //
    bool swapped (e && symlink_exists (p) && xboot::entry_exists (s));

    if (swapped && symlink_target (p) == tg)
    {
      l4 ([&]{trace << p << " is already swapped";});
      return swap_status::success;
    }

    swap_entry se {p, nullopt};

    if (e && !swapped)
    {
      move_entry (p, s);
      se.saved = move (s);
    }

    // Record before creating the symlink so that a revert can restore the
    // preserved entry even if the symlink creation fails.
    //
    t.entries.push_back (move (se));

    make_symlink (tg, p);
    return swap_status::success;
  }

  swap_status
  swap_tool (const dir_path& bin,
             const string& n,
             const path& tg,
             swap_token& t)
  {
    return swap_path (bin / path (n), tg, false /* create */, t);
  }

  swap_token
  swap_to_cross_compilers (const dir_path& bin,
                           const strings& tools,
                           const string& triple)
  {
    l2 ([&]{text << "swapping compilers in " << bin << " to " << triple;});

    swap_token r;

    for (const string& n: tools)
    {
      for (const string& v: {n, n + ".opt"})
        swap_tool (bin, v, path (triple + '-' + v), r);
    }

    return r;
  }

  swap_token
  setup_cross_c_compilers (const dir_path& bin, const string& cc)
  {
    l2 ([&]{text << "setting up C cross-compiler " << cc << " in " << bin;});

    swap_token r;

    for (const char* n: {"gcc", "cc"})
      swap_path (bin / path (n), path (cc), true /* create */, r);

    return r;
  }

  void
  revert_swap (swap_token& t)
  {
    for (auto i (t.entries.rbegin ()); i != t.entries.rend (); ++i)
    {
      rmfile (i->link);

      if (i->saved)
        move_entry (*i->saved, i->link);
    }

    t.entries.clear ();
  }
}
