// file      : libxboot/filesystem.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/filesystem.hxx>

#include <algorithm> // sort()

#include <libxboot/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace xboot
{
  fs_status<mkdir_status>
  mkdir_p (const dir_path& d, uint16_t v)
  {
    // We don't want to print the command if the directory already exists.
    // This makes the below code a bit ugly.
    //
    auto print = [v, &d] (bool ovr)
    {
      if (verb >= v || ovr)
      {
        if (verb >= 3)
          text << "mkdir -p " << d;
        else if (verb)
          print_diag ("mkdir -p", d);
      }
    };

    mkdir_status ms;
    try
    {
      ms = try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      print (true);
      fail << "unable to create directory " << d << ": " << e << endf;
    }

    if (ms == mkdir_status::success)
      print (false);

    return ms;
  }

  void
  move_entry (const path& f, const path& t, uint16_t v)
  {
    if (verb >= v)
    {
      if (verb >= 3)
        text << "mv " << f << ' ' << t;
      else if (verb)
        print_diag ("mv", f, t);
    }

    try
    {
      butl::mventry (f, t, (cpflags::overwrite_content |
                            cpflags::overwrite_permissions));
    }
    catch (const io_error& e)
    {
      fail << "unable to overwrite " << t << " with " << f << ": " << e;
    }
    catch (const system_error& e) // EACCES, etc.
    {
      fail << "unable to move " << f << " to " << t << ": " << e;
    }
  }

  fs_status<rmfile_status>
  rmfile (const path& f, uint16_t v)
  {
    // We don't want to print the command if we couldn't remove the file
    // because it does not exist. But we always want to print some command
    // before we issue diagnostics.
    //
    auto print = [&f, v] (bool ovr)
    {
      if (verb >= v || ovr)
      {
        if (verb >= 3)
          text << "rm " << f;
        else if (verb)
          print_diag ("rm", f);
      }
    };

    rmfile_status rs;

    try
    {
      // Note that try_rmfile() removes the symlink itself rather than its
      // target.
      //
      rs = try_rmfile (f);
    }
    catch (const system_error& e)
    {
      print (true);
      fail << "unable to remove file " << f << ": " << e << endf;
    }

    if (rs == rmfile_status::success)
      print (false);

    return rs;
  }

  fs_status<rmdir_status>
  rmtree (const dir_path& d, uint16_t v)
  {
    if (work.sub (d)) // Don't try to remove working directory.
      return rmdir_status::not_empty;

    if (!xboot::entry_exists (d))
      return rmdir_status::not_exist;

    if (verb >= v)
    {
      if (verb >= 3)
        text << "rmdir -r " << d;
      else if (verb)
        print_diag ("rmdir -r", d);
    }

    try
    {
      butl::rmdir_r (d, true /* dir */);
    }
    catch (const system_error& e)
    {
      fail << "unable to remove directory " << d << ": " << e;
    }

    return rmdir_status::success;
  }

  void
  copy_file (const path& f,
             const path& t,
             optional<permissions> m,
             uint16_t v)
  {
    if (verb >= v)
    {
      if (verb >= 3)
        text << "cp " << f << ' ' << t;
      else if (verb)
        print_diag ("cp", f, t);
    }

    try
    {
      // Note that cpfile() opens the source for reading and so follows
      // symlinks. It also copies the source permissions.
      //
      butl::cpfile (f, t, (cpflags::overwrite_content |
                           cpflags::overwrite_permissions));

      if (m)
        path_permissions (t, *m);
    }
    catch (const io_error& e)
    {
      fail << "unable to copy " << f << " to " << t << ": " << e;
    }
    catch (const system_error& e)
    {
      fail << "unable to copy " << f << " to " << t << ": " << e;
    }
  }

  // Copy the directory content without printing anything.
  //
  static size_t
  copy_tree_impl (const dir_path& f, const dir_path& t)
  {
    size_t r (0);

    try
    {
      try_mkdir_p (t);

      for (const dir_entry& de: dir_iterator (f, dir_iterator::no_follow))
      {
        path n (de.path ());

        // Note that type() follows symlinks (and fails for dangling ones).
        //
        if (de.type () == entry_type::directory)
        {
          r += copy_tree_impl (f / path_cast<dir_path> (n),
                             t / path_cast<dir_path> (n));
        }
        else
        {
          butl::cpfile (f / n, t / n, (cpflags::overwrite_content |
                                       cpflags::overwrite_permissions));
          ++r;
        }
      }
    }
    catch (const io_error& e)
    {
      fail << "unable to copy " << f << " to " << t << ": " << e;
    }
    catch (const system_error& e)
    {
      fail << "unable to copy " << f << " to " << t << ": " << e;
    }

    return r;
  }

  size_t
  copy_tree (const dir_path& f, const dir_path& t, uint16_t v)
  {
    if (verb >= v)
    {
      if (verb >= 3)
        text << "cp -rL " << f << ' ' << t;
      else if (verb)
        print_diag ("cp -rL", f, t);
    }

    if (!exists (f))
      fail << "directory " << f << " does not exist";

    return copy_tree_impl (f, t);
  }

  void
  make_symlink (const path& tg, const path& l, uint16_t v)
  {
    if (verb >= v)
    {
      if (verb >= 3)
        text << "ln -sf " << tg.string () << ' ' << l;
      else if (verb)
        print_diag ("ln -s", l, tg, "->");
    }

    try
    {
      try_rmfile (l);
      butl::mksymlink (tg, l);
    }
    catch (const system_error& e)
    {
      fail << "unable to create symlink " << l << " to " << tg.string ()
           << ": " << e;
    }
  }

  path
  symlink_target (const path& l)
  {
    try
    {
      return butl::readsymlink (l);
    }
    catch (const system_error& e)
    {
      fail << "unable to read symlink " << l << ": " << e << endf;
    }
  }

  bool
  exists (const path& f, bool fs, bool ie)
  {
    try
    {
      return file_exists (f, fs, ie);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ie)
  {
    try
    {
      return dir_exists (d, ie);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  bool
  entry_exists (const path& p, bool fs, bool ie)
  {
    try
    {
      return butl::entry_exists (p, fs, ie);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << p << ": " << e << endf;
    }
  }

  bool
  symlink_exists (const path& p)
  {
    try
    {
      pair<bool, entry_stat> pe (path_entry (p, false /* follow_symlinks */));
      return pe.first && pe.second.type == entry_type::symlink;
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << p << ": " << e << endf;
    }
  }

  bool
  executable (const path& f)
  {
    if (!exists (f))
      return false;

    permissions x (permissions::xu | permissions::xg | permissions::xo);
    return (path_perms (f) & x) != permissions::none;
  }

  paths
  dir_files (const dir_path& d, const char* e)
  {
    paths r;

    try
    {
      for (const dir_entry& de: dir_iterator (d, dir_iterator::no_follow))
      {
        if (de.type () != entry_type::regular)
          continue;

        path n (de.path ());

        if (e != nullptr && n.extension () != e)
          continue;

        r.push_back (move (n));
      }
    }
    catch (const system_error& ex)
    {
      fail << "unable to scan directory " << d << ": " << ex;
    }

    sort (r.begin (), r.end ());
    return r;
  }

  permissions
  path_perms (const path& p)
  {
    try
    {
      return path_permissions (p);
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain path " << p << " permissions: " << e << endf;
    }
  }

  void
  path_perms (const path& p, permissions f)
  {
    try
    {
      path_permissions (p, f);
    }
    catch (const system_error& e)
    {
      fail << "unable to set path " << p << " permissions: " << e;
    }
  }

  string
  read_file (const path& f)
  {
    try
    {
      ifdstream is (f);
      return is.read_text ();
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e << endf;
    }
  }

  void
  write_file (const path& f, const string& s, uint16_t v)
  {
    if (verb >= v)
    {
      if (verb >= 3)
        text << "write " << f;
      else if (verb)
        print_diag ("write", f);
    }

    try
    {
      ofdstream os (f);
      os << s;
      os.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << f << ": " << e;
    }
  }
}
