// file      : libxboot/install.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/install.hxx>

#include <libxboot/platform.hxx>
#include <libxboot/filesystem.hxx>
#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  // Move files from one directory to another creating the destination. If
  // the extension is specified, then only move files with this extension.
  //
  static size_t
  move_files (const dir_path& f, const dir_path& t, const char* ext = nullptr)
  {
    paths fs (dir_files (f, ext));

    mkdir_p (t);

    for (const path& n: fs)
      move_entry (f / n, t / n);

    return fs.size ();
  }

  size_t
  relocate_man_pages (const build_context& c)
  {
    const dir_path& ip (c.install_prefix);

    size_t r (0);
    for (const char* s: {"man1", "man5"})
    {
      dir_path f (ip / dir_path ("man") / dir_path (s));
      dir_path t (ip / dir_path ("share/man") / dir_path (s));

      if (!exists (f))
        fail << "man page directory " << f << " does not exist";

      r += move_files (f, t);
    }

    return r;
  }

  size_t
  relocate_editor_files (const build_context& c)
  {
    dir_path d (c.install_prefix / dir_path ("share/emacs/site-lisp"));
    dir_path t (d / dir_path (c.package.name));

    mkdir_p (t);

    return exists (d) ? move_files (d, t, "el") : 0;
  }

  void
  install_activation_scripts (const build_context& c, const dir_path& d)
  {
    const string& n (c.package.name);
    const char* e (is_non_unix (c) ? ".bat" : ".sh");

    dir_path cd (c.prefix / dir_path ("etc/conda"));

    for (const char* a: {"activate", "deactivate"})
    {
      path s (d / path (n + '-' + a + e));

      if (!exists (s))
        fail << "activation script " << s << " does not exist";

      dir_path t (cd / dir_path (string (a) + ".d"));

      mkdir_p (t);
      copy_file (s, t / s.leaf ());
    }
  }

  string
  record_compiler_version (const build_context& c, const environment& e)
  {
    const package& p (c.package);

    process_path pp (run_search (path (p.bootstrap_compiler),
                                 true /* init */,
                                 c.build_bin ()));

    cstrings args {pp.recall_string (), "-version", nullptr};
    environment_vars vs (e);

    string v (run<string> (3 /* verbosity */,
                           process_env (pp, c.src_dir, vs.data ()),
                           args.data (),
                           [] (string& l, bool) {return move (l);}));

    if (v.empty ())
      fail << "unable to obtain " << pp << " version";

    dir_path d (c.prefix / dir_path ("etc/conda/test-files"));
    path f (d / path (p.version_record));

    mkdir_p (d);
    write_file (f, v + '\n');

    l1 ([&]{text << "recorded " << p.bootstrap_compiler << " version " << v
                 << " in " << f;});

    return v;
  }

  path
  verify_binary (const build_context& c, const environment& e, bool strip)
  {
    const package& p (c.package);

    path b (c.install_prefix / dir_path ("bin") /
            path (is_non_unix (c) ? p.name + ".exe" : p.name));

    if (!exists (b))
      fail << p.name << " binary not found at " << b;

    l1 ([&]{text << p.name << " installed as " << b;});

    // Stripping on macOS would break the code signature.
    //
    if (strip && is_linux (c))
    {
      process_path pp (run_try_search (path ("strip"), true /* init */));

      if (pp.empty ())
        warn << "strip not found, " << b << " is not stripped";
      else if (!run (e, c.src_dir, pp, strings {b.string ()}))
        warn << "unable to strip " << b;
    }

    return b;
  }

  void
  post_install (const build_context& c,
                const environment& e,
                const install_fixups& f)
  {
    if (f.activation_dir)
      install_activation_scripts (c, *f.activation_dir);

    if (f.version_record)
      record_compiler_version (c, e);

    relocate_man_pages (c);
    relocate_editor_files (c);

    verify_binary (c, e, f.strip);
  }
}
