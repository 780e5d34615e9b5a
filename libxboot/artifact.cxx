// file      : libxboot/artifact.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/artifact.hxx>

#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  artifact_tree
  build_artifacts (const build_context& c)
  {
    const package& p (c.package);
    dir_path b (c.src (p.build_dir));

    return artifact_tree {
      b / dir_path ("install/default"),
      b / dir_path ("default") / path (p.name + ".install")};
  }

  artifact_tree
  snapshot_artifacts (const build_context& c)
  {
    const package& p (c.package);

    return artifact_tree {
      c.src (dir_path ("_build_install_native")),
      c.src (path ('_' + p.name + ".install.saved"))};
  }

  artifact_tree
  snapshot (const build_context& c)
  {
    artifact_tree b (build_artifacts (c));
    artifact_tree r (snapshot_artifacts (c));

    if (!exists (b.root))
      fail << "install artifacts directory " << b.root << " does not exist";

    if (!exists (b.metadata))
      fail << "install metadata file " << b.metadata << " does not exist";

    // The binary in the tree is normally a symlink so dereference.
    //
    copy_tree (b.root, r.root);
    copy_file (b.metadata, r.metadata);

    return r;
  }

  artifact_tree
  reassemble (artifact_tree s, const path& b, const package& p)
  {
    if (!exists (b))
      fail << "cross-compiled binary " << b << " does not exist";

    path t (s.binary (p));

    mkdir_p (t.directory ());
    rmfile (t);
    copy_file (b, t, exec_perms);

    return s;
  }

  artifact_tree
  restore (const build_context& c, const artifact_tree& s)
  {
    artifact_tree r (build_artifacts (c));

    mkdir_p (r.root.directory ());
    mkdir_p (r.metadata.directory ());

    move_entry (s.root, r.root);
    move_entry (s.metadata, r.metadata);

    return r;
  }

  // Copy files from one directory to another creating the destination. If
  // the extension is specified, then only copy files with this extension.
  // Return the number of files copied.
  //
  static size_t
  copy_files (const dir_path& f, const dir_path& t, const char* ext = nullptr)
  {
    paths fs (dir_files (f, ext));

    mkdir_p (t);

    for (const path& n: fs)
      copy_file (f / n, t / n);

    return fs.size ();
  }

  void
  install_artifacts (const artifact_tree& s,
                     const dir_path& ip,
                     const package& p)
  {
    const dir_path& sr (s.root);

    l1 ([&]{text << "installing " << p.name << " from " << sr << " to "
                 << ip;});

    // bin/
    //
    {
      path f (s.binary (p));

      if (!exists (f))
        fail << "binary " << f << " does not exist";

      dir_path d (ip / dir_path ("bin"));
      mkdir_p (d);
      copy_file (f, d / path (p.name), exec_perms);
    }

    // lib/<package>/
    //
    {
      dir_path d (dir_path ("lib") / dir_path (p.name));

      if (!exists (sr / d))
        fail << "library directory " << sr / d << " does not exist";

      copy_tree (sr / d, ip / d);
    }

    // doc/<package>/ (optional).
    //
    {
      dir_path d (dir_path ("doc") / dir_path (p.name));
      dir_path o (d / dir_path ("odoc-pages"));

      mkdir_p (ip / o);

      if (exists (sr / d))
        copy_files (sr / d, ip / d, "md");
      else
        l4 ([&]{text << "no documentation in " << sr / d;});

      if (exists (sr / o))
        copy_files (sr / o, ip / o);
    }

    // man/man{1,5}/
    //
    for (const char* m: {"man/man1", "man/man5"})
    {
      dir_path d (m);

      if (!exists (sr / d))
        fail << "man page directory " << sr / d << " does not exist";

      if (copy_files (sr / d, ip / d) == 0)
        fail << "no man pages in " << sr / d;
    }

    // share/emacs/site-lisp/*.el (optional).
    //
    {
      dir_path d ("share/emacs/site-lisp");

      if (!exists (sr / d) || dir_files (sr / d, "el").empty ())
        l4 ([&]{text << "no editor integration files in " << sr / d;});
      else
        copy_files (sr / d, ip / d, "el");
    }
  }
}
