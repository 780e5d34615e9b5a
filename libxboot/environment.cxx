// file      : libxboot/environment.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/environment.hxx>

#include <libxboot/platform.hxx>
#include <libxboot/filesystem.hxx>
#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  // environment
  //
  optional<string> environment::
  get (const string& n) const
  {
    auto i (overrides_.find (n));
    return i != overrides_.end () ? i->second : getenv (n);
  }

  void environment::
  set (const string& n, string v)
  {
    overrides_[n] = move (v);
  }

  void environment::
  unset (const string& n)
  {
    overrides_[n] = nullopt;
  }

  void environment::
  prepend (const string& n, const string& v, const char* sep)
  {
    optional<string> o (get (n));

    string r (v);
    r += sep;

    if (o)
      r += *o;

    set (n, move (r));
  }

  strings environment::
  vars () const
  {
    strings r;
    r.reserve (overrides_.size ());

    for (const auto& p: overrides_)
    {
      if (p.second)
        r.push_back (p.first + '=' + *p.second);
      else
        r.push_back (p.first);
    }

    return r;
  }

  // environment_vars
  //
  environment_vars::
  environment_vars (const environment& e)
      : vars_ (e.vars ())
  {
    cvars_.reserve (vars_.size () + 1);

    for (const string& v: vars_)
      cvars_.push_back (v.c_str ());

    cvars_.push_back (nullptr);
  }

  bool
  run (const environment& e,
       const dir_path& cwd,
       const process_path& pp,
       const strings& args)
  {
    cstrings a (process_args (pp.recall_string (), args));
    environment_vars vs (e);

    process pr (run_start (2 /* verbosity */,
                           process_env (pp, cwd, vs.data ()),
                           a));

    return run_finish_code (a, pr, 2 /* verbosity */);
  }

  void
  compose_driver_environment (const build_context& c, environment& e)
  {
    string libs (c.target_lib ().string () + ':' +
                 (c.build_prefix / dir_path ("lib")).string ());

    if (is_cross_compiling (c))
      e.prepend ("LIBRARY_PATH", libs);

    // Target-linked dynamic libraries are resolved at load time on macOS.
    //
    if (is_macos (c))
      e.prepend ("DYLD_FALLBACK_LIBRARY_PATH", libs);

    if (is_non_unix (c))
      e.prepend ("PATH",
                 c.build_bin ().string () + ':' +
                 (c.build_prefix / dir_path ("Library/bin")).string ());
  }

  // Return true if the colon-separated search path contains the directory.
  //
  static bool
  search_path_contains (const string& v, const string& d)
  {
    for (size_t b (0), n (v.size ()); b <= n; )
    {
      size_t e (v.find (':', b));
      if (e == string::npos)
        e = n;

      if (v.compare (b, e - b, d) == 0)
        return true;

      b = e + 1;
    }

    return false;
  }

  // Prepend to the search path variable those of the directories that are
  // not already in it, preserving their order.
  //
  static void
  prepend_missing (environment& e, const string& n, const dir_paths& ds)
  {
    optional<string> o (e.get (n));

    string v;
    for (const dir_path& d: ds)
    {
      const string& s (d.string ());

      if ((o && search_path_contains (*o, s)) ||
          (!v.empty () && search_path_contains (v, s)))
        continue;

      if (!v.empty ())
        v += ':';

      v += s;
    }

    if (!v.empty ())
      e.prepend (n, v);
  }

  void
  compose_bootstrap_environment (const build_context& c, environment& e)
  {
    const package& p (c.package);

    dir_path rt (c.target_runtime ());
    dir_path tl (c.target_lib ());
    dir_path bl (c.build_prefix / dir_path ("lib"));

    e.set (p.runtime_var, rt.string ());

    // Target library roots before the build ones (which may already be
    // there from the driver setup).
    //
    prepend_missing (e, "LIBRARY_PATH", dir_paths {rt, tl, bl});

    if (is_macos (c))
      prepend_missing (e, "DYLD_FALLBACK_LIBRARY_PATH", dir_paths {tl, bl});

    l4 ([&]{text << p.runtime_var << ": " << *e.get (p.runtime_var) << '\n'
                 << "LIBRARY_PATH: " << *e.get ("LIBRARY_PATH");});
  }

  void
  configure_cross_environment (const build_context& c, environment& e)
  {
    const package& p (c.package);
    const string& vp (p.tool_var_prefix);
    const string& th (c.toolchain_host);

    string cc (target_compiler (c));

    e.set (vp + "CC", cc);

    if (is_macos (c))
    {
      e.set (vp + "MKEXE", cc);
      e.set (vp + "MKDLL", cc + " -dynamiclib");
    }
    else
    {
      e.set (vp + "MKEXE", cc + " -Wl,-E -ldl");
      e.set (vp + "MKDLL", cc + " -shared");
    }

    e.set (vp + "AR", th + "-ar");
    e.set (vp + "AS", th + "-as");
    e.set (vp + "LD", th + "-ld");

    dir_path cr (c.cross_runtime ());

    if (exists (cr))
    {
      e.set (p.runtime_var, cr.string ());
      e.prepend ("LIBRARY_PATH",
                 cr.string () + ':' + c.target_lib ().string ());
      e.prepend ("LDFLAGS",
                 "-L" + cr.string () + " -L" + c.target_lib ().string (),
                 " ");
    }
    else
      l4 ([&]{text << "no cross runtime in " << cr;});
  }
}
