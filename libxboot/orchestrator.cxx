// file      : libxboot/orchestrator.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/orchestrator.hxx>

#include <libxboot/platform.hxx>
#include <libxboot/bootstrap.hxx>
#include <libxboot/filesystem.hxx>
#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  string
  to_string (strategy s)
  {
    switch (s)
    {
    case strategy::fast:      return "fast";
    case strategy::bootstrap: return "bootstrap";
    }

    return string (); // Should never reach.
  }

  string
  to_string (phase p)
  {
    switch (p)
    {
    case phase::idle:                return "checking preconditions";
    case phase::artifact_generation: return "building install artifacts";
    case phase::bootstrap_build:     return "building bootstrap tool";
    case phase::toolchain_swap:      return "setting up cross-compilers";
    case phase::cross_build:
      return "running bootstrap with cross-compiler";
    case phase::reassembly:
      return "replacing binary with cross-compiled version";
    case phase::done:                return "done";
    }

    return string (); // Should never reach.
  }

  path
  fast_path_tool (const build_context& c)
  {
    return c.build_bin () / path (c.package.name);
  }

  void
  clean_working_state (const build_context& c)
  {
    const package& p (c.package);

    l2 ([&]{text << "cleaning working state in " << c.src_dir;});

    rmtree (c.src (p.boot_dir));
    rmtree (c.src (p.build_dir));

    artifact_tree s (snapshot_artifacts (c));
    rmtree (s.root);
    rmfile (s.metadata);

    rmfile (c.src (p.bootstrap_exe));
  }

  // The fast strategy failures are recoverable and so are issued as
  // warnings (but still terminate the attempt).
  //
  static const fail_mark fail_fast ("warning");

  static inline const fail_mark&
  phase_fail (const attempt& a)
  {
    return a.strategy == strategy::fast ? fail_fast : fail;
  }

  // Enter the phase printing the banner.
  //
  static void
  enter (attempt& a, phase p, const string& suffix = empty_string)
  {
    a.phase = p;

    l1 ([&]{
        diag_record dr (text);
        dr << "phase " << phase_number (p) << ": " << to_string (p);

        if (!suffix.empty ())
          dr << ' ' << suffix;
      });
  }

  // Query the fast path tool version (first line of the --version output).
  //
  static string
  tool_version (const build_context& c,
                const attempt& a,
                const process_path& pp)
  {
    cstrings args {pp.recall_string (), "--version", nullptr};
    environment_vars vs (a.env);

    string r (run<string> (3 /* verbosity */,
                           process_env (pp, c.src_dir, vs.data ()),
                           args.data (),
                           [] (string& l, bool) {return move (l);},
                           false /* error */));

    if (r.empty ())
      phase_fail (a) << "unable to obtain " << pp << " version";

    return r;
  }

  void
  run_strategy (const build_context& c, attempt& a)
  {
    tracer trace ("run_strategy");

    const package& p (c.package);
    bool fast (a.strategy == strategy::fast);

    auto df = make_diag_frame (
      [&a] (const diag_record& dr)
      {
        dr << info << "during " << a.strategy << " strategy phase "
                   << phase_number (a.phase) << " (" << to_string (a.phase)
                   << ')';
      });

    l1 ([&]{text << "cross-compiling " << p.name << " for "
                 << c.target_platform << " using " << a.strategy
                 << " strategy";});

    // Fast path tool.
    //
    path tool;
    process_path tp;

    if (fast)
    {
      tool = fast_path_tool (c);

      if (!executable (tool))
        phase_fail (a) << "native " << p.name << " not found at " << tool;

      tp = run_search (tool, true /* init */);
      a.tool_version = tool_version (c, a, tp);

      l1 ([&]{text << "native " << p.name << ": " << tool << " ("
                   << a.tool_version << ')';});
    }

    // Phase 1: build and save the install artifacts.
    //
    artifact_tree bt (build_artifacts (c));
    {
      enter (a,
             phase::artifact_generation,
             fast ? "with native " + p.name : "with native compiler");

      if (fast)
      {
        // The self build profile expects the bootstrap output binary so use
        // the native tool as a placeholder.
        //
        mkdir_p (c.src (p.boot_dir));
        copy_file (tool, c.src (p.bootstrap_output));

        if (!run (a.env, c.src_dir, tp,
                  strings {"build", "@install",
                           "-p", p.name,
                           "--profile", p.profile}))
          phase_fail (a) << "unable to build install artifacts with " << tool;
      }
      else
      {
        process_path mp (run_search (path (p.build_system),
                                     true /* init */,
                                     c.build_bin ()));

        if (!run (a.env, c.src_dir, mp, strings {p.release_target}))
          phase_fail (a) << "unable to build install artifacts with "
                         << p.build_system << ' ' << p.release_target;
      }

      if (!exists (bt.root))
        phase_fail (a) << "install artifacts directory " << bt.root
                       << " does not exist";

      if (!exists (bt.metadata))
        phase_fail (a) << "install metadata file " << bt.metadata
                       << " does not exist";

      a.snapshot = snapshot (c);
    }

    // Phase 2: build the bootstrap executable with the native compiler.
    //
    path be (c.src (p.bootstrap_exe));
    {
      enter (a, phase::bootstrap_build);

      if (!build_native_bootstrap (c, a.env) || !exists (be))
        phase_fail (a) << "unable to build bootstrap executable " << be;
    }

    // Phase 3: switch to the cross toolchain.
    //
    {
      enter (a, phase::toolchain_swap);

      a.swaps.append (swap_to_cross_compilers (c.build_bin (),
                                               p.tools,
                                               c.toolchain_host));

      a.swaps.append (setup_cross_c_compilers (c.build_bin (),
                                               target_compiler (c)));

      configure_cross_environment (c, a.env);

      l4 ([&]{trace << a.swaps.entries.size () << " entries swapped";});
    }

    // Phase 4: produce the cross-compiled binary.
    //
    path out (c.src (p.bootstrap_output));
    {
      enter (a, phase::cross_build);

      rmtree (c.src (p.boot_dir));
      rmtree (c.src (p.build_dir));

      process_path bp (run_search (be, true /* init */));

      if (!run (a.env, c.src_dir, bp, strings ()))
        phase_fail (a) << "bootstrap executable " << be << " failed" <<
          info << "expected binary " << out;

      if (!exists (out))
        phase_fail (a) << "bootstrap executable " << be << " did not produce "
                       << out;
    }

    // Phase 5: substitute the binary and install.
    //
    {
      enter (a, phase::reassembly);

      artifact_tree s (reassemble (move (*a.snapshot), out, p));
      a.snapshot = nullopt;

      artifact_tree t (restore (c, s));

      if (fast)
      {
        // The same tool generated the artifacts in phase 1 so make sure it
        // hasn't changed since then.
        //
        string v (tool_version (c, a, tp));

        if (v != a.tool_version)
          phase_fail (a) << "native " << p.name << " version changed from '"
                         << a.tool_version << "' to '" << v << "'";

        if (!run (a.env, c.src_dir, tp,
                  strings {"install",
                           "--prefix=" + c.install_prefix.string (),
                           p.name}))
          phase_fail (a) << "unable to install with " << tool <<
            info << "install prefix " << c.install_prefix;
      }
      else
        install_artifacts (t, c.install_prefix, p);
    }

    a.phase = phase::done;
  }

  strategy
  cross_compile (const build_context& c, const environment& e, bool fp)
  {
    const package& p (c.package);
    path tool (fast_path_tool (c));

    if (fp && executable (tool))
    {
      l1 ([&]{text << "native " << p.name << " found, attempting fast "
                   << "cross-compilation";});

      attempt a (strategy::fast, e);

      try
      {
        run_strategy (c, a);
        return strategy::fast;
      }
      catch (const failed&)
      {
        diag_record dr (warn);
        dr << "cross-compilation with native " << p.name << " failed";

        if (a.phase != phase::idle)
          dr << " in phase " << phase_number (a.phase) << " ("
             << to_string (a.phase) << ')';

        dr << info << "falling back to full bootstrap";
      }

      clean_working_state (c);
    }
    else if (!fp)
      l1 ([&]{text << "fast path disabled, using full bootstrap";});
    else
      l1 ([&]{text << "native " << p.name << " not found at " << tool
                   << ", using full bootstrap";});

    attempt a (strategy::bootstrap, e);
    run_strategy (c, a);
    return strategy::bootstrap;
  }

  void
  native_build (const build_context& c, const environment& be)
  {
    const package& p (c.package);

    environment e (be);

    if (is_non_unix (c))
    {
      const dir_path& b (c.build_prefix);

      e.prepend ("PATH",
                 (b / dir_path ("Library/mingw-w64/bin")).string () + ':' +
                 (b / dir_path ("Library/bin")).string () + ':' +
                 c.build_bin ().string ());
    }

    l1 ([&]{text << "building " << p.name << " natively for "
                 << c.target_platform;});

    process_path mp (run_search (path (p.build_system),
                                 true /* init */,
                                 c.build_bin ()));

    if (!run (e, c.src_dir, mp, strings {p.release_target}))
      fail << "unable to build " << p.name << " with " << p.build_system
           << ' ' << p.release_target;

    if (!run (e, c.src_dir, mp,
              strings {"PREFIX=" + c.install_prefix.string (), "install"}))
      fail << "unable to install " << p.name << " with " << p.build_system
           << " install" <<
        info << "install prefix " << c.install_prefix;
  }
}
