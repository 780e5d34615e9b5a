// file      : libxboot/orchestrator.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbutl/utility.hxx> // setenv(), unsetenv()

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/context.hxx>
#include <libxboot/package.hxx>
#include <libxboot/artifact.hxx>
#include <libxboot/toolchain.hxx>
#include <libxboot/filesystem.hxx>
#include <libxboot/environment.hxx>
#include <libxboot/diagnostics.hxx>
#include <libxboot/orchestrator.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace xboot
{
  // The build tool and the build system both lay out the install artifacts
  // the same way.
  //
  static const char artifacts_function[] = R"(
mk_artifacts ()
{
  r=_build/install/default
  mkdir -p _build/default/bin $r/bin $r/lib/dune $r/doc/dune $r/man/man1 \
    $r/man/man5 $r/share/emacs/site-lisp || exit 1
  printf 'native dune\n' >_build/default/bin/dune.exe
  ln -sf ../../../default/bin/dune.exe $r/bin/dune
  printf 'META\n' >$r/lib/dune/META
  printf 'README\n' >$r/doc/dune/README.md
  printf 'dune.1\n' >$r/man/man1/dune.1
  printf 'dune-config.5\n' >$r/man/man5/dune-config.5
  printf 'dune.el\n' >$r/share/emacs/site-lisp/dune.el
  printf 'bin: [dune]\n' >_build/default/dune.install
}
)";

  // Log any working state left over by a previous attempt.
  //
  static const char make_script[] = R"(
echo "make $*" >>"$XBOOT_TEST_LOG"
case "$1" in
  release)
    for f in _boot _build _build_install_native _native_duneboot \
      _dune.install.saved; do
      if test -e "$f"; then echo "stale $f" >>"$XBOOT_TEST_LOG"; fi
    done
    mk_artifacts ;;
  PREFIX=*)
    p="${1#PREFIX=}"
    mkdir -p "$p/bin" && cp _build/install/default/bin/dune "$p/bin/dune" ;;
  *)
    exit 1 ;;
esac
)";

  static const char dune_script[] = R"(
echo "dune $*" >>"$XBOOT_TEST_LOG"
case "$1" in
  --version)
    echo 3.16.0 ;;
  build)
    test -z "$XBOOT_TEST_FAIL_BUILD" || exit 1
    mk_artifacts ;;
  install)
    p="${2#--prefix=}"
    mkdir -p "$p" && cp -R _build/install/default/. "$p/" ;;
  *)
    exit 1 ;;
esac
)";

  // The bootstrap compiler writes a bootstrap executable that produces the
  // cross-compiled binary provided the cross environment is set up. If
  // XBOOT_TEST_FAIL_CROSS names a file that does not exist, then the
  // bootstrap executable creates it and fails (so only the first run fails).
  //
  static const char ocamlc_script[] = R"(
echo "ocamlc $*" >>"$XBOOT_TEST_LOG"
if test "$1" = -version; then
  echo 5.2.0
  exit 0
fi
test -z "$XBOOT_TEST_FAIL_COMPILE" || exit 5
test -n "$OCAMLLIB" || exit 2
o=
while test $# -gt 0; do
  if test "$1" = -o; then
    o="$2"
    shift
  fi
  shift
done
test -n "$o" || exit 3
cat >"$o" <<'EOF'
#!/bin/sh
test -n "$CONDA_OCAML_CC" || exit 4
if test -n "$XBOOT_TEST_FAIL_CROSS" -a ! -f "$XBOOT_TEST_FAIL_CROSS"; then
  touch "$XBOOT_TEST_FAIL_CROSS"
  exit 6
fi
mkdir -p _boot && printf 'cross dune\n' >_boot/dune.exe
EOF
chmod +x "$o"
)";

  static string original_path;

  static void
  script (const path& f, const char* body)
  {
    write_file (f, string ("#!/bin/sh\n") + artifacts_function + body);
    path_perms (f, exec_perms);
  }

  // Set up the build prefix with the fake tools, the target prefix, and
  // the source directory under the specified directory. Return the
  // cross-compilation context.
  //
  static build_context
  prepare (const dir_path& d)
  {
    build_context c;
    c.build_platform = "linux-64";
    c.target_platform = "linux-aarch64";
    c.prefix = d / dir_path ("host");
    c.build_prefix = d / dir_path ("build");
    c.install_prefix = c.prefix;
    c.toolchain_host = "aarch64-conda-linux-gnu";
    c.cross = true;
    c.src_dir = d / dir_path ("src");
    c.package = default_package ();

    dir_path bin (c.build_bin ());
    mkdir_p (bin);

    script (bin / path ("make"), make_script);
    script (bin / path ("dune"), dune_script);
    script (bin / path ("ocamlc"), ocamlc_script);
    script (bin / path ("ocamldep"), "");

    mkdir_p (c.target_lib ());
    mkdir_p (c.src_dir);

    butl::setenv ("PATH", bin.string () + ':' + original_path);
    butl::setenv ("XBOOT_TEST_LOG", (d / path ("log")).string ());

    return c;
  }

  static string
  read_log (const dir_path& d)
  {
    path f (d / path ("log"));
    return exists (f) ? read_file (f) : string ();
  }

  static bool
  contains (const string& s, const string& x)
  {
    return s.find (x) != string::npos;
  }

  // Verify the cross-compiled package is installed and the toolchain is
  // swapped.
  //
  static void
  verify_installed (const build_context& c)
  {
    const dir_path& ip (c.install_prefix);

    assert (read_file (ip / path ("bin/dune")) == "cross dune\n");
    assert (read_file (ip / path ("lib/dune/META")) == "META\n");
    assert (read_file (ip / path ("man/man1/dune.1")) == "dune.1\n");
    assert (exists (ip / path ("man/man5/dune-config.5")));
    assert (exists (ip / path ("share/emacs/site-lisp/dune.el")));
    assert (exists (ip / path ("doc/dune/README.md")));

    dir_path bin (c.build_bin ());

    assert (symlink_target (bin / path ("ocamlc")) ==
            path ("aarch64-conda-linux-gnu-ocamlc"));
    assert (symlink_target (bin / path ("ocamldep")) ==
            path ("aarch64-conda-linux-gnu-ocamldep"));
    assert (symlink_target (bin / path ("gcc")) ==
            path ("aarch64-conda-linux-gnu-gcc"));
    assert (contains (read_file (bin / path ("ocamlc.build")),
                      "echo 5.2.0"));

    // No snapshot left behind.
    //
    artifact_tree s (snapshot_artifacts (c));
    assert (!exists (s.root));
    assert (!exists (s.metadata));
  }

  int
  main (int, char*[])
  {
    init_diag (1);
    init ();

    {
      optional<string> p (getenv ("PATH"));
      original_path = p ? *p : "/usr/bin:/bin";
    }

    butl::unsetenv ("XBOOT_TEST_FAIL_BUILD");
    butl::unsetenv ("XBOOT_TEST_FAIL_COMPILE");

    // Phase descriptions.
    //
    assert (phase_number (phase::idle) == 0);
    assert (phase_number (phase::artifact_generation) == 1);
    assert (phase_number (phase::reassembly) == 5);
    assert (phase_number (phase::done) == 0);
    assert (to_string (phase::bootstrap_build) == "building bootstrap tool");
    assert (to_string (strategy::fast) == "fast");

    // Cleaning the working state is idempotent.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));
      const package& p (c.package);

      mkdir_p (c.src (dir_path ("_boot")));
      mkdir_p (c.src (dir_path ("_build/install/default")));
      mkdir_p (c.src (dir_path ("_build_install_native/bin")));
      write_file (c.src (path ("_dune.install.saved")), "");
      write_file (c.src (p.bootstrap_exe), "");
      write_file (c.src (path ("dune-project")), "");

      clean_working_state (c);
      clean_working_state (c);

      assert (!exists (c.src (dir_path ("_boot"))));
      assert (!exists (c.src (dir_path ("_build"))));
      assert (!exists (c.src (dir_path ("_build_install_native"))));
      assert (!exists (c.src (path ("_dune.install.saved"))));
      assert (!exists (c.src (p.bootstrap_exe)));
      assert (exists (c.src (path ("dune-project"))));
    }

    // Fast strategy.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));

      environment e;
      compose_driver_environment (c, e);

      assert (cross_compile (c, e) == strategy::fast);
      verify_installed (c);

      string l (read_log (d));
      assert (contains (l, "dune --version"));
      assert (contains (l, "dune build @install -p dune "
                           "--profile dune-bootstrap"));
      assert (contains (l, "dune install --prefix=" +
                           c.install_prefix.string () + " dune"));
      assert (!contains (l, "make "));
    }

    // Fallback to the bootstrap strategy if the fast strategy fails.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));

      environment e;
      compose_driver_environment (c, e);
      e.set ("XBOOT_TEST_FAIL_BUILD", "1");

      assert (cross_compile (c, e) == strategy::bootstrap);
      verify_installed (c);

      string l (read_log (d));
      assert (contains (l, "dune build @install"));
      assert (contains (l, "make release"));
      assert (!contains (l, "dune install"));

      // The bootstrap strategy starts from a clean working state and never
      // invokes the native tool.
      //
      size_t m (l.find ("make release"));
      assert (m > l.find ("dune build"));
      assert (l.find ("\ndune ", m) == string::npos);
      assert (!contains (l, "stale "));
    }

    // Fallback after the fast strategy has already switched the toolchain.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));

      // The bootstrap strategy builds its bootstrap executable with the
      // swapped compiler so provide the cross one.
      //
      dir_path bin (c.build_bin ());
      script (bin / path ("aarch64-conda-linux-gnu-ocamlc"),
              (string ("# cross compiler\n") + ocamlc_script).c_str ());

      environment e;
      compose_driver_environment (c, e);
      e.set ("XBOOT_TEST_FAIL_CROSS", (d / path ("cross-failed")).string ());

      assert (cross_compile (c, e) == strategy::bootstrap);
      assert (exists (d / path ("cross-failed")));
      verify_installed (c);

      string l (read_log (d));
      size_t m (l.find ("make release"));

      assert (m != string::npos);
      assert (contains (l, "dune build @install"));
      assert (!contains (l, "dune install"));
      assert (l.find ("\ndune ", m) == string::npos);

      // Nothing from the failed attempt is left when the bootstrap strategy
      // starts.
      //
      assert (!contains (l, "stale "));

      // The second swap preserves the native compiler.
      //
      assert (!contains (read_file (bin / path ("ocamlc.build")),
                         "# cross compiler"));
    }

    // Fast strategy disabled.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));

      environment e;
      compose_driver_environment (c, e);

      assert (cross_compile (c, e, false) == strategy::bootstrap);
      verify_installed (c);

      assert (!contains (read_log (d), "dune --version"));
    }

    // No native tool in the build prefix.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));
      rmfile (fast_path_tool (c));

      environment e;
      compose_driver_environment (c, e);

      assert (cross_compile (c, e) == strategy::bootstrap);
      verify_installed (c);
    }

    // The failed phase is recorded and a failure of the bootstrap strategy
    // is fatal.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));

      environment e;
      compose_driver_environment (c, e);
      e.set ("XBOOT_TEST_FAIL_COMPILE", "1");

      {
        attempt a (strategy::fast, e);

        try
        {
          run_strategy (c, a);
          assert (false);
        }
        catch (const failed&)
        {
          assert (a.phase == phase::bootstrap_build);
          assert (a.tool_version == "3.16.0");
          assert (a.swaps.empty ());
        }
      }

      clean_working_state (c);

      try
      {
        cross_compile (c, e);
        assert (false);
      }
      catch (const failed&) {}

      assert (!exists (c.install_prefix / path ("bin/dune")));
      assert (!symlink_exists (c.build_bin () / path ("ocamlc")));
    }

    // Native build.
    //
    {
      dir_path d (dir_path::temp_path ("xboot-orchestrator"));
      mkdir_p (d);
      auto_rmdir rm (d);

      build_context c (prepare (d));
      c.cross = false;
      c.build_prefix = c.prefix;

      environment e;
      compose_driver_environment (c, e);

      native_build (c, e);

      assert (read_file (c.install_prefix / path ("bin/dune")) ==
              "native dune\n");

      string l (read_log (d));
      assert (contains (l, "make release"));
      assert (contains (l, "make PREFIX=" + c.install_prefix.string () +
                           " install"));
    }

    butl::setenv ("PATH", original_path);
    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return xboot::main (argc, argv);
}
