// file      : libxboot/bootstrap.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/bootstrap.hxx>

#include <libxboot/platform.hxx>
#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  strings
  bootstrap_arguments (const build_context& c)
  {
    const package& p (c.package);

    string lib (c.target_lib ().string ());
    string rt (c.target_runtime ().string ());

    strings r {"-output-complete-exe", "-intf-suffix", ".dummy", "-g"};

    // On macOS link zstd by path since the linker would otherwise pick the
    // build prefix one.
    //
    if (is_macos (c))
    {
      r.push_back ("-verbose");
      r.push_back ("-cclib");
      r.push_back (lib + "/libzstd.dylib");
    }
    else
    {
      r.push_back ("-cclib");
      r.push_back ("-L" + lib);
    }

    r.push_back ("-cclib");
    r.push_back ("-L" + rt);

    r.push_back ("-cclib");
    r.push_back ("-Wl,-rpath," + lib);

    r.push_back ("-o");
    r.push_back ("./" + p.bootstrap_exe.string ());

    r.push_back ("-I");
    r.push_back (p.bootstrap_include.string ());

    r.push_back ("-I");
    r.push_back (p.bootstrap_library_include);
    r.push_back (p.bootstrap_library);

    for (const path& s: p.bootstrap_sources)
      r.push_back (s.string ());

    return r;
  }

  bool
  build_native_bootstrap (const build_context& c, environment& e)
  {
    compose_bootstrap_environment (c, e);

    l2 ([&]{text << "target lib: " << c.target_lib () << '\n'
                 << "target runtime: " << c.target_runtime ();});

    // Note that the build prefix bin/ directory is normally in PATH but we
    // use it as a fallback in case it's not.
    //
    process_path pp (run_search (path (c.package.bootstrap_compiler),
                                 true /* init */,
                                 c.build_bin ()));

    return run (e, c.src_dir, pp, bootstrap_arguments (c));
  }
}
