// file      : libxboot/package.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/package.hxx>

using namespace std;

namespace xboot
{
  package
  default_package (const string& n)
  {
    package r;
    r.name = n;

    r.bootstrap_compiler = "ocamlc";
    r.bootstrap_include = dir_path ("boot");
    r.bootstrap_sources = paths {path ("boot/types.ml"),
                                 path ("boot/libs.ml"),
                                 path ("boot/" + n + "boot.ml")};
    r.bootstrap_library = "unix.cma";
    r.bootstrap_library_include = "+unix";
    r.bootstrap_exe = path ("_native_" + n + "boot");
    r.bootstrap_output = path ("_boot/" + n + ".exe");

    r.profile = n + "-bootstrap";

    r.tools = strings {"ocamlc", "ocamldep", "ocamlopt", "ocamlobjinfo"};

    r.runtime_subdir = "ocaml";
    r.runtime_var = "OCAMLLIB";
    r.tool_var_prefix = "CONDA_OCAML_";
    r.cross_runtime_root = dir_path ("lib/ocaml-cross-compilers");

    r.boot_dir = dir_path ("_boot");
    r.build_dir = dir_path ("_build");

    r.build_system = "make";
    r.release_target = "release";

    r.version_record = "ocaml-build-version";

    return r;
  }
}
