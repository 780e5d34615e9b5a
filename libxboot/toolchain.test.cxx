// file      : libxboot/toolchain.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/types.hxx>
#include <libxboot/utility.hxx>

#include <libxboot/toolchain.hxx>
#include <libxboot/filesystem.hxx>
#include <libxboot/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace xboot
{
  int
  main (int, char*[])
  {
    init_diag (1);
    init ();

    const string triple ("aarch64-conda-linux-gnu");

    dir_path bin (dir_path::temp_path ("xboot-toolchain"));
    mkdir_p (bin);
    auto_rmdir rm (bin);

    auto p = [&bin] (const char* n) {return bin / path (n);};

    write_file (p ("ocamlc"), "native ocamlc\n");
    write_file (p ("ocamlc.opt"), "native ocamlc.opt\n");
    write_file (p ("ocamldep"), "native ocamldep\n");
    write_file (p ("cc"), "native cc\n");

    // A tool that is itself a symlink is preserved as such.
    //
    make_symlink (path ("ocamlc.opt"), p ("ocamlopt"));

    // Swap to the cross compilers. Missing tools are skipped.
    //
    swap_token t (swap_to_cross_compilers (
                    bin,
                    strings {"ocamlc", "ocamldep", "ocamlopt", "ocamlobjinfo"},
                    triple));

    assert (t.entries.size () == 4);

    for (const char* n: {"ocamlc", "ocamlc.opt", "ocamldep", "ocamlopt"})
    {
      assert (symlink_exists (p (n)));
      assert (symlink_target (p (n)) == path (triple + '-' + n));
      assert (xboot::entry_exists (saved_path (p (n))));
    }

    assert (read_file (p ("ocamlc.build")) == "native ocamlc\n");
    assert (read_file (p ("ocamldep.build")) == "native ocamldep\n");

    assert (symlink_exists (p ("ocamlopt.build")));
    assert (symlink_target (p ("ocamlopt.build")) == path ("ocamlc.opt"));

    assert (!xboot::entry_exists (p ("ocamlobjinfo")));
    assert (!xboot::entry_exists (p ("ocamlobjinfo.build")));

    // Swapping again changes nothing and, in particular, does not overwrite
    // the preserved native tools.
    //
    {
      swap_token r (swap_to_cross_compilers (
                      bin,
                      strings {"ocamlc", "ocamldep"},
                      triple));

      assert (r.empty ());
      assert (read_file (p ("ocamlc.build")) == "native ocamlc\n");
      assert (symlink_target (p ("ocamlc")) == path (triple + "-ocamlc"));
    }

    // The C compiler symlinks are created even if there is nothing to
    // preserve.
    //
    {
      const string cc (triple + "-gcc");

      swap_token r (setup_cross_c_compilers (bin, cc));

      assert (r.entries.size () == 2);
      assert (r.entries[0].link == p ("gcc") && !r.entries[0].saved);
      assert (r.entries[1].link == p ("cc") && r.entries[1].saved);

      assert (symlink_target (p ("gcc")) == path (cc));
      assert (symlink_target (p ("cc")) == path (cc));
      assert (!xboot::entry_exists (p ("gcc.build")));
      assert (read_file (p ("cc.build")) == "native cc\n");

      t.append (move (r));
      assert (r.empty ());
      assert (t.entries.size () == 6);
    }

    // Revert everything.
    //
    revert_swap (t);
    assert (t.empty ());

    for (const char* n: {"ocamlc", "ocamlc.opt", "ocamldep", "cc"})
    {
      assert (!symlink_exists (p (n)));
      assert (!xboot::entry_exists (saved_path (p (n))));
    }

    assert (read_file (p ("ocamlc")) == "native ocamlc\n");
    assert (read_file (p ("cc")) == "native cc\n");

    assert (symlink_exists (p ("ocamlopt")));
    assert (symlink_target (p ("ocamlopt")) == path ("ocamlc.opt"));
    assert (!xboot::entry_exists (p ("ocamlopt.build")));

    assert (!xboot::entry_exists (p ("gcc")));

    // Swapping a single tool.
    //
    {
      swap_token r;

      assert (swap_tool (bin, "ocamlfind", path ("x"), r) ==
              swap_status::absent);
      assert (r.empty ());

      assert (swap_tool (bin, "ocamldep", path (triple + "-ocamldep"), r) ==
              swap_status::success);
      assert (r.entries.size () == 1);
      assert (*r.entries[0].saved == saved_path (p ("ocamldep")));

      revert_swap (r);
      assert (read_file (p ("ocamldep")) == "native ocamldep\n");
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return xboot::main (argc, argv);
}
