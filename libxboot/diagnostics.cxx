// file      : libxboot/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/diagnostics.hxx>

#include <libbutl/process-io.hxx>

using namespace std;
using namespace butl;

namespace xboot
{
  // Diagnostics state (verbosity level, etc). Keep default until set from
  // options.
  //
  uint16_t verb = 1;

  void
  init_diag (uint16_t v)
  {
    verb = v;
  }

  // Stream verbosity.
  //
  const int stream_verb_index = ostream::xalloc ();

  // print_diag()
  //
  void
  print_diag (const char* p, const path& r)
  {
    text << p << ' ' << r;
  }

  void
  print_diag (const char* p, const dir_path& r)
  {
    text << p << ' ' << r;
  }

  void
  print_diag (const char* p, const path& l, const path& r, const char* c)
  {
    text << p << ' ' << l << ' ' << (c == nullptr ? "->" : c) << ' ' << r;
  }

  // print_process()
  //
  void
  print_process (diag_record& dr,
                 const char* const* args, size_t n)
  {
    dr << butl::process_args {args, n};
  }

  void
  print_process (const process_env& pe, const char* const* args, size_t n)
  {
    diag_record dr (text);
    print_process (dr, pe, args, n);
  }

  void
  print_process (diag_record& dr,
                 const process_env& pe, const char* const* args, size_t n)
  {
    if (pe.env ())
      dr << pe << ' ';

    dr << butl::process_args {args, n};
  }

  // Diagnostic facility, project specifics.
  //

  void simple_prologue_base::
  operator() (const diag_record& r) const
  {
    stream_verb (r.os, sverb_);

    if (type_ != nullptr)
      r << type_ << ": ";

    if (mod_ != nullptr)
      r << mod_ << "::";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr, nullptr); // No type/frame.
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
