// file      : libxboot/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/utility.hxx>

#ifndef _WIN32
#  include <signal.h> // signal()
#endif

#include <cerrno>   // ENOENT, errno
#include <iostream> // cerr

#include <libxboot/diagnostics.hxx>

using namespace std;
using namespace butl;

// <libxboot/types.hxx>
//
namespace xboot
{
  ostream&
  operator<< (ostream& os, const path& p)
  {
    return stream_verb (os).path < 1
      ? os << diag_relative (p)
      : to_stream (os, p, true /* representation */);
  }

  ostream&
  operator<< (ostream& os, const process_path& p)
  {
    if (p.empty ())
      os << "<empty>";
    else
    {
      os << p.recall_string ();

      if (!p.effect.empty ())
        os << '@' << p.effect.string (); // Suppress relative().
    }

    return os;
  }
}

// <libxboot/utility.hxx>
//
namespace xboot
{
  dir_path work;
  dir_path home;
  const dir_path* relative_base = &work;

  const string empty_string;

  string
  diag_relative (const path& p, bool cur)
  {
    if (p.string () == "-")
      return "<stdin>";

    const path& b (*relative_base);

    if (p.absolute ())
    {
      if (p == b)
        return cur ? "." + p.separator_string () : string ();

#ifndef _WIN32
      if (!home.empty ())
      {
        if (p == home)
          return "~" + p.separator_string ();
      }
#endif

      path rb (relative (p));

#ifndef _WIN32
      if (!home.empty ())
      {
        if (rb.relative ())
        {
          // See if the original path with the ~/ shortcut is better that the
          // relative to base.
          //
          if (p.sub (home))
          {
            path rh (p.leaf (home));
            if (rb.size () > rh.size () + 2) // 2 for '~/'
              return "~/" + move (rh).representation ();
          }
        }
        else if (rb.sub (home))
          return "~/" + rb.leaf (home).representation ();
      }

#endif

      return move (rb).representation ();
    }

    return p.representation ();
  }

  process_path
  run_search (const path& f,
              bool init,
              const dir_path& fallback,
              bool path_only)
  try
  {
    return process::path_search (f, init, fallback, path_only);
  }
  catch (const process_error& e)
  {
    fail << "unable to execute " << f << ": " << e << endf;
  }

  process_path
  run_try_search (const path& f,
                  bool init,
                  const dir_path& fallback,
                  bool path_only)
  {
    return process::try_path_search (f, init, fallback, path_only);
  }

  process
  run_start (uint16_t verbosity,
             const process_env& pe,
             const char* const* args,
             int in,
             int out,
             int err)
  try
  {
    assert (args[0] == pe.path->recall_string ());

    if (verb >= verbosity)
      print_process (pe, args, 0);

    return process (
      *pe.path,
      args,
      in,
      out,
      err,
      pe.cwd != nullptr && !pe.cwd->empty ()
      ? pe.cwd->string ().c_str ()
      : nullptr,
      pe.vars);
  }
  catch (const process_error& e)
  {
    if (e.child)
    {
      // Note: run_finish_impl() below expects this exact message.
      //
      cerr << "unable to execute " << args[0] << ": " << e << endl;

      // It is unwise to try to do any kind of cleanup (like unwinding the
      // stack and running destructors) in a child that fork()'ed but did not
      // exec().
      //
      exit (1);
    }
    else
      fail << "unable to execute " << args[0] << ": " << e << endf;
  }

  bool
  run_wait (const char* const* args, process& pr)
  try
  {
    return pr.wait ();
  }
  catch (const process_error& e)
  {
    fail << "unable to execute " << args[0] << ": " << e << endf;
  }

  bool
  run_finish_impl (const char* const* args,
                   process& pr,
                   bool f,
                   const string& l,
                   uint16_t v,
                   bool omit_normal)
  {
    tracer trace ("run_finish");

    if (run_wait (args, pr))
      return true;

    const process_exit& pe (*pr.exit);
    bool ne (pe.normal ());

    // Even if the user redirected the diagnostics, one error that we want to
    // let through is the inability to execute the program itself. This
    // particular situation will result in a single error line printed by
    // run_start() above.
    //
    if (ne && l.compare (0, 18, "unable to execute ") == 0)
      fail << l;

    if (omit_normal && ne)
    {
      l4 ([&]{trace << "process " << args[0] << " " << pe;});
    }
    else
    {
      diag_record dr;
      dr << error << "process " << args[0] << " " << pe;

      if (verb >= 1 && verb <= v)
      {
        dr << info << "command line: ";
        print_process (dr, args);
      }
    }

    if (f || !ne)
      throw failed ();

    return false;
  }

  bool
  run (uint16_t verbosity,
       const process_env& pe,
       const char* const* args,
       uint16_t finish_verbosity,
       const function<bool (string&, bool)>& f,
       bool err)
  {
    process pr (run_start (verbosity,
                           pe,
                           args,
                           0           /* stdin */,
                           -1          /* stdout */,
                           err ? 2 : 1 /* stderr */));

    string l; // Last line of output.
    try
    {
      ifdstream is (move (pr.in_ofd), fdstream_mode::skip);

      bool empty (true);

      // Make sure we keep the last line.
      //
      for (bool last (is.peek () == ifdstream::traits_type::eof ());
           !last && getline (is, l); )
      {
        last = (is.peek () == ifdstream::traits_type::eof ());

        trim (l);

        if (empty)
        {
          empty = f (l, last);

          if (!empty)
            break;
        }
      }

      is.close ();
    }
    catch (const io_error& e)
    {
      if (run_wait (args, pr))
        fail << "io error reading " << args[0] << " output: " << e << endf;

      // If the child process has failed then assume the io error was
      // caused by that and let run_finish() deal with it.
    }

    // Omit normal exit code diagnostics if err is false.
    //
    return run_finish_impl (args, pr, err, l, finish_verbosity, !err);
  }

  cstrings
  process_args (const char* program, const strings& args)
  {
    cstrings r;
    r.reserve (args.size () + 2);

    r.push_back (program);

    for (const string& a: args)
      r.push_back (a.c_str ());

    r.push_back (nullptr);
    return r;
  }

  void
  init_process ()
  {
    // On POSIX ignore SIGPIPE which is signaled to a pipe-writing process if
    // the pipe reading end is closed. Note that by default this signal
    // terminates a process.
    //
#ifndef _WIN32
    if (signal (SIGPIPE, SIG_IGN) == SIG_ERR)
      fail << "unable to ignore broken pipe (SIGPIPE) signal: "
           << system_error (errno, generic_category ()); // Sanitize.
#endif
  }

  void
  init ()
  {
    // Figure out work and home directories.
    //
    try
    {
      work = dir_path::current_directory ();
    }
    catch (const system_error& e)
    {
      fail << "invalid current working directory: " << e;
    }

    try
    {
      home = dir_path::home_directory ();
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain home directory: " << e;
    }
  }
}
