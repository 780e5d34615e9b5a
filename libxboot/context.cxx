// file      : libxboot/context.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/context.hxx>

#include <libxboot/platform.hxx>
#include <libxboot/diagnostics.hxx>

using namespace std;

namespace xboot
{
  dir_path build_context::
  cross_runtime () const
  {
    return build_prefix                    /
           package.cross_runtime_root      /
           dir_path (toolchain_host)       /
           dir_path ("lib")                /
           dir_path (package.runtime_subdir);
  }

  // Return the option value, if specified, and the environment variable
  // value otherwise. Treat an empty variable value as unspecified.
  //
  static optional<string>
  value (const optional<string>& o, const char* var)
  {
    if (o)
      return o;

    optional<string> r (getenv (var));

    if (r && r->empty ())
      r = nullopt;

    return r;
  }

  static optional<dir_path>
  directory (const optional<dir_path>& o, const char* opt, const char* var)
  {
    optional<dir_path> r;

    if (o)
      r = *o;
    else if (optional<string> v = value (nullopt, var))
    {
      try
      {
        r = dir_path (move (*v));
      }
      catch (const invalid_path& e)
      {
        fail << "invalid " << var << " environment variable value '"
             << e.path << "'" <<
          info << "use " << opt << " to override";
      }
    }

    if (r)
    {
      try
      {
        r->complete ().normalize ();
      }
      catch (const invalid_path& e)
      {
        fail << "invalid " << opt << " directory '" << e.path << "'";
      }
    }

    return r;
  }

  build_context
  resolve_context (const context_overrides& o, package pkg)
  {
    tracer trace ("resolve_context");

    build_context r;
    r.package = move (pkg);

    // Platforms.
    //
    {
      optional<string> v (value (o.target_platform, "target_platform"));

      if (!v)
        fail << "target platform is not specified" <<
          info << "use --target-platform or set target_platform";

      r.target_platform = move (*v);
    }

    {
      optional<string> v (value (o.build_platform, "build_platform"));
      r.build_platform = v ? move (*v) : r.target_platform;
    }

    // Cross-compilation flag.
    //
    if (o.cross)
      r.cross = *o.cross;
    else
    {
      optional<string> v (getenv ("CONDA_BUILD_CROSS_COMPILATION"));
      r.cross = v && cross_flag (*v);
    }

    // Prefixes.
    //
    {
      optional<dir_path> d (directory (o.prefix, "--prefix", "PREFIX"));

      if (!d)
        fail << "target prefix is not specified" <<
          info << "use --prefix or set PREFIX";

      r.prefix = move (*d);
    }

    {
      optional<dir_path> d (
        directory (o.build_prefix, "--build-prefix", "BUILD_PREFIX"));

      if (!d)
      {
        if (r.cross)
          fail << "build prefix is not specified" <<
            info << "use --build-prefix or set BUILD_PREFIX";

        d = r.prefix;
      }

      r.build_prefix = move (*d);
    }

    if (r.cross && r.prefix == r.build_prefix)
      fail << "target prefix and build prefix must be distinct when "
           << "cross-compiling" <<
        info << "both are " << r.prefix;

    r.install_prefix = is_non_unix (r.target_platform)
      ? r.prefix / dir_path ("Library")
      : r.prefix;

    // Toolchain triple.
    //
    if (optional<string> v = value (o.toolchain_host, "CONDA_TOOLCHAIN_HOST"))
    {
      try
      {
        target_triplet tt (*v);
        l5 ([&]{trace << "toolchain " << *v << " system " << tt.system;});
      }
      catch (const invalid_argument& e)
      {
        fail << "invalid toolchain triple '" << *v << "': " << e <<
          info << "use --toolchain-host or set CONDA_TOOLCHAIN_HOST";
      }

      r.toolchain_host = move (*v);
    }
    else if (r.cross)
      fail << "toolchain triple is not specified" <<
        info << "use --toolchain-host or set CONDA_TOOLCHAIN_HOST";

    // Source directory.
    //
    {
      optional<dir_path> d (directory (o.src_dir, "--src-dir", "SRC_DIR"));
      r.src_dir = d ? move (*d) : work;

      if (r.src_dir.empty ())
      {
        try
        {
          r.src_dir = dir_path::current_directory ();
        }
        catch (const system_error& e)
        {
          fail << "invalid current working directory: " << e;
        }
      }
    }

    l4 ([&]{trace << "target " << r.target_platform << " build "
                  << r.build_platform << (r.cross ? " (cross)" : "");});

    return r;
  }
}
