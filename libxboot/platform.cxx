// file      : libxboot/platform.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libxboot/platform.hxx>

using namespace std;

namespace xboot
{
  bool
  is_macos (const string& p)
  {
    return p.compare (0, 4, "osx-") == 0;
  }

  bool
  is_linux (const string& p)
  {
    return p.compare (0, 6, "linux-") == 0;
  }

  bool
  is_non_unix (const string& p)
  {
    return !is_linux (p) && !is_macos (p);
  }

  bool
  cross_flag (const string& v)
  {
    return v == "1";
  }

  string
  target_compiler (const string& p, const string& tp)
  {
    if (!tp.empty ())
    {
      return tp.find ("apple-darwin") != string::npos
        ? tp + "-clang"
        : tp + "-gcc";
    }

    return is_macos (p) ? "clang" : "gcc";
  }
}
