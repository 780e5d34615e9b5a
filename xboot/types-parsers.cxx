// file      : xboot/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <xboot/types-parsers.hxx>

#include <xboot/xboot-options.hxx> // xboot::cli namespace

namespace xboot
{
  namespace cli
  {
    void parser<dir_path>::
    parse (dir_path& x, bool& xs, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      const char* v (s.next ());

      try
      {
        x = dir_path (v);

        if (x.empty ())
          throw invalid_value (o, v);

        dir_path (x).normalize (); // Throws for things like `/..`.
      }
      catch (const invalid_path&)
      {
        throw invalid_value (o, v);
      }

      xs = true;
    }
  }
}
