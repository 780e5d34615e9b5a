// file      : xboot/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef XBOOT_TYPES_PARSERS_HXX
#define XBOOT_TYPES_PARSERS_HXX

#include <libxboot/types.hxx>

namespace xboot
{
  namespace cli
  {
    class scanner;

    template <typename T>
    struct parser;

    // Directory options (--src-dir, --prefix, etc). An empty or invalid
    // directory is diagnosed as an invalid option value.
    //
    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };
  }
}

#endif // XBOOT_TYPES_PARSERS_HXX
