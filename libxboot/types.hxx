// file      : libxboot/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_TYPES_HXX
#define LIBXBOOT_TYPES_HXX

#include <map>
#include <vector>
#include <string>
#include <utility>          // pair, move()
#include <cstddef>          // size_t
#include <cstdint>          // uint16_t
#include <ostream>
#include <functional>       // function

#include <ios>           // ios_base::failure
#include <exception>     // exception
#include <stdexcept>     // invalid_argument
#include <system_error>

#include <libbutl/path.hxx>
#include <libbutl/sha256.hxx>
#include <libbutl/process.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/optional.hxx>
#include <libbutl/target-triplet.hxx>

#include <libxboot/export.hxx>

namespace xboot
{
  // Commonly-used types.
  //
  using std::uint16_t;
  using std::size_t;

  using std::pair;
  using std::string;
  using std::function;

  using strings = std::vector<string>;
  using cstrings = std::vector<const char*>;

  using std::map;
  using std::vector;

  using std::ostream;
  using std::endl;

  // Exceptions.
  //
  // While <exception> is included, there is no using for std::exception --
  // use qualified.
  //
  using std::invalid_argument;
  using std::system_error;
  using io_error = std::ios_base::failure;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;

  // <libbutl/path.hxx>
  //
  using butl::path;
  using butl::dir_path;
  using butl::path_cast;
  using butl::basic_path;
  using butl::invalid_path;

  using paths = std::vector<path>;
  using dir_paths = std::vector<dir_path>;

  // Path printing potentially relative with trailing slash for directories.
  //
  LIBXBOOT_SYMEXPORT ostream&
  operator<< (ostream&, const path&); // utility.cxx

  inline ostream&
  operator<< (ostream& os, const dir_path& d) // For overload resolution.
  {
    return xboot::operator<< (os, static_cast<const path&> (d));
  }

  // <libbutl/sha256.hxx>
  //
  using butl::sha256;

  // <libbutl/process.hxx>
  //
  using butl::process;
  using butl::process_env;
  using butl::process_exit;
  using butl::process_path;
  using butl::process_error;

  LIBXBOOT_SYMEXPORT ostream&
  operator<< (ostream&, const process_path&); // utility.cxx

  // <libbutl/fdstream.hxx>
  //
  using butl::ifdstream;
  using butl::ofdstream;
  using butl::fdstream_mode;

  // <libbutl/target-triplet.hxx>
  //
  using butl::target_triplet;
}

#endif // LIBXBOOT_TYPES_HXX
