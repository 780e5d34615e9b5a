// file      : libxboot/export.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBXBOOT_EXPORT_HXX
#define LIBXBOOT_EXPORT_HXX

// The library type is signaled by the build (see CMakeLists.txt). Only
// non-inline functions and variables are exported; on POSIX visibility is
// left at default.

#if defined(LIBXBOOT_STATIC)         // Using static.
#  define LIBXBOOT_SYMEXPORT
#elif defined(LIBXBOOT_STATIC_BUILD) // Building static.
#  define LIBXBOOT_SYMEXPORT
#elif defined(LIBXBOOT_SHARED)       // Using shared.
#  ifdef _WIN32
#    define LIBXBOOT_SYMEXPORT __declspec(dllimport)
#  else
#    define LIBXBOOT_SYMEXPORT
#  endif
#elif defined(LIBXBOOT_SHARED_BUILD) // Building shared.
#  ifdef _WIN32
#    define LIBXBOOT_SYMEXPORT __declspec(dllexport)
#  else
#    define LIBXBOOT_SYMEXPORT
#  endif
#else
#  define LIBXBOOT_SYMEXPORT         // Unspecified, assume static.
#endif

#endif // LIBXBOOT_EXPORT_HXX
