#ifndef LIBHTLS_LIBHTLS_HEADER
#define LIBHTLS_LIBHTLS_HEADER

/** \file
 * \brief Sets some global macros and further includes string.hpp
 */

#include "visibility_helper.hpp"

#ifdef BUILDING_LIBHTLS
  #define HTLS_PUBLIC_SYMBOL HTLS_EXPORT_PUBLIC
  #define HTLS_PRIVATE_SYMBOL HTLS_EXPORT_PRIVATE
#elif defined(HTLS_STATIC)
  #define HTLS_PUBLIC_SYMBOL
  #define HTLS_PRIVATE_SYMBOL
#else
  #define HTLS_PUBLIC_SYMBOL HTLS_IMPORT_SHARED
  #define HTLS_PRIVATE_SYMBOL
#endif

#include <cstdint>
#include <cstddef>

/**
 * \brief The namespace used by libhtls
 *
 * All declarations in any libhtls header are in this namespace.
 */
namespace htls {

/// Version string of the library, e.g. "0.4.0"
HTLS_PUBLIC_SYMBOL char const* get_version_string();

}

#endif
