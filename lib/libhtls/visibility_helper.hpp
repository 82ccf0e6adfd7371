#ifndef LIBHTLS_VISIBILITY_HELPER_HEADER
#define LIBHTLS_VISIBILITY_HELPER_HEADER

/** \file
 * \brief Helper macros for symbol visibility in shared libraries
 *
 * There are two main cases: Building a library and using it.
 * For building, symbols need to be marked as export, for using it they
 * need to be imported.
 */

#ifdef _WIN32
  #define HTLS_EXPORT_PUBLIC __declspec(dllexport)
  #define HTLS_EXPORT_PRIVATE
  #define HTLS_IMPORT_SHARED __declspec(dllimport)
#else
  #define HTLS_EXPORT_PUBLIC __attribute__((visibility("default")))
  #define HTLS_EXPORT_PRIVATE __attribute__((visibility("hidden")))
  #define HTLS_IMPORT_SHARED
#endif

#endif
