#ifndef LIBHTLS_HASH_HEADER
#define LIBHTLS_HASH_HEADER

/** \file
 * \brief Cryptographic hash functions used by HTTP authentication
 */

#include "libhtls.hpp"

#include <string_view>
#include <vector>

namespace htls {

/** \brief Standard MD5
 *
 * Insecure, avoid using this. HTTP digest authentication without
 * an algorithm directive mandates it.
 *
 * Returns the raw 16 byte digest.
 */
std::vector<uint8_t> HTLS_PUBLIC_SYMBOL md5(std::string_view const& data);

}

#endif
