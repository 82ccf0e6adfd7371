#ifndef LIBHTLS_ENCODE_HEADER
#define LIBHTLS_ENCODE_HEADER

#include "libhtls.hpp"

#include <string>

/** \file
 * \brief Hex encoding of digests
 */

namespace htls {

/** \brief Converts an integer to the corresponding lowercase hex digit
*
* Example: 9 becomes '9', 11 becomes 'b'
*
* Undefined output if input is less than 0 or larger than 15
*/
template<typename Char = char, bool Lowercase = true>
Char int_to_hex_char(int d)
{
	if (d > 9) {
		return static_cast<Char>((Lowercase ? 'a' : 'A') + d - 10);
	}
	else {
		return static_cast<Char>('0' + d);
	}
}

/// Hex-encodes the input. Lowercase digits are used unless \c Lowercase is false.
template<typename OutString, bool Lowercase = true, typename InString>
OutString hex_encode(InString const& data)
{
	static_assert(sizeof(typename InString::value_type) == 1, "Input must be a container of 8 bit values");
	OutString ret;
	ret.reserve(data.size() * 2);
	for (auto const& c : data) {
		ret.push_back(int_to_hex_char<typename OutString::value_type, Lowercase>(static_cast<unsigned char>(c) >> 4));
		ret.push_back(int_to_hex_char<typename OutString::value_type, Lowercase>(static_cast<unsigned char>(c) & 0xf));
	}

	return ret;
}

}

#endif
