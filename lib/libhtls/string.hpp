#ifndef LIBHTLS_STRING_HEADER
#define LIBHTLS_STRING_HEADER

#include "libhtls.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <limits>
#include <type_traits>

/** \file
 * \brief String utilities for the ASCII-centric world of HTTP
 *
 * Header field names, digest directives, cookie attributes and the like are
 * all case-insensitive ASCII. None of these functions are locale-aware.
 */

namespace htls {

/// Converts ASCII uppercase characters to lowercase. Does not do Unicode normalization.
inline char tolower_ascii(char c)
{
	if (c >= 'A' && c <= 'Z') {
		return c + ('a' - 'A');
	}
	return c;
}

std::string HTLS_PUBLIC_SYMBOL str_tolower_ascii(std::string_view const& s);

/** \brief Locale-insensitive case-insensitive comparison of two strings.
 *
 * Only ASCII letters are folded.
 */
bool HTLS_PUBLIC_SYMBOL equal_insensitive_ascii(std::string_view const& a, std::string_view const& b);

bool HTLS_PUBLIC_SYMBOL starts_with(std::string_view const& s, std::string_view const& beginning);
bool HTLS_PUBLIC_SYMBOL ends_with(std::string_view const& s, std::string_view const& ending);

/// Like starts_with, but ignores the case of ASCII letters
bool HTLS_PUBLIC_SYMBOL starts_with_insensitive_ascii(std::string_view const& s, std::string_view const& beginning);

/// Like ends_with, but ignores the case of ASCII letters
bool HTLS_PUBLIC_SYMBOL ends_with_insensitive_ascii(std::string_view const& s, std::string_view const& ending);

/** \brief Return passed string with all leading and trailing characters from chars removed.
 *
 * By default, removes tabs, linefeeds, carriage returns and spaces.
 */
std::string_view HTLS_PUBLIC_SYMBOL trimmed(std::string_view s, std::string_view const& chars = " \r\n\t", bool from_left = true, bool from_right = true);

/// Remove all leading and trailing characters from chars in place
void HTLS_PUBLIC_SYMBOL trim(std::string_view & s, std::string_view const& chars = " \r\n\t", bool from_left = true, bool from_right = true);

/** \brief Tokenizes string.
 *
 * \param tokens The string to tokenize
 * \param delims the delimiters to look for
 * \param ignore_empty If true, empty tokens are omitted in the output
 *
 * The returned views point into the passed string.
 */
std::vector<std::string_view> HTLS_PUBLIC_SYMBOL strtok_view(std::string_view const& tokens, std::string_view const& delims, bool const ignore_empty = true);

/// Converts string to integral type T. If string is not convertible, errorval is returned.
template<typename T>
T to_integral(std::string_view const& s, T const errorval = T())
{
	static_assert(std::is_integral_v<T>);

	if (s.empty()) {
		return errorval;
	}

	auto it = s.cbegin();
	bool negative{};
	if (*it == '-') {
		if constexpr (!std::is_signed_v<T>) {
			return errorval;
		}
		negative = true;
		++it;
	}
	else if (*it == '+') {
		++it;
	}

	if (it == s.cend()) {
		return errorval;
	}

	T ret{};
	for (; it != s.cend(); ++it) {
		auto const c = *it;
		if (c < '0' || c > '9') {
			return errorval;
		}
		T const digit = static_cast<T>(c - '0');
		if (negative) {
			if (ret < (std::numeric_limits<T>::min() + digit) / 10) {
				return errorval;
			}
			ret = ret * 10 - digit;
		}
		else {
			if (ret > (std::numeric_limits<T>::max() - digit) / 10) {
				return errorval;
			}
			ret = ret * 10 + digit;
		}
	}

	return ret;
}

}

#endif
