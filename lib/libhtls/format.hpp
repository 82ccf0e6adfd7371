#ifndef LIBHTLS_FORMAT_HEADER
#define LIBHTLS_FORMAT_HEADER

#include "string.hpp"

#include <cstdio>
#include <string>
#include <string_view>
#include <type_traits>

/** \file
 * \brief Header for the \ref htls::sprintf "sprintf" string formatting function
 */

namespace htls {

/// \private
namespace detail {

struct field final {
	size_t width{};
	bool left_align{};
	bool pad_zero{};
	char type{};
};

template<typename T>
std::string integral_to_string(T arg, bool hex, bool upper)
{
	using U = std::make_unsigned_t<T>;

	bool negative{};
	U v;
	if constexpr (std::is_signed_v<T>) {
		if (arg < 0) {
			negative = true;
			v = static_cast<U>(0) - static_cast<U>(arg);
		}
		else {
			v = static_cast<U>(arg);
		}
	}
	else {
		v = arg;
	}

	char buf[sizeof(T) * 3 + 2];
	char* const end = buf + sizeof(buf);
	char* p = end;

	unsigned const base = hex ? 16 : 10;
	char const* digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
	do {
		*(--p) = digits[v % base];
		v /= base;
	} while (v);

	if (negative) {
		*(--p) = '-';
	}

	return std::string(p, end);
}

template<typename Arg>
std::string format_arg(field const& f, Arg && arg)
{
	using T = std::decay_t<Arg>;

	std::string ret;
	if constexpr (std::is_same_v<T, bool>) {
		ret = arg ? "true" : "false";
	}
	else if constexpr (std::is_same_v<T, char>) {
		if (f.type == 'c' || f.type == 's') {
			ret = std::string(1, arg);
		}
		else {
			ret = integral_to_string(static_cast<int>(arg), f.type == 'x' || f.type == 'X', f.type == 'X');
		}
	}
	else if constexpr (std::is_enum_v<T>) {
		ret = integral_to_string(static_cast<std::underlying_type_t<T>>(arg), f.type == 'x' || f.type == 'X', f.type == 'X');
	}
	else if constexpr (std::is_integral_v<T>) {
		if (f.type == 'c') {
			ret = std::string(1, static_cast<char>(arg));
		}
		else {
			ret = integral_to_string(arg, f.type == 'x' || f.type == 'X', f.type == 'X');
		}
	}
	else if constexpr (std::is_floating_point_v<T>) {
		char buf[64];
		int const len = std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(arg));
		if (len > 0) {
			ret.assign(buf, static_cast<size_t>(len) < sizeof(buf) ? static_cast<size_t>(len) : sizeof(buf) - 1);
		}
	}
	else if constexpr (std::is_pointer_v<T> && !std::is_convertible_v<T, char const*>) {
		ret = "0x" + integral_to_string(reinterpret_cast<uintptr_t>(arg), true, false);
	}
	else if constexpr (std::is_constructible_v<std::string_view, T const&>) {
		if constexpr (std::is_pointer_v<T>) {
			if (!arg) {
				return ret;
			}
		}
		ret = std::string(std::string_view(arg));
	}
	else {
		static_assert(std::is_constructible_v<std::string_view, T const&>, "Argument type not supported by htls::sprintf");
	}

	if (ret.size() < f.width) {
		if (f.left_align) {
			ret.append(f.width - ret.size(), ' ');
		}
		else if (f.pad_zero && f.type != 's') {
			size_t const offset = (!ret.empty() && ret[0] == '-') ? 1 : 0;
			ret.insert(offset, f.width - ret.size(), '0');
		}
		else {
			ret.insert(0, f.width - ret.size(), ' ');
		}
	}
	return ret;
}

inline std::string extract_arg(field const&, size_t)
{
	return std::string();
}

template<typename First, typename... Args>
std::string extract_arg(field const& f, size_t index, First && first, Args &&... args)
{
	if (!index) {
		return format_arg(f, std::forward<First>(first));
	}
	return extract_arg(f, index - 1, std::forward<Args>(args)...);
}

// Parses the field starting after the % sign. Returns false on malformed field.
HTLS_PUBLIC_SYMBOL bool parse_field(std::string_view const& fmt, size_t & pos, field & f);
}

/** \brief A simple type-safe sprintf replacement
 *
 * Only partially implements the format specifiers for the printf family of C functions:
 *
 * \li Positional arguments are not supported.
 * \li Length modifiers are ignored, the type is deduced from the argument.
 * \li The flags '-' and '0' as well as a field width are supported.
 * \li Supported conversion specifiers are s, d, i, u, x, X, c and %.
 *
 * Excess arguments are ignored. Missing arguments format as empty strings.
 */
template<typename... Args>
std::string sprintf(std::string_view const& fmt, Args &&... args)
{
	std::string ret;

	size_t arg_n{};
	size_t start{};
	size_t pos{};
	while ((pos = fmt.find('%', start)) != std::string_view::npos) {
		ret += fmt.substr(start, pos - start);
		++pos;

		detail::field f;
		if (!detail::parse_field(fmt, pos, f)) {
			start = pos;
			continue;
		}
		start = pos;

		if (f.type == '%') {
			ret += '%';
		}
		else {
			ret += detail::extract_arg(f, arg_n++, std::forward<Args>(args)...);
		}
	}
	ret += fmt.substr(start);

	return ret;
}

}

#endif
