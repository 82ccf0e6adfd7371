#include "libhtls/format.hpp"

namespace htls::detail {

bool parse_field(std::string_view const& fmt, size_t & pos, field & f)
{
	if (pos >= fmt.size()) {
		return false;
	}

	// Flags
	for (; pos < fmt.size(); ++pos) {
		if (fmt[pos] == '-') {
			f.left_align = true;
		}
		else if (fmt[pos] == '0') {
			f.pad_zero = true;
		}
		else {
			break;
		}
	}

	// Field width
	while (pos < fmt.size() && fmt[pos] >= '0' && fmt[pos] <= '9') {
		f.width *= 10;
		f.width += fmt[pos] - '0';
		++pos;
	}

	// Length modifiers are ignored
	while (pos < fmt.size() && (fmt[pos] == 'l' || fmt[pos] == 'h' || fmt[pos] == 'z' || fmt[pos] == 'j' || fmt[pos] == 't' || fmt[pos] == 'L')) {
		++pos;
	}

	if (pos >= fmt.size()) {
		return false;
	}

	char const c = fmt[pos++];
	switch (c) {
	case '%':
	case 's':
	case 'd':
	case 'i':
	case 'u':
	case 'x':
	case 'X':
	case 'c':
		f.type = c;
		return true;
	default:
		return false;
	}
}

}
