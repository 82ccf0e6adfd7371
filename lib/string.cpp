#include "libhtls/string.hpp"

static_assert('a' + 25 == 'z', "We only support systems running with an ASCII-based character set. Sorry, no EBCDIC.");

// char may be unsigned, yielding stange results if subtracting characters. To work around it, expect a particular order of characters.
static_assert('A' < 'a', "We only support systems running with an ASCII-based character set. Sorry, no EBCDIC.");

namespace htls {

std::string str_tolower_ascii(std::string_view const& s)
{
	std::string ret;
	ret.resize(s.size());
	for (size_t i = 0; i < s.size(); ++i) {
		ret[i] = tolower_ascii(s[i]);
	}
	return ret;
}

bool equal_insensitive_ascii(std::string_view const& a, std::string_view const& b)
{
	if (a.size() != b.size()) {
		return false;
	}
	for (size_t i = 0; i < a.size(); ++i) {
		if (tolower_ascii(a[i]) != tolower_ascii(b[i])) {
			return false;
		}
	}
	return true;
}

bool starts_with(std::string_view const& s, std::string_view const& beginning)
{
	return s.size() >= beginning.size() && s.substr(0, beginning.size()) == beginning;
}

bool ends_with(std::string_view const& s, std::string_view const& ending)
{
	return s.size() >= ending.size() && s.substr(s.size() - ending.size()) == ending;
}

bool starts_with_insensitive_ascii(std::string_view const& s, std::string_view const& beginning)
{
	return s.size() >= beginning.size() && equal_insensitive_ascii(s.substr(0, beginning.size()), beginning);
}

bool ends_with_insensitive_ascii(std::string_view const& s, std::string_view const& ending)
{
	return s.size() >= ending.size() && equal_insensitive_ascii(s.substr(s.size() - ending.size()), ending);
}

std::string_view trimmed(std::string_view s, std::string_view const& chars, bool from_left, bool from_right)
{
	trim(s, chars, from_left, from_right);
	return s;
}

void trim(std::string_view & s, std::string_view const& chars, bool from_left, bool from_right)
{
	size_t const first = from_left ? s.find_first_not_of(chars) : 0;
	if (first == std::string_view::npos) {
		s = std::string_view();
		return;
	}

	size_t const last = from_right ? s.find_last_not_of(chars) : s.size() - 1;
	if (last == std::string_view::npos) {
		s = std::string_view();
		return;
	}

	s = s.substr(first, last - first + 1);
}

std::vector<std::string_view> strtok_view(std::string_view const& tokens, std::string_view const& delims, bool const ignore_empty)
{
	std::vector<std::string_view> ret;

	size_t start{};
	while (start <= tokens.size()) {
		size_t pos = tokens.find_first_of(delims, start);
		if (pos == std::string_view::npos) {
			pos = tokens.size();
		}
		if (pos != start || !ignore_empty) {
			ret.push_back(tokens.substr(start, pos - start));
		}
		start = pos + 1;
	}

	return ret;
}

}
