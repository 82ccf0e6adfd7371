#include "libhtls/uri.hpp"
#include "libhtls/string.hpp"

#include <algorithm>
#include <tuple>

using namespace std::literals;

namespace htls {

namespace {
bool is_scheme_char(char c)
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

// RFC 3986 5.2.4
std::string remove_dot_segments(std::string_view path)
{
	std::string out;
	while (!path.empty()) {
		if (starts_with(path, "../"sv)) {
			path.remove_prefix(3);
		}
		else if (starts_with(path, "./"sv)) {
			path.remove_prefix(2);
		}
		else if (starts_with(path, "/./"sv)) {
			path.remove_prefix(2);
		}
		else if (path == "/."sv) {
			path = "/"sv;
		}
		else if (starts_with(path, "/../"sv) || path == "/.."sv) {
			if (path.size() == 3) {
				path = "/"sv;
			}
			else {
				path.remove_prefix(3);
			}
			auto pos = out.rfind('/');
			if (pos == std::string::npos) {
				out.clear();
			}
			else {
				out.erase(pos);
			}
		}
		else if (path == "."sv || path == ".."sv) {
			path = std::string_view();
		}
		else {
			size_t pos = path.find('/', 1);
			if (pos == std::string_view::npos) {
				pos = path.size();
			}
			out += path.substr(0, pos);
			path.remove_prefix(pos);
		}
	}
	return out;
}
}

uri::uri(std::string_view const& in)
{
	if (!parse(in)) {
		clear();
	}
}

void uri::clear()
{
	*this = uri();
}

bool uri::parse(std::string_view in)
{
	clear();

	// Fragment is client-side only
	auto pos = in.find('#');
	if (pos != std::string_view::npos) {
		in = in.substr(0, pos);
	}

	pos = in.find('?');
	if (pos != std::string_view::npos) {
		query_ = std::string(in.substr(pos + 1));
		in = in.substr(0, pos);
	}

	// Scheme
	pos = in.find_first_of(":/"sv);
	if (pos != std::string_view::npos && in[pos] == ':') {
		auto const scheme = in.substr(0, pos);
		if (scheme.empty() || !((scheme[0] >= 'a' && scheme[0] <= 'z') || (scheme[0] >= 'A' && scheme[0] <= 'Z'))) {
			clear();
			return false;
		}
		if (!std::all_of(scheme.cbegin(), scheme.cend(), is_scheme_char)) {
			clear();
			return false;
		}
		scheme_ = str_tolower_ascii(scheme);
		in = in.substr(pos + 1);
	}

	// Authority
	if (starts_with(in, "//"sv)) {
		in = in.substr(2);
		pos = in.find('/');
		auto const authority = in.substr(0, pos);
		if (!parse_authority(authority)) {
			clear();
			return false;
		}
		in = (pos == std::string_view::npos) ? std::string_view() : in.substr(pos);
	}

	path_ = std::string(in);

	if (!host_.empty() && !path_.empty() && path_[0] != '/') {
		clear();
		return false;
	}

	return true;
}

bool uri::parse_authority(std::string_view authority)
{
	if (authority.find('@') != std::string_view::npos) {
		// No credentials in URIs
		return false;
	}

	std::string_view port;
	if (!authority.empty() && authority[0] == '[') {
		// IPv6 literal
		auto const end = authority.find(']');
		if (end == std::string_view::npos) {
			return false;
		}
		host_ = std::string(authority.substr(0, end + 1));
		auto const rest = authority.substr(end + 1);
		if (!rest.empty()) {
			if (rest[0] != ':') {
				return false;
			}
			port = rest.substr(1);
		}
	}
	else {
		auto const colon = authority.rfind(':');
		if (colon != std::string_view::npos) {
			port = authority.substr(colon + 1);
			authority = authority.substr(0, colon);
		}
		host_ = std::string(authority);
	}

	if (host_.empty()) {
		return false;
	}

	if (!port.empty()) {
		int const p = to_integral<int>(port, -1);
		if (p <= 0 || p > 65535) {
			return false;
		}
		port_ = static_cast<unsigned short>(p);
	}

	return true;
}

std::string uri::to_string() const
{
	std::string ret;
	if (!scheme_.empty()) {
		ret += scheme_ + ":";
	}
	if (!host_.empty()) {
		ret += "//" + get_authority();
	}
	ret += get_request();

	return ret;
}

std::string uri::get_request(bool with_query) const
{
	std::string ret = path_;
	if (with_query && !query_.empty()) {
		ret += "?";
		ret += query_;
	}

	return ret;
}

std::string uri::get_authority() const
{
	std::string ret = host_;
	if (port_) {
		ret += ':';
		ret += std::to_string(port_);
	}
	return ret;
}

unsigned short uri::effective_port() const
{
	if (port_) {
		return port_;
	}
	return is_secure() ? 443 : 80;
}

bool uri::is_secure() const
{
	return scheme_ == "https";
}

bool uri::empty() const
{
	return host_.empty() && path_.empty();
}

bool uri::resolve(uri const& base)
{
	if (!scheme_.empty()) {
		path_ = remove_dot_segments(path_);
		return true;
	}

	if (base.scheme_.empty() || base.host_.empty()) {
		return false;
	}

	scheme_ = base.scheme_;
	if (!host_.empty()) {
		path_ = remove_dot_segments(path_);
		return true;
	}

	host_ = base.host_;
	port_ = base.port_;

	if (path_.empty()) {
		path_ = base.path_;
		if (query_.empty()) {
			query_ = base.query_;
		}
	}
	else if (path_[0] == '/') {
		path_ = remove_dot_segments(path_);
	}
	else {
		std::string merged;
		auto const slash = base.path_.rfind('/');
		if (slash == std::string::npos) {
			merged = "/" + path_;
		}
		else {
			merged = base.path_.substr(0, slash + 1) + path_;
		}
		path_ = remove_dot_segments(merged);
	}

	return true;
}

bool uri::operator==(uri const& arg) const
{
	return std::tie(scheme_, host_, port_, path_, query_) == std::tie(arg.scheme_, arg.host_, arg.port_, arg.path_, arg.query_);
}

}
