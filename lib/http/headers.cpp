#include "../libhtls/http/headers.hpp"
#include "../libhtls/uri.hpp"

#include <algorithm>

using namespace std::literals;

namespace htls::http {

headers::const_iterator headers::find(std::string_view const& name) const
{
	return std::find_if(fields_.cbegin(), fields_.cend(), [&name](value_type const& field) {
		return equal_insensitive_ascii(field.first, name);
	});
}

std::optional<std::string> headers::get(std::string_view const& name) const
{
	auto it = find(name);
	if (it == end()) {
		return {};
	}
	return it->second;
}

std::vector<std::string> headers::get_all(std::string_view const& name) const
{
	std::vector<std::string> ret;
	for (auto const& field : fields_) {
		if (equal_insensitive_ascii(field.first, name)) {
			ret.push_back(field.second);
		}
	}
	return ret;
}

size_t headers::count(std::string_view const& name) const
{
	return static_cast<size_t>(std::count_if(fields_.cbegin(), fields_.cend(), [&name](value_type const& field) {
		return equal_insensitive_ascii(field.first, name);
	}));
}

void headers::add(std::string name, std::string value)
{
	fields_.emplace_back(std::move(name), std::move(value));
}

void headers::prepend(std::string name, std::string value)
{
	fields_.emplace(fields_.begin(), std::move(name), std::move(value));
}

void headers::set(std::string const& name, std::string value)
{
	auto it = std::find_if(fields_.begin(), fields_.end(), [&name](value_type const& field) {
		return equal_insensitive_ascii(field.first, name);
	});
	if (it == fields_.end()) {
		fields_.emplace_back(name, std::move(value));
		return;
	}

	it->second = std::move(value);
	fields_.erase(std::remove_if(it + 1, fields_.end(), [&name](value_type const& field) {
		return equal_insensitive_ascii(field.first, name);
	}), fields_.end());
}

size_t headers::erase(std::string_view const& name)
{
	size_t const old = fields_.size();
	fields_.erase(std::remove_if(fields_.begin(), fields_.end(), [&name](value_type const& field) {
		return equal_insensitive_ascii(field.first, name);
	}), fields_.end());
	return old - fields_.size();
}

with_headers::~with_headers()
{
}

std::optional<uint64_t> with_headers::get_content_length() const
{
	auto it = headers_.find("Content-Length"sv);
	if (it == headers_.end()) {
		return {};
	}

	auto const v = trimmed(it->second);
	if (v.empty() || v.find_first_not_of("0123456789"sv) != std::string_view::npos) {
		return {};
	}
	uint64_t const length = to_integral<uint64_t>(v, uint64_t(-1));
	if (length == uint64_t(-1)) {
		return {};
	}
	return length;
}

void with_headers::set_content_length(uint64_t l)
{
	headers_.set("Content-Length"s, std::to_string(l));
	headers_.erase("Transfer-Encoding"sv);
}

bool with_headers::chunked_encoding() const
{
	auto it = headers_.find("Transfer-Encoding"sv);
	if (it == headers_.end()) {
		return false;
	}
	return equal_insensitive_ascii(it->second, "chunked"sv);
}

void with_headers::set_content_type(std::string content_type)
{
	if (content_type.empty()) {
		headers_.erase("Content-Type"sv);
	}
	else {
		headers_.set("Content-Type"s, std::move(content_type));
	}
}

std::string with_headers::get_header(std::string_view const& key) const
{
	auto it = headers_.find(key);
	if (it != headers_.end()) {
		return it->second;
	}
	return std::string();
}

bool with_headers::has_header(std::string_view const& key) const
{
	return headers_.find(key) != headers_.end();
}

std::string get_canonical_host(uri const& u)
{
	if (u.port_ == 0) {
		return u.host_;
	}
	else if (u.port_ == 443 && equal_insensitive_ascii(u.scheme_, "https"sv)) {
		return u.host_;
	}
	else if (u.port_ == 80 && equal_insensitive_ascii(u.scheme_, "http"sv)) {
		return u.host_;
	}

	return u.host_ + ":" + std::to_string(u.port_);
}

}
