#include "libhtls/tls_settings.hpp"
#include "libhtls/string.hpp"
#include "libhtls/uri.hpp"

#include <cstdlib>

using namespace std::literals;

namespace htls {

std::optional<proxy_settings> parse_proxy(std::string_view const& value)
{
	auto const trimmed_value = trimmed(value);
	if (trimmed_value.empty()) {
		return {};
	}

	std::string s(trimmed_value);
	if (s.find("://"sv) == std::string::npos) {
		s = "http://" + s;
	}

	uri u;
	if (!u.parse(s) || u.host_.empty() || u.scheme_ != "http"sv) {
		return {};
	}

	proxy_settings ret;
	ret.host_ = u.host_;
	ret.port_ = u.port_ ? u.port_ : 80;
	return ret;
}

bool is_proxy_exempt(std::string_view const& no_proxy, std::string_view const& target_host)
{
	if (target_host.empty()) {
		return false;
	}

	for (auto entry : strtok_view(no_proxy, ","sv)) {
		trim(entry);
		if (entry.empty()) {
			continue;
		}
		if (entry == "*"sv) {
			return true;
		}
		if (entry[0] == '.') {
			entry.remove_prefix(1);
		}
		if (equal_insensitive_ascii(entry, target_host)) {
			return true;
		}
		if (target_host.size() > entry.size() && target_host[target_host.size() - entry.size() - 1] == '.' && ends_with_insensitive_ascii(target_host, entry)) {
			return true;
		}
	}

	return false;
}

namespace {
std::string_view get_env(char const* name)
{
	char const* v = getenv(name);
	return v ? std::string_view(v) : std::string_view();
}
}

std::optional<proxy_settings> proxy_from_environment(bool secure, std::string_view const& target_host)
{
	std::string_view value;
	if (secure) {
		value = get_env("https_proxy");
		if (value.empty()) {
			value = get_env("HTTPS_PROXY");
		}
	}
	else {
		value = get_env("http_proxy");
	}

	if (value.empty()) {
		return {};
	}

	auto no_proxy = get_env("no_proxy");
	if (no_proxy.empty()) {
		no_proxy = get_env("NO_PROXY");
	}
	if (is_proxy_exempt(no_proxy, target_host)) {
		return {};
	}

	return parse_proxy(value);
}

}
