#include "../libhtls/http/cookie_jar.hpp"
#include "../libhtls/string.hpp"
#include "../libhtls/uri.hpp"

#include <algorithm>
#include <limits>

using namespace std::literals;

namespace htls::http {

namespace {
bool is_ip_literal(std::string_view const& host)
{
	if (!host.empty() && host[0] == '[') {
		return true;
	}
	return !host.empty() && host.find_first_not_of("0123456789."sv) == std::string_view::npos;
}

std::string default_path(std::string_view const& request_path)
{
	if (request_path.empty() || request_path[0] != '/') {
		return "/";
	}
	auto const pos = request_path.rfind('/');
	if (!pos) {
		return "/";
	}
	return std::string(request_path.substr(0, pos));
}

bool parse_max_age(std::string_view const& v, int64_t & seconds)
{
	if (v.empty()) {
		return false;
	}
	bool const negative = v[0] == '-';
	size_t const start = negative ? 1 : 0;
	if (start == v.size() || v.find_first_not_of("0123456789"sv, start) != std::string_view::npos) {
		return false;
	}

	// Saturate on overflow
	int64_t const saturated = negative ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
	seconds = to_integral<int64_t>(v, saturated);
	return true;
}

int64_t seconds_since_epoch(cookie_jar::time_point const& t)
{
	return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

// Largest and smallest whole seconds representable by the clock
int64_t const max_seconds = seconds_since_epoch(cookie_jar::time_point::max());
int64_t const min_seconds = seconds_since_epoch(cookie_jar::time_point::min());

cookie_jar::time_point to_time_point(int64_t seconds)
{
	if (seconds >= max_seconds) {
		return cookie_jar::time_point::max();
	}
	if (seconds <= min_seconds) {
		return cookie_jar::time_point::min();
	}
	return cookie_jar::time_point(std::chrono::seconds(seconds));
}

cookie_jar::time_point expiry_from_max_age(cookie_jar::time_point const& now, int64_t max_age)
{
	int64_t const now_seconds = seconds_since_epoch(now);
	if (max_age >= max_seconds - now_seconds - 1) {
		return cookie_jar::time_point::max();
	}
	return now + std::chrono::seconds(max_age);
}

bool is_date_delimiter(unsigned char c)
{
	return c == 0x09 || (c >= 0x20 && c <= 0x2f) || (c >= 0x3b && c <= 0x40) || (c >= 0x5b && c <= 0x60) || (c >= 0x7b && c <= 0x7e);
}

// Reads between min and max leading digits. Returns the number of digits read, 0 if
// there are too few or too many.
size_t leading_digits(std::string_view const& token, size_t min, size_t max, int & value)
{
	value = 0;
	size_t n = 0;
	while (n < token.size() && n <= max && token[n] >= '0' && token[n] <= '9') {
		value = value * 10 + (token[n] - '0');
		++n;
	}
	if (n < min || n > max) {
		return 0;
	}
	return n;
}

bool parse_time_token(std::string_view const& token, int & hour, int & minute, int & second)
{
	int* const fields[] = {&hour, &minute, &second};

	size_t pos = 0;
	for (size_t i = 0; i < 3; ++i) {
		size_t const n = leading_digits(token.substr(pos), 1, 2, *fields[i]);
		if (!n) {
			return false;
		}
		pos += n;
		if (i < 2) {
			if (pos >= token.size() || token[pos] != ':') {
				return false;
			}
			++pos;
		}
	}
	return true;
}

int parse_month_token(std::string_view const& token)
{
	static std::string_view const months[] = {"jan"sv, "feb"sv, "mar"sv, "apr"sv, "may"sv, "jun"sv, "jul"sv, "aug"sv, "sep"sv, "oct"sv, "nov"sv, "dec"sv};
	if (token.size() < 3) {
		return 0;
	}
	for (int i = 0; i < 12; ++i) {
		if (equal_insensitive_ascii(token.substr(0, 3), months[i])) {
			return i + 1;
		}
	}
	return 0;
}

bool is_leap_year(int year)
{
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month)
{
	static int const days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month == 2 && is_leap_year(year)) {
		return 29;
	}
	return days[month - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar
int64_t days_from_civil(int64_t year, int month, int day)
{
	year -= month <= 2;
	int64_t const era = (year >= 0 ? year : year - 399) / 400;
	int64_t const yoe = year - era * 400;
	int64_t const doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
	int64_t const doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}
}

std::optional<int64_t> parse_cookie_date(std::string_view const& in)
{
	// RFC 6265 section 5.1.1
	bool found_time{};
	bool found_day{};
	bool found_month{};
	bool found_year{};
	int hour{};
	int minute{};
	int second{};
	int day{};
	int month{};
	int year{};

	size_t pos = 0;
	while (pos < in.size()) {
		while (pos < in.size() && is_date_delimiter(static_cast<unsigned char>(in[pos]))) {
			++pos;
		}
		size_t end = pos;
		while (end < in.size() && !is_date_delimiter(static_cast<unsigned char>(in[end]))) {
			++end;
		}
		std::string_view const token = in.substr(pos, end - pos);
		pos = end;
		if (token.empty()) {
			continue;
		}

		int value{};
		if (!found_time && parse_time_token(token, hour, minute, second)) {
			found_time = true;
		}
		else if (!found_day && leading_digits(token, 1, 2, value)) {
			day = value;
			found_day = true;
		}
		else if (!found_month && (value = parse_month_token(token))) {
			month = value;
			found_month = true;
		}
		else if (!found_year && leading_digits(token, 2, 4, value)) {
			year = value;
			found_year = true;
		}
	}

	if (!found_time || !found_day || !found_month || !found_year) {
		return {};
	}

	if (year >= 70 && year <= 99) {
		year += 1900;
	}
	else if (year >= 0 && year <= 69) {
		year += 2000;
	}

	if (year < 1601 || day < 1 || day > days_in_month(year, month) || hour > 23 || minute > 59 || second > 59) {
		return {};
	}

	return days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
}

bool cookie::operator==(cookie const& op) const
{
	return name_ == op.name_ && value_ == op.value_ && domain_ == op.domain_ && path_ == op.path_ &&
		host_only_ == op.host_only_ && secure_ == op.secure_ && http_only_ == op.http_only_ &&
		expires_ == op.expires_;
}

bool domain_match(std::string_view const& host, std::string_view const& domain)
{
	if (host == domain) {
		return true;
	}
	if (domain.empty() || is_ip_literal(host)) {
		return false;
	}
	return host.size() > domain.size() && ends_with(host, domain) && host[host.size() - domain.size() - 1] == '.';
}

bool path_match(std::string_view const& request_path, std::string_view const& cookie_path)
{
	if (request_path == cookie_path) {
		return true;
	}
	if (!starts_with(request_path, cookie_path)) {
		return false;
	}
	if (!cookie_path.empty() && cookie_path.back() == '/') {
		return true;
	}
	return request_path.size() > cookie_path.size() && request_path[cookie_path.size()] == '/';
}

void cookie_jar::update(uri const& u, std::vector<std::string> const& set_cookie_values, time_point const& now)
{
	for (auto const& value : set_cookie_values) {
		update(u, value, now);
	}
	purge(now);
}

bool cookie_jar::update(uri const& u, std::string_view const& set_cookie_value, time_point const& now)
{
	std::string const host = str_tolower_ascii(u.host_);
	if (host.empty()) {
		return false;
	}

	auto const parts = strtok_view(set_cookie_value, ";"sv);
	if (parts.empty()) {
		return false;
	}

	auto const name_value = parts.front();
	auto const eq = name_value.find('=');
	if (eq == std::string_view::npos) {
		return false;
	}

	cookie c;
	c.name_ = std::string(trimmed(name_value.substr(0, eq), " \t"sv));
	c.value_ = std::string(trimmed(name_value.substr(eq + 1), " \t"sv));
	if (c.name_.empty()) {
		return false;
	}

	std::optional<int64_t> max_age;
	std::optional<int64_t> expires;
	std::string domain;
	std::string path;
	for (size_t i = 1; i < parts.size(); ++i) {
		auto const attribute = trimmed(parts[i], " \t"sv);
		auto const pos = attribute.find('=');
		auto const key = trimmed(attribute.substr(0, pos), " \t"sv);
		auto const value = (pos == std::string_view::npos) ? std::string_view() : trimmed(attribute.substr(pos + 1), " \t"sv);

		if (equal_insensitive_ascii(key, "domain"sv)) {
			domain = str_tolower_ascii(value);
			if (!domain.empty() && domain[0] == '.') {
				domain = domain.substr(1);
			}
		}
		else if (equal_insensitive_ascii(key, "path"sv)) {
			path = std::string(value);
		}
		else if (equal_insensitive_ascii(key, "max-age"sv)) {
			int64_t seconds{};
			if (parse_max_age(value, seconds)) {
				max_age = seconds;
			}
		}
		else if (equal_insensitive_ascii(key, "expires"sv)) {
			auto const date = parse_cookie_date(value);
			if (date) {
				expires = date;
			}
		}
		else if (equal_insensitive_ascii(key, "secure"sv)) {
			c.secure_ = true;
		}
		else if (equal_insensitive_ascii(key, "httponly"sv)) {
			c.http_only_ = true;
		}
	}

	if (domain.empty()) {
		c.domain_ = host;
		c.host_only_ = true;
	}
	else {
		if (!domain_match(host, domain)) {
			return false;
		}
		c.domain_ = domain;
	}

	if (path.empty() || path[0] != '/') {
		c.path_ = default_path(u.path_);
	}
	else {
		c.path_ = path;
	}

	auto it = std::find_if(cookies_.begin(), cookies_.end(), [&c](cookie const& other) {
		return other.name_ == c.name_ && other.domain_ == c.domain_ && other.path_ == c.path_;
	});

	// Max-Age takes precedence over Expires
	if (max_age) {
		c.expires_ = (*max_age <= 0) ? cookie_jar::time_point::min() : expiry_from_max_age(now, *max_age);
	}
	else if (expires) {
		c.expires_ = to_time_point(*expires);
	}

	if (c.expires_ && *c.expires_ <= now) {
		if (it != cookies_.end()) {
			cookies_.erase(it);
		}
		return true;
	}

	if (it != cookies_.end()) {
		*it = std::move(c);
	}
	else {
		cookies_.push_back(std::move(c));
	}

	return true;
}

std::string cookie_jar::cookie_header(uri const& u, time_point const& now) const
{
	std::string const host = str_tolower_ascii(u.host_);
	std::string_view const path = u.path_.empty() ? "/"sv : std::string_view(u.path_);
	bool const secure = u.is_secure();

	std::string ret;
	for (auto const& c : cookies_) {
		if (c.expires_ && *c.expires_ <= now) {
			continue;
		}
		if (c.secure_ && !secure) {
			continue;
		}
		if (c.host_only_ ? (host != c.domain_) : !domain_match(host, c.domain_)) {
			continue;
		}
		if (!path_match(path, c.path_)) {
			continue;
		}

		if (!ret.empty()) {
			ret += "; ";
		}
		ret += c.name_;
		ret += '=';
		ret += c.value_;
	}

	return ret;
}

void cookie_jar::purge(time_point const& now)
{
	cookies_.erase(std::remove_if(cookies_.begin(), cookies_.end(), [&now](cookie const& c) {
		return c.expires_ && *c.expires_ <= now;
	}), cookies_.end());
}

}
