#ifndef LIBHTLS_HTTP_COOKIE_JAR_HEADER
#define LIBHTLS_HTTP_COOKIE_JAR_HEADER

/** \file
 * \brief A client-side cookie store, see \ref htls::http::cookie_jar
 */

#include "../libhtls.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace htls {

class uri;

namespace http {

struct HTLS_PUBLIC_SYMBOL cookie final
{
	std::string name_;
	std::string value_;

	/// Lowercase, without leading dot
	std::string domain_;
	std::string path_;

	/// If set, the cookie is only sent to exactly domain_, not to its subdomains
	bool host_only_{};
	bool secure_{};
	bool http_only_{};

	/// Session cookies have no expiration
	std::optional<std::chrono::system_clock::time_point> expires_;

	bool operator==(cookie const& op) const;
	bool operator!=(cookie const& op) const { return !(*this == op); }
};

/**
 * \brief Stores cookies received in responses and selects those to send with requests.
 *
 * A simplified subset of RFC 6265. The combination of name, domain and path
 * is unique, a newer cookie replaces an older one in place.
 */
class HTLS_PUBLIC_SYMBOL cookie_jar final
{
public:
	typedef std::chrono::system_clock::time_point time_point;

	/**
	 * \brief Processes the values of Set-Cookie headers received in a response to a request for u
	 *
	 * Understands the Domain, Path, Max-Age, Expires, Secure and HttpOnly attributes.
	 * Max-Age takes precedence over Expires, an expiration in the past deletes the cookie.
	 * Invalid cookies and cookies for foreign domains are dropped. Afterwards, expired
	 * cookies are purged.
	 */
	void update(uri const& u, std::vector<std::string> const& set_cookie_values, time_point const& now = std::chrono::system_clock::now());

	/// Processes a single Set-Cookie value, returns false if it was rejected
	bool update(uri const& u, std::string_view const& set_cookie_value, time_point const& now = std::chrono::system_clock::now());

	/// Assembles the value of the Cookie header for a request to u. Empty if no cookie applies.
	std::string cookie_header(uri const& u, time_point const& now = std::chrono::system_clock::now()) const;

	/// Removes expired cookies
	void purge(time_point const& now = std::chrono::system_clock::now());

	size_t size() const { return cookies_.size(); }
	bool empty() const { return cookies_.empty(); }

	std::vector<cookie> const& cookies() const { return cookies_; }

	bool operator==(cookie_jar const& op) const { return cookies_ == op.cookies_; }
	bool operator!=(cookie_jar const& op) const { return cookies_ != op.cookies_; }

private:
	std::vector<cookie> cookies_;
};

/**
 * \brief Parses a cookie date as described in RFC 6265 section 5.1.1
 *
 * Accepts the formats seen in the wild, such as "Wed, 21 Oct 2015 07:28:00 GMT"
 * or "Wednesday, 21-Oct-15 07:28:00 GMT". Returns the seconds since the epoch.
 */
std::optional<int64_t> HTLS_PUBLIC_SYMBOL parse_cookie_date(std::string_view const& in);

/// Whether host lies within domain as defined in RFC 6265 section 5.1.3. Both must be lowercase.
bool HTLS_PUBLIC_SYMBOL domain_match(std::string_view const& host, std::string_view const& domain);

/// Whether the cookie path matches the request path, RFC 6265 section 5.1.4
bool HTLS_PUBLIC_SYMBOL path_match(std::string_view const& request_path, std::string_view const& cookie_path);

}
}

#endif
