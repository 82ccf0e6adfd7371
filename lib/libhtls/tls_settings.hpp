#ifndef LIBHTLS_TLS_SETTINGS_HEADER
#define LIBHTLS_TLS_SETTINGS_HEADER

/** \file
 * \brief Settings of the transport: TLS, SOCKS and HTTP proxies
 */

#include "libhtls.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace htls {

/// How TLS sessions are established
struct HTLS_PUBLIC_SYMBOL tls_settings final
{
	/// If false, any certificate is accepted. Only useful for testing.
	bool validate_certificate_{true};

	/// PEM file with trusted CA certificates. If empty, the system trust store is used.
	std::string trust_file_;

	/// GnuTLS priority string. If empty, the GnuTLS defaults are used.
	std::string priority_;

	/// Whether to send the hostname via Server Name Indication
	bool use_server_name_{true};
};

/// A SOCKS proxy through which all connections are made
struct HTLS_PUBLIC_SYMBOL socks_settings final
{
	std::string host_;
	unsigned short port_{1080};
};

/**
 * \brief An HTTP proxy.
 *
 * Plain HTTP requests are forwarded by the proxy, HTTPS requests are
 * tunneled through it with CONNECT.
 */
struct HTLS_PUBLIC_SYMBOL proxy_settings final
{
	std::string host_;
	unsigned short port_{};

	bool operator==(proxy_settings const& op) const {
		return host_ == op.host_ && port_ == op.port_;
	}
};

/**
 * \brief Parses a proxy specification such as http://proxy.example:3128 or proxy.example:3128
 *
 * Only the http scheme is accepted. Port defaults to 80.
 */
std::optional<proxy_settings> HTLS_PUBLIC_SYMBOL parse_proxy(std::string_view const& value);

/**
 * \brief Checks whether target_host is exempted from proxying by a no_proxy list.
 *
 * The list is comma-separated. An entry matches the host itself and all its subdomains,
 * a leading dot is ignored. A single * matches everything.
 */
bool HTLS_PUBLIC_SYMBOL is_proxy_exempt(std::string_view const& no_proxy, std::string_view const& target_host);

/**
 * \brief Reads the proxy from the environment.
 *
 * For secure requests https_proxy (or HTTPS_PROXY) is used, otherwise http_proxy.
 * HTTP_PROXY in uppercase is deliberately ignored, it can be set by
 * CGI environments from a request header. Honors no_proxy and NO_PROXY.
 */
std::optional<proxy_settings> HTLS_PUBLIC_SYMBOL proxy_from_environment(bool secure, std::string_view const& target_host);

}

#endif
