#ifndef LIBHTLS_CONNECTION_PROVIDER_HEADER
#define LIBHTLS_CONNECTION_PROVIDER_HEADER

/** \file
 * \brief Declares \ref htls::connection_provider, the factory used by the HTTP engine to obtain connections
 */

#include "socket.hpp"
#include "tls_settings.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace htls {

/**
 * \brief Validates the reply of a proxy to a tunnel request.
 *
 * Called on the plain stream after the tunnel request has been sent.
 * Has to consume exactly the proxy's reply and nothing beyond it.
 */
typedef std::function<transport_result(connection&)> tunnel_validator;

/**
 * \brief Abstract factory for connections
 *
 * On failure, the functions return nullptr and set error.
 */
class HTLS_PUBLIC_SYMBOL connection_provider
{
public:
	virtual ~connection_provider() = default;

	/**
	 * \brief Opens a connection to host:port
	 *
	 * If tls is given, the connection is wrapped in a TLS session.
	 * If socks is given, the connection is made through the SOCKS proxy.
	 */
	virtual std::unique_ptr<connection> open(std::string const& host, unsigned short port,
		tls_settings const* tls, socks_settings const* socks, transport_result & error) = 0;

	/**
	 * \brief Opens a TLS connection tunneled through an HTTP proxy
	 *
	 * Connects to the proxy, writes connect_bytes, runs validator on the plain
	 * stream and then performs the TLS handshake with tls_server_name on the same stream.
	 */
	virtual std::unique_ptr<connection> open_via_proxy_tunnel(std::string_view const& connect_bytes,
		tunnel_validator const& validator, std::string const& tls_server_name,
		std::string const& proxy_host, unsigned short proxy_port,
		tls_settings const& tls, transport_result & error) = 0;
};

/// Provider using \ref tcp_connection and \ref tls_layer. SOCKS is not supported.
class HTLS_PUBLIC_SYMBOL default_connection_provider final : public connection_provider
{
public:
	explicit default_connection_provider(logger_interface & logger, std::chrono::milliseconds const& timeout = std::chrono::seconds(30));

	virtual std::unique_ptr<connection> open(std::string const& host, unsigned short port,
		tls_settings const* tls, socks_settings const* socks, transport_result & error) override;

	virtual std::unique_ptr<connection> open_via_proxy_tunnel(std::string_view const& connect_bytes,
		tunnel_validator const& validator, std::string const& tls_server_name,
		std::string const& proxy_host, unsigned short proxy_port,
		tls_settings const& tls, transport_result & error) override;

private:
	std::unique_ptr<connection> connect(std::string const& host, unsigned short port, transport_result & error);
	std::unique_ptr<connection> upgrade(std::unique_ptr<connection> && plain, std::string const& server_name, tls_settings const& tls, transport_result & error);

	logger_interface & logger_;
	std::chrono::milliseconds const timeout_;
};

}

#endif
