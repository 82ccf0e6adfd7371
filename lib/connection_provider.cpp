#include "libhtls/connection_provider.hpp"
#include "libhtls/logger.hpp"
#include "libhtls/tls_layer.hpp"

namespace htls {

default_connection_provider::default_connection_provider(logger_interface & logger, std::chrono::milliseconds const& timeout)
	: logger_(logger)
	, timeout_(timeout)
{
}

std::unique_ptr<connection> default_connection_provider::connect(std::string const& host, unsigned short port, transport_result & error)
{
	auto s = std::make_unique<tcp_connection>(logger_);
	error = s->connect(host, port, timeout_);
	if (!error) {
		return nullptr;
	}
	return s;
}

std::unique_ptr<connection> default_connection_provider::upgrade(std::unique_ptr<connection> && plain, std::string const& server_name, tls_settings const& tls, transport_result & error)
{
	auto layer = std::make_unique<tls_layer>(std::move(plain), tls, logger_);
	error = layer->client_handshake(server_name);
	if (!error) {
		return nullptr;
	}
	return layer;
}

std::unique_ptr<connection> default_connection_provider::open(std::string const& host, unsigned short port,
	tls_settings const* tls, socks_settings const* socks, transport_result & error)
{
	if (socks) {
		logger_.log(logmsg::error, "SOCKS proxies are not supported by the default connection provider");
		error = transport_result(transport_result::unsupported);
		return nullptr;
	}

	auto s = connect(host, port, error);
	if (!s || !tls) {
		return s;
	}

	return upgrade(std::move(s), host, *tls, error);
}

std::unique_ptr<connection> default_connection_provider::open_via_proxy_tunnel(std::string_view const& connect_bytes,
	tunnel_validator const& validator, std::string const& tls_server_name,
	std::string const& proxy_host, unsigned short proxy_port,
	tls_settings const& tls, transport_result & error)
{
	auto s = connect(proxy_host, proxy_port, error);
	if (!s) {
		return nullptr;
	}

	error = s->write_all(connect_bytes);
	if (!error) {
		return nullptr;
	}

	if (validator) {
		error = validator(*s);
		if (!error) {
			logger_.log(logmsg::error, "Proxy %s:%u refused to open the tunnel", proxy_host, proxy_port);
			return nullptr;
		}
	}

	return upgrade(std::move(s), tls_server_name, tls, error);
}

}
