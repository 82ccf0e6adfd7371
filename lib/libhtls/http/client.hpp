#ifndef LIBHTLS_HTTP_CLIENT_HEADER
#define LIBHTLS_HTTP_CLIENT_HEADER

/** \file
 * \brief A synchronous HTTP/1.1 client, see \ref htls::http::client::manager
 */

#include "client_request.hpp"
#include "client_response.hpp"
#include "../connection_provider.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace htls {

class logger_interface;

namespace http::client {

/**
 * \brief Something that can execute an HTTP request end to end.
 *
 * The response is reset before the request is performed.
 */
class HTLS_PUBLIC_SYMBOL issuer
{
public:
	virtual ~issuer() = default;

	/// Performs the request and reads the complete response
	virtual transport_result perform(request const& req, response & res) = 0;

	/// Performs the request, but does not read the response body. res.body_ stays empty.
	virtual transport_result perform_no_body(request const& req, response & res) = 0;
};

typedef std::function<bool(transport_result const&)> result_predicate;

/// Failures after which an idempotent request is sent once more: tls_eof and no_response
bool HTLS_PUBLIC_SYMBOL default_retryable(transport_result const& r);

/// Failures marked as internal_: io, tls_terminated, tls_handshake and tls_not_established
bool HTLS_PUBLIC_SYMBOL default_wrap(transport_result const& r);

struct HTLS_PUBLIC_SYMBOL manager_settings final
{
	tls_settings tls_;

	/// Connect through a SOCKS proxy. Cannot be combined with proxy_.
	std::optional<socks_settings> socks_;

	/// Use an HTTP proxy. Cannot be combined with socks_.
	std::optional<proxy_settings> proxy_;

	/// If proxy_ and socks_ are both unset, look up the proxy in the environment on each request
	bool use_environment_proxy_{true};

	/// If not set, a \ref default_connection_provider is used
	std::shared_ptr<connection_provider> provider_;

	result_predicate retryable_{&default_retryable};
	result_predicate wrap_{&default_wrap};

	unsigned int max_redirects_{10};
	size_t max_body_size_{16 * 1024 * 1024};

	/// Applies to connecting and every read and write
	std::chrono::milliseconds timeout_{std::chrono::seconds(30)};

	std::string user_agent_;

	/// Returns a config error if the settings conflict
	transport_result validate() const;
};

/// Settings with the given TLS configuration, optionally going through a SOCKS proxy
manager_settings HTLS_PUBLIC_SYMBOL mk_manager_settings(tls_settings const& tls, std::optional<socks_settings> const& socks = std::nullopt);

/// Default settings: verified TLS with the system trust store, proxy from the environment
manager_settings HTLS_PUBLIC_SYMBOL tls_manager_settings();

class manager;

/**
 * \brief Creates a manager
 *
 * Validates the settings first, returns nullptr on failure. If error is given,
 * it receives the result of the validation.
 *
 * The logger needs to outlive the manager.
 */
std::shared_ptr<manager> HTLS_PUBLIC_SYMBOL make_manager(manager_settings settings, logger_interface & logger, transport_result * error = nullptr);

/**
 * \brief The HTTP engine
 *
 * Every request is sent on a new connection that is closed afterwards,
 * there are no shared connections or pipelining. The manager itself only holds
 * immutable settings, it can be used by multiple threads concurrently.
 *
 * Follows redirects, maintains the cookie jar of the request across redirects,
 * retries idempotent requests once on failures accepted by the retryable_ predicate.
 */
class HTLS_PUBLIC_SYMBOL manager final : public issuer
{
public:
	virtual ~manager() override;

	virtual transport_result perform(request const& req, response & res) override;
	virtual transport_result perform_no_body(request const& req, response & res) override;

	manager_settings const& settings() const;

private:
	friend std::shared_ptr<manager> make_manager(manager_settings settings, logger_interface & logger, transport_result * error);

	manager(manager_settings && settings, logger_interface & logger);

	class impl;
	std::unique_ptr<impl> impl_;
};

/**
 * \brief Reads the reply of an HTTP proxy to CONNECT
 *
 * Consumes the reply up to and including the empty line terminating it.
 * Fails with proxy_rejected unless the proxy replied with a 2xx status code.
 */
transport_result HTLS_PUBLIC_SYMBOL validate_tunnel_reply(connection & c, logger_interface & logger);

/**
 * \brief Returns the process-wide default issuer
 *
 * Created on first use with \ref tls_manager_settings and a logger discarding all messages.
 */
std::shared_ptr<issuer> HTLS_PUBLIC_SYMBOL get_global_issuer();

/// Replaces the process-wide default issuer. Returns false if i is null.
bool HTLS_PUBLIC_SYMBOL set_global_issuer(std::shared_ptr<issuer> const& i);

}
}

#endif
