#ifndef LIBHTLS_TLS_LAYER_HEADER
#define LIBHTLS_TLS_LAYER_HEADER

/** \file
 * \brief A TLS client session on top of another connection, using GnuTLS
 */

#include "socket.hpp"
#include "tls_settings.hpp"

#include <memory>

namespace htls {

class logger_interface;

/**
 * \brief A Transport Layer Security (TLS) client layer.
 *
 * Takes ownership of the layer below. As the TLS session is established on top of
 * an already connected stream, the same class serves direct connections as well as
 * streams upgraded in place after a proxy tunnel has been set up.
 *
 * Reported errors:
 * \li transport_result::tls_handshake if the handshake or certificate verification fails
 * \li transport_result::tls_eof if the peer closes the connection without close_notify
 * \li transport_result::tls_terminated on any other fatal error inside the TLS session
 * \li transport_result::tls_not_established if used before a successful handshake
 * \li failures of the layer below are passed through as they are
 */
class HTLS_PUBLIC_SYMBOL tls_layer final : public connection
{
public:
	tls_layer(std::unique_ptr<connection> next_layer, tls_settings const& settings, logger_interface & logger);
	virtual ~tls_layer() override;

	/**
	 * \brief Starts and completes a client handshake
	 *
	 * \param hostname Used for SNI and to verify the server certificate.
	 */
	transport_result client_handshake(std::string const& hostname);

	virtual rwresult read(void* buffer, size_t size) override;
	virtual rwresult write(void const* buffer, size_t size) override;

	/// Sends close_notify, then shuts down the layer below
	virtual int shutdown() override;

	/// Only valid after a successful handshake
	std::string get_protocol() const;
	std::string get_cipher() const;

	/// Returns the version of the loaded GnuTLS library
	static std::string get_gnutls_version();

private:
	class impl;
	std::unique_ptr<impl> impl_;
};

}

#endif
