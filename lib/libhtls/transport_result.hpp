#ifndef LIBHTLS_TRANSPORT_RESULT_HEADER
#define LIBHTLS_TRANSPORT_RESULT_HEADER

/** \file
 * \brief \ref htls::transport_result and \ref htls::rwresult wrappers for dealing with connection errors.
 */

#include "libhtls.hpp"

namespace htls {

/**
 * \brief Small class to return transport and protocol errors
 *
 * The raw error code isn't always available. If available, it is
 * the value of errno, the getaddrinfo error or the GnuTLS error code
 * when the failure occurred.
 */
class HTLS_PUBLIC_SYMBOL transport_result
{
public:
	enum error {
		ok,
		none = ok,

		/// Invalid arguments, e.g. a request without host
		invalid,

		/// Conflicting settings, e.g. SOCKS together with proxy tunneling
		config,

		/// Feature not available with the used connection provider
		unsupported,

		/// Hostname could not be resolved
		resolve,

		/// No connection could be established
		connect,

		/// Reading or writing the underlying socket failed
		io,

		/// Socket operation timed out
		timeout,

		/// Connection was closed without a TLS close_notify
		tls_eof,

		/// TLS session aborted by a fatal alert or error
		tls_terminated,

		/// TLS handshake failed, including certificate verification
		tls_handshake,

		/// TLS session used before it was established
		tls_not_established,

		/// Validation of the proxy's reply to CONNECT failed
		proxy_rejected,

		/// Connection closed before any response data was received
		no_response,

		/// Malformed status line, header or message framing
		invalid_response,

		/// Response body exceeds the configured limit
		response_too_large,

		/// Redirect limit exceeded
		too_many_redirects
	};

	transport_result() = default;

	explicit transport_result(error e, int raw = 0)
		: error_(e)
		, raw_(raw)
	{}

	explicit operator bool() const { return error_ == 0; }

	error error_{};

	int raw_{};

	/**
	 * \brief Set if the HTTP engine reported this failure on behalf of the request
	 *
	 * Whether a failure is marked as internal is governed by the wrap policy
	 * of the manager settings.
	 */
	bool internal_{};
};

/// Returns a short, human-readable description of the error kind
HTLS_PUBLIC_SYMBOL char const* to_string(transport_result::error e);

/**
 * \brief Holds the result of read/write operations on connections.
 *
 * On success, holds the number of bytes read/written. A successful
 * read of zero bytes indicates an orderly end of stream.
 */
class HTLS_PUBLIC_SYMBOL rwresult final
{
public:
	rwresult() = default;

	explicit rwresult(transport_result::error e, int raw = 0)
		: error_(e)
		, raw_(raw)
	{}

	explicit rwresult(size_t value)
		: value_(value)
	{}

	explicit operator bool() const { return error_ == 0; }

	transport_result to_result() const {
		return transport_result(error_, raw_);
	}

	transport_result::error error_{};

	/// Undefined if error_ is none
	int raw_{};

	/// Undefined if error_ is not none
	size_t value_{};
};

}

#endif
