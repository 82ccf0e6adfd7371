#ifndef LIBHTLS_HTTP_CLIENT_REQUEST_HEADER
#define LIBHTLS_HTTP_CLIENT_REQUEST_HEADER

/** \file
 * \brief HTTP requests, client-side view.
 */

#include "cookie_jar.hpp"
#include "headers.hpp"
#include "../uri.hpp"

namespace htls::http::client {

/** \brief A single HTTP request to be sent by the client.
 *
 * A plain value, copying it yields an independent request that can be modified
 * without affecting the original.
 */
class HTLS_PUBLIC_SYMBOL request : public with_headers
{
public:
	htls::uri uri_;

	/// Defaults to GET if empty
	std::string verb_;

	enum flags : uint64_t {
		/// Avoids logging the path of the URI when processing request
		flag_confidential_path = 0x01,

		/// Avoids logging the query string of the URI when processing request
		flag_confidential_querystring = 0x2
	};
	uint64_t flags_{};

	/// Kept in memory so that the request can be sent again, e.g. on retries and redirects
	std::string body_;

	/**
	 * \brief Cookies sent with the request, updated from Set-Cookie on each response.
	 *
	 * Starts out as an empty jar. Call reset() to neither send nor remember cookies.
	 */
	std::optional<cookie_jar> cookie_jar_{std::in_place};

	/**
	 * \brief Sets Content-Length from the body.
	 *
	 * Bodyless GET, HEAD and OPTIONS requests carry no Content-Length at all.
	 * Returns the number of body bytes to send.
	 */
	uint64_t update_content_length_from_body();

	/// Whether the verb may be safely repeated
	bool idempotent() const;

	bool operator==(request const& op) const;
	bool operator!=(request const& op) const { return !(*this == op); }
};
}

#endif
