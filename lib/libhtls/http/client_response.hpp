#ifndef LIBHTLS_HTTP_CLIENT_RESPONSE_HEADER
#define LIBHTLS_HTTP_CLIENT_RESPONSE_HEADER

/** \file
 * \brief HTTP responses, client-side view.
 */

#include "cookie_jar.hpp"
#include "headers.hpp"

namespace htls::http::client {

/** \brief A single HTTP response received by the client.
 */
class HTLS_PUBLIC_SYMBOL response : public with_headers
{
public:
	unsigned int code_{};
	std::string reason_;

	enum flags {
		flag_got_code = 0x01,
		flag_got_header = 0x02,
		flag_got_body = 0x04,
		flag_no_body = 0x08, // e.g. on HEAD requests, or 204/304 responses
	};
	int flags_{};

	bool got_code() const { return flags_ & flag_got_code; }
	bool got_header() const { return flags_ & flag_got_header; }
	bool got_body() const { return (flags_ & (flag_got_body | flag_no_body)) == flag_got_body; }
	bool no_body() const { return flags_ & flag_no_body; }

	/// Stays empty if the response got requested without body
	std::string body_;

	/// The cookies of the request, updated with the Set-Cookie headers of this response
	cookie_jar cookie_jar_;

	bool success() const {
		return code_ >= 200 && code_ < 300;
	}

	bool is_redirect() const {
		return code_ >= 300 && code_ < 400 && code_ != 304 && code_ != 305 && code_ != 306;
	}

	/// Some HTTP responses cannot possibly have a body.
	bool code_prohibits_body() const {
		return (code_ >= 100 && code_ < 200) || code_ == 304 || code_ == 204;
	}

	void reset();
};
}

#endif
