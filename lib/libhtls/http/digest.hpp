#ifndef LIBHTLS_HTTP_DIGEST_HEADER
#define LIBHTLS_HTTP_DIGEST_HEADER

/** \file
 * \brief HTTP digest authorization, client side
 *
 * Supports the MD5 algorithm with and without qop=auth. The client nonce
 * and nonce count are fixed, so the same challenge always yields the same
 * authorization.
 */

#include "client.hpp"
#include "../logger.hpp"

#include <optional>
#include <variant>

namespace htls::http {

/// Key/value pairs of a challenge in order of appearance, duplicates included
typedef std::vector<std::pair<std::string, std::string>> auth_params;

/**
 * \brief Splits the parameters of a digest challenge
 *
 * Input is the part of the WWW-Authenticate value after the scheme.
 * Entries are separated by commas. Quoted values run up to the next quote,
 * backslashes have no special meaning. Keys without value map to the empty string.
 */
auth_params HTLS_PUBLIC_SYMBOL parse_digest_params(std::string_view const& in);

/// Returns the value of the first parameter with exactly that key
std::optional<std::string> HTLS_PUBLIC_SYMBOL get_param(auth_params const& params, std::string_view const& key);

struct HTLS_PUBLIC_SYMBOL digest_challenge final
{
	std::string realm_;
	std::string nonce_;
	std::optional<std::string> opaque_;

	/// Whether the server offered a quality of protection. Its value is not looked at, auth is always used.
	bool qop_{};
};

/// Why \ref apply_digest_auth could not authorize a request
struct HTLS_PUBLIC_SYMBOL digest_failure final
{
	enum class reason
	{
		unexpected_status_code,
		missing_www_authenticate_header,
		www_authenticate_is_not_digest,
		missing_realm,
		missing_nonce
	};

	reason reason_{};

	/// The request as passed to apply_digest_auth
	client::request request_;

	/// The response to the unauthorized request, without body
	client::response response_;
};

HTLS_PUBLIC_SYMBOL char const* to_string(digest_failure::reason r);

/**
 * \brief Parses the value of a WWW-Authenticate header containing a digest challenge
 *
 * On failure, returns nullopt and, if given, sets reason to one of
 * www_authenticate_is_not_digest, missing_realm or missing_nonce.
 */
std::optional<digest_challenge> HTLS_PUBLIC_SYMBOL parse_digest_challenge(std::string_view const& header, digest_failure::reason * reason = nullptr);

/// Computes the lowercase hex response value for the given challenge
std::string HTLS_PUBLIC_SYMBOL compute_digest_response(std::string_view const& user, std::string_view const& password,
	digest_challenge const& challenge, std::string_view const& verb, std::string_view const& path);

/// Builds the value of the Authorization header. The algorithm directive is never included.
std::string HTLS_PUBLIC_SYMBOL build_digest_authorization(std::string_view const& user, std::string_view const& password,
	digest_challenge const& challenge, std::string_view const& verb, std::string_view const& path);

typedef std::variant<client::request, digest_failure, transport_result> digest_auth_result;

/**
 * \brief Prepares a request with digest credentials
 *
 * Sends req once through the issuer without reading the response body. If the
 * server answers with a 401 and a digest challenge, returns a copy of req
 * carrying the Authorization header and the cookies of the response. The copy
 * has to be sent by the caller.
 *
 * Transport failures of the issuer are returned unchanged, everything else
 * that prevents authorization yields a \ref digest_failure.
 */
digest_auth_result HTLS_PUBLIC_SYMBOL apply_digest_auth(std::string const& user, std::string const& password,
	client::request const& req, client::issuer & issuer, logger_interface & logger = get_null_logger());

}

#endif
