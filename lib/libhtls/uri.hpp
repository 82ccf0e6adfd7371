#ifndef LIBHTLS_URI_HEADER
#define LIBHTLS_URI_HEADER

#include "libhtls.hpp"

#include <string>
#include <string_view>

/** \file
 * \brief Declares htls::uri for (de)composing URIs.
 */

namespace htls {

/**
 * \brief The uri class is used to decompose URIs into their individual components.
 *
 * Implements Uniform Resource Identifiers as described in RFC 3986, restricted
 * to what HTTP needs: no userinfo, and the authority must be a host with
 * an optional port. The fragment is dropped, it never goes on the wire.
 */
class HTLS_PUBLIC_SYMBOL uri final
{
public:
	uri() = default;
	explicit uri(std::string_view const& in);

	void clear();

	/**
	 * \brief Splits uri into components.
	 *
	 * Percent-decoding is not performed. Returns false on invalid input,
	 * in which case the uri is cleared.
	 */
	bool parse(std::string_view in);

	/// Assembles components into string
	std::string to_string() const;

	/// Returns path and query, separated by question mark.
	std::string get_request(bool with_query = true) const;

	/// Returns [host[:port]], the port is omitted if zero
	std::string get_authority() const;

	/// The port to connect to, taking the scheme default into account
	unsigned short effective_port() const;

	/// Whether the scheme is https
	bool is_secure() const;

	bool empty() const;

	/// Often refered to as the protocol prefix, e.g. ftp://
	std::string scheme_;

	/// Hostname, or ip address
	std::string host_;

	/// Optional port, zero if not set
	unsigned short port_{};

	/// Must either be empty or start with a slash
	std::string path_;

	/// The part of a URI after ? but before #
	std::string query_;

	/**
	 * \brief Resolves a reference relative to this URI
	 *
	 * Used when following HTTP redirects. An absolute reference
	 * replaces this uri completely, a network-path reference keeps only
	 * the scheme, an absolute path keeps scheme and authority,
	 * a relative path is merged with the directory of the current path.
	 */
	bool resolve(uri const& base);

	bool operator==(uri const& arg) const;
	bool operator!=(uri const& op) const { return !(*this == op); }

private:
	bool parse_authority(std::string_view authority);
};

}

#endif
