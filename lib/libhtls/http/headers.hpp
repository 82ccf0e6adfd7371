#ifndef LIBHTLS_HTTP_HEADERS_HEADER
#define LIBHTLS_HTTP_HEADERS_HEADER

/** \file
 * \brief Declares \ref htls::http::headers and \ref htls::http::with_headers as base for HTTP requests/responses
 */

#include "../string.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace htls {

class uri;

namespace http {

/**
 * \brief An ordered list of header fields.
 *
 * Names compare case-insensitively. Unlike a map, the order of insertion
 * is preserved and a name can occur multiple times, as is the case with Set-Cookie.
 * Lookups return the first matching field.
 */
class HTLS_PUBLIC_SYMBOL headers final
{
public:
	typedef std::pair<std::string, std::string> value_type;
	typedef std::vector<value_type>::const_iterator const_iterator;

	const_iterator begin() const { return fields_.cbegin(); }
	const_iterator end() const { return fields_.cend(); }

	size_t size() const { return fields_.size(); }
	bool empty() const { return fields_.empty(); }

	/// Returns the first field with the given name, end() if there is none
	const_iterator find(std::string_view const& name) const;

	/// Value of the first field with the given name
	std::optional<std::string> get(std::string_view const& name) const;

	/// Values of all fields with the given name, in order
	std::vector<std::string> get_all(std::string_view const& name) const;

	size_t count(std::string_view const& name) const;

	/// Appends a field, keeping existing fields of the same name
	void add(std::string name, std::string value);

	/// Inserts a field in front of all others
	void prepend(std::string name, std::string value);

	/**
	 * \brief Sets the value of a field
	 *
	 * Replaces the value of the first field of that name and removes all
	 * further ones. If there is none, the field gets appended.
	 */
	void set(std::string const& name, std::string value);

	/// Removes all fields with the given name, returns the number of removed fields
	size_t erase(std::string_view const& name);

	void clear() { fields_.clear(); }

	bool operator==(headers const& op) const { return fields_ == op.fields_; }
	bool operator!=(headers const& op) const { return fields_ != op.fields_; }

private:
	std::vector<value_type> fields_;
};

class HTLS_PUBLIC_SYMBOL with_headers
{
public:
	virtual ~with_headers();

	std::optional<uint64_t> get_content_length() const;

	/// Sets Content-Length. Also clears Transfer-Encoding
	void set_content_length(uint64_t l);

	/// Whether chunked encoding is used
	bool chunked_encoding() const;

	void set_content_type(std::string content_type);

	/// Returns the value of the first field with the given name, empty if there is none
	std::string get_header(std::string_view const& key) const;

	bool has_header(std::string_view const& key) const;

	headers headers_;
};

/// Canonicalizes the URI for use in the Host: header
std::string HTLS_PUBLIC_SYMBOL get_canonical_host(uri const& uri);

}
}

#endif
