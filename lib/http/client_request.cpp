#include "../libhtls/http/client_request.hpp"

using namespace std::literals;

namespace htls::http::client {

uint64_t request::update_content_length_from_body()
{
	if (body_.empty() && (verb_.empty() || verb_ == "GET"sv || verb_ == "HEAD"sv || verb_ == "OPTIONS"sv)) {
		headers_.erase("Transfer-Encoding"sv);
		headers_.erase("Content-Length"sv);
		return 0;
	}

	set_content_length(body_.size());
	return body_.size();
}

bool request::idempotent() const
{
	return verb_.empty() || verb_ == "GET"sv || verb_ == "HEAD"sv || verb_ == "PUT"sv ||
		verb_ == "DELETE"sv || verb_ == "OPTIONS"sv || verb_ == "TRACE"sv;
}

bool request::operator==(request const& op) const
{
	return uri_ == op.uri_ && verb_ == op.verb_ && flags_ == op.flags_ && body_ == op.body_ &&
		headers_ == op.headers_ && cookie_jar_ == op.cookie_jar_;
}

}
