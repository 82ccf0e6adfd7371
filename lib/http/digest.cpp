#include "../libhtls/http/digest.hpp"

#include "../libhtls/encode.hpp"
#include "../libhtls/hash.hpp"

using namespace std::literals;

namespace htls::http {

namespace {
constexpr std::string_view const nonce_count = "00000001"sv;
constexpr std::string_view const client_nonce = "deadbeef"sv;

std::string_view strip_spaces(std::string_view s)
{
	return trimmed(s, " "sv);
}

std::string md5_hex(std::string_view const& in)
{
	return hex_encode<std::string>(md5(in));
}

std::string concat(std::initializer_list<std::string_view> parts)
{
	std::string ret;
	for (auto const& part : parts) {
		ret += part;
	}
	return ret;
}
}

auth_params parse_digest_params(std::string_view const& in)
{
	auth_params ret;

	std::string_view rest = in;
	while (!rest.empty()) {
		auto const start = rest.find_first_not_of(' ');
		rest = (start == std::string_view::npos) ? std::string_view() : rest.substr(start);

		auto const sep = rest.find_first_of("=,"sv);
		std::string key(strip_spaces(rest.substr(0, sep)));
		if (sep == std::string_view::npos) {
			ret.emplace_back(std::move(key), std::string());
			break;
		}
		if (rest[sep] == ',') {
			ret.emplace_back(std::move(key), std::string());
			rest = rest.substr(sep + 1);
			continue;
		}

		std::string_view const value = rest.substr(sep + 1);
		if (!value.empty() && value[0] == '"') {
			auto const close = value.find('"', 1);
			if (close != std::string_view::npos) {
				// Quoted values are kept verbatim, inner spaces included.
				// Anything between closing quote and next comma is dropped
				ret.emplace_back(std::move(key), std::string(value.substr(1, close - 1)));
				auto const comma = value.find(',', close);
				rest = (comma == std::string_view::npos) ? std::string_view() : value.substr(comma + 1);
				continue;
			}
			// Unterminated, fall through and treat the quote as part of a plain value
		}

		auto const comma = value.find(',');
		ret.emplace_back(std::move(key), std::string(strip_spaces(value.substr(0, comma))));
		rest = (comma == std::string_view::npos) ? std::string_view() : value.substr(comma + 1);
	}

	return ret;
}

std::optional<std::string> get_param(auth_params const& params, std::string_view const& key)
{
	for (auto const& param : params) {
		if (param.first == key) {
			return param.second;
		}
	}
	return {};
}

char const* to_string(digest_failure::reason r)
{
	switch (r) {
	case digest_failure::reason::unexpected_status_code:
		return "unexpected status code";
	case digest_failure::reason::missing_www_authenticate_header:
		return "missing WWW-Authenticate header";
	case digest_failure::reason::www_authenticate_is_not_digest:
		return "WWW-Authenticate is not a digest challenge";
	case digest_failure::reason::missing_realm:
		return "challenge without realm";
	case digest_failure::reason::missing_nonce:
		return "challenge without nonce";
	}
	return "unknown";
}

std::optional<digest_challenge> parse_digest_challenge(std::string_view const& header, digest_failure::reason * reason)
{
	auto fail = [reason](digest_failure::reason r) -> std::optional<digest_challenge> {
		if (reason) {
			*reason = r;
		}
		return {};
	};

	if (!starts_with_insensitive_ascii(header, "Digest "sv)) {
		return fail(digest_failure::reason::www_authenticate_is_not_digest);
	}

	auto const params = parse_digest_params(header.substr(7));

	digest_challenge ret;

	auto realm = get_param(params, "realm"sv);
	if (!realm) {
		return fail(digest_failure::reason::missing_realm);
	}
	ret.realm_ = std::move(*realm);

	auto nonce = get_param(params, "nonce"sv);
	if (!nonce) {
		return fail(digest_failure::reason::missing_nonce);
	}
	ret.nonce_ = std::move(*nonce);

	ret.opaque_ = get_param(params, "opaque"sv);
	ret.qop_ = get_param(params, "qop"sv).has_value();

	return ret;
}

std::string compute_digest_response(std::string_view const& user, std::string_view const& password,
	digest_challenge const& challenge, std::string_view const& verb, std::string_view const& path)
{
	// See RFC 2617, section 3.2.2
	std::string const ha1 = md5_hex(concat({user, ":"sv, challenge.realm_, ":"sv, password}));
	std::string const ha2 = md5_hex(concat({verb, ":"sv, path}));

	if (challenge.qop_) {
		return md5_hex(concat({ha1, ":"sv, challenge.nonce_, ":"sv, nonce_count, ":"sv, client_nonce, ":auth:"sv, ha2}));
	}
	return md5_hex(concat({ha1, ":"sv, challenge.nonce_, ":"sv, ha2}));
}

std::string build_digest_authorization(std::string_view const& user, std::string_view const& password,
	digest_challenge const& challenge, std::string_view const& verb, std::string_view const& path)
{
	std::string const response = compute_digest_response(user, password, challenge, verb, path);

	std::string auth = concat({"Digest username=\""sv, user,
		"\", realm=\""sv, challenge.realm_,
		"\", nonce=\""sv, challenge.nonce_,
		"\", uri=\""sv, path,
		"\", response=\""sv, response, "\""sv});

	if (challenge.opaque_) {
		auth += concat({", opaque=\""sv, *challenge.opaque_, "\""sv});
	}
	if (challenge.qop_) {
		auth += concat({", qop=auth, nc="sv, nonce_count, ", cnonce=\""sv, client_nonce, "\""sv});
	}

	return auth;
}

digest_auth_result apply_digest_auth(std::string const& user, std::string const& password,
	client::request const& req, client::issuer & issuer, logger_interface & logger)
{
	client::response res;
	auto const result = issuer.perform_no_body(req, res);
	if (!result) {
		return result;
	}

	auto fail = [&](digest_failure::reason r) -> digest_auth_result {
		logger.log(logmsg::debug_warning, "Cannot apply digest authentication: %s", to_string(r));
		return digest_failure{r, req, std::move(res)};
	};

	if (res.code_ != 401) {
		return fail(digest_failure::reason::unexpected_status_code);
	}

	auto const header = res.headers_.get("WWW-Authenticate"sv);
	if (!header) {
		return fail(digest_failure::reason::missing_www_authenticate_header);
	}

	digest_failure::reason reason{};
	auto const challenge = parse_digest_challenge(*header, &reason);
	if (!challenge) {
		return fail(reason);
	}

	// Verb and path as they went on the wire
	std::string_view const verb = req.verb_.empty() ? "GET"sv : std::string_view(req.verb_);
	std::string_view const path = req.uri_.path_.empty() ? "/"sv : std::string_view(req.uri_.path_);

	client::request out = req;
	out.headers_.erase("Authorization"sv);
	out.headers_.prepend("Authorization"s, build_digest_authorization(user, password, *challenge, verb, path));
	if (out.cookie_jar_) {
		out.cookie_jar_ = res.cookie_jar_;
	}

	logger.log(logmsg::debug_info, "Got digest challenge for realm \"%s\"%s", challenge->realm_, challenge->qop_ ? " with qop" : "");

	return out;
}

}
