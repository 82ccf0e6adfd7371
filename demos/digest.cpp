#include <libhtls/http/digest.hpp>
#include <libhtls/logger.hpp>
#include <libhtls/tls_layer.hpp>

#include <string.h>

using namespace std::literals;

int main(int argc, char * argv[])
{
	htls::stdout_logger logger;

	int arg = 1;
	if (argc > 1 && !strcmp(argv[1], "-v")) {
		logger.set_all(htls::logmsg::type(-1));
		++arg;
	}

	if (argc - arg != 3) {
		logger.log(htls::logmsg::error, "Usage: %s [-v] <uri> <user> <password>", argv[0]);
		return 1;
	}

	htls::http::client::request req;
	if (!req.uri_.parse(argv[arg])) {
		logger.log(htls::logmsg::error, "Invalid URI: '%s'", argv[arg]);
		return 1;
	}

	std::string const user = argv[arg + 1];
	std::string const password = argv[arg + 2];

	logger.log(htls::logmsg::debug_info, "libhtls %s, GnuTLS %s", htls::get_version_string(), htls::tls_layer::get_gnutls_version());

	auto settings = htls::http::client::tls_manager_settings();
	settings.user_agent_ = "libhtls_digest_demo";

	htls::transport_result error;
	auto manager = htls::http::client::make_manager(std::move(settings), logger, &error);
	if (!manager) {
		logger.log(htls::logmsg::error, "Could not create manager: %s", htls::to_string(error.error_));
		return 1;
	}
	htls::http::client::set_global_issuer(manager);

	auto issuer = htls::http::client::get_global_issuer();
	auto result = htls::http::apply_digest_auth(user, password, req, *issuer, logger);

	if (auto const* failure = std::get_if<htls::http::digest_failure>(&result)) {
		logger.log(htls::logmsg::error, "Digest authentication not possible: %s (status %u)", htls::http::to_string(failure->reason_), failure->response_.code_);
		return 1;
	}
	if (auto const* failure = std::get_if<htls::transport_result>(&result)) {
		logger.log(htls::logmsg::error, "Request failed: %s", htls::to_string(failure->error_));
		return 1;
	}

	auto const& authorized = std::get<htls::http::client::request>(result);

	htls::http::client::response res;
	error = issuer->perform(authorized, res);
	if (!error) {
		logger.log(htls::logmsg::error, "Request failed: %s", htls::to_string(error.error_));
		return 1;
	}

	logger.log(htls::logmsg::status, "Got response for %s with code %u, %u bytes", req.uri_.to_string(), res.code_, res.body_.size());
	if (!res.body_.empty()) {
		logger.log_raw(htls::logmsg::status, res.body_);
	}

	return res.success() ? 0 : 1;
}
