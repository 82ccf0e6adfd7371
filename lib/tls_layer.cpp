#include "libhtls/tls_layer.hpp"
#include "libhtls/logger.hpp"

#include <gnutls/gnutls.h>
#include <gnutls/x509.h>

#include <arpa/inet.h>
#include <errno.h>

namespace htls {

class tls_layer::impl final
{
public:
	impl(std::unique_ptr<connection> && next_layer, tls_settings const& settings, logger_interface & logger)
		: next_layer_(std::move(next_layer))
		, settings_(settings)
		, logger_(logger)
	{
	}

	~impl()
	{
		if (session_) {
			gnutls_deinit(session_);
		}
		if (cred_) {
			gnutls_certificate_free_credentials(cred_);
		}
	}

	transport_result client_handshake(std::string const& hostname);

	rwresult read(void* buffer, size_t size);
	rwresult write(void const* buffer, size_t size);
	int shutdown();

	std::string get_protocol() const;
	std::string get_cipher() const;

private:
	transport_result init_session(std::string const& hostname);
	rwresult failure(ssize_t res, char const* function);
	void log_error(int code, char const* function, logmsg::type type = logmsg::error);
	void log_verification_error();

	static ssize_t push_function(gnutls_transport_ptr_t ptr, void const* data, size_t len);
	static ssize_t pull_function(gnutls_transport_ptr_t ptr, void* data, size_t len);

	std::unique_ptr<connection> next_layer_;
	tls_settings const settings_;
	logger_interface & logger_;

	gnutls_session_t session_{};
	gnutls_certificate_credentials_t cred_{};

	bool established_{};

	// Last failure of the layer below, reported instead of the resulting GnuTLS error
	rwresult transport_error_;
};

namespace {
bool is_ip_address(std::string const& host)
{
	unsigned char buf[sizeof(in6_addr)];
	return inet_pton(AF_INET, host.c_str(), buf) == 1 || inet_pton(AF_INET6, host.c_str(), buf) == 1;
}
}

ssize_t tls_layer::impl::push_function(gnutls_transport_ptr_t ptr, void const* data, size_t len)
{
	auto* self = static_cast<tls_layer::impl*>(ptr);
	auto r = self->next_layer_->write(data, len);
	if (!r) {
		self->transport_error_ = r;
		gnutls_transport_set_errno(self->session_, EIO);
		return -1;
	}
	return static_cast<ssize_t>(r.value_);
}

ssize_t tls_layer::impl::pull_function(gnutls_transport_ptr_t ptr, void* data, size_t len)
{
	auto* self = static_cast<tls_layer::impl*>(ptr);
	auto r = self->next_layer_->read(data, len);
	if (!r) {
		self->transport_error_ = r;
		gnutls_transport_set_errno(self->session_, EIO);
		return -1;
	}
	return static_cast<ssize_t>(r.value_);
}

void tls_layer::impl::log_error(int code, char const* function, logmsg::type type)
{
	char const* error = gnutls_strerror(code);
	if (!error) {
		error = "unknown error";
	}
	logger_.log(type, "GnuTLS error %d in %s: %s", code, function, error);
}

void tls_layer::impl::log_verification_error()
{
	unsigned int const status = gnutls_session_get_verify_cert_status(session_);
	gnutls_datum_t out{};
	if (gnutls_certificate_verification_status_print(status, gnutls_certificate_type_get(session_), &out, 0) == 0) {
		logger_.log(logmsg::error, "Certificate verification failed: %s", std::string_view(reinterpret_cast<char const*>(out.data), out.size));
		gnutls_free(out.data);
	}
	else {
		logger_.log(logmsg::error, "Certificate verification failed with status %x", status);
	}
}

transport_result tls_layer::impl::init_session(std::string const& hostname)
{
	int res = gnutls_certificate_allocate_credentials(&cred_);
	if (res < 0) {
		log_error(res, "gnutls_certificate_allocate_credentials");
		return transport_result(transport_result::tls_handshake, res);
	}

	if (settings_.validate_certificate_) {
		if (settings_.trust_file_.empty()) {
			res = gnutls_certificate_set_x509_system_trust(cred_);
			if (res < 0) {
				log_error(res, "gnutls_certificate_set_x509_system_trust");
				return transport_result(transport_result::tls_handshake, res);
			}
			logger_.log(logmsg::debug_verbose, "Loaded %d certificates from system trust store", res);
		}
		else {
			res = gnutls_certificate_set_x509_trust_file(cred_, settings_.trust_file_.c_str(), GNUTLS_X509_FMT_PEM);
			if (res < 0) {
				logger_.log(logmsg::error, "Could not load trusted certificates from '%s'", settings_.trust_file_);
				log_error(res, "gnutls_certificate_set_x509_trust_file");
				return transport_result(transport_result::tls_handshake, res);
			}
		}
	}

	res = gnutls_init(&session_, GNUTLS_CLIENT);
	if (res < 0) {
		session_ = nullptr;
		log_error(res, "gnutls_init");
		return transport_result(transport_result::tls_handshake, res);
	}

	if (settings_.priority_.empty()) {
		res = gnutls_set_default_priority(session_);
	}
	else {
		char const* error_pos{};
		res = gnutls_priority_set_direct(session_, settings_.priority_.c_str(), &error_pos);
		if (res < 0 && error_pos) {
			logger_.log(logmsg::error, "Invalid TLS priority string near '%s'", error_pos);
		}
	}
	if (res < 0) {
		log_error(res, "gnutls_priority_set");
		return transport_result(transport_result::tls_handshake, res);
	}

	res = gnutls_credentials_set(session_, GNUTLS_CRD_CERTIFICATE, cred_);
	if (res < 0) {
		log_error(res, "gnutls_credentials_set");
		return transport_result(transport_result::tls_handshake, res);
	}

	if (settings_.use_server_name_ && !hostname.empty() && !is_ip_address(hostname)) {
		res = gnutls_server_name_set(session_, GNUTLS_NAME_DNS, hostname.c_str(), hostname.size());
		if (res < 0) {
			log_error(res, "gnutls_server_name_set");
			return transport_result(transport_result::tls_handshake, res);
		}
	}

	if (settings_.validate_certificate_) {
		gnutls_session_set_verify_cert(session_, hostname.empty() ? nullptr : hostname.c_str(), 0);
	}

	gnutls_transport_set_ptr(session_, this);
	gnutls_transport_set_push_function(session_, &push_function);
	gnutls_transport_set_pull_function(session_, &pull_function);
	gnutls_handshake_set_timeout(session_, GNUTLS_DEFAULT_HANDSHAKE_TIMEOUT);

	return transport_result();
}

transport_result tls_layer::impl::client_handshake(std::string const& hostname)
{
	if (session_ || !next_layer_) {
		logger_.log(logmsg::debug_warning, "Called tls_layer::client_handshake on a session already in use");
		return transport_result(transport_result::invalid);
	}

	std::string host = hostname;
	if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
		host = host.substr(1, host.size() - 2);
	}

	logger_.log(logmsg::debug_verbose, "Starting TLS handshake with %s", host);

	auto result = init_session(host);
	if (!result) {
		return result;
	}

	int res;
	do {
		res = gnutls_handshake(session_);
	} while (res < 0 && !gnutls_error_is_fatal(res));

	if (res < 0) {
		if (res == GNUTLS_E_CERTIFICATE_VERIFICATION_ERROR) {
			log_verification_error();
		}
		else {
			log_error(res, "gnutls_handshake");
		}

		if (!transport_error_) {
			return transport_error_.to_result();
		}
		if (res == GNUTLS_E_PREMATURE_TERMINATION) {
			return transport_result(transport_result::tls_eof, res);
		}
		return transport_result(transport_result::tls_handshake, res);
	}

	established_ = true;
	logger_.log(logmsg::debug_info, "TLS connection established, protocol %s, cipher %s", get_protocol(), get_cipher());

	return transport_result();
}

rwresult tls_layer::impl::failure(ssize_t res, char const* function)
{
	if (!transport_error_) {
		logger_.log(logmsg::debug_warning, "%s failed in layer below TLS: %s", function, to_string(transport_error_.error_));
		return transport_error_;
	}

	if (res == GNUTLS_E_PREMATURE_TERMINATION) {
		log_error(static_cast<int>(res), function, logmsg::debug_warning);
		return rwresult(transport_result::tls_eof, static_cast<int>(res));
	}

	log_error(static_cast<int>(res), function);
	established_ = false;
	return rwresult(transport_result::tls_terminated, static_cast<int>(res));
}

rwresult tls_layer::impl::read(void* buffer, size_t size)
{
	if (!established_) {
		return rwresult(transport_result::tls_not_established);
	}

	ssize_t res;
	do {
		res = gnutls_record_recv(session_, buffer, size);
	} while (res < 0 && !gnutls_error_is_fatal(res));

	if (res < 0) {
		return failure(res, "gnutls_record_recv");
	}

	return rwresult(static_cast<size_t>(res));
}

rwresult tls_layer::impl::write(void const* buffer, size_t size)
{
	if (!established_) {
		return rwresult(transport_result::tls_not_established);
	}

	ssize_t res;
	do {
		res = gnutls_record_send(session_, buffer, size);
	} while (res < 0 && !gnutls_error_is_fatal(res));

	if (res < 0) {
		return failure(res, "gnutls_record_send");
	}

	return rwresult(static_cast<size_t>(res));
}

int tls_layer::impl::shutdown()
{
	if (!established_) {
		return ENOTCONN;
	}

	int res;
	do {
		res = gnutls_bye(session_, GNUTLS_SHUT_WR);
	} while (res == GNUTLS_E_AGAIN || res == GNUTLS_E_INTERRUPTED);

	if (res < 0) {
		log_error(res, "gnutls_bye", logmsg::debug_warning);
		return ECONNABORTED;
	}

	return next_layer_->shutdown();
}

std::string tls_layer::impl::get_protocol() const
{
	if (!session_) {
		return std::string();
	}
	char const* s = gnutls_protocol_get_name(gnutls_protocol_get_version(session_));
	return s ? s : "unknown";
}

std::string tls_layer::impl::get_cipher() const
{
	if (!session_) {
		return std::string();
	}
	char const* s = gnutls_cipher_get_name(gnutls_cipher_get(session_));
	return s ? s : "unknown";
}

tls_layer::tls_layer(std::unique_ptr<connection> next_layer, tls_settings const& settings, logger_interface & logger)
	: impl_(std::make_unique<impl>(std::move(next_layer), settings, logger))
{
}

tls_layer::~tls_layer()
{
}

transport_result tls_layer::client_handshake(std::string const& hostname)
{
	return impl_->client_handshake(hostname);
}

rwresult tls_layer::read(void* buffer, size_t size)
{
	return impl_->read(buffer, size);
}

rwresult tls_layer::write(void const* buffer, size_t size)
{
	return impl_->write(buffer, size);
}

int tls_layer::shutdown()
{
	return impl_->shutdown();
}

std::string tls_layer::get_protocol() const
{
	return impl_->get_protocol();
}

std::string tls_layer::get_cipher() const
{
	return impl_->get_cipher();
}

std::string tls_layer::get_gnutls_version()
{
	char const* v = gnutls_check_version(nullptr);
	return v ? v : std::string();
}

}
