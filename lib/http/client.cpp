#include "../libhtls/http/client.hpp"
#include "../libhtls/buffer.hpp"
#include "../libhtls/format.hpp"
#include "../libhtls/logger.hpp"

#include <atomic>
#include <cstring>

using namespace std::literals;

namespace htls::http::client {

namespace {
constexpr size_t const max_line_size = 8192;
constexpr size_t const max_header_lines = 4096;

enum class transfer_encoding
{
	identity,
	chunked,
	none
};

/// Reads a single response from a connection
class response_reader final
{
public:
	response_reader(connection & c, logger_interface & logger)
		: conn_(c)
		, logger_(logger)
	{}

	transport_result read_header(response & res);
	transport_result read_body(response & res, transfer_encoding te, std::optional<uint64_t> const& length, size_t max_body_size);

private:
	transport_result fill();

	// Finds the end of the first line in the receive buffer. Sets found to false if the line is incomplete.
	transport_result find_line(size_t & length, bool & found, char const* context);

	transport_result read_chunked_body(response & res, size_t max_body_size);
	transport_result append_body(response & res, size_t n, size_t max_body_size);

	transport_result error(char const* context, char const* what)
	{
		logger_.log(logmsg::error, "Malformed %s: %s", context, what);
		return transport_result(transport_result::invalid_response);
	}

	connection & conn_;
	logger_interface & logger_;

	htls::buffer recv_buffer_;
	bool eof_{};
	bool got_data_{};
};

transport_result response_reader::fill()
{
	size_t const chunk_size = 16 * 1024;
	auto r = conn_.read(recv_buffer_.get(chunk_size), chunk_size);
	if (!r) {
		return r.to_result();
	}
	if (!r.value_) {
		eof_ = true;
	}
	else {
		recv_buffer_.add(r.value_);
		got_data_ = true;
	}
	return transport_result();
}

transport_result response_reader::find_line(size_t & length, bool & found, char const* context)
{
	found = false;

	size_t i = 0;
	for (i = 0; (i + 1) < recv_buffer_.size(); ++i) {
		if (recv_buffer_[i] == '\r') {
			if (recv_buffer_[i + 1] != '\n') {
				return error(context, "Server not sending proper line endings");
			}
			break;
		}
		if (!recv_buffer_[i]) {
			return error(context, "Null character in line");
		}
	}

	if ((i + 1) >= recv_buffer_.size()) {
		if (recv_buffer_.size() >= max_line_size) {
			return error(context, "Line length exceeded");
		}
		return transport_result();
	}

	length = i;
	found = true;
	return transport_result();
}

transport_result response_reader::read_header(response & res)
{
	// Set while skipping the header of a 100 Continue response
	bool interim{};

	for (;;) {
		size_t i{};
		bool found{};
		auto r = find_line(i, found, "response header");
		if (!r) {
			return r;
		}

		if (!found) {
			if (eof_) {
				if (!got_data_) {
					logger_.log(logmsg::error, "Connection closed by server without sending a response");
					return transport_result(transport_result::no_response);
				}
				logger_.log(logmsg::error, "Connection closed by server while receiving the response header");
				return transport_result(transport_result::invalid_response);
			}
			r = fill();
			if (!r) {
				return r;
			}
			continue;
		}

		std::string_view const line = recv_buffer_.to_view().substr(0, i);
		if (!line.empty()) {
			logger_.log_raw(logmsg::reply, line);
		}

		if (interim) {
			if (!i) {
				interim = false;
			}
		}
		else if (!res.got_code()) {
			if (line.size() < 12 || memcmp(line.data(), "HTTP/1.", 7) || line[8] != ' ' || (line.size() > 12 && line[12] != ' ')) {
				// Invalid HTTP Status-Line
				logger_.log(logmsg::error, "Invalid HTTP Response");
				return transport_result(transport_result::invalid_response);
			}

			if (line[9] < '1' || line[9] > '5' ||
				line[10] < '0' || line[10] > '9' ||
				line[11] < '0' || line[11] > '9')
			{
				// Invalid response code
				logger_.log(logmsg::error, "Invalid response code");
				return transport_result(transport_result::invalid_response);
			}

			unsigned int code = (line[9] - '0') * 100 + (line[10] - '0') * 10 + line[11] - '0';
			if (code == 100) {
				interim = true;
			}
			else {
				res.code_ = code;
				res.reason_ = line.size() > 13 ? std::string(line.substr(13)) : std::string();
				res.flags_ |= response::flag_got_code;
			}
		}
		else {
			if (!i) {
				// End of header
				recv_buffer_.consume(2);
				res.flags_ |= response::flag_got_header;
				return transport_result();
			}

			auto delim_pos = line.find(':');
			if (delim_pos == std::string_view::npos || !delim_pos) {
				return error("response header", "Invalid line");
			}

			std::string_view value = trimmed(line.substr(delim_pos + 1), " \t"sv);
			res.headers_.add(std::string(line.substr(0, delim_pos)), std::string(value));

			if (res.headers_.size() >= max_header_lines) {
				logger_.log(logmsg::error, "Too many header lines");
				return transport_result(transport_result::invalid_response);
			}
		}

		recv_buffer_.consume(i + 2);
	}
}

transport_result response_reader::append_body(response & res, size_t n, size_t max_body_size)
{
	if (res.body_.size() + n > max_body_size) {
		logger_.log(logmsg::error, "Response body exceeds the limit of %u bytes", max_body_size);
		return transport_result(transport_result::response_too_large);
	}

	res.body_.append(reinterpret_cast<char const*>(recv_buffer_.get()), n);
	recv_buffer_.consume(n);
	return transport_result();
}

transport_result response_reader::read_body(response & res, transfer_encoding te, std::optional<uint64_t> const& length, size_t max_body_size)
{
	if (te == transfer_encoding::none) {
		return transport_result();
	}

	if (te == transfer_encoding::chunked) {
		return read_chunked_body(res, max_body_size);
	}

	if (length) {
		if (*length > max_body_size) {
			logger_.log(logmsg::error, "Response body exceeds the limit of %u bytes", max_body_size);
			return transport_result(transport_result::response_too_large);
		}

		uint64_t remaining = *length;
		while (remaining) {
			if (recv_buffer_.empty()) {
				if (eof_) {
					logger_.log(logmsg::error, "Connection closed by server before the response body was complete");
					return transport_result(transport_result::invalid_response);
				}
				auto r = fill();
				if (!r) {
					return r;
				}
				continue;
			}

			size_t n = recv_buffer_.size();
			if (n > remaining) {
				n = static_cast<size_t>(remaining);
			}
			auto r = append_body(res, n, max_body_size);
			if (!r) {
				return r;
			}
			remaining -= n;
		}
	}
	else {
		// Body is delimited by the end of the connection
		while (!eof_) {
			if (!recv_buffer_.empty()) {
				auto r = append_body(res, recv_buffer_.size(), max_body_size);
				if (!r) {
					return r;
				}
			}
			auto r = fill();
			if (!r) {
				if (r.error_ == transport_result::tls_eof) {
					logger_.log(logmsg::debug_warning, "Server did not properly shut down TLS connection");
					break;
				}
				return r;
			}
		}
		if (!recv_buffer_.empty()) {
			auto r = append_body(res, recv_buffer_.size(), max_body_size);
			if (!r) {
				return r;
			}
		}
	}

	return transport_result();
}

transport_result response_reader::read_chunked_body(response & res, size_t max_body_size)
{
	bool trailer{};
	for (;;) {
		size_t i{};
		bool found{};
		auto r = find_line(i, found, "chunk data");
		if (!r) {
			return r;
		}
		if (!found) {
			if (eof_) {
				logger_.log(logmsg::error, "Connection closed by server before the response body was complete");
				return transport_result(transport_result::invalid_response);
			}
			r = fill();
			if (!r) {
				return r;
			}
			continue;
		}

		if (trailer) {
			recv_buffer_.consume(i + 2);
			if (!i) {
				// We're done
				return transport_result();
			}

			// Ignore the trailer
			continue;
		}

		// Read chunk size
		uint64_t size{};
		unsigned char const* const begin = recv_buffer_.get();
		unsigned char const* const end = begin + i;
		unsigned char const* q;
		for (q = begin; q != end && *q != ';' && *q != ' '; ++q) {
			if (size & 0xf000000000000000ull) {
				return error("chunk data", "Invalid chunk size");
			}
			size *= 16;
			if (*q >= '0' && *q <= '9') {
				size += *q - '0';
			}
			else if (*q >= 'A' && *q <= 'F') {
				size += *q - 'A' + 10;
			}
			else if (*q >= 'a' && *q <= 'f') {
				size += *q - 'a' + 10;
			}
			else {
				return error("chunk data", "Invalid chunk size");
			}
		}
		if (q == begin) {
			return error("chunk data", "Invalid chunk size");
		}
		recv_buffer_.consume(i + 2);

		if (!size) {
			trailer = true;
			continue;
		}

		if (res.body_.size() + size > max_body_size) {
			logger_.log(logmsg::error, "Response body exceeds the limit of %u bytes", max_body_size);
			return transport_result(transport_result::response_too_large);
		}

		// Chunk data followed by CRLF
		uint64_t remaining = size;
		while (remaining || recv_buffer_.size() < 2) {
			if (remaining && !recv_buffer_.empty()) {
				size_t n = recv_buffer_.size();
				if (n > remaining) {
					n = static_cast<size_t>(remaining);
				}
				r = append_body(res, n, max_body_size);
				if (!r) {
					return r;
				}
				remaining -= n;
				continue;
			}
			if (eof_) {
				logger_.log(logmsg::error, "Connection closed by server before the response body was complete");
				return transport_result(transport_result::invalid_response);
			}
			r = fill();
			if (!r) {
				return r;
			}
		}

		if (recv_buffer_[0] != '\r' || recv_buffer_[1] != '\n') {
			return error("chunk data", "Chunk data improperly terminated");
		}
		recv_buffer_.consume(2);
	}
}

bool is_http_scheme(std::string const& scheme)
{
	return scheme == "http"sv || scheme == "https"sv;
}

std::string strip_brackets(std::string const& host)
{
	if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
		return host.substr(1, host.size() - 2);
	}
	return host;
}
}

bool default_retryable(transport_result const& r)
{
	return r.error_ == transport_result::tls_eof || r.error_ == transport_result::no_response;
}

bool default_wrap(transport_result const& r)
{
	switch (r.error_) {
	case transport_result::io:
	case transport_result::tls_terminated:
	case transport_result::tls_handshake:
	case transport_result::tls_not_established:
		return true;
	default:
		return false;
	}
}

transport_result manager_settings::validate() const
{
	if (socks_ && proxy_) {
		return transport_result(transport_result::config);
	}
	if (socks_ && socks_->host_.empty()) {
		return transport_result(transport_result::config);
	}
	if (proxy_ && (proxy_->host_.empty() || !proxy_->port_)) {
		return transport_result(transport_result::config);
	}
	return transport_result();
}

manager_settings mk_manager_settings(tls_settings const& tls, std::optional<socks_settings> const& socks)
{
	manager_settings ret;
	ret.tls_ = tls;
	ret.socks_ = socks;
	return ret;
}

manager_settings tls_manager_settings()
{
	return mk_manager_settings(tls_settings());
}

transport_result validate_tunnel_reply(connection & c, logger_interface & logger)
{
	std::string reply;
	while (reply.size() < 4 || reply.compare(reply.size() - 4, 4, "\r\n\r\n"sv)) {
		if (reply.size() >= max_line_size * 4) {
			logger.log(logmsg::error, "Proxy reply too long");
			return transport_result(transport_result::proxy_rejected);
		}

		// One byte at a time, the TLS handshake follows directly on the same stream
		char ch{};
		auto r = c.read(&ch, 1);
		if (!r) {
			return r.to_result();
		}
		if (!r.value_) {
			logger.log(logmsg::error, "Proxy closed connection");
			return transport_result(transport_result::proxy_rejected);
		}
		reply += ch;
	}

	auto const lines = strtok_view(reply, "\r\n"sv);
	for (auto const& line : lines) {
		logger.log_raw(logmsg::reply, line);
	}

	std::string_view const status = lines.empty() ? std::string_view() : lines.front();
	if (status.size() < 12 || !starts_with(status, "HTTP/1."sv) || status[8] != ' ') {
		logger.log(logmsg::error, "Invalid reply from proxy");
		return transport_result(transport_result::proxy_rejected);
	}

	int const code = to_integral<int>(status.substr(9, 3), -1);
	if (code < 200 || code >= 300) {
		logger.log(logmsg::error, "Proxy refused tunnel with %s", status.substr(9));
		return transport_result(transport_result::proxy_rejected, code);
	}

	return transport_result();
}

class manager::impl final
{
public:
	impl(manager_settings && settings, logger_interface & logger);

	transport_result perform(request const& req, response & res, bool with_body);

	manager_settings const settings_;

private:
	transport_result perform_with_retry(request const& req, response & res, bool with_body);
	transport_result exchange(request const& req, response & res, bool with_body);

	std::optional<proxy_settings> get_proxy(uri const& u) const;
	std::unique_ptr<connection> open_connection(request const& req, bool & absolute_form, transport_result & error);
	std::string assemble_request(request & req, bool absolute_form);

	logger_interface & logger_;
	std::shared_ptr<connection_provider> provider_;
};

manager::impl::impl(manager_settings && settings, logger_interface & logger)
	: settings_(std::move(settings))
	, logger_(logger)
	, provider_(settings_.provider_)
{
	if (!provider_) {
		provider_ = std::make_shared<default_connection_provider>(logger_, settings_.timeout_);
	}
}

std::optional<proxy_settings> manager::impl::get_proxy(uri const& u) const
{
	if (settings_.proxy_) {
		return settings_.proxy_;
	}
	if (settings_.socks_ || !settings_.use_environment_proxy_) {
		return {};
	}
	return proxy_from_environment(u.is_secure(), strip_brackets(u.host_));
}

std::unique_ptr<connection> manager::impl::open_connection(request const& req, bool & absolute_form, transport_result & error)
{
	absolute_form = false;

	bool const https = req.uri_.is_secure();
	unsigned short const port = req.uri_.effective_port();

	auto const proxy = get_proxy(req.uri_);
	if (!proxy) {
		logger_.log(logmsg::status, "Connecting to %s:%u", req.uri_.host_, port);
		return provider_->open(req.uri_.host_, port, https ? &settings_.tls_ : nullptr, settings_.socks_ ? &*settings_.socks_ : nullptr, error);
	}

	if (settings_.socks_) {
		logger_.log(logmsg::error, "Cannot use both a SOCKS and an HTTP proxy");
		error = transport_result(transport_result::config);
		return nullptr;
	}

	if (!https) {
		logger_.log(logmsg::status, "Connecting to proxy %s:%u", proxy->host_, proxy->port_);
		absolute_form = true;
		return provider_->open(proxy->host_, proxy->port_, nullptr, nullptr, error);
	}

	logger_.log(logmsg::status, "Connecting to %s:%u through proxy %s:%u", req.uri_.host_, port, proxy->host_, proxy->port_);

	std::string const authority = sprintf("%s:%u", req.uri_.host_, port);
	logger_.log(logmsg::command, "CONNECT %s HTTP/1.1", authority);
	std::string const connect = sprintf("CONNECT %s HTTP/1.1\r\nHost: %s\r\n\r\n", authority, authority);

	logger_interface & logger = logger_;
	auto validator = [&logger](connection & c) {
		return validate_tunnel_reply(c, logger);
	};

	return provider_->open_via_proxy_tunnel(connect, validator, req.uri_.host_, proxy->host_, proxy->port_, settings_.tls_, error);
}

std::string manager::impl::assemble_request(request & req, bool absolute_form)
{
	req.headers_.set("Host"s, get_canonical_host(req.uri_));
	if (!req.has_header("Connection"sv)) {
		req.headers_.add("Connection"s, "close"s);
	}
	if (!req.has_header("User-Agent"sv) && !settings_.user_agent_.empty()) {
		req.headers_.add("User-Agent"s, settings_.user_agent_);
	}
	if (req.cookie_jar_ && !req.has_header("Cookie"sv)) {
		auto cookies = req.cookie_jar_->cookie_header(req.uri_);
		if (!cookies.empty()) {
			req.headers_.add("Cookie"s, std::move(cookies));
		}
	}
	req.update_content_length_from_body();

	std::string const target = absolute_form ? req.uri_.to_string() : req.uri_.get_request();

	std::string out = sprintf("%s %s HTTP/1.1", req.verb_, target);
	if (req.flags_ & request::flag_confidential_path) {
		logger_.log(logmsg::command, "%s <confidential> HTTP/1.1", req.verb_);
	}
	else if (req.flags_ & request::flag_confidential_querystring) {
		uri u = req.uri_;
		u.query_.clear();
		logger_.log(logmsg::command, "%s %s HTTP/1.1", req.verb_, absolute_form ? u.to_string() : u.get_request(false));
	}
	else {
		logger_.log(logmsg::command, "%s", out);
	}
	out += "\r\n";

	for (auto const& header : req.headers_) {
		std::string line = sprintf("%s: %s", header.first, header.second);
		if (equal_insensitive_ascii(header.first, "Authorization"sv) || equal_insensitive_ascii(header.first, "Proxy-Authorization"sv)) {
			logger_.log(logmsg::command, "%s: %s", header.first, std::string(header.second.size(), '*'));
		}
		else {
			logger_.log(logmsg::command, "%s", line);
		}
		out += line;
		out += "\r\n";
	}
	out += "\r\n";
	out += req.body_;

	return out;
}

transport_result manager::impl::exchange(request const& original, response & res, bool with_body)
{
	res.reset();

	request req = original;
	if (req.verb_.empty()) {
		req.verb_ = "GET";
	}
	if (req.uri_.path_.empty()) {
		req.uri_.path_ = "/";
	}

	bool absolute_form{};
	transport_result result;
	auto conn = open_connection(req, absolute_form, result);
	if (!conn) {
		if (result) {
			result = transport_result(transport_result::connect);
		}
		return result;
	}

	result = conn->write_all(assemble_request(req, absolute_form));
	if (!result) {
		logger_.log(logmsg::error, "Could not send request: %s", to_string(result.error_));
		return result;
	}

	response_reader reader(*conn, logger_);
	result = reader.read_header(res);
	if (!result) {
		return result;
	}

	if (req.verb_ == "HEAD"sv || res.code_prohibits_body()) {
		res.flags_ |= response::flag_no_body;
	}

	if (req.cookie_jar_) {
		res.cookie_jar_ = *req.cookie_jar_;
		res.cookie_jar_.update(req.uri_, res.headers_.get_all("Set-Cookie"sv));
	}

	if (!with_body) {
		return result;
	}

	transfer_encoding te = transfer_encoding::identity;
	std::optional<uint64_t> length;
	if (res.no_body()) {
		te = transfer_encoding::none;
	}
	else {
		if (res.chunked_encoding()) {
			te = transfer_encoding::chunked;
		}
		else if (res.has_header("Transfer-Encoding"sv) && !equal_insensitive_ascii(res.get_header("Transfer-Encoding"sv), "identity"sv)) {
			logger_.log(logmsg::error, "Malformed response header: %s", "Unknown transfer encoding");
			return transport_result(transport_result::invalid_response);
		}
		else if (res.has_header("Content-Length"sv)) {
			length = res.get_content_length();
			if (!length) {
				logger_.log(logmsg::error, "Malformed response header: %s", "Invalid Content-Length");
				return transport_result(transport_result::invalid_response);
			}
		}
	}

	result = reader.read_body(res, te, length, settings_.max_body_size_);
	if (result) {
		res.flags_ |= response::flag_got_body;

		// Sends the TLS close_notify alert before the connection goes away
		int const error = conn->shutdown();
		if (error) {
			logger_.log(logmsg::debug_warning, "Could not shut down connection: %s", socket_error_string(error));
		}
	}
	return result;
}

transport_result manager::impl::perform_with_retry(request const& req, response & res, bool with_body)
{
	auto result = exchange(req, res, with_body);
	if (!result && req.idempotent() && settings_.retryable_ && settings_.retryable_(result)) {
		logger_.log(logmsg::debug_info, "Request failed with %s, retrying once", to_string(result.error_));
		result = exchange(req, res, with_body);
	}
	return result;
}

transport_result manager::impl::perform(request const& req, response & res, bool with_body)
{
	auto wrap = [this](transport_result r) {
		if (!r && settings_.wrap_ && settings_.wrap_(r)) {
			r.internal_ = true;
		}
		return r;
	};

	if (req.uri_.host_.empty() || !is_http_scheme(req.uri_.scheme_)) {
		logger_.log(logmsg::error, "Invalid request URI, need an absolute http or https URI");
		res.reset();
		return wrap(transport_result(transport_result::invalid));
	}

	request current = req;
	for (unsigned int redirects = 0;; ++redirects) {
		auto result = perform_with_retry(current, res, with_body);
		if (!result || !res.is_redirect()) {
			return wrap(result);
		}

		auto const location = res.headers_.get("Location"sv);
		if (!location) {
			logger_.log(logmsg::debug_warning, "Redirect response without Location header");
			return result;
		}

		if (redirects >= settings_.max_redirects_) {
			logger_.log(logmsg::error, "Too many redirects");
			return wrap(transport_result(transport_result::too_many_redirects));
		}

		uri target;
		if (!target.parse(*location) || !target.resolve(current.uri_) || target.host_.empty() || !is_http_scheme(target.scheme_)) {
			logger_.log(logmsg::error, "Invalid redirect target '%s'", *location);
			return wrap(transport_result(transport_result::invalid_response));
		}

		logger_.log(logmsg::status, "Following redirect to %s", target.to_string());

		bool const post = current.verb_ == "POST"sv;
		if (res.code_ == 303 || (post && (res.code_ == 301 || res.code_ == 302))) {
			if (current.verb_ != "HEAD"sv) {
				current.verb_ = "GET";
			}
			current.body_.clear();
			current.headers_.erase("Content-Length"sv);
			current.headers_.erase("Content-Type"sv);
			current.headers_.erase("Transfer-Encoding"sv);
		}

		if (current.cookie_jar_) {
			current.cookie_jar_ = res.cookie_jar_;
		}

		// Credentials are only for the origin they were meant for
		if (!equal_insensitive_ascii(target.scheme_, current.uri_.scheme_) || !equal_insensitive_ascii(target.host_, current.uri_.host_) ||
			target.effective_port() != current.uri_.effective_port())
		{
			if (current.headers_.erase("Authorization"sv)) {
				logger_.log(logmsg::debug_info, "Dropping Authorization header on redirect to a different origin");
			}
		}
		current.uri_ = std::move(target);
	}
}

manager::manager(manager_settings && settings, logger_interface & logger)
	: impl_(std::make_unique<impl>(std::move(settings), logger))
{
}

manager::~manager()
{
}

transport_result manager::perform(request const& req, response & res)
{
	return impl_->perform(req, res, true);
}

transport_result manager::perform_no_body(request const& req, response & res)
{
	return impl_->perform(req, res, false);
}

manager_settings const& manager::settings() const
{
	return impl_->settings_;
}

std::shared_ptr<manager> make_manager(manager_settings settings, logger_interface & logger, transport_result * error)
{
	auto result = settings.validate();
	if (error) {
		*error = result;
	}
	if (!result) {
		logger.log(logmsg::error, "Invalid manager settings: %s", to_string(result.error_));
		return nullptr;
	}

	return std::shared_ptr<manager>(new manager(std::move(settings), logger));
}

namespace {
std::shared_ptr<issuer> & global_issuer()
{
	static std::shared_ptr<issuer> instance;
	return instance;
}
}

std::shared_ptr<issuer> get_global_issuer()
{
	auto & storage = global_issuer();

	auto current = std::atomic_load(&storage);
	if (current) {
		return current;
	}

	std::shared_ptr<issuer> created = make_manager(tls_manager_settings(), get_null_logger());
	if (std::atomic_compare_exchange_strong(&storage, &current, created)) {
		return created;
	}

	// Lost the race, current now holds the winner
	return current;
}

bool set_global_issuer(std::shared_ptr<issuer> const& i)
{
	if (!i) {
		return false;
	}

	std::atomic_store(&global_issuer(), i);
	return true;
}

}
