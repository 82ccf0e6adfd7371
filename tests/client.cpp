#include "../lib/libhtls/http/client.hpp"

#include "test_utils.hpp"

using namespace std::literals;

class client_test final : public CppUnit::TestFixture
{
	CPPUNIT_TEST_SUITE(client_test);
	CPPUNIT_TEST(test_content_length);
	CPPUNIT_TEST(test_chunked);
	CPPUNIT_TEST(test_read_to_close);
	CPPUNIT_TEST(test_no_body);
	CPPUNIT_TEST(test_head);
	CPPUNIT_TEST(test_interim_response);
	CPPUNIT_TEST(test_request_headers);
	CPPUNIT_TEST(test_authorization_masked);
	CPPUNIT_TEST(test_redirect);
	CPPUNIT_TEST(test_redirect_authorization);
	CPPUNIT_TEST(test_redirect_post);
	CPPUNIT_TEST(test_redirect_limit);
	CPPUNIT_TEST(test_retry);
	CPPUNIT_TEST(test_no_retry_post);
	CPPUNIT_TEST(test_wrap);
	CPPUNIT_TEST(test_no_response);
	CPPUNIT_TEST(test_invalid_response);
	CPPUNIT_TEST(test_too_large);
	CPPUNIT_TEST(test_invalid_request);
	CPPUNIT_TEST(test_config);
	CPPUNIT_TEST(test_proxy_plain);
	CPPUNIT_TEST(test_proxy_tunnel);
	CPPUNIT_TEST(test_proxy_rejected);
	CPPUNIT_TEST(test_global_issuer);
	CPPUNIT_TEST_SUITE_END();

public:
	void setUp() {}
	void tearDown() {}

	void test_content_length();
	void test_chunked();
	void test_read_to_close();
	void test_no_body();
	void test_head();
	void test_interim_response();
	void test_request_headers();
	void test_authorization_masked();
	void test_redirect();
	void test_redirect_authorization();
	void test_redirect_post();
	void test_redirect_limit();
	void test_retry();
	void test_no_retry_post();
	void test_wrap();
	void test_no_response();
	void test_invalid_response();
	void test_too_large();
	void test_invalid_request();
	void test_config();
	void test_proxy_plain();
	void test_proxy_tunnel();
	void test_proxy_rejected();
	void test_global_issuer();
};

CPPUNIT_TEST_SUITE_REGISTRATION(client_test);

namespace {
struct fixture
{
	explicit fixture(std::function<void(htls::http::client::manager_settings&)> const& modify = nullptr)
	{
		provider_ = std::make_shared<scripted_provider>();

		auto settings = htls::http::client::tls_manager_settings();
		settings.provider_ = provider_;
		settings.use_environment_proxy_ = false;
		settings.user_agent_ = "libhtls_test";
		if (modify) {
			modify(settings);
		}

		manager_ = htls::http::client::make_manager(std::move(settings), logger_);
	}

	htls::http::client::request get(std::string_view const& u, std::string const& verb = "GET")
	{
		htls::http::client::request req;
		req.uri_.parse(u);
		req.verb_ = verb;
		return req;
	}

	capture_logger logger_;
	std::shared_ptr<scripted_provider> provider_;
	std::shared_ptr<htls::http::client::manager> manager_;
};

bool contains(std::string const& haystack, std::string_view const& needle)
{
	return haystack.find(needle) != std::string::npos;
}
}

void client_test::test_content_length()
{
	fixture f;
	CPPUNIT_ASSERT(f.manager_);
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Test: a\r\n\r\nhello");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/path?q=1"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(200u, res.code_);
	CPPUNIT_ASSERT_EQUAL("OK"s, res.reason_);
	CPPUNIT_ASSERT_EQUAL("hello"s, res.body_);
	CPPUNIT_ASSERT_EQUAL("a"s, res.get_header("x-test"sv));
	CPPUNIT_ASSERT(res.got_body());

	CPPUNIT_ASSERT_EQUAL(size_t(1), f.provider_->targets_.size());
	CPPUNIT_ASSERT_EQUAL("example.com:80"s, f.provider_->targets_[0]);
	CPPUNIT_ASSERT(!f.provider_->tls_[0]);

	auto const& sent = f.provider_->written(0);
	CPPUNIT_ASSERT(htls::starts_with(sent, "GET /path?q=1 HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(contains(sent, "\r\nHost: example.com\r\n"sv));
	CPPUNIT_ASSERT(contains(sent, "\r\nConnection: close\r\n"sv));
	CPPUNIT_ASSERT(contains(sent, "\r\nUser-Agent: libhtls_test\r\n"sv));
	CPPUNIT_ASSERT(!contains(sent, "Content-Length"sv));
	CPPUNIT_ASSERT(htls::ends_with(sent, "\r\n\r\n"sv));

	// Orderly shutdown once the response is complete
	CPPUNIT_ASSERT_EQUAL(size_t(1), *f.provider_->shutdowns_);

	// Not after a failed exchange
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel");
	r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT(!r);
	CPPUNIT_ASSERT_EQUAL(size_t(1), *f.provider_->shutdowns_);
}

void client_test::test_chunked()
{
	fixture f;
	f.provider_->add("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
		"5\r\nhello\r\n"
		"6;name=value\r\n world\r\n"
		"0\r\nX-Trailer: 1\r\n\r\n");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("https://example.com/"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL("hello world"s, res.body_);
	CPPUNIT_ASSERT_EQUAL("example.com:443"s, f.provider_->targets_[0]);
	CPPUNIT_ASSERT(f.provider_->tls_[0]);

	fixture broken;
	broken.provider_->add("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nhello\r\n0\r\n\r\n");
	r = broken.manager_->perform(broken.get("https://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid_response, r.error_);

	fixture unknown;
	unknown.provider_->add("HTTP/1.1 200 OK\r\nTransfer-Encoding: gzip\r\n\r\n");
	r = unknown.manager_->perform(unknown.get("https://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid_response, r.error_);
}

void client_test::test_read_to_close()
{
	fixture f;
	f.provider_->add("HTTP/1.0 200 OK\r\nContent-Type: text/plain\r\n\r\nuntil the end");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL("until the end"s, res.body_);

	// Truncated bodies are errors when the length is known
	fixture truncated;
	truncated.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
	r = truncated.manager_->perform(truncated.get("http://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid_response, r.error_);
}

void client_test::test_no_body()
{
	fixture f;
	f.provider_->add("HTTP/1.1 401 Unauthorized\r\nWWW-Authenticate: Digest realm=\"r\", nonce=\"n\"\r\nContent-Length: 12\r\n\r\nUnauthorized");

	htls::http::client::response res;
	auto r = f.manager_->perform_no_body(f.get("http://example.com/secret"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(401u, res.code_);
	CPPUNIT_ASSERT_EQUAL("Digest realm=\"r\", nonce=\"n\""s, res.get_header("WWW-Authenticate"sv));
	CPPUNIT_ASSERT(res.body_.empty());
	CPPUNIT_ASSERT(!res.got_body());
}

void client_test::test_head()
{
	fixture f;
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 1000\r\n\r\n");
	f.provider_->add("HTTP/1.1 204 No Content\r\n\r\n");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/", "HEAD"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT(res.no_body());
	CPPUNIT_ASSERT(res.body_.empty());

	r = f.manager_->perform(f.get("http://example.com/", "DELETE"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(204u, res.code_);
	CPPUNIT_ASSERT(res.no_body());
	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(1), "DELETE / HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(contains(f.provider_->written(1), "\r\nContent-Length: 0\r\n"sv));
}

void client_test::test_interim_response()
{
	fixture f;
	f.provider_->add("HTTP/1.1 100 Continue\r\nX-Interim: 1\r\n\r\nHTTP/1.1 201 Created\r\nContent-Length: 2\r\n\r\nok");

	htls::http::client::response res;
	auto req = f.get("http://example.com/upload", "PUT");
	req.body_ = "payload";
	auto r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(201u, res.code_);
	CPPUNIT_ASSERT_EQUAL("ok"s, res.body_);
	CPPUNIT_ASSERT(!res.has_header("X-Interim"sv));

	auto const& sent = f.provider_->written(0);
	CPPUNIT_ASSERT(contains(sent, "\r\nContent-Length: 7\r\n"sv));
	CPPUNIT_ASSERT(htls::ends_with(sent, "\r\n\r\npayload"sv));
}

void client_test::test_request_headers()
{
	fixture f;
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	auto req = f.get("http://example.com:8080/");
	req.headers_.add("Connection", "keep-alive");
	req.headers_.add("User-Agent", "custom");
	req.headers_.add("Cookie", "manual=1");
	CPPUNIT_ASSERT(req.cookie_jar_);
	req.cookie_jar_->update(req.uri_, "auto=2"sv);

	htls::http::client::response res;
	auto r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);

	auto const& sent = f.provider_->written(0);
	CPPUNIT_ASSERT(contains(sent, "\r\nHost: example.com:8080\r\n"sv));
	CPPUNIT_ASSERT(contains(sent, "\r\nConnection: keep-alive\r\n"sv));
	CPPUNIT_ASSERT(!contains(sent, "close"sv));
	CPPUNIT_ASSERT(contains(sent, "\r\nUser-Agent: custom\r\n"sv));
	CPPUNIT_ASSERT(!contains(sent, "libhtls_test"sv));
	CPPUNIT_ASSERT(contains(sent, "\r\nCookie: manual=1\r\n"sv));
	CPPUNIT_ASSERT(!contains(sent, "auto=2"sv));

	// Cookies from the jar
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\nSet-Cookie: fresh=3\r\n\r\n");
	req.headers_.erase("Cookie"sv);
	r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT(contains(f.provider_->written(1), "\r\nCookie: auto=2\r\n"sv));
	CPPUNIT_ASSERT_EQUAL(size_t(2), res.cookie_jar_.size());

	// Without jar, cookies are neither sent nor remembered
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\nSet-Cookie: fresh=3\r\n\r\n");
	req.cookie_jar_.reset();
	r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT(!contains(f.provider_->written(2), "Cookie"sv));
	CPPUNIT_ASSERT(res.cookie_jar_.empty());
}

void client_test::test_authorization_masked()
{
	fixture f;
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	auto req = f.get("http://example.com/private?token=secret");
	req.headers_.add("authorization", "Basic c2VjcmV0");
	req.flags_ = htls::http::client::request::flag_confidential_querystring;

	htls::http::client::response res;
	auto r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);

	CPPUNIT_ASSERT(contains(f.provider_->written(0), "\r\nauthorization: Basic c2VjcmV0\r\n"sv));
	CPPUNIT_ASSERT(f.logger_.contains("authorization: **************"sv));
	CPPUNIT_ASSERT(f.logger_.contains("GET /private HTTP/1.1"sv));
	CPPUNIT_ASSERT(!f.logger_.contains("c2VjcmV0"sv));
	CPPUNIT_ASSERT(!f.logger_.contains("token=secret"sv));
	CPPUNIT_ASSERT(f.logger_.contains("HTTP/1.1 200 OK"sv));
}

void client_test::test_redirect()
{
	fixture f;
	f.provider_->add("HTTP/1.1 302 Found\r\nLocation: /next\r\nSet-Cookie: session=abc; Path=/\r\nContent-Length: 4\r\n\r\nmove");
	f.provider_->add("HTTP/1.1 301 Moved Permanently\r\nLocation: https://other.example/final\r\nContent-Length: 0\r\n\r\n");
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");

	// Cookies are kept without setting up a jar
	auto req = f.get("http://example.com/start");

	htls::http::client::response res;
	auto r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(200u, res.code_);
	CPPUNIT_ASSERT_EQUAL("ok"s, res.body_);

	CPPUNIT_ASSERT_EQUAL(size_t(3), f.provider_->targets_.size());
	CPPUNIT_ASSERT_EQUAL("example.com:80"s, f.provider_->targets_[1]);
	CPPUNIT_ASSERT_EQUAL("other.example:443"s, f.provider_->targets_[2]);

	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(1), "GET /next HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(contains(f.provider_->written(1), "\r\nCookie: session=abc\r\n"sv));
	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(2), "GET /final HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(contains(f.provider_->written(2), "\r\nHost: other.example\r\n"sv));
	CPPUNIT_ASSERT(!contains(f.provider_->written(2), "Cookie"sv));

	// The jar is carried over to the final response
	CPPUNIT_ASSERT_EQUAL(size_t(1), res.cookie_jar_.size());
	CPPUNIT_ASSERT_EQUAL("session"s, res.cookie_jar_.cookies().front().name_);

	// The original request stays untouched
	CPPUNIT_ASSERT(req.cookie_jar_->empty());

	// Redirects without Location are returned as is
	fixture bare;
	bare.provider_->add("HTTP/1.1 302 Found\r\nContent-Length: 0\r\n\r\n");
	r = bare.manager_->perform(bare.get("http://example.com/"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(302u, res.code_);
}

void client_test::test_redirect_authorization()
{
	fixture f;
	f.provider_->add("HTTP/1.1 302 Found\r\nLocation: /next\r\nContent-Length: 0\r\n\r\n");
	f.provider_->add("HTTP/1.1 302 Found\r\nLocation: http://EXAMPLE.com:80/same\r\nContent-Length: 0\r\n\r\n");
	f.provider_->add("HTTP/1.1 302 Found\r\nLocation: http://other.example/elsewhere\r\nContent-Length: 0\r\n\r\n");
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	auto req = f.get("http://example.com/start");
	req.headers_.add("Authorization", "Basic c2VjcmV0");

	htls::http::client::response res;
	auto r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(200u, res.code_);
	CPPUNIT_ASSERT_EQUAL(size_t(4), f.provider_->written_.size());

	// Same origin keeps the credentials
	CPPUNIT_ASSERT(contains(f.provider_->written(0), "\r\nAuthorization: Basic c2VjcmV0\r\n"sv));
	CPPUNIT_ASSERT(contains(f.provider_->written(1), "\r\nAuthorization: Basic c2VjcmV0\r\n"sv));
	CPPUNIT_ASSERT(contains(f.provider_->written(2), "\r\nAuthorization: Basic c2VjcmV0\r\n"sv));

	// A different host does not get them
	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(3), "GET /elsewhere HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(!contains(f.provider_->written(3), "Authorization"sv));
	CPPUNIT_ASSERT(f.logger_.contains("Dropping Authorization header"sv));

	// Neither does a different port or scheme on the same host
	for (auto const& location : {"http://example.com:8080/"s, "https://example.com/"s}) {
		fixture g;
		g.provider_->add("HTTP/1.1 301 Moved Permanently\r\nLocation: " + location + "\r\nContent-Length: 0\r\n\r\n");
		g.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
		r = g.manager_->perform(req, res);
		CPPUNIT_ASSERT(r);
		CPPUNIT_ASSERT(contains(g.provider_->written(0), "Authorization"sv));
		CPPUNIT_ASSERT(!contains(g.provider_->written(1), "Authorization"sv));
	}

	// The original request keeps its header
	CPPUNIT_ASSERT(req.has_header("Authorization"sv));
}

void client_test::test_redirect_post()
{
	fixture f;
	f.provider_->add("HTTP/1.1 303 See Other\r\nLocation: result\r\nContent-Length: 0\r\n\r\n");
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	auto req = f.get("http://example.com/form/submit", "POST");
	req.body_ = "a=b";
	req.set_content_type("application/x-www-form-urlencoded");

	htls::http::client::response res;
	auto r = f.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);

	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(0), "POST /form/submit HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(htls::ends_with(f.provider_->written(0), "\r\n\r\na=b"sv));

	auto const& second = f.provider_->written(1);
	CPPUNIT_ASSERT(htls::starts_with(second, "GET /form/result HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(!contains(second, "Content-Length"sv));
	CPPUNIT_ASSERT(!contains(second, "Content-Type"sv));
	CPPUNIT_ASSERT(htls::ends_with(second, "\r\n\r\n"sv));

	// 307 keeps verb and body
	fixture keep;
	keep.provider_->add("HTTP/1.1 307 Temporary Redirect\r\nLocation: /elsewhere\r\nContent-Length: 0\r\n\r\n");
	keep.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
	r = keep.manager_->perform(req, res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT(htls::starts_with(keep.provider_->written(1), "POST /elsewhere HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(htls::ends_with(keep.provider_->written(1), "\r\n\r\na=b"sv));
}

void client_test::test_redirect_limit()
{
	fixture f([](htls::http::client::manager_settings & s) { s.max_redirects_ = 2; });
	for (int i = 0; i < 5; ++i) {
		f.provider_->add("HTTP/1.1 302 Found\r\nLocation: /loop\r\nContent-Length: 0\r\n\r\n");
	}

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/loop"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::too_many_redirects, r.error_);
	CPPUNIT_ASSERT(!r.internal_);
	CPPUNIT_ASSERT_EQUAL(size_t(3), f.provider_->targets_.size());

	fixture invalid;
	invalid.provider_->add("HTTP/1.1 302 Found\r\nLocation: ftp://example.com/file\r\nContent-Length: 0\r\n\r\n");
	r = invalid.manager_->perform(invalid.get("http://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid_response, r.error_);
}

void client_test::test_retry()
{
	fixture f;
	f.provider_->add("", htls::transport_result::tls_eof);
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("https://example.com/"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL("ok"s, res.body_);
	CPPUNIT_ASSERT_EQUAL(size_t(2), f.provider_->targets_.size());

	// Only once
	fixture twice;
	twice.provider_->add("", htls::transport_result::tls_eof);
	twice.provider_->add("", htls::transport_result::tls_eof);
	twice.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
	r = twice.manager_->perform(twice.get("https://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::tls_eof, r.error_);
	CPPUNIT_ASSERT(!r.internal_);
	CPPUNIT_ASSERT_EQUAL(size_t(2), twice.provider_->targets_.size());
}

void client_test::test_no_retry_post()
{
	fixture f;
	f.provider_->add("", htls::transport_result::tls_eof);
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("https://example.com/", "POST"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::tls_eof, r.error_);
	CPPUNIT_ASSERT_EQUAL(size_t(1), f.provider_->targets_.size());
}

void client_test::test_wrap()
{
	fixture f;
	f.provider_->add("HTTP/1.1 200 OK\r\n", htls::transport_result::io);
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("https://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::io, r.error_);
	CPPUNIT_ASSERT(r.internal_);
	// io is not retryable
	CPPUNIT_ASSERT_EQUAL(size_t(1), f.provider_->targets_.size());

	// Custom policies
	fixture custom([](htls::http::client::manager_settings & s) {
		s.wrap_ = nullptr;
		s.retryable_ = [](htls::transport_result const& r) { return r.error_ == htls::transport_result::io; };
	});
	custom.provider_->add("", htls::transport_result::io);
	custom.provider_->add("", htls::transport_result::io);
	r = custom.manager_->perform(custom.get("https://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::io, r.error_);
	CPPUNIT_ASSERT(!r.internal_);
	CPPUNIT_ASSERT_EQUAL(size_t(2), custom.provider_->targets_.size());

	CPPUNIT_ASSERT(htls::http::client::default_wrap(htls::transport_result(htls::transport_result::tls_handshake)));
	CPPUNIT_ASSERT(htls::http::client::default_wrap(htls::transport_result(htls::transport_result::tls_terminated)));
	CPPUNIT_ASSERT(htls::http::client::default_wrap(htls::transport_result(htls::transport_result::tls_not_established)));
	CPPUNIT_ASSERT(!htls::http::client::default_wrap(htls::transport_result(htls::transport_result::tls_eof)));
	CPPUNIT_ASSERT(!htls::http::client::default_wrap(htls::transport_result(htls::transport_result::timeout)));
	CPPUNIT_ASSERT(htls::http::client::default_retryable(htls::transport_result(htls::transport_result::no_response)));
	CPPUNIT_ASSERT(!htls::http::client::default_retryable(htls::transport_result(htls::transport_result::io)));
}

void client_test::test_no_response()
{
	fixture f;
	f.provider_->add("");
	f.provider_->add("");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::no_response, r.error_);
	CPPUNIT_ASSERT_EQUAL(size_t(2), f.provider_->targets_.size());

	// Connection failures come from the provider
	r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::connect, r.error_);
	CPPUNIT_ASSERT_EQUAL(ECONNREFUSED, r.raw_);
}

void client_test::test_invalid_response()
{
	char const* const responses[] = {
		"FOO\r\n\r\n",
		"HTTP/1.1 2x0 OK\r\n\r\n",
		"HTTP/1.1 200 OK\r\nno colon here\r\n\r\n",
		"HTTP/1.1 200 OK\r\n: empty name\r\n\r\n",
		"HTTP/1.1 200 OK\nContent-Length: 0\n\n",
		"HTTP/1.1 200 OK\r\nContent-Length: abc\r\n\r\n",
		"HTTP/1.1 200 OK\r\nContent-Le",
	};

	for (auto const& response : responses) {
		fixture f;
		f.provider_->add(response);

		htls::http::client::response res;
		auto r = f.manager_->perform(f.get("http://example.com/"), res);
		CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid_response, r.error_);
		CPPUNIT_ASSERT_EQUAL(size_t(1), f.provider_->targets_.size());
	}

	fixture f;
	f.provider_->add("HTTP/1.1 200 OK\r\nX-Long: " + std::string(9000, 'a') + "\r\n\r\n");
	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid_response, r.error_);
}

void client_test::test_too_large()
{
	fixture f([](htls::http::client::manager_settings & s) { s.max_body_size_ = 4; });
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello");
	f.provider_->add("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n3\r\ndef\r\n0\r\n\r\n");
	f.provider_->add("HTTP/1.1 200 OK\r\n\r\nfive!");
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nfour");

	htls::http::client::response res;
	for (int i = 0; i < 3; ++i) {
		auto r = f.manager_->perform(f.get("http://example.com/"), res);
		CPPUNIT_ASSERT_EQUAL(htls::transport_result::response_too_large, r.error_);
	}

	auto r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL("four"s, res.body_);
}

void client_test::test_invalid_request()
{
	fixture f;

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("/relative/only"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid, r.error_);

	r = f.manager_->perform(f.get("ftp://example.com/file"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::invalid, r.error_);

	CPPUNIT_ASSERT(f.provider_->targets_.empty());

	// Empty verb and path default to GET /
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");
	r = f.manager_->perform(f.get("http://example.com", ""), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(0), "GET / HTTP/1.1\r\n"sv));
}

void client_test::test_config()
{
	auto settings = htls::http::client::mk_manager_settings(htls::tls_settings(), htls::socks_settings{"socks.example", 1080});
	CPPUNIT_ASSERT(settings.socks_);
	CPPUNIT_ASSERT(settings.validate());

	settings.proxy_ = htls::proxy_settings{"proxy.example", 3128};

	htls::transport_result error;
	auto m = htls::http::client::make_manager(settings, htls::get_null_logger(), &error);
	CPPUNIT_ASSERT(!m);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::config, error.error_);

	settings.socks_.reset();
	m = htls::http::client::make_manager(settings, htls::get_null_logger(), &error);
	CPPUNIT_ASSERT(m);
	CPPUNIT_ASSERT(error);
	CPPUNIT_ASSERT((*m->settings().proxy_ == htls::proxy_settings{"proxy.example", 3128}));

	auto defaults = htls::http::client::tls_manager_settings();
	CPPUNIT_ASSERT(defaults.validate());
	CPPUNIT_ASSERT(defaults.tls_.validate_certificate_);
	CPPUNIT_ASSERT(defaults.use_environment_proxy_);
	CPPUNIT_ASSERT(!defaults.proxy_);
	CPPUNIT_ASSERT(!defaults.socks_);
	CPPUNIT_ASSERT_EQUAL(10u, defaults.max_redirects_);
	CPPUNIT_ASSERT_EQUAL(size_t(16 * 1024 * 1024), defaults.max_body_size_);

	// SOCKS requests go to the provider
	fixture f([](htls::http::client::manager_settings & s) { s.socks_ = htls::socks_settings{"socks.example", 1080}; });
	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::unsupported, r.error_);
}

void client_test::test_proxy_plain()
{
	fixture f([](htls::http::client::manager_settings & s) { s.proxy_ = htls::proxy_settings{"proxy.example", 3128}; });
	f.provider_->add("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("http://example.com/a?b=c"), res);
	CPPUNIT_ASSERT(r);

	CPPUNIT_ASSERT_EQUAL("proxy.example:3128"s, f.provider_->targets_[0]);
	CPPUNIT_ASSERT(!f.provider_->tls_[0]);
	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(0), "GET http://example.com/a?b=c HTTP/1.1\r\n"sv));
	CPPUNIT_ASSERT(contains(f.provider_->written(0), "\r\nHost: example.com\r\n"sv));
}

void client_test::test_proxy_tunnel()
{
	fixture f([](htls::http::client::manager_settings & s) { s.proxy_ = htls::proxy_settings{"proxy.example", 3128}; });
	f.provider_->add("HTTP/1.1 200 Connection established\r\nProxy-Agent: test\r\n\r\nHTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("https://secure.example/x"), res);
	CPPUNIT_ASSERT(r);
	CPPUNIT_ASSERT_EQUAL(200u, res.code_);
	CPPUNIT_ASSERT_EQUAL("hi"s, res.body_);
	CPPUNIT_ASSERT(!res.has_header("Proxy-Agent"sv));

	CPPUNIT_ASSERT_EQUAL("proxy.example:3128"s, f.provider_->targets_[0]);
	CPPUNIT_ASSERT_EQUAL("secure.example"s, f.provider_->tunnel_server_name_);
	CPPUNIT_ASSERT(htls::starts_with(f.provider_->written(0), "CONNECT secure.example:443 HTTP/1.1\r\nHost: secure.example:443\r\n\r\nGET /x HTTP/1.1\r\n"sv));
}

void client_test::test_proxy_rejected()
{
	fixture f([](htls::http::client::manager_settings & s) { s.proxy_ = htls::proxy_settings{"proxy.example", 3128}; });
	f.provider_->add("HTTP/1.1 407 Proxy Authentication Required\r\nContent-Length: 0\r\n\r\n");
	f.provider_->add("HTTP/1.1 200 OK\r\n\r\n");

	htls::http::client::response res;
	auto r = f.manager_->perform(f.get("https://secure.example/x"), res);
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::proxy_rejected, r.error_);
	CPPUNIT_ASSERT_EQUAL(407, r.raw_);
	CPPUNIT_ASSERT_EQUAL(size_t(1), f.provider_->targets_.size());

	// Directly on a connection
	auto written = std::make_shared<std::string>();
	scripted_connection garbage("SSH-2.0-OpenSSH\r\n\r\n", htls::transport_result::ok, written);
	r = htls::http::client::validate_tunnel_reply(garbage, htls::get_null_logger());
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::proxy_rejected, r.error_);

	scripted_connection closed("HTTP/1.1 200 OK\r\n", htls::transport_result::ok, written);
	r = htls::http::client::validate_tunnel_reply(closed, htls::get_null_logger());
	CPPUNIT_ASSERT_EQUAL(htls::transport_result::proxy_rejected, r.error_);

	scripted_connection ok("HTTP/1.0 204 Tunnel\r\n\r\nrest", htls::transport_result::ok, written);
	r = htls::http::client::validate_tunnel_reply(ok, htls::get_null_logger());
	CPPUNIT_ASSERT(r);

	// Nothing beyond the reply has been consumed
	char buf[16];
	auto rr = ok.read(buf, sizeof(buf));
	CPPUNIT_ASSERT(rr);
	CPPUNIT_ASSERT_EQUAL("rest"s, std::string(buf, rr.value_));
}

namespace {
class fixed_issuer final : public htls::http::client::issuer
{
public:
	virtual htls::transport_result perform(htls::http::client::request const&, htls::http::client::response & res) override
	{
		res.code_ = 418;
		return htls::transport_result();
	}

	virtual htls::transport_result perform_no_body(htls::http::client::request const& req, htls::http::client::response & res) override
	{
		return perform(req, res);
	}
};
}

void client_test::test_global_issuer()
{
	auto const initial = htls::http::client::get_global_issuer();
	CPPUNIT_ASSERT(initial);
	CPPUNIT_ASSERT(initial == htls::http::client::get_global_issuer());
	CPPUNIT_ASSERT(dynamic_cast<htls::http::client::manager*>(initial.get()));

	CPPUNIT_ASSERT(!htls::http::client::set_global_issuer(nullptr));
	CPPUNIT_ASSERT(initial == htls::http::client::get_global_issuer());

	auto replacement = std::make_shared<fixed_issuer>();
	CPPUNIT_ASSERT(htls::http::client::set_global_issuer(replacement));
	CPPUNIT_ASSERT(htls::http::client::get_global_issuer() == replacement);

	htls::http::client::response res;
	CPPUNIT_ASSERT(htls::http::client::get_global_issuer()->perform(htls::http::client::request(), res));
	CPPUNIT_ASSERT_EQUAL(418u, res.code_);

	CPPUNIT_ASSERT(htls::http::client::set_global_issuer(initial));
}
