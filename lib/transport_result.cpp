#include "libhtls/transport_result.hpp"

namespace htls {

char const* to_string(transport_result::error e)
{
	switch (e) {
	case transport_result::ok:
		return "ok";
	case transport_result::invalid:
		return "invalid argument";
	case transport_result::config:
		return "configuration error";
	case transport_result::unsupported:
		return "unsupported";
	case transport_result::resolve:
		return "could not resolve host";
	case transport_result::connect:
		return "could not connect";
	case transport_result::io:
		return "socket error";
	case transport_result::timeout:
		return "timeout";
	case transport_result::tls_eof:
		return "connection closed without TLS close_notify";
	case transport_result::tls_terminated:
		return "TLS session terminated";
	case transport_result::tls_handshake:
		return "TLS handshake failed";
	case transport_result::tls_not_established:
		return "TLS session not established";
	case transport_result::proxy_rejected:
		return "proxy rejected tunnel";
	case transport_result::no_response:
		return "no response data received";
	case transport_result::invalid_response:
		return "invalid response";
	case transport_result::response_too_large:
		return "response too large";
	case transport_result::too_many_redirects:
		return "too many redirects";
	}
	return "unknown error";
}

}
