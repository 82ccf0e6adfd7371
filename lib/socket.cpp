#include "libhtls/socket.hpp"
#include "libhtls/logger.hpp"

#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <memory>

namespace htls {

transport_result connection::write_all(std::string_view const& data)
{
	size_t written{};
	while (written < data.size()) {
		auto const r = write(data.data() + written, data.size() - written);
		if (!r) {
			return r.to_result();
		}
		if (!r.value_) {
			return transport_result(transport_result::io, EPIPE);
		}
		written += r.value_;
	}
	return transport_result();
}

namespace {
struct addrinfo_deleter final
{
	void operator()(addrinfo* p) const {
		if (p) {
			freeaddrinfo(p);
		}
	}
};

void set_timeout(int fd, std::chrono::milliseconds const& timeout)
{
	if (timeout.count() <= 0) {
		return;
	}
	timeval tv{};
	tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
	tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
	setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
	setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

transport_result::error classify(int error)
{
	if (error == EAGAIN || error == EWOULDBLOCK || error == EINPROGRESS || error == ETIMEDOUT) {
		return transport_result::timeout;
	}
	return transport_result::io;
}
}

tcp_connection::tcp_connection(logger_interface & logger)
	: logger_(logger)
{
}

tcp_connection::~tcp_connection()
{
	close();
}

void tcp_connection::close()
{
	if (fd_ != -1) {
		::close(fd_);
		fd_ = -1;
	}
}

transport_result tcp_connection::connect(std::string const& host, unsigned short port, std::chrono::milliseconds const& timeout)
{
	close();

	std::string h = host;
	if (h.size() > 2 && h.front() == '[' && h.back() == ']') {
		h = h.substr(1, h.size() - 2);
	}

	addrinfo hints{};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_flags = AI_ADDRCONFIG;

	addrinfo* res_raw{};
	std::string const service = std::to_string(port);
	int res = getaddrinfo(h.c_str(), service.c_str(), &hints, &res_raw);
	std::unique_ptr<addrinfo, addrinfo_deleter> addresses(res_raw);
	if (res) {
		logger_.log(logmsg::error, "Could not resolve '%s': %s", host, gai_strerror(res));
		return transport_result(transport_result::resolve, res);
	}

	int error = ECONNREFUSED;
	for (addrinfo* addr = addresses.get(); addr; addr = addr->ai_next) {
		int fd = socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
		if (fd == -1) {
			error = errno;
			continue;
		}

		set_timeout(fd, timeout);

		int value = 1;
		setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &value, sizeof(value));

		logger_.log(logmsg::debug_verbose, "Connecting to %s port %d", host, port);
		if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
			fd_ = fd;
			logger_.log(logmsg::debug_info, "Connection established to %s", host);
			return transport_result();
		}

		error = errno;
		logger_.log(logmsg::debug_warning, "Connection attempt to %s failed: %s", host, socket_error_string(error));
		::close(fd);
	}

	logger_.log(logmsg::error, "Could not connect to %s: %s", host, socket_error_string(error));
	return transport_result(classify(error) == transport_result::timeout ? transport_result::timeout : transport_result::connect, error);
}

rwresult tcp_connection::read(void* buffer, size_t size)
{
	if (fd_ == -1) {
		return rwresult(transport_result::io, ENOTCONN);
	}

	ssize_t r;
	do {
		r = recv(fd_, buffer, size, 0);
	} while (r == -1 && errno == EINTR);

	if (r == -1) {
		int const error = errno;
		return rwresult(classify(error), error);
	}
	return rwresult(static_cast<size_t>(r));
}

rwresult tcp_connection::write(void const* buffer, size_t size)
{
	if (fd_ == -1) {
		return rwresult(transport_result::io, ENOTCONN);
	}

	ssize_t r;
	do {
		r = send(fd_, buffer, size, MSG_NOSIGNAL);
	} while (r == -1 && errno == EINTR);

	if (r == -1) {
		int const error = errno;
		return rwresult(classify(error), error);
	}
	return rwresult(static_cast<size_t>(r));
}

int tcp_connection::shutdown()
{
	if (fd_ == -1) {
		return ENOTCONN;
	}
	if (::shutdown(fd_, SHUT_WR) != 0) {
		return errno;
	}
	return 0;
}

std::string socket_error_string(int error)
{
	switch (error) {
	case ECONNREFUSED:
		return "ECONNREFUSED";
	case ECONNRESET:
		return "ECONNRESET";
	case ECONNABORTED:
		return "ECONNABORTED";
	case ETIMEDOUT:
		return "ETIMEDOUT";
	case EHOSTUNREACH:
		return "EHOSTUNREACH";
	case ENETUNREACH:
		return "ENETUNREACH";
	case EPIPE:
		return "EPIPE";
	case ENOTCONN:
		return "ENOTCONN";
	case EAGAIN:
		return "EAGAIN";
	case EINPROGRESS:
		return "EINPROGRESS";
	default:
		return std::to_string(error);
	}
}

}
