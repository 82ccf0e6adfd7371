#ifndef LIBHTLS_SOCKET_HEADER
#define LIBHTLS_SOCKET_HEADER

/** \file
 * \brief Byte-stream connections
 *
 * All connections are blocking. A \ref htls::connection can be layered on top of
 * another, which is how \ref htls::tls_layer upgrades an established stream.
 */

#include "transport_result.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace htls {

class logger_interface;

/**
 * \brief Interface for duplex byte streams.
 *
 * Reading returns the number of bytes read, zero at end of stream.
 */
class HTLS_PUBLIC_SYMBOL connection
{
public:
	connection() = default;
	virtual ~connection() = default;

	connection(connection const&) = delete;
	connection& operator=(connection const&) = delete;

	virtual rwresult read(void* buffer, size_t size) = 0;
	virtual rwresult write(void const* buffer, size_t size) = 0;

	/// Signals the end of the outgoing data. Returns 0 on success or an errno value.
	virtual int shutdown() = 0;

	/// Writes all the data, looping over short writes.
	transport_result write_all(std::string_view const& data);
};

/// A TCP connection over a blocking BSD socket
class HTLS_PUBLIC_SYMBOL tcp_connection final : public connection
{
public:
	explicit tcp_connection(logger_interface & logger);
	virtual ~tcp_connection() override;

	/**
	 * \brief Resolves the host and connects to the first address accepting the connection.
	 *
	 * A zero timeout disables timeouts. The timeout also applies to every subsequent read and write.
	 */
	transport_result connect(std::string const& host, unsigned short port, std::chrono::milliseconds const& timeout);

	virtual rwresult read(void* buffer, size_t size) override;
	virtual rwresult write(void const* buffer, size_t size) override;
	virtual int shutdown() override;

	bool is_connected() const { return fd_ != -1; }

private:
	void close();

	logger_interface & logger_;
	int fd_{-1};
};

/// Gets a symbolic name for socket errors, e.g. ECONNREFUSED
std::string HTLS_PUBLIC_SYMBOL socket_error_string(int error);

}

#endif
