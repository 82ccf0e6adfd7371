#ifndef LIBHTLS_LOGGER_HEADER
#define LIBHTLS_LOGGER_HEADER

/** \file
 * \brief Interface for logging
 */

#include "format.hpp"

#include <atomic>
#include <mutex>

namespace htls {
namespace logmsg
{
	enum type : uint64_t
	{
		/// Generic status messages aimed at the user
		status = 1ull,

		/// Error messages aimed at the user
		error = 1ull << 1,

		/// Commands, aimed at the users
		command = 1ull << 2,

		/// Replies, aimed at the users
		reply = 1ull << 3,

		/// Debug messages aimed at developers
		debug_warning = 1ull << 4,
		debug_info = 1ull << 5,
		debug_verbose = 1ull << 6,
		debug_debug = 1ull << 7,

		/// The types in the range custom1 to custom32 are free to use by the user.
		custom1 = 1ull << 32,
		custom32 = 1ull << 63
	};
}

/**
 * \brief Abstract base class for logging.
 *
 * Specializations need to implement do_log.
 *
 * By default, only messages of type status, error, command and reply are enabled.
 */
class HTLS_PUBLIC_SYMBOL logger_interface
{
public:
	logger_interface() = default;
	virtual ~logger_interface() = default;

	logger_interface(logger_interface const&) = delete;
	logger_interface& operator=(logger_interface const&) = delete;

	/// The one thing you need to override
	virtual void do_log(logmsg::type t, std::string && msg) = 0;

	/**
	 * The \ref log function to log messages.
	 *
	 * Takes a format string and arguments formatted by \ref htls::sprintf. Does nothing
	 * if the type isn't enabled.
	 */
	template<typename String, typename...Args>
	void log(logmsg::type t, String&& fmt, Args&& ...args)
	{
		if (should_log(t)) {
			std::string formatted = htls::sprintf(std::string_view(fmt), std::forward<Args>(args)...);
			do_log(t, std::move(formatted));
		}
	}

	/// Logs the raw string, it is not treated as format string
	template<typename String>
	void log_raw(logmsg::type t, String&& msg)
	{
		if (should_log(t)) {
			std::string s(std::forward<String>(msg));
			do_log(t, std::move(s));
		}
	}

	bool should_log(logmsg::type t) const {
		return level_ & t;
	}

	/// Returns all currently enabled log levels
	logmsg::type levels() const {
		return static_cast<logmsg::type>(level_.load());
	}

	/// Sets which message types should be logged
	virtual void set_all(logmsg::type t) {
		level_ = t;
	}

	/// Sets whether the given types should be logged
	void set(logmsg::type t, bool flag) {
		if (flag) {
			enable(t);
		}
		else {
			disable(t);
		}
	}

	/// Enables logging for the passed message types
	virtual void enable(logmsg::type t) {
		level_ |= t;
	}

	/// Disables logging for the passed message types
	virtual void disable(logmsg::type t) {
		level_ &= ~t;
	}

protected:
	std::atomic<uint64_t> level_{logmsg::status | logmsg::error | logmsg::command | logmsg::reply};
};

/// A logger that does not log anything
class HTLS_PUBLIC_SYMBOL null_logger final : public logger_interface
{
public:
	virtual void do_log(logmsg::type, std::string &&) override {}
};

/// Returns a process-wide logger that discards everything
HTLS_PUBLIC_SYMBOL null_logger& get_null_logger();

/// A simple logger that writes to stdout. Each line is prefixed with the message type.
class HTLS_PUBLIC_SYMBOL stdout_logger final : public logger_interface
{
public:
	virtual void do_log(logmsg::type t, std::string && msg) override;

private:
	std::mutex mtx_;
};

}

#endif
