#include "libhtls/logger.hpp"

#include <iostream>

namespace htls {

namespace {
char const* type_prefix(logmsg::type t)
{
	switch (t) {
	case logmsg::status:
		return "Status:";
	case logmsg::error:
		return "Error:";
	case logmsg::command:
		return "Command:";
	case logmsg::reply:
		return "Reply:";
	case logmsg::debug_warning:
		return "Warning:";
	case logmsg::debug_info:
		return "Info:";
	case logmsg::debug_verbose:
		return "Verbose:";
	case logmsg::debug_debug:
		return "Debug:";
	default:
		return "Custom:";
	}
}
}

null_logger& get_null_logger()
{
	static null_logger logger;
	return logger;
}

void stdout_logger::do_log(logmsg::type t, std::string && msg)
{
	std::lock_guard<std::mutex> l(mtx_);
	std::cout << type_prefix(t) << ' ' << msg << std::endl;
}

}
