#include "../libhtls/http/client_response.hpp"

namespace htls::http::client {

void response::reset()
{
	flags_ = 0;
	code_ = 0;
	reason_.clear();
	headers_.clear();
	body_.clear();
	cookie_jar_ = cookie_jar();
}

}
