#include "libhtls/libhtls.hpp"

namespace htls {

char const* get_version_string()
{
	return HTLS_VERSION;
}

}
