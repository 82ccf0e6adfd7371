#include "libhtls/hash.hpp"

#include <nettle/md5.h>

namespace htls {

std::vector<uint8_t> md5(std::string_view const& data)
{
	md5_ctx ctx;
	nettle_md5_init(&ctx);
	if (!data.empty()) {
		nettle_md5_update(&ctx, data.size(), reinterpret_cast<uint8_t const*>(data.data()));
	}

	std::vector<uint8_t> ret;
	ret.resize(MD5_DIGEST_SIZE);
	nettle_md5_digest(&ctx, MD5_DIGEST_SIZE, ret.data());
	return ret;
}

}
