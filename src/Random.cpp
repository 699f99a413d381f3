// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

#include <cstdint>
#include <vector>

#include <openssl/rand.h>

#include "../include/rupload/Random.hpp"

namespace rupload {

bool pseudoRandomBytes(void *dst, size_t len)
{
	if(0 == len)
		return true;
	return 1 == RAND_bytes((unsigned char *)dst, (int)len);
}

std::string randomHex(size_t numBytes)
{
	std::vector<uint8_t> buf(numBytes);
	if(not pseudoRandomBytes(buf.data(), buf.size()))
		return std::string();
	return hexEncode(buf.data(), buf.size());
}

std::string hexEncode(const void *bytes, size_t len)
{
	const char *digits = "0123456789abcdef";
	const uint8_t *cursor = (const uint8_t *)bytes;
	const uint8_t *limit = cursor + len;
	std::string rv;
	rv.reserve(len * 2);

	while(cursor < limit)
	{
		rv.push_back(digits[*cursor >> 4]);
		rv.push_back(digits[*cursor & 0x0f]);
		cursor++;
	}

	return rv;
}

} // namespace rupload
