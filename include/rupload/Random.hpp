#pragma once

// Copyright © 2021 Michael Thornburgh
// SPDX-License-Identifier: MIT

// Random identifiers for transfers and multipart boundaries, using OpenSSL.

#include <string>

namespace rupload {

// Fill dst with len cryptographically strong random bytes. Answer false on failure.
bool pseudoRandomBytes(void *dst, size_t len);

// numBytes random bytes as lowercase hex (2 * numBytes digits). Empty on failure.
std::string randomHex(size_t numBytes);

std::string hexEncode(const void *bytes, size_t len);

} // namespace rupload
