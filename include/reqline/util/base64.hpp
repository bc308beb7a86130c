/*
 * Base64 encoding - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace reqline {

// Standard alphabet, padded (RFC 4648).
std::string base64_encode(const std::string& in);

} // namespace reqline
