/*
 * Decompress - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Content-Encoding unwrapping. Codings are listed in the order they were
 * applied and are undone last-first: "br, gzip" is gunzipped, then
 * brotli-decoded.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace reqline {

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DecodeResult {
    std::string body;
    bool decoded = false;   // at least one coding was undone
};

// gzip, x-gzip, deflate, br. identity and unknown codings pass through.
DecodeResult decode_content(const std::string& body, const std::string& content_encoding);

std::string gunzip(const std::string& data);      // gzip or zlib framing
std::string inflate_deflate(const std::string& data); // zlib framing, raw deflate fallback
std::string brotli_decode(const std::string& data);

} // namespace reqline
