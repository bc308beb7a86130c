/*
 * Base64 encoding - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/util/base64.hpp>

namespace reqline {

std::string base64_encode(const std::string& in) {
    static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out; out.reserve(((in.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < in.size()) {
        unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i+1]) << 8) | static_cast<unsigned char>(in[i+2]);
        out.push_back(table[(v >> 18) & 0x3f]); out.push_back(table[(v >> 12) & 0x3f]);
        out.push_back(table[(v >> 6) & 0x3f]);  out.push_back(table[v & 0x3f]);
        i += 3;
    }
    std::size_t rest = in.size() - i;
    if (rest == 1) {
        unsigned v = static_cast<unsigned char>(in[i]) << 16;
        out.push_back(table[(v >> 18) & 0x3f]); out.push_back(table[(v >> 12) & 0x3f]);
        out += "==";
    } else if (rest == 2) {
        unsigned v = (static_cast<unsigned char>(in[i]) << 16) | (static_cast<unsigned char>(in[i+1]) << 8);
        out.push_back(table[(v >> 18) & 0x3f]); out.push_back(table[(v >> 12) & 0x3f]);
        out.push_back(table[(v >> 6) & 0x3f]); out.push_back('=');
    }
    return out;
}

} // namespace reqline
