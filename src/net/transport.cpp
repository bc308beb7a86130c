/*
 * Transport - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/net/transport.hpp>
#include <reqline/util/strings.hpp>

namespace reqline::net {

std::string Response::header(const std::string& name) const {
    for (auto &h : headers) if (iequals(h.name, name)) return h.value;
    return {};
}

std::vector<std::string> Response::header_values(const std::string& name) const {
    std::vector<std::string> out;
    for (auto &h : headers) if (iequals(h.name, name)) out.push_back(h.value);
    return out;
}

} // namespace reqline::net
