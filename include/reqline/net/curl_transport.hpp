/*
 * Reqline Curl Transport
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * libcurl implementation of ITransport. One easy handle is reused across
 * hops so connections and the in-memory cookie jar survive redirects.
 * Automatic redirect following and content decoding are switched off.
 */
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "reqline/net/transport.hpp"

namespace reqline::net {

class CurlTransport : public ITransport {
public:
    CurlTransport();
    ~CurlTransport() override;
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Response send(const Request& req, const TransportOptions& opts) override;
    std::vector<std::string> jar_cookies(const std::string& url) override;

private:
    template <typename T>
    void setopt(CURLoption option, T value);

    void prepare(const Request& req, const TransportOptions& opts);
    void perform_throw();
    static std::size_t write_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
    static std::size_t header_cb(char* buffer, std::size_t size, std::size_t n_items, void* userdata);

    CURL* m_handle{};
    curl_slist* m_headers{};
    std::array<char, CURL_ERROR_SIZE> m_error{};

    // per-send scratch
    Response m_resp;
    std::optional<std::uint64_t> m_limit;
    bool m_limit_hit = false;
};

} // namespace reqline::net
