/*
 * Curl Global - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/net/curl_global.hpp>
#include <curl/curl.h>
#include <stdexcept>
#include <string>

namespace reqline::net {

CurlGlobal::CurlGlobal() {
    CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) throw std::runtime_error(std::string("libcurl init failed: ") + curl_easy_strerror(rc));
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

} // namespace reqline::net
