/*
 * Curl Global - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once

namespace reqline::net {

// curl_global_init / curl_global_cleanup for the lifetime of the object.
// Create one in main before any CurlTransport.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace reqline::net
