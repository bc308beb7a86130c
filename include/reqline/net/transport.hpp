/*
 * Reqline Transport Interface
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   One HTTP hop: a Request goes out, a Response comes back. Implementations
 *   never follow redirects and never decode Content-Encoding; both are handled
 *   by the executor so that every hop and every encoding stays observable.
 *   A persistent cookie jar is kept per transport instance.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reqline::net {

struct Header {
    std::string name;
    std::string value;
};
using HeaderList = std::vector<Header>;

struct Request {
    std::string method = "GET";
    std::string url;
    HeaderList headers;   // sent in order
    std::string body;
};

struct Response {
    long status = 0;
    HeaderList headers;   // final response only, in arrival order
    std::string body;     // still content-encoded
    std::string effective_url;

    // First value for name (case-insensitive), empty when absent.
    std::string header(const std::string& name) const;
    std::vector<std::string> header_values(const std::string& name) const;
};

struct TransportOptions {
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    std::optional<std::uint64_t> size_limit;
    std::string proxy;
    bool insecure = false;
    std::string user_agent;
};

class TransportError : public std::runtime_error {
public:
    enum class Kind { Connect, Tls, Timeout, SizeLimit, Other };
    TransportError(Kind kind, const std::string& what) : std::runtime_error(what), m_kind(kind) {}
    Kind kind() const { return m_kind; }
private:
    Kind m_kind;
};

class ITransport {
public:
    ITransport() = default;
    virtual ~ITransport() = default;
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;

    virtual Response send(const Request& req, const TransportOptions& opts) = 0;

    // "name=value" entries the jar holds for url's host.
    virtual std::vector<std::string> jar_cookies(const std::string& url) = 0;
};

} // namespace reqline::net
