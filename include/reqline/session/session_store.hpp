/*
 * Reqline Session Store
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Per-host cookies and bearer authorization captured by `authenticate` and
 *   replayed by later requests to the same host. One JSON file per host,
 *   session_<host>.json, inside a base directory chosen once at startup.
 *   Files are written 0600 in a 0700 directory; a file readable by group or
 *   others is refused on load rather than ignored.
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
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace reqline {

struct Session {
    std::string host;
    std::map<std::string, std::string> cookies;
    std::string authorization;   // "Bearer <token>" or empty
};

class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SessionStore {
public:
    explicit SessionStore(std::filesystem::path base_dir) : m_dir(std::move(base_dir)) {}

    // std::nullopt when no session exists. Throws SessionError on unsafe
    // permissions or an unreadable file.
    std::optional<Session> load(const std::string& host) const;
    void save(const Session& session) const;
    // Absent file is not an error.
    void remove(const std::string& host) const;
    std::vector<std::string> list() const;

    std::filesystem::path path_for(const std::string& host) const;
    const std::filesystem::path& base_dir() const { return m_dir; }
private:
    std::filesystem::path m_dir;
};

// host[:port] of url. Throws SessionError.
std::string extract_host(const std::string& url);

// Cookie values become "***", authorization "Bearer ***".
Session redact(const Session& session);

// Merges Set-Cookie name=value prefixes and a top-level JSON access_token.
Session update_session(Session session, const std::vector<std::string>& set_cookies, const std::string& body);

nlohmann::json session_to_json(const Session& session);
Session session_from_json(const nlohmann::json& j);

} // namespace reqline
