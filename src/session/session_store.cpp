/*
 * Reqline Session Store Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/session/session_store.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/url.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace reqline {

fs::path SessionStore::path_for(const std::string& host) const {
    std::string safe = host;
    for (char& c : safe) if (c == ':' || c == '/') c = '_';
    return m_dir / ("session_" + safe + ".json");
}

std::optional<Session> SessionStore::load(const std::string& host) const {
    fs::path p = path_for(host);
    std::error_code ec;
    fs::file_status st = fs::status(p, ec);
    if (ec || !fs::exists(st)) return std::nullopt;
    fs::perms mode = st.permissions();
    if ((mode & (fs::perms::group_read | fs::perms::others_read)) != fs::perms::none)
        throw SessionError("session file " + p.string() + " is group or world readable, refusing to load (chmod 600 it)");

    std::ifstream f(p);
    if (!f) throw SessionError("cannot read session file " + p.string());
    std::stringstream ss;
    ss << f.rdbuf();
    auto j = nlohmann::json::parse(ss.str(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw SessionError("session file " + p.string() + " is not valid JSON");
    Session s = session_from_json(j);
    if (s.host.empty()) s.host = host;
    return s;
}

void SessionStore::save(const Session& session) const {
    std::error_code ec;
    bool created = fs::create_directories(m_dir, ec);
    if (ec) throw SessionError("cannot create session directory " + m_dir.string() + ": " + ec.message());
    if (created) {
        fs::permissions(m_dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) throw SessionError("cannot restrict permissions on " + m_dir.string() + ": " + ec.message());
    }

    fs::path final_path = path_for(session.host);
    fs::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw SessionError("cannot write session file " + tmp.string());
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec) throw SessionError("cannot restrict permissions on " + tmp.string() + ": " + ec.message());
        f << session_to_json(session).dump(2) << "\n";
        f.close();
        if (!f) throw SessionError("error writing session file " + tmp.string());
    }
    fs::rename(tmp, final_path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw SessionError("cannot replace session file " + final_path.string());
    }
}

void SessionStore::remove(const std::string& host) const {
    std::error_code ec;
    fs::remove(path_for(host), ec);
    if (ec) throw SessionError("cannot delete session for " + host + ": " + ec.message());
}

std::vector<std::string> SessionStore::list() const {
    std::vector<std::string> hosts;
    std::error_code ec;
    if (!fs::is_directory(m_dir, ec)) return hosts;
    for (auto &entry : fs::directory_iterator(m_dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("session_", 0) != 0 || entry.path().extension() != ".json") continue;
        std::string host = name.substr(8, name.size() - 8 - 5);
        // the file records the real host; the name has ':' folded to '_'
        std::ifstream f(entry.path());
        auto j = nlohmann::json::parse(f, nullptr, false);
        if (!j.is_discarded() && j.is_object() && j.contains("host") && j["host"].is_string()) host = j["host"].get<std::string>();
        hosts.push_back(host);
    }
    std::sort(hosts.begin(), hosts.end());
    return hosts;
}

std::string extract_host(const std::string& url) {
    try {
        return to_lower(url_authority(url));
    } catch (const UrlError& e) {
        throw SessionError(std::string("invalid host: ") + e.what());
    }
}

Session redact(const Session& session) {
    Session r;
    r.host = session.host;
    for (auto &kv : session.cookies) r.cookies[kv.first] = "***";
    if (!session.authorization.empty()) r.authorization = "Bearer ***";
    return r;
}

Session update_session(Session s, const std::vector<std::string>& set_cookies, const std::string& body) {
    for (auto &header : set_cookies) {
        std::string pair = trim(header.substr(0, header.find(';')));
        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        s.cookies[trim(pair.substr(0, eq))] = trim(pair.substr(eq + 1));
    }
    if (!body.empty()) {
        auto j = nlohmann::json::parse(body, nullptr, false);
        if (!j.is_discarded() && j.is_object()) {
            auto it = j.find("access_token");
            if (it != j.end() && it->is_string() && !it->get<std::string>().empty())
                s.authorization = "Bearer " + it->get<std::string>();
        }
    }
    return s;
}

nlohmann::json session_to_json(const Session& s) {
    nlohmann::json j;
    j["host"] = s.host;
    if (!s.cookies.empty()) j["cookies"] = s.cookies;
    if (!s.authorization.empty()) j["authorization"] = s.authorization;
    return j;
}

Session session_from_json(const nlohmann::json& j) {
    Session s;
    if (j.contains("host") && j["host"].is_string()) s.host = j["host"].get<std::string>();
    if (j.contains("cookies") && j["cookies"].is_object()) {
        for (auto it = j["cookies"].begin(); it != j["cookies"].end(); ++it)
            if (it.value().is_string()) s.cookies[it.key()] = it.value().get<std::string>();
    }
    if (j.contains("authorization") && j["authorization"].is_string()) s.authorization = j["authorization"].get<std::string>();
    return s;
}

} // namespace reqline
