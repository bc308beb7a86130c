/*
 * Reqline Configuration Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/config/config.hpp>
#include <reqline/util/duration.hpp>
#include <reqline/util/strings.hpp>
#include <cstdlib>
#include <fstream>

namespace reqline {

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }

static bool parse_bool(const std::string& v, bool& out) {
    std::string s = to_lower(v);
    if (s == "1" || s == "true" || s == "on" || s == "yes") { out = true; return true; }
    if (s == "0" || s == "false" || s == "off" || s == "no") { out = false; return true; }
    return false;
}

Config parse_config(std::istream& in, Config cfg, std::vector<std::string>* warnings) {
    auto warn = [&](int lineno, const std::string& msg) {
        if (warnings) warnings->push_back("line " + std::to_string(lineno) + ": " + msg);
    };
    std::string line; int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) { warn(lineno, "expected key=value"); continue; }
        std::string key = trim(line.substr(0, eq)), val = trim(line.substr(eq + 1));
        if (key == "color") {
            if (!parse_bool(val, cfg.color)) warn(lineno, "color expects on/off, got '" + val + "'");
        } else if (key == "session_dir") {
            cfg.session_dir = val;
        } else if (key == "timeout" || key == "connect_timeout") {
            auto d = parse_duration(val);
            if (!d || d->count() <= 0) { warn(lineno, key + " expects a positive duration, got '" + val + "'"); continue; }
            (key == "timeout" ? cfg.timeout : cfg.connect_timeout) = *d;
        } else if (key == "user_agent") {
            cfg.user_agent = val;
        } else {
            warn(lineno, "unknown key '" + key + "'");
        }
    }
    return cfg;
}

std::string default_session_dir() {
    std::string home = getenv_or("HOME");
    if (home.empty()) return ".reqline";
    return home + "/.config/reqline";
}

Config load_config(std::vector<std::string>* warnings) {
    Config cfg;
    cfg.session_dir = default_session_dir();
    std::string path = getenv_or("REQLINE_CONFIG");
    if (path.empty()) {
        std::string home = getenv_or("HOME");
        if (!home.empty()) path = home + "/.reqlinerc";
    }
    if (!path.empty()) {
        std::ifstream in(path);
        if (in) {
            std::vector<std::string> local;
            cfg = parse_config(in, cfg, &local);
            if (warnings) for (auto &w : local) warnings->push_back(path + ": " + w);
        }
    }
    std::string dir = getenv_or("REQLINE_SESSION_DIR");
    if (!dir.empty()) cfg.session_dir = dir;
    return cfg;
}

} // namespace reqline
