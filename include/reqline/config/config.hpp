/*
 * Reqline Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * ~/.reqlinerc: key=value lines, '#' comments.
 *   color=on|off           colored Error:/Hint: lines on a terminal
 *   session_dir=<path>     where session_<host>.json files live
 *   timeout=<duration>     default whole-exchange timeout (30s)
 *   connect_timeout=<duration>
 *   user_agent=<string>
 * Environment: REQLINE_CONFIG (rc path), REQLINE_SESSION_DIR.
 */
#pragma once
#include <chrono>
#include <istream>
#include <string>
#include <vector>

#ifndef REQLINE_VERSION
#define REQLINE_VERSION "0.0.0"
#endif

namespace reqline {

struct Config {
    bool color = true;
    std::string session_dir;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    std::string user_agent = "reqline/" REQLINE_VERSION;
};

// Applies the rc lines in `in` on top of base. Unknown keys and bad values are
// reported through warnings (when given) and leave the field unchanged.
Config parse_config(std::istream& in, Config base, std::vector<std::string>* warnings = nullptr);

// ~/.config/reqline, or .reqline when HOME is unset.
std::string default_session_dir();

// Defaults, then the rc file, then environment overrides.
Config load_config(std::vector<std::string>* warnings = nullptr);

} // namespace reqline
