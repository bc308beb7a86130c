/*
 * Reqline Output
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Response rendering and file output. render() is pure: the caller decides
 * whether stdout is a terminal.
 */
#pragma once
#include <stdexcept>
#include <string>

namespace reqline {

class OutputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// json: pretty (2 spaces) when the body parses, raw otherwise.
// auto: like json on a terminal, raw when piped.
// text, csv, raw and anything else: raw.
std::string render(const std::string& body, const std::string& format, bool is_tty);

// Value at path as text (strings unquoted, the rest as JSON).
// Throws OutputError when the body is not JSON or the path does not resolve.
std::string apply_pick(const std::string& body, const std::string& path);

// Creates parent directories as needed.
void write_destination(const std::string& path, const std::string& body, bool append);

} // namespace reqline
