/*
 * Reqline Output Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/exec/output.hpp>
#include <reqline/util/jsonpath.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace reqline {

namespace {

std::string pretty_or_raw(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded()) return body;
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace

std::string render(const std::string& body, const std::string& format, bool is_tty) {
    if (format == "json") return pretty_or_raw(body);
    if (format == "auto") return is_tty ? pretty_or_raw(body) : body;
    return body;
}

std::string apply_pick(const std::string& body, const std::string& path) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded()) throw OutputError("pick=" + path + ": response is not valid JSON");
    const nlohmann::json* v = nullptr;
    try {
        v = select_jsonpath(doc, path);
    } catch (const JsonPathError& e) {
        throw OutputError(e.what());
    }
    if (!v) throw OutputError("pick=" + path + ": no value at path");
    return json_scalar_text(*v);
}

void write_destination(const std::string& path, const std::string& body, bool append) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) throw OutputError("cannot create directory '" + p.parent_path().string() + "': " + ec.message());
    }
    std::ofstream f(p, std::ios::binary | (append ? std::ios::app : std::ios::trunc));
    if (!f) throw OutputError("cannot open '" + path + "' for writing");
    f.write(body.data(), static_cast<std::streamsize>(body.size()));
    f.close();
    if (!f) throw OutputError("error writing '" + path + "'");
}

} // namespace reqline
