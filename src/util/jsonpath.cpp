/*
 * JSONPath subset - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/util/jsonpath.hpp>
#include <reqline/util/strings.hpp>
#include <cctype>
#include <charconv>

namespace reqline {

using nlohmann::json;

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '$' || c == '@';
}

} // namespace

std::vector<std::string> compile_jsonpath(const std::string& raw) {
    std::string path = trim(raw);
    std::vector<std::string> ptr;
    std::size_t i = 0;
    if (i < path.size() && path[i] == '$') ++i;
    bool first = true;
    while (i < path.size()) {
        char c = path[i];
        if (c == '.') {
            ++i;
            if (i < path.size() && (path[i] == '.' || path[i] == '*'))
                throw JsonPathError("unsupported JSONPath syntax in '" + raw + "'");
            std::size_t start = i;
            while (i < path.size() && is_name_char(path[i])) ++i;
            if (i == start) throw JsonPathError("empty member name in '" + raw + "'");
            ptr.push_back(path.substr(start, i - start));
        } else if (c == '[') {
            std::size_t close = path.find(']', i);
            if (close == std::string::npos) throw JsonPathError("unterminated '[' in '" + raw + "'");
            std::string inner = trim(path.substr(i + 1, close - i - 1));
            bool quoted = false;
            std::string name = unquote(inner, &quoted);
            if (quoted) {
                ptr.push_back(name);
            } else {
                if (inner.empty()) throw JsonPathError("empty index in '" + raw + "'");
                for (char d : inner)
                    if (!std::isdigit(static_cast<unsigned char>(d)))
                        throw JsonPathError("unsupported JSONPath index '" + inner + "' in '" + raw + "'");
                ptr.push_back(inner);
            }
            i = close + 1;
        } else if (first && is_name_char(c)) {
            // bare leading member: "data.items"
            std::size_t start = i;
            while (i < path.size() && is_name_char(path[i])) ++i;
            ptr.push_back(path.substr(start, i - start));
        } else {
            throw JsonPathError("unexpected '" + std::string(1, c) + "' in JSONPath '" + raw + "'");
        }
        first = false;
    }
    return ptr;
}

const json* select_jsonpath(const json& doc, const std::string& path) {
    const json* cur = &doc;
    // numeric tokens index arrays and name members on objects
    for (auto &tok : compile_jsonpath(path)) {
        if (cur->is_object()) {
            auto it = cur->find(tok);
            if (it == cur->end()) return nullptr;
            cur = &*it;
        } else if (cur->is_array()) {
            if (tok.empty() || tok.find_first_not_of("0123456789") != std::string::npos) return nullptr;
            std::size_t idx = 0;
            auto [end, ec] = std::from_chars(tok.data(), tok.data() + tok.size(), idx);
            if (ec != std::errc{} || end != tok.data() + tok.size()) return nullptr;
            if (idx >= cur->size()) return nullptr;
            cur = &(*cur)[idx];
        } else {
            return nullptr;
        }
    }
    return cur;
}

std::string json_scalar_text(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // namespace reqline
