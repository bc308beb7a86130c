/*
 * URL helpers - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/util/url.hpp>
#include <curl/curl.h>
#include <cctype>
#include <memory>

namespace reqline {

namespace {

struct UrlDeleter { void operator()(CURLU* h) const { curl_url_cleanup(h); } };
using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;

UrlHandle make_handle(const std::string& url) {
    UrlHandle h(curl_url());
    if (!h) throw UrlError("out of memory creating URL handle");
    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0);
    if (rc != CURLUE_OK) throw UrlError("invalid URL '" + url + "': " + curl_url_strerror(rc));
    return h;
}

std::string get_part(CURLU* h, CURLUPart part, unsigned flags = 0) {
    char* value = nullptr;
    CURLUcode rc = curl_url_get(h, part, &value, flags);
    if (rc != CURLUE_OK || !value) return {};
    std::string out(value);
    curl_free(value);
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool looks_like_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

UrlParts parse_url(const std::string& url) {
    auto h = make_handle(url);
    UrlParts p;
    p.scheme = get_part(h.get(), CURLUPART_SCHEME);
    p.host = get_part(h.get(), CURLUPART_HOST);
    p.port = get_part(h.get(), CURLUPART_PORT);
    p.path = get_part(h.get(), CURLUPART_PATH);
    p.query = get_part(h.get(), CURLUPART_QUERY);
    return p;
}

std::string url_authority(const std::string& url) {
    if (!looks_like_url(url)) throw UrlError("not an http(s) URL: '" + url + "'");
    auto p = parse_url(url);
    if (p.host.empty()) throw UrlError("URL has no host: '" + url + "'");
    return p.port.empty() ? p.host : p.host + ":" + p.port;
}

std::string append_query(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params) {
    if (params.empty()) return url;
    auto h = make_handle(url);
    for (auto &kv : params) {
        std::string pair = kv.first + "=" + kv.second;
        CURLUcode rc = curl_url_set(h.get(), CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE);
        if (rc != CURLUE_OK) throw UrlError("cannot add query parameter '" + kv.first + "': " + curl_url_strerror(rc));
    }
    return get_part(h.get(), CURLUPART_URL);
}

std::string resolve_url(const std::string& base, const std::string& location) {
    auto h = make_handle(base);
    CURLUcode rc = curl_url_set(h.get(), CURLUPART_URL, location.c_str(), 0);
    if (rc != CURLUE_OK) throw UrlError("invalid redirect location '" + location + "': " + curl_url_strerror(rc));
    return get_part(h.get(), CURLUPART_URL);
}

std::string percent_decode(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i+1]), lo = hex_value(s[i+2]);
            if (hi >= 0 && lo >= 0) { out.push_back(static_cast<char>(hi * 16 + lo)); i += 2; continue; }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace reqline
