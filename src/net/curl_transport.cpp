/*
 * Reqline Curl Transport Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/net/curl_transport.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/url.hpp>
#include <algorithm>
#include <sstream>

namespace reqline::net {

namespace {

TransportError::Kind classify(CURLcode rc) {
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError::Kind::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return TransportError::Kind::Connect;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_PEER_FAILED_VERIFICATION:
            return TransportError::Kind::Tls;
        case CURLE_FILESIZE_EXCEEDED:
            return TransportError::Kind::SizeLimit;
        default:
            return TransportError::Kind::Other;
    }
}

const char* kind_label(TransportError::Kind k) {
    switch (k) {
        case TransportError::Kind::Connect: return "connection failed";
        case TransportError::Kind::Tls: return "TLS failure";
        case TransportError::Kind::Timeout: return "request timed out";
        case TransportError::Kind::SizeLimit: return "size limit exceeded";
        case TransportError::Kind::Other: return "transfer failed";
    }
    return "transfer failed";
}

} // namespace

CurlTransport::CurlTransport() : m_handle(curl_easy_init()) {
    if (!m_handle) throw std::runtime_error("failed to create curl easy handle");
}

CurlTransport::~CurlTransport() {
    if (m_headers) curl_slist_free_all(m_headers);
    if (m_handle) curl_easy_cleanup(m_handle);
}

template <typename T>
void CurlTransport::setopt(CURLoption option, T value) {
    CURLcode rc = curl_easy_setopt(m_handle, option, value);
    if (rc != CURLE_OK) throw TransportError(TransportError::Kind::Other, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
}

std::size_t CurlTransport::write_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlTransport*>(userdata);
    std::size_t n = size * nmemb;
    if (self->m_limit && self->m_resp.body.size() + n > *self->m_limit) {
        self->m_limit_hit = true;
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    self->m_resp.body.append(ptr, n);
    return n;
}

std::size_t CurlTransport::header_cb(char* buffer, std::size_t size, std::size_t n_items, void* userdata) {
    auto* self = static_cast<CurlTransport*>(userdata);
    std::size_t bytes = size * n_items;
    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (line.rfind("HTTP/", 0) == 0) {
        // new status line: interim (100, proxy CONNECT) headers are discarded
        self->m_resp.headers.clear();
        return bytes;
    }
    auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) return bytes;
    self->m_resp.headers.push_back({trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    return bytes;
}

void CurlTransport::prepare(const Request& req, const TransportOptions& opts) {
    curl_easy_reset(m_handle);
    m_error[0] = '\0';
    m_resp = Response{};
    m_limit = opts.size_limit;
    m_limit_hit = false;

    setopt(CURLOPT_ERRORBUFFER, m_error.data());
    setopt(CURLOPT_URL, req.url.c_str());
    setopt(CURLOPT_NOSIGNAL, 1L);
    setopt(CURLOPT_NOPROGRESS, 1L);
    setopt(CURLOPT_FOLLOWLOCATION, 0L);
    setopt(CURLOPT_HTTP_CONTENT_DECODING, 0L);
    setopt(CURLOPT_COOKIEFILE, "");
    setopt(CURLOPT_WRITEFUNCTION, &CurlTransport::write_cb);
    setopt(CURLOPT_WRITEDATA, static_cast<void*>(this));
    setopt(CURLOPT_HEADERFUNCTION, &CurlTransport::header_cb);
    setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));

    long timeout_ms = static_cast<long>(std::max<long long>(1, opts.timeout.count()));
    long connect_ms = static_cast<long>(std::max<long long>(1, std::min(opts.connect_timeout, opts.timeout).count()));
    setopt(CURLOPT_TIMEOUT_MS, timeout_ms);
    setopt(CURLOPT_CONNECTTIMEOUT_MS, connect_ms);
    if (opts.size_limit) setopt(CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(*opts.size_limit));
    if (!opts.proxy.empty()) setopt(CURLOPT_PROXY, opts.proxy.c_str());
    if (opts.insecure) {
        setopt(CURLOPT_SSL_VERIFYPEER, 0L);
        setopt(CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!opts.user_agent.empty()) setopt(CURLOPT_USERAGENT, opts.user_agent.c_str());

    if (req.method == "HEAD") {
        setopt(CURLOPT_NOBODY, 1L);
    } else if (req.method == "GET" && req.body.empty()) {
        setopt(CURLOPT_HTTPGET, 1L);
    } else {
        setopt(CURLOPT_CUSTOMREQUEST, req.method.c_str());
        if (!req.body.empty() || req.method == "POST" || req.method == "PUT" || req.method == "PATCH") {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body.size()));
            setopt(CURLOPT_POSTFIELDS, req.body.c_str());
        }
    }

    if (m_headers) { curl_slist_free_all(m_headers); m_headers = nullptr; }
    for (auto &h : req.headers) {
        // "Name;" is curl's spelling for a header with an empty value
        std::string line = h.value.empty() ? h.name + ";" : h.name + ": " + h.value;
        m_headers = curl_slist_append(m_headers, line.c_str());
    }
    m_headers = curl_slist_append(m_headers, "Expect:");
    setopt(CURLOPT_HTTPHEADER, m_headers);
}

void CurlTransport::perform_throw() {
    CURLcode rc = curl_easy_perform(m_handle);
    if (rc == CURLE_OK) return;
    TransportError::Kind kind = m_limit_hit ? TransportError::Kind::SizeLimit : classify(rc);
    std::string detail;
    if (m_limit_hit) detail = "response body larger than " + std::to_string(*m_limit) + " bytes";
    else detail = m_error[0] != '\0' ? std::string(m_error.data()) : std::string(curl_easy_strerror(rc));
    throw TransportError(kind, std::string(kind_label(kind)) + ": " + detail);
}

Response CurlTransport::send(const Request& req, const TransportOptions& opts) {
    prepare(req, opts);
    perform_throw();
    long code = 0;
    char* eff = nullptr;
    curl_easy_getinfo(m_handle, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_getinfo(m_handle, CURLINFO_EFFECTIVE_URL, &eff);
    m_resp.status = code;
    m_resp.effective_url = eff ? eff : req.url;
    return std::move(m_resp);
}

std::vector<std::string> CurlTransport::jar_cookies(const std::string& url) {
    std::vector<std::string> out;
    std::string host;
    try {
        host = to_lower(parse_url(url).host);
    } catch (const UrlError&) {
        return out;
    }
    curl_slist* list = nullptr;
    if (curl_easy_getinfo(m_handle, CURLINFO_COOKIELIST, &list) != CURLE_OK) return out;
    // Netscape format: domain, tailmatch, path, secure, expires, name, value
    for (curl_slist* it = list; it; it = it->next) {
        std::istringstream line(it->data);
        std::vector<std::string> fields;
        std::string f;
        while (std::getline(line, f, '\t')) fields.push_back(f);
        if (fields.size() < 7) continue;
        std::string domain = to_lower(fields[0]);
        if (domain.rfind("#httponly_", 0) == 0) domain = domain.substr(10);
        if (!domain.empty() && domain[0] == '.') domain = domain.substr(1);
        bool match = host == domain || (host.size() > domain.size() && host.compare(host.size() - domain.size() - 1, std::string::npos, "." + domain) == 0);
        if (match) out.push_back(fields[5] + "=" + fields[6]);
    }
    curl_slist_free_all(list);
    return out;
}

} // namespace reqline::net
