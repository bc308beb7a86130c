/*
 * Curl transport tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/net/curl_global.hpp>
#include <reqline/net/curl_transport.hpp>
#include <reqline/util/strings.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>

using namespace reqline;

namespace {

// Serves canned HTTP/1.1 responses on 127.0.0.1, one connection per response.
class LoopbackServer {
public:
    explicit LoopbackServer(std::deque<std::string> responses) : m_responses(std::move(responses)) {
        m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(m_fd, 4);
        socklen_t len = sizeof(addr);
        ::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len);
        m_port = ntohs(addr.sin_port);
        m_thread = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        ::shutdown(m_fd, SHUT_RDWR);
        ::close(m_fd);
        if (m_thread.joinable()) m_thread.join();
    }

    std::string url(const std::string& path) const { return "http://127.0.0.1:" + std::to_string(m_port) + path; }

    std::vector<std::string> requests() {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_requests;
    }

private:
    void serve() {
        while (true) {
            std::string response;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (m_responses.empty()) return;
                response = m_responses.front();
                m_responses.pop_front();
            }
            int c = ::accept(m_fd, nullptr, nullptr);
            if (c < 0) return;
            std::string req = read_request(c);
            {
                std::lock_guard<std::mutex> lk(m_mu);
                m_requests.push_back(req);
            }
            std::size_t sent = 0;
            while (sent < response.size()) {
                ssize_t n = ::send(c, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) break;
                sent += static_cast<std::size_t>(n);
            }
            ::close(c);
        }
    }

    static std::string read_request(int c) {
        std::string data;
        char buf[4096];
        std::size_t header_end = std::string::npos;
        std::size_t want = 0;
        while (true) {
            if (header_end != std::string::npos && data.size() >= header_end + 4 + want) break;
            ssize_t n = ::recv(c, buf, sizeof(buf), 0);
            if (n <= 0) break;
            data.append(buf, static_cast<std::size_t>(n));
            if (header_end == std::string::npos && (header_end = data.find("\r\n\r\n")) != std::string::npos) {
                std::string head = to_lower(data.substr(0, header_end));
                auto cl = head.find("content-length:");
                if (cl != std::string::npos) want = std::stoul(head.substr(cl + 15));
            }
        }
        return data;
    }

    int m_fd = -1;
    unsigned short m_port = 0;
    std::thread m_thread;
    std::mutex m_mu;
    std::deque<std::string> m_responses;
    std::vector<std::string> m_requests;
};

std::string http_response(const std::string& status_line, const std::string& headers, const std::string& body) {
    return "HTTP/1.1 " + status_line + "\r\n" + headers + "Content-Length: " + std::to_string(body.size()) +
           "\r\nConnection: close\r\n\r\n" + body;
}

net::TransportOptions quick() {
    net::TransportOptions o;
    o.timeout = std::chrono::milliseconds{5000};
    o.connect_timeout = std::chrono::milliseconds{2000};
    o.user_agent = "reqline-test";
    return o;
}

} // namespace

TEST(CurlTransport, GetReturnsStatusHeadersBody) {
    net::CurlGlobal global;
    LoopbackServer server({http_response("200 OK", "Content-Type: text/plain\r\nX-Id: 7\r\n", "hello")});
    net::CurlTransport t;
    net::Request req;
    req.url = server.url("/greet?x=1");
    req.headers.push_back({"Accept", "text/plain"});
    auto resp = t.send(req, quick());
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "hello");
    EXPECT_EQ(resp.header("content-type"), "text/plain");
    EXPECT_EQ(resp.header("X-Id"), "7");
    EXPECT_EQ(resp.effective_url, req.url);

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].rfind("GET /greet?x=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(seen[0].find("Accept: text/plain\r\n"), std::string::npos);
    EXPECT_NE(seen[0].find("User-Agent: reqline-test\r\n"), std::string::npos);
}

TEST(CurlTransport, SendsMethodAndBody) {
    net::CurlGlobal global;
    LoopbackServer server({http_response("201 Created", "", "{}")});
    net::CurlTransport t;
    net::Request req;
    req.method = "PUT";
    req.url = server.url("/items/1");
    req.headers.push_back({"Content-Type", "application/json"});
    req.body = "{\"name\":\"Ada\"}";
    auto resp = t.send(req, quick());
    EXPECT_EQ(resp.status, 201);
    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].rfind("PUT /items/1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(seen[0].find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_EQ(seen[0].substr(seen[0].size() - req.body.size()), req.body);
    EXPECT_EQ(seen[0].find("Expect:"), std::string::npos);
}

TEST(CurlTransport, DoesNotFollowRedirects) {
    net::CurlGlobal global;
    LoopbackServer server({http_response("302 Found", "Location: /elsewhere\r\n", "")});
    net::CurlTransport t;
    net::Request req;
    req.url = server.url("/start");
    auto resp = t.send(req, quick());
    EXPECT_EQ(resp.status, 302);
    EXPECT_EQ(resp.header("Location"), "/elsewhere");
    EXPECT_EQ(server.requests().size(), 1u);
}

TEST(CurlTransport, LeavesContentEncodingAlone) {
    net::CurlGlobal global;
    const std::string raw("\x1f\x8b not really gzip", 18);
    LoopbackServer server({http_response("200 OK", "Content-Encoding: gzip\r\n", raw)});
    net::CurlTransport t;
    net::Request req;
    req.url = server.url("/z");
    auto resp = t.send(req, quick());
    EXPECT_EQ(resp.body, raw);
    EXPECT_EQ(resp.header("Content-Encoding"), "gzip");
}

TEST(CurlTransport, SizeLimitIsReported) {
    net::CurlGlobal global;
    LoopbackServer server({http_response("200 OK", "", std::string(4096, 'x'))});
    net::CurlTransport t;
    net::Request req;
    req.url = server.url("/big");
    auto opts = quick();
    opts.size_limit = 1024;
    try {
        t.send(req, opts);
        FAIL() << "expected TransportError";
    } catch (const net::TransportError& e) {
        EXPECT_EQ(e.kind(), net::TransportError::Kind::SizeLimit);
        EXPECT_EQ(std::string(e.what()).rfind("size limit exceeded", 0), 0u);
    }
}

TEST(CurlTransport, RefusedConnection) {
    net::CurlGlobal global;
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    unsigned short port = ntohs(addr.sin_port);
    ::close(fd);

    net::CurlTransport t;
    net::Request req;
    req.url = "http://127.0.0.1:" + std::to_string(port) + "/";
    try {
        t.send(req, quick());
        FAIL() << "expected TransportError";
    } catch (const net::TransportError& e) {
        EXPECT_EQ(e.kind(), net::TransportError::Kind::Connect);
    }
}

TEST(CurlTransport, CookieJarKeepsSetCookies) {
    net::CurlGlobal global;
    LoopbackServer server({http_response("200 OK", "Set-Cookie: sid=abc; Path=/\r\nSet-Cookie: theme=dark\r\n", "")});
    net::CurlTransport t;
    net::Request req;
    req.url = server.url("/login");
    auto resp = t.send(req, quick());
    EXPECT_EQ(resp.header_values("Set-Cookie").size(), 2u);
    auto jar = t.jar_cookies(server.url("/"));
    std::sort(jar.begin(), jar.end());
    ASSERT_EQ(jar.size(), 2u);
    EXPECT_EQ(jar[0], "sid=abc");
    EXPECT_EQ(jar[1], "theme=dark");
    EXPECT_TRUE(t.jar_cookies("http://other.test/").empty());
}
