/*
 * Reqline Redirect Follower Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/exec/redirect.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/url.hpp>
#include <algorithm>

namespace reqline {

const char* to_string(RedirectState s) {
    switch (s) {
        case RedirectState::Sending: return "sending";
        case RedirectState::RedirectReceived: return "redirect-received";
        case RedirectState::Done: return "done";
        case RedirectState::Error: return "error";
    }
    return "?";
}

bool is_redirect_status(long status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

bool is_write_request(Verb verb, const std::string& method) {
    if (verb == Verb::Send || verb == Verb::Upload) return true;
    return method == "POST" || method == "PUT" || method == "PATCH" || method == "DELETE";
}

RedirectAction redirect_policy(Verb verb, const std::string& method, FollowPolicy follow, long status) {
    bool write = is_write_request(verb, method);
    if (follow == FollowPolicy::Smart) {
        if (write && status != 307 && status != 308) return RedirectAction::Reject;
        return RedirectAction::Follow;
    }
    if (verb == Verb::Read || verb == Verb::Save || verb == Verb::Authenticate) return RedirectAction::Follow;
    if (write && (status == 301 || status == 302 || status == 303)) return RedirectAction::Advise;
    return RedirectAction::Stop;
}

namespace {

void drop_headers(net::HeaderList& headers, std::initializer_list<const char*> names) {
    headers.erase(std::remove_if(headers.begin(), headers.end(), [&](const net::Header& h) {
        return std::any_of(names.begin(), names.end(), [&](const char* n) { return iequals(h.name, n); });
    }), headers.end());
}

} // namespace

net::Request RedirectFollower::next_request(const net::Request& prev, long status, const std::string& location) const {
    net::Request next = prev;
    next.url = resolve_url(prev.url, location);
    if ((status == 301 || status == 302 || status == 303) && prev.method != "HEAD") {
        next.method = "GET";
        next.body.clear();
        drop_headers(next.headers, {"Content-Type", "Content-Length"});
    }
    if (to_lower(url_authority(next.url)) != to_lower(url_authority(prev.url)))
        drop_headers(next.headers, {"Authorization", "Cookie"});
    return next;
}

RedirectOutcome RedirectFollower::run(net::Request req, const net::TransportOptions& opts, Verb verb, FollowPolicy follow,
                                      const RedirectOptions& ro) {
    using namespace std::chrono;
    RedirectOutcome out;
    const std::string origin = req.url;
    const auto deadline = steady_clock::now() + opts.timeout;
    net::Response resp;
    m_state = RedirectState::Sending;

    while (true) {
        switch (m_state) {
            case RedirectState::Sending: {
                auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
                if (remaining.count() <= 0) {
                    m_state = RedirectState::Error;
                    throw net::TransportError(net::TransportError::Kind::Timeout,
                        "request timed out: deadline exceeded after " + std::to_string(out.hops) + " redirect(s)");
                }
                net::TransportOptions hop = opts;
                hop.timeout = remaining;
                try {
                    resp = m_transport.send(req, hop);
                } catch (const net::TransportError&) {
                    m_state = RedirectState::Error;
                    throw;
                }
                if (ro.collect_cookies) {
                    auto cookies = resp.header_values("Set-Cookie");
                    out.set_cookies.insert(out.set_cookies.end(), cookies.begin(), cookies.end());
                }
                m_state = is_redirect_status(resp.status) ? RedirectState::RedirectReceived : RedirectState::Done;
                break;
            }
            case RedirectState::RedirectReceived: {
                RedirectAction action = redirect_policy(verb, req.method, follow, resp.status);
                std::string location = resp.header("Location");
                if (action == RedirectAction::Advise) {
                    m_trace << "Advisory: " << resp.status << " redirect for write verb, not following\n";
                    m_state = RedirectState::Done;
                    break;
                }
                if (action == RedirectAction::Stop || location.empty()) {
                    m_state = RedirectState::Done;
                    break;
                }
                if (action == RedirectAction::Reject) {
                    m_state = RedirectState::Error;
                    throw RedirectError("write verb: not following " + std::to_string(resp.status) + " redirect (use 307/308)");
                }
                if (out.hops >= ro.max_hops) {
                    m_state = RedirectState::Error;
                    throw RedirectError("stopped after " + std::to_string(ro.max_hops) + " redirects");
                }
                net::Request next;
                try {
                    next = next_request(req, resp.status, location);
                } catch (const UrlError& e) {
                    m_state = RedirectState::Error;
                    throw RedirectError(std::string("invalid redirect URL: ") + e.what());
                }
                ++out.hops;
                m_trace << "→ " << resp.status << " " << next.method << " " << next.url << "\n";
                req = std::move(next);
                m_state = RedirectState::Sending;
                break;
            }
            case RedirectState::Done: {
                if (ro.collect_cookies) {
                    auto jar = m_transport.jar_cookies(origin);
                    out.set_cookies.insert(out.set_cookies.end(), jar.begin(), jar.end());
                }
                out.response = std::move(resp);
                out.final_url = req.url;
                out.final_method = req.method;
                return out;
            }
            case RedirectState::Error:
                throw RedirectError("redirect follower entered error state");
        }
    }
}

} // namespace reqline
