/*
 * Reqline Redirect Follower
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Drives one exchange across redirect hops. The transport performs single
 *   hops; this module decides per response whether to follow, stop, print an
 *   advisory or fail, rewrites the request for the next hop and keeps one
 *   deadline for the whole chain.
 *
 *   Policy (verb, method, follow=, status):
 *     follow=smart    write requests follow 307/308 only, other 3xx fail;
 *                     everything else follows.
 *     default         read, save, authenticate follow; write requests stop
 *                     and print an advisory on 301/302/303; others stop.
 *   301/302/303 turn into GET without a body (HEAD stays HEAD), 307/308 keep
 *   method and body. Authorization and Cookie are not carried to another host.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <chrono>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "reqline/net/transport.hpp"
#include "reqline/parse/ast.hpp"
#include "reqline/plan/plan.hpp"

namespace reqline {

enum class RedirectState { Sending, RedirectReceived, Done, Error };
enum class RedirectAction { Follow, Stop, Advise, Reject };

const char* to_string(RedirectState s);

bool is_redirect_status(long status);

// send/upload, or any POST PUT PATCH DELETE.
bool is_write_request(Verb verb, const std::string& method);

RedirectAction redirect_policy(Verb verb, const std::string& method, FollowPolicy follow, long status);

// Too many hops or a redirect refused by policy.
class RedirectError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RedirectOptions {
    int max_hops = 5;
    bool collect_cookies = false;   // authenticate: every Set-Cookie plus the jar
};

struct RedirectOutcome {
    net::Response response;
    std::string final_url;
    std::string final_method;
    int hops = 0;
    std::vector<std::string> set_cookies;
};

class RedirectFollower {
public:
    RedirectFollower(net::ITransport& transport, std::ostream& trace) : m_transport(transport), m_trace(trace) {}

    // opts.timeout is the budget for the whole chain.
    RedirectOutcome run(net::Request req, const net::TransportOptions& opts, Verb verb, FollowPolicy follow,
                        const RedirectOptions& ro = {});

    RedirectState state() const { return m_state; }
private:
    net::ITransport& m_transport;
    std::ostream& m_trace;
    RedirectState m_state = RedirectState::Sending;

    net::Request next_request(const net::Request& prev, long status, const std::string& location) const;
};

} // namespace reqline
