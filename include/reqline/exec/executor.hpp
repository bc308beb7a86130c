/*
 * Reqline Executor
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Carries out an ExecutionPlan: builds the wire request (URL, body, headers,
 *   cookies, stored session), runs it through the redirect follower under the
 *   plan's retry policy, decodes the response, evaluates expect= checks and
 *   writes the output. Diagnostics go to ctx.err, the response to ctx.out or
 *   the destination file. Failures surface as ExecutionError with the process
 *   exit code attached.
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
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include "reqline/exec/redirect.hpp"
#include "reqline/net/transport.hpp"
#include "reqline/plan/plan.hpp"
#include "reqline/session/session_store.hpp"

namespace reqline {

enum class ExitCode { Ok = 0, ExpectationFailed = 3, Network = 4, Usage = 5 };

class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ExitCode code, const std::string& what) : std::runtime_error(what), m_code(code) {}
    ExitCode code() const { return m_code; }
    int exit_code() const { return static_cast<int>(m_code); }
private:
    ExitCode m_code;
};

struct ExecContext {
    std::istream* in = &std::cin;
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
    bool stdout_is_tty = false;
    std::chrono::milliseconds default_timeout{30000};
    std::chrono::milliseconds connect_timeout{10000};
    std::string user_agent = "reqline";
    std::function<void(std::chrono::milliseconds)> sleep;   // unset: std::this_thread::sleep_for
    int max_polls = 0;                                      // watch: 0 means until the condition holds
    int last_status = 0;
};

// plan.url with plan.query_params appended in order.
std::string build_url(const ExecutionPlan& plan);

// 429, 502, 503, 504.
bool is_retryable_status(long status);

class Executor {
public:
    // sessions may be null: no auto-apply, authenticate cannot save.
    Executor(net::ITransport& transport, const SessionStore* sessions, ExecContext& ctx)
        : m_transport(transport), m_sessions(sessions), m_ctx(ctx) {}

    void execute(const ExecutionPlan& plan);

    // Request as it would go on the wire for the first hop.
    net::Request build_request(const ExecutionPlan& plan);

private:
    net::ITransport& m_transport;
    const SessionStore* m_sessions;
    ExecContext& m_ctx;

    std::ostream& err() { return *m_ctx.err; }
    void apply_session(const ExecutionPlan& plan, net::Request& req);
    net::TransportOptions transport_options(const ExecutionPlan& plan) const;
    RedirectOutcome exchange(const ExecutionPlan& plan, const net::Request& req);
    std::string decode(const net::Response& resp);
    void print_meta(const RedirectOutcome& outcome, std::size_t size);
    void print_verbose_request(const net::Request& req);
    void print_verbose_response(const net::Response& resp);
    void capture_session(const ExecutionPlan& plan, const RedirectOutcome& outcome, const std::string& body);
    void verify(const ExecutionPlan& plan, const net::Response& resp, const std::string& body);
    void emit(const ExecutionPlan& plan, const net::Response& resp, const std::string& body, bool resumed, const std::string& prefix = {});
    void watch(const ExecutionPlan& plan, const net::Request& req);
    void pause(std::chrono::milliseconds d);
};

} // namespace reqline
