/*
 * Reqline Executor Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/exec/executor.hpp>
#include <reqline/exec/body.hpp>
#include <reqline/exec/decompress.hpp>
#include <reqline/exec/expect.hpp>
#include <reqline/exec/output.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/url.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace reqline {

namespace {

bool has_header(const net::HeaderList& headers, const std::string& name) {
    return std::any_of(headers.begin(), headers.end(), [&](const net::Header& h) { return iequals(h.name, name); });
}

void set_header(net::HeaderList& headers, const std::string& name, const std::string& value) {
    for (auto &h : headers) if (iequals(h.name, name)) { h.value = value; return; }
    headers.push_back({name, value});
}

std::string cookie_header(const std::map<std::string, std::string>& cookies) {
    std::string out;
    for (auto &[k, v] : cookies) {
        if (!out.empty()) out += "; ";
        out += k + "=" + v;
    }
    return out;
}

std::string timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%H:%M:%S") << "] ";
    return ss.str();
}

} // namespace

std::string build_url(const ExecutionPlan& plan) {
    return append_query(plan.url, plan.query_params);
}

bool is_retryable_status(long status) {
    return status == 429 || status == 502 || status == 503 || status == 504;
}

net::Request Executor::build_request(const ExecutionPlan& plan) {
    net::Request req;
    req.method = plan.method;
    try {
        req.url = build_url(plan);
    } catch (const UrlError& e) {
        throw ExecutionError(ExitCode::Usage, std::string("invalid URL: ") + e.what());
    }

    PreparedBody body;
    if (plan.body) {
        try {
            body = prepare_body(*plan.body, *m_ctx.in, err());
        } catch (const BodyError& e) {
            throw ExecutionError(ExitCode::Usage, std::string("failed to build body: ") + e.what());
        }
        req.body = std::move(body.content);
    }

    for (auto &[name, value] : plan.headers) req.headers.push_back({name, value});
    if (plan.body && plan.body->kind == BodyKind::Multipart) {
        if (plan.headers.count("Content-Type")) err() << "Note: Content-Type overridden for multipart\n";
        set_header(req.headers, "Content-Type", body.content_type);
    } else if (!body.content_type.empty() && !has_header(req.headers, "Content-Type")) {
        req.headers.push_back({"Content-Type", body.content_type});
    }
    if (!plan.cookies.empty()) set_header(req.headers, "Cookie", cookie_header(plan.cookies));
    if (!has_header(req.headers, "Accept-Encoding")) req.headers.push_back({"Accept-Encoding", "gzip, br"});
    return req;
}

void Executor::apply_session(const ExecutionPlan& plan, net::Request& req) {
    // explicit credentials always win over a stored session
    if (!m_sessions || has_header(req.headers, "Authorization") || has_header(req.headers, "Cookie")) return;
    std::string host;
    try {
        host = extract_host(plan.url);
    } catch (const SessionError&) {
        return;
    }
    std::optional<Session> s;
    try {
        s = m_sessions->load(host);
    } catch (const SessionError& e) {
        err() << "Warning: " << e.what() << "\n";
        return;
    }
    if (!s || (s->authorization.empty() && s->cookies.empty())) return;
    if (!s->authorization.empty()) req.headers.push_back({"Authorization", s->authorization});
    if (!s->cookies.empty()) req.headers.push_back({"Cookie", cookie_header(s->cookies)});
    err() << "Using session for " << host << "\n";
}

net::TransportOptions Executor::transport_options(const ExecutionPlan& plan) const {
    net::TransportOptions o;
    o.timeout = plan.timeout ? *plan.timeout : m_ctx.default_timeout;
    o.connect_timeout = m_ctx.connect_timeout;
    o.size_limit = plan.size_limit;
    o.proxy = plan.proxy;
    o.insecure = plan.insecure;
    o.user_agent = m_ctx.user_agent;
    return o;
}

void Executor::pause(std::chrono::milliseconds d) {
    if (m_ctx.sleep) m_ctx.sleep(d);
    else std::this_thread::sleep_for(d);
}

RedirectOutcome Executor::exchange(const ExecutionPlan& plan, const net::Request& req) {
    const int retries = plan.retry ? plan.retry->count : 0;
    std::chrono::milliseconds delay = plan.retry ? plan.retry->backoff_min : std::chrono::milliseconds{0};
    RedirectOptions ro;
    ro.collect_cookies = plan.verb == Verb::Authenticate;
    net::TransportOptions opts = transport_options(plan);

    for (int attempt = 0;; ++attempt) {
        std::string reason;
        try {
            RedirectFollower follower(m_transport, err());
            RedirectOutcome outcome = follower.run(req, opts, plan.verb, plan.follow, ro);
            if (attempt >= retries || !is_retryable_status(outcome.response.status)) return outcome;
            reason = "HTTP " + std::to_string(outcome.response.status);
        } catch (const net::TransportError& e) {
            if (e.kind() == net::TransportError::Kind::SizeLimit || attempt >= retries)
                throw ExecutionError(ExitCode::Network, std::string("request failed: ") + e.what());
            reason = e.what();
        } catch (const RedirectError& e) {
            throw ExecutionError(ExitCode::Network, std::string("request failed: ") + e.what());
        }
        err() << "Retry " << (attempt + 1) << "/" << retries << " in " << delay.count() << "ms: " << reason << "\n";
        pause(delay);
        delay = std::min(delay * 2, plan.retry->backoff_max);
    }
}

std::string Executor::decode(const net::Response& resp) {
    try {
        DecodeResult d = decode_content(resp.body, resp.header("Content-Encoding"));
        if (d.decoded) err() << "Decompressed response\n";
        return std::move(d.body);
    } catch (const DecodeError& e) {
        throw ExecutionError(ExitCode::Network, std::string("failed to read response: ") + e.what());
    }
}

void Executor::print_meta(const RedirectOutcome& outcome, std::size_t size) {
    err() << "HTTP " << outcome.response.status << "\n";
    err() << "URL: " << outcome.final_url << "\n";
    err() << "Size: " << size << " bytes\n";
    std::string ct = outcome.response.header("Content-Type");
    if (!ct.empty()) err() << "Content-Type: " << ct << "\n";
}

void Executor::print_verbose_request(const net::Request& req) {
    err() << "> " << req.method << " " << req.url << "\n";
    for (auto &h : req.headers) err() << "> " << h.name << ": " << h.value << "\n";
    if (!req.body.empty()) err() << "> (" << req.body.size() << " bytes body)\n";
}

void Executor::print_verbose_response(const net::Response& resp) {
    err() << "< HTTP " << resp.status << "\n";
    for (auto &h : resp.headers) err() << "< " << h.name << ": " << h.value << "\n";
}

void Executor::capture_session(const ExecutionPlan& plan, const RedirectOutcome& outcome, const std::string& body) {
    if (!m_sessions) return;
    std::string host;
    try {
        host = extract_host(plan.url);
    } catch (const SessionError& e) {
        err() << "Warning: session not saved: " << e.what() << "\n";
        return;
    }
    Session base;
    try {
        if (auto existing = m_sessions->load(host)) base = *existing;
    } catch (const SessionError& e) {
        err() << "Warning: " << e.what() << "; replacing it\n";
    }
    base.host = host;
    Session updated = update_session(base, outcome.set_cookies, body);
    try {
        m_sessions->save(updated);
    } catch (const SessionError& e) {
        err() << "Warning: session not saved: " << e.what() << "\n";
        return;
    }
    err() << "Session saved for " << host << "\n";
}

void Executor::verify(const ExecutionPlan& plan, const net::Response& resp, const std::string& body) {
    if (!plan.expect.empty()) {
        if (auto failure = evaluate_checks(plan.expect, resp, body))
            throw ExecutionError(ExitCode::ExpectationFailed, "expectation failed: " + *failure);
        return;
    }
    if (resp.status < 200 || resp.status >= 300)
        throw ExecutionError(ExitCode::Network, "HTTP " + std::to_string(resp.status));
}

void Executor::emit(const ExecutionPlan& plan, const net::Response& resp, const std::string& body, bool resumed, const std::string& prefix) {
    std::string payload = body;
    if (plan.verb == Verb::Inspect) {
        nlohmann::json headers = nlohmann::json::object();
        for (auto &h : resp.headers) {
            if (headers.contains(h.name)) headers[h.name] = headers[h.name].get<std::string>() + ", " + h.value;
            else headers[h.name] = h.value;
        }
        payload = nlohmann::json{{"status", resp.status}, {"headers", headers}}.dump();
    }
    if (!plan.output.pick.empty()) {
        try {
            payload = apply_pick(payload, plan.output.pick);
        } catch (const OutputError& e) {
            throw ExecutionError(ExitCode::ExpectationFailed, e.what());
        }
    }
    if (!plan.output.destination.empty()) {
        try {
            write_destination(plan.output.destination, payload, resumed && resp.status == 206);
        } catch (const OutputError& e) {
            throw ExecutionError(ExitCode::Network, std::string("failed to write file: ") + e.what());
        }
        return;
    }
    std::string text = render(payload, plan.output.format, m_ctx.stdout_is_tty);
    *m_ctx.out << prefix << text;
    if (!prefix.empty() && (text.empty() || text.back() != '\n')) *m_ctx.out << "\n";
    m_ctx.out->flush();
}

void Executor::watch(const ExecutionPlan& plan, const net::Request& req) {
    const PollPlan& poll = *plan.poll;
    for (int polls = 1;; ++polls) {
        RedirectOutcome outcome = exchange(plan, req);
        if (plan.verbose) print_verbose_response(outcome.response);
        std::string body = decode(outcome.response);
        emit(plan, outcome.response, body, false, m_ctx.stdout_is_tty ? timestamp() : std::string());
        bool done = poll.until && !evaluate_check(*poll.until, outcome.response, body);
        if (done) {
            print_meta(outcome, body.size());
            verify(plan, outcome.response, body);
            return;
        }
        if (m_ctx.max_polls > 0 && polls >= m_ctx.max_polls) {
            if (poll.until)
                throw ExecutionError(ExitCode::ExpectationFailed, "until condition not met after " + std::to_string(polls) + " polls");
            return;
        }
        pause(poll.interval);
    }
}

void Executor::execute(const ExecutionPlan& plan) {
    if (plan.insecure) err() << "Warning: TLS verification disabled\n";
    net::Request req = build_request(plan);
    apply_session(plan, req);

    bool resumed = false;
    if (plan.resume && !plan.output.destination.empty()) {
        std::error_code ec;
        auto size = fs::file_size(plan.output.destination, ec);
        if (!ec && size > 0) {
            set_header(req.headers, "Range", "bytes=" + std::to_string(size) + "-");
            resumed = true;
        }
    }

    if (plan.verbose) print_verbose_request(req);
    if (plan.poll) {
        watch(plan, req);
        return;
    }

    RedirectOutcome outcome = exchange(plan, req);
    if (plan.verbose) print_verbose_response(outcome.response);
    if (resumed && outcome.response.status == 416) {
        err() << "Nothing to resume: " << plan.output.destination << " is already complete\n";
        return;
    }
    std::string body = decode(outcome.response);
    print_meta(outcome, body.size());
    if (plan.verb == Verb::Authenticate) capture_session(plan, outcome, body);
    verify(plan, outcome.response, body);
    emit(plan, outcome.response, body, resumed);
}

} // namespace reqline
