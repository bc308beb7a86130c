/*
 * Reqline Planner Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/plan/planner.hpp>
#include <reqline/util/base64.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/url.hpp>
#include <algorithm>
#include <filesystem>
#include <variant>

namespace fs = std::filesystem;

namespace reqline {

const char* to_string(BodyKind k) {
    switch (k) {
        case BodyKind::Json: return "json";
        case BodyKind::Form: return "form";
        case BodyKind::Raw: return "raw";
        case BodyKind::Multipart: return "multipart";
    }
    return "?";
}

const char* to_string(BodySource s) {
    switch (s) {
        case BodySource::Inline: return "inline";
        case BodySource::File: return "file";
        case BodySource::Stdin: return "stdin";
    }
    return "?";
}

const char* to_string(FollowPolicy f) {
    return f == FollowPolicy::Smart ? "smart" : "default";
}

bool method_allowed_for(Verb verb, const std::string& method) {
    auto in = [&](std::initializer_list<const char*> allowed) {
        return std::any_of(allowed.begin(), allowed.end(), [&](const char* m) { return method == m; });
    };
    switch (verb) {
        case Verb::Read: return in({"GET", "HEAD", "OPTIONS"});
        case Verb::Save: return in({"GET", "POST"});
        case Verb::Send: return in({"POST", "PUT", "PATCH"});
        case Verb::Upload: return in({"POST", "PUT"});
        case Verb::Watch: return in({"GET"});
        case Verb::Inspect: return in({"HEAD", "GET", "OPTIONS"});
        case Verb::Authenticate: return true;
        case Verb::Session: return false;
    }
    return false;
}

std::string filename_from_url(const std::string& url) {
    std::string path;
    try {
        path = parse_url(url).path;
    } catch (const UrlError&) {
        return "download";
    }
    if (path.empty() || path == "/") return "download";
    std::string segment = path.substr(path.find_last_of('/') + 1);
    std::string name;
    for (char c : percent_decode(segment)) if (c != '/' && c != '\\') name.push_back(c);
    if (name.empty() || name == "." || name == ".." || name.find('.') == std::string::npos) return "download";
    return name;
}

namespace {

// One overload per Clause alternative; a new alternative without a handler fails to compile.
struct ClauseFolder {
    ExecutionPlan& plan;
    const PlannerConfig& cfg;

    BodyPlan& body() {
        if (!plan.body) plan.body = BodyPlan{};
        return *plan.body;
    }

    void promote_to_post() { if (plan.method == "GET") plan.method = "POST"; }

    void operator()(const UsingClause& c) {
        if (!method_allowed_for(plan.verb, c.method))
            throw PlanError(std::string("verb '") + to_string(plan.verb) + "' is incompatible with method '" + c.method + "'");
        plan.method = c.method;
    }

    void operator()(const WithClause& c) {
        if (plan.body && plan.body->kind == BodyKind::Multipart)
            throw PlanError("with= cannot be combined with attach= or field=");
        BodyPlan& b = body();
        b.content.clear(); b.file_path.clear(); b.inferred_json = false;
        switch (c.source) {
            case WithClause::Source::Stdin: b.source = BodySource::Stdin; break;
            case WithClause::Source::File: b.source = BodySource::File; b.file_path = c.value; break;
            case WithClause::Source::Inline: b.source = BodySource::Inline; b.content = c.value; break;
        }
        if (c.type == "json") b.kind = BodyKind::Json;
        else if (c.type == "form") b.kind = BodyKind::Form;
        else if (c.type == "raw") b.kind = BodyKind::Raw;
        else if (b.source == BodySource::Inline) {
            std::string t = trim(c.value);
            bool json_shaped = !t.empty() && (t[0] == '{' || t[0] == '[');
            b.kind = json_shaped ? BodyKind::Json : BodyKind::Raw;
            b.inferred_json = json_shaped;
        } else {
            b.kind = BodyKind::Raw;
        }
        promote_to_post();
    }

    void operator()(const IncludeClause& c) {
        for (auto &item : c.items) {
            switch (item.kind) {
                case IncludeItem::Kind::Header: plan.headers[item.name] = item.value; break;
                case IncludeItem::Kind::Param: plan.query_params.emplace_back(item.name, item.value); break;
                case IncludeItem::Kind::Cookie: plan.cookies[item.name] = item.value; break;
                case IncludeItem::Kind::Basic: plan.headers["Authorization"] = "Basic " + base64_encode(item.value); break;
            }
        }
    }

    void to_multipart() {
        if (plan.body && plan.body->kind != BodyKind::Multipart)
            throw PlanError("attach= and field= cannot be combined with with=");
        body().kind = BodyKind::Multipart;
        promote_to_post();
    }

    void operator()(const AttachClause& c) {
        to_multipart();
        auto &parts = plan.body->parts;
        parts.insert(parts.end(), c.parts.begin(), c.parts.end());
        if (!c.boundary.empty()) plan.body->boundary = c.boundary;
    }

    void operator()(const FieldClause& c) {
        to_multipart();
        AttachPart part;
        part.name = c.name;
        part.value = c.value;
        plan.body->parts.push_back(part);
    }

    void operator()(const ExpectClause& c) { plan.expect = c.checks; }
    void operator()(const AsClause& c) { plan.output.format = c.format; }
    void operator()(const ToClause& c) { plan.output.destination = c.destination; }
    void operator()(const PickClause& c) { plan.output.pick = c.path; }

    RetryPlan& retry() {
        if (!plan.retry) plan.retry = RetryPlan{0, cfg.default_backoff_min, cfg.default_backoff_max};
        return *plan.retry;
    }

    void operator()(const RetryClause& c) { retry().count = c.count; }

    void operator()(const BackoffClause& c) {
        bool fresh = !plan.retry;
        RetryPlan& r = retry();
        if (fresh) r.count = cfg.default_retry_count;
        r.backoff_min = c.min;
        r.backoff_max = c.max;
    }

    void operator()(const TimeoutClause& c) { plan.timeout = c.duration; }

    void operator()(const UnderClause& c) {
        if (c.size) plan.size_limit = *c.size;
        else plan.timeout = c.duration;
    }

    void operator()(const ViaClause& c) { plan.proxy = c.url; }
    void operator()(const FollowClause&) { plan.follow = FollowPolicy::Smart; }
    void operator()(const InsecureClause& c) { plan.insecure = c.value; }

    void operator()(const EveryClause& c) {
        if (!plan.poll) plan.poll = PollPlan{};
        plan.poll->interval = c.interval;
    }

    void operator()(const UntilClause& c) {
        if (!plan.poll) plan.poll = PollPlan{};
        plan.poll->until = c.check;
    }

    void operator()(const VerboseClause&) { plan.verbose = true; }
    void operator()(const ResumeClause&) { plan.resume = true; }
};

} // namespace

void Planner::apply_verb_defaults(ExecutionPlan& p) const {
    switch (p.verb) {
        case Verb::Read:
        case Verb::Send:
        case Verb::Watch:
            p.method = "GET"; p.output.format = "auto"; break;
        case Verb::Save:
            p.method = "GET"; p.output.format = "raw"; break;
        case Verb::Upload:
        case Verb::Authenticate:
            p.method = "POST"; p.output.format = "auto"; break;
        case Verb::Inspect:
            p.method = "HEAD"; p.output.format = "json"; break;
        case Verb::Session:
            throw PlanError("session commands are not planned as HTTP requests");
    }
}

void Planner::validate(const ExecutionPlan& p) const {
    if (p.url.empty()) throw PlanError("URL is required");
    if (p.verb == Verb::Upload && !p.body) throw PlanError("upload needs a body: add with= or attach=");
    if (p.poll) {
        if (p.verb != Verb::Watch) throw PlanError("every= and until= are only valid for watch");
        if (p.poll->interval.count() <= 0) throw PlanError("until= needs every= to set the polling interval");
    }
    if (p.resume && p.verb != Verb::Save) throw PlanError("resume is only valid for save");
    if (p.body && p.body->kind == BodyKind::Multipart && p.body->parts.empty())
        throw PlanError("attach= needs at least one part:");
}

void Planner::infer_destination(ExecutionPlan& p) const {
    if (p.verb != Verb::Save) return;
    if (p.output.destination.empty()) {
        p.output.destination = filename_from_url(p.url);
        return;
    }
    if (!m_cfg.probe_filesystem) return;
    std::error_code ec;
    if (fs::is_directory(p.output.destination, ec))
        p.output.destination = (fs::path(p.output.destination) / filename_from_url(p.url)).string();
}

ExecutionPlan Planner::plan(const Command& cmd) const {
    ExecutionPlan p;
    p.verb = cmd.verb;
    p.url = cmd.target;
    apply_verb_defaults(p);
    ClauseFolder folder{p, m_cfg};
    for (auto &clause : cmd.clauses) std::visit(folder, clause);
    validate(p);
    infer_destination(p);
    return p;
}

} // namespace reqline
