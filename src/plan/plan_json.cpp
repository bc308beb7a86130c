/*
 * Reqline Plan JSON Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/plan/plan_json.hpp>
#include <reqline/util/duration.hpp>

namespace reqline {

namespace {

nlohmann::json check_to_json(const ExpectCheck& c) {
    nlohmann::json j;
    j["type"] = to_string(c.kind);
    switch (c.kind) {
        case ExpectCheck::Kind::Header: j["name"] = c.name; j["value"] = c.value; break;
        case ExpectCheck::Kind::JsonPath:
            j["path"] = c.path;
            if (c.has_value) j["value"] = c.value;
            break;
        default: j["value"] = c.value; break;
    }
    return j;
}

nlohmann::json part_to_json(const AttachPart& p) {
    nlohmann::json j;
    j["name"] = p.name;
    if (p.file_path) j["file"] = *p.file_path;
    if (p.value) j["value"] = *p.value;
    if (!p.filename.empty()) j["filename"] = p.filename;
    if (!p.type.empty()) j["type"] = p.type;
    return j;
}

} // namespace

nlohmann::json plan_to_json(const ExecutionPlan& p) {
    nlohmann::json j;
    j["verb"] = to_string(p.verb);
    j["method"] = p.method;
    j["url"] = p.url;
    if (!p.headers.empty()) {
        nlohmann::json h = nlohmann::json::object();
        for (auto &[k, v] : p.headers) h[k] = v;
        j["headers"] = h;
    }
    // Array of pairs: repeated keys must survive.
    if (!p.query_params.empty()) {
        nlohmann::json q = nlohmann::json::array();
        for (auto &[k, v] : p.query_params) q.push_back({{"name", k}, {"value", v}});
        j["query_params"] = q;
    }
    if (!p.cookies.empty()) j["cookies"] = p.cookies;
    if (p.body) {
        const BodyPlan& b = *p.body;
        nlohmann::json body;
        body["type"] = to_string(b.kind);
        if (b.kind != BodyKind::Multipart) body["source"] = to_string(b.source);
        if (!b.content.empty()) body["content"] = b.content;
        if (!b.file_path.empty()) body["file_path"] = b.file_path;
        if (!b.parts.empty()) {
            nlohmann::json parts = nlohmann::json::array();
            for (auto &part : b.parts) parts.push_back(part_to_json(part));
            body["attach_parts"] = parts;
        }
        if (!b.boundary.empty()) body["boundary"] = b.boundary;
        j["body"] = body;
    }
    nlohmann::json out;
    out["format"] = p.output.format;
    if (!p.output.destination.empty()) out["destination"] = p.output.destination;
    if (!p.output.pick.empty()) out["pick"] = p.output.pick;
    j["output"] = out;
    if (p.retry) {
        j["retry"] = {
            {"count", p.retry->count},
            {"backoff", {{"min", format_duration(p.retry->backoff_min)}, {"max", format_duration(p.retry->backoff_max)}}}
        };
    }
    if (p.timeout) j["timeout"] = format_duration(*p.timeout);
    if (p.size_limit) j["size_limit"] = *p.size_limit;
    if (!p.proxy.empty()) j["proxy"] = p.proxy;
    if (p.insecure) j["insecure"] = true;
    if (p.verbose) j["verbose"] = true;
    if (p.resume) j["resume"] = true;
    if (p.follow != FollowPolicy::Default) j["follow"] = to_string(p.follow);
    if (!p.expect.empty()) {
        nlohmann::json checks = nlohmann::json::array();
        for (auto &c : p.expect) checks.push_back(check_to_json(c));
        j["expect"] = checks;
    }
    if (p.poll) {
        nlohmann::json poll;
        poll["interval"] = format_duration(p.poll->interval);
        if (p.poll->until) poll["until"] = check_to_json(*p.poll->until);
        j["poll"] = poll;
    }
    return j;
}

std::string to_json(const ExecutionPlan& plan, bool pretty) {
    return pretty ? plan_to_json(plan).dump(2) : plan_to_json(plan).dump();
}

} // namespace reqline
