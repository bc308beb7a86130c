/*
 * Reqline Grammar Table Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for overview.
 */
#include <reqline/parse/grammar.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>

namespace reqline {

const std::vector<VerbInfo>& grammar_verbs() {
    static const std::vector<VerbInfo> verbs = {
        {"read", "GET, print to stdout"},
        {"save", "GET, write to file via to="},
        {"send", "default GET, POST if with= present"},
        {"upload", "POST when attach= or with= present, else error"},
        {"watch", "GET, repeat with every= until until= holds"},
        {"inspect", "HEAD only, prints status and headers"},
        {"authenticate", "login and store session state"},
        {"session", "session management (show, clear, use)"},
    };
    return verbs;
}

const std::vector<ClauseInfo>& grammar_clauses() {
    static const std::vector<ClauseInfo> clauses = {
        {"using", "HTTP method override", false, false, true, "using=PUT"},
        {"include", "Add headers, params, cookies, basic auth", true, false, true,
            "include='header: Authorization: Bearer token; param: q=search query; basic: user:pass'"},
        {"with", "Request body", false, false, true, "with=@user.json or with='{\"name\":\"Adam\"}'"},
        {"expect", "Assertions on response", false, false, true,
            "expect=status:200, header:Content-Type=application/json, contains:\"ok\""},
        {"as", "Output format for stdout", false, false, true, "as=json"},
        {"to", "Destination path", false, false, true, "to=out.json"},
        {"retry", "Retry attempts for transient errors", false, false, true, "retry=3"},
        {"backoff", "Retry delay range", false, false, true, "backoff=200ms..5s"},
        {"timeout", "Deadline for the whole exchange", false, false, true, "timeout=10s"},
        {"under", "Timeout or size limit", false, false, true, "under=30s or under=10MB"},
        {"via", "Proxy URL", false, false, true, "via=http://proxy:8080"},
        {"attach", "Multipart parts for upload or send", true, false, true,
            "attach='part: name=avatar, file=@me.png; part: name=meta, value=xyz'"},
        {"field", "Single multipart text field", true, false, true, "field=name=value"},
        {"follow", "Redirect policy for write verbs", false, false, true, "follow=smart"},
        {"insecure", "Disable TLS verification for this request", false, true, true, "insecure=true"},
        {"pick", "Print only the value at a JSONPath", false, false, true, "pick=$.data.id"},
        {"every", "Polling interval for watch", false, false, true, "every=5s"},
        {"until", "Stop polling once this check holds", false, false, true, "until=jsonpath:$.state=done"},
        {"verbose", "Print request and response headers", false, true, false, "verbose"},
        {"resume", "Continue a partial download", false, true, false, "resume"},
    };
    return clauses;
}

const ClauseInfo* find_clause(const std::string& key) {
    for (auto &c : grammar_clauses()) if (c.key == key) return &c;
    return nullptr;
}

bool is_clause_key(const std::string& key) {
    auto c = find_clause(key);
    return c && c->takes_value;
}

bool is_flag_word(const std::string& word) {
    auto c = find_clause(word);
    return c && c->bare_flag;
}

std::vector<std::string> verb_names() {
    std::vector<std::string> out;
    for (auto &v : grammar_verbs()) out.push_back(v.name);
    return out;
}

std::vector<std::string> clause_keys() {
    std::vector<std::string> out;
    for (auto &c : grammar_clauses()) out.push_back(c.key);
    return out;
}

std::string format_help() {
    std::string help = "reqline - HTTP client with a verb + clause grammar\n\n";
    help += "Usage: reqline <verb> <url> [clauses...]\n\n";
    help += "Verbs:\n";
    char buf[64];
    for (auto &v : grammar_verbs()) {
        std::snprintf(buf, sizeof(buf), "  %-13s - ", v.name.c_str());
        help += buf + v.description + "\n";
    }
    help += "\nClauses:\n";
    for (auto &c : grammar_clauses()) {
        std::string name = c.takes_value ? c.key + "=" : c.key;
        std::snprintf(buf, sizeof(buf), "  %-13s - ", name.c_str());
        help += buf + c.description;
        if (c.repeatable) help += " (repeatable)";
        help += "\n                  Example: " + c.example + "\n";
    }
    help += "\nExamples:\n";
    help += "  reqline read https://api.example.com/search include='param: q=search query' as=json\n";
    help += "  reqline read https://httpbin.org/basic-auth/user/passwd include='basic: user:passwd' expect=status:200\n";
    help += "  reqline send https://api.example.com/users using=PUT with='{\"name\":\"Ada\"}' expect=status:200\n";
    help += "  reqline upload https://api.example.com/upload attach='part: name=file, file=@./avatar.png, type=image/png'\n";
    help += "  reqline save https://example.com/file.zip to=downloads/ resume\n";
    help += "  reqline authenticate https://api.example.com/login with='{\"user\":\"ada\",\"pass\":\"xyz\"}'\n";
    help += "  reqline session show api.example.com\n";
    return help;
}

std::string grammar_snapshot_json() {
    nlohmann::json snap;
    snap["verbs"] = verb_names();
    snap["clauses"] = nlohmann::json::array();
    for (auto &c : grammar_clauses()) {
        snap["clauses"].push_back({{"name", c.takes_value ? c.key + "=" : c.key},
                                   {"description", c.description},
                                   {"repeatable", c.repeatable}});
    }
    return snap.dump(2);
}

} // namespace reqline
