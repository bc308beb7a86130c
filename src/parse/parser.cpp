/*
 * Reqline Parser Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: See header for details.
 */
#include <reqline/parse/ast.hpp>
#include <reqline/parse/grammar.hpp>
#include <reqline/parse/parser.hpp>
#include <reqline/parse/tokens.hpp>
#include <reqline/lex/lexer.hpp>
#include <reqline/util/duration.hpp>
#include <reqline/util/jsonpath.hpp>
#include <reqline/util/strings.hpp>
#include <reqline/util/suggest.hpp>
#include <reqline/util/url.hpp>
#include <cctype>
#include <limits>
#include <regex>
#include <set>

namespace reqline {

const char* to_string(Verb v) {
    switch (v) {
        case Verb::Read: return "read";
        case Verb::Save: return "save";
        case Verb::Send: return "send";
        case Verb::Upload: return "upload";
        case Verb::Watch: return "watch";
        case Verb::Inspect: return "inspect";
        case Verb::Authenticate: return "authenticate";
        case Verb::Session: return "session";
    }
    return "?";
}

std::optional<Verb> verb_from_string(const std::string& s) {
    static const Verb all[] = {Verb::Read, Verb::Save, Verb::Send, Verb::Upload,
                               Verb::Watch, Verb::Inspect, Verb::Authenticate, Verb::Session};
    for (auto v : all) if (s == to_string(v)) return v;
    return std::nullopt;
}

const char* to_string(SessionSubcommand s) {
    switch (s) {
        case SessionSubcommand::None: return "";
        case SessionSubcommand::Show: return "show";
        case SessionSubcommand::Clear: return "clear";
        case SessionSubcommand::Use: return "use";
    }
    return "";
}

const char* to_string(IncludeItem::Kind k) {
    switch (k) {
        case IncludeItem::Kind::Header: return "header";
        case IncludeItem::Kind::Param: return "param";
        case IncludeItem::Kind::Cookie: return "cookie";
        case IncludeItem::Kind::Basic: return "basic";
    }
    return "?";
}

const char* to_string(ExpectCheck::Kind k) {
    switch (k) {
        case ExpectCheck::Kind::Status: return "status";
        case ExpectCheck::Kind::Header: return "header";
        case ExpectCheck::Kind::Contains: return "contains";
        case ExpectCheck::Kind::JsonPath: return "jsonpath";
        case ExpectCheck::Kind::Matches: return "matches";
    }
    return "?";
}

namespace {

std::string build_message(std::size_t position, const std::string& token, const std::string& message, const std::string& suggestion) {
    std::string out = "parse error at position " + std::to_string(position) + " (token: \"" + token + "\"): " + message;
    if (!suggestion.empty()) out += " (did you mean \"" + suggestion + "\"?)";
    return out;
}

const std::vector<std::string> k_methods = {"GET", "POST", "PUT", "PATCH", "DELETE", "HEAD", "OPTIONS"};
const std::vector<std::string> k_include_tags = {"header", "param", "cookie", "basic"};
const std::vector<std::string> k_expect_tags = {"status", "header", "contains", "jsonpath", "matches"};
const std::vector<std::string> k_attach_tags = {"part", "boundary"};
const std::vector<std::string> k_part_keys = {"name", "file", "value", "filename", "type"};
const std::vector<std::string> k_session_subcommands = {"show", "clear", "use"};

// "tag:" prefix of an item, lower-cased; empty when the text does not start with one.
std::string leading_tag(const std::string& text) {
    std::string t = trim(text);
    std::size_t i = 0;
    while (i < t.size() && (std::isalnum(static_cast<unsigned char>(t[i])) || t[i] == '_' || t[i] == '-')) ++i;
    if (i == 0 || i >= t.size() || t[i] != ':') return {};
    return to_lower(t.substr(0, i));
}

std::string after_tag(const std::string& text) {
    std::string t = trim(text);
    return trim(t.substr(t.find(':') + 1));
}

// Splits on sep and glues back pieces that do not open a new "tag:" item,
// so "header: Accept: a; q=0.9" stays a single item.
std::vector<std::string> split_items(const std::string& value, char sep) {
    std::vector<std::string> items;
    for (auto &piece : split_top_level(value, sep)) {
        if (!items.empty() && leading_tag(piece).empty()) { items.back() += sep + piece; continue; }
        items.push_back(piece);
    }
    return items;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

// First '=' outside quotes and brackets.
std::size_t find_assignment(const std::string& s) {
    char quote = 0; int depth = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (quote) { if (c == quote) quote = 0; continue; }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '[') ++depth;
        else if (c == ']') --depth;
        else if (c == '=' && depth == 0) return i;
    }
    return std::string::npos;
}

class Parser {
public:
    Parser(const TokenStream& ts) : m_ts(ts) {}

    Command parse_line() {
        Command cmd;
        cmd.verb = parse_verb();
        if (cmd.verb == Verb::Session) parse_session_target(cmd);
        else cmd.target = parse_target();
        while (!eof()) cmd.clauses.push_back(parse_clause());
        return cmd;
    }

private:
    const Token& peek() const { return m_ts[m_index]; }
    bool eof() const { return m_index >= m_ts.size() || peek().kind == TokenKind::Eof; }
    const Token& get() { return m_ts[m_index++]; }
    std::size_t end_pos() const { return m_ts.empty() ? 0 : m_ts.back().pos; }

    Verb parse_verb() {
        if (eof()) throw ParseError(end_pos(), "", "expected a verb (" + join_names() + ")");
        const Token& t = get();
        if (t.kind == TokenKind::Url) throw ParseError(t.pos, t.lexeme, "expected a verb before the URL", "read");
        std::string word = t.kind == TokenKind::Clause ? t.lexeme + "=" : t.lexeme;
        auto v = verb_from_string(to_lower(word));
        if (!v) throw ParseError(t.pos, word, "unknown verb", suggest(to_lower(word), verb_names()));
        return *v;
    }

    static std::string join_names() {
        std::string out;
        for (auto &n : verb_names()) { if (!out.empty()) out += ", "; out += n; }
        return out;
    }

    std::string parse_target() {
        if (eof()) throw ParseError(end_pos(), "", "expected a target URL");
        const Token& t = get();
        if (t.kind == TokenKind::Url) return t.lexeme;
        if (t.kind == TokenKind::Word && !t.lexeme.empty())
            throw ParseError(t.pos, t.lexeme, "expected a URL starting with http:// or https://", "https://" + t.lexeme);
        throw ParseError(t.pos, t.lexeme, "expected a target URL");
    }

    void parse_session_target(Command& cmd) {
        if (eof()) throw ParseError(end_pos(), "", "expected a session subcommand (show, clear, use)");
        const Token& sub = get();
        std::string word = to_lower(sub.lexeme);
        if (sub.kind != TokenKind::Word || (word != "show" && word != "clear" && word != "use"))
            throw ParseError(sub.pos, sub.lexeme, "unknown session subcommand", suggest(word, k_session_subcommands));
        cmd.session_subcommand = word == "show" ? SessionSubcommand::Show
                               : word == "clear" ? SessionSubcommand::Clear : SessionSubcommand::Use;
        if (eof()) throw ParseError(end_pos(), "", "expected a host after 'session " + word + "'");
        const Token& host = get();
        if (host.kind == TokenKind::Url) cmd.target = host.lexeme;
        else if (host.kind == TokenKind::Word && !host.lexeme.empty()) cmd.target = "https://" + host.lexeme;
        else throw ParseError(host.pos, host.lexeme, "expected a host");
    }

    void mark_seen(const Token& t, const ClauseInfo& info) {
        if (info.repeatable) return;
        if (!m_seen.insert(info.key).second)
            throw ParseError(t.pos, info.key, "duplicate clause '" + info.key + "' (may appear only once)");
    }

    Clause parse_clause() {
        const Token& t = get();
        if (t.kind == TokenKind::Flag) {
            const ClauseInfo* info = find_clause(t.lexeme);
            mark_seen(t, *info);
            if (t.lexeme == "insecure") return InsecureClause{true};
            if (t.lexeme == "verbose") return VerboseClause{};
            return ResumeClause{};
        }
        if (t.kind != TokenKind::Clause)
            throw ParseError(t.pos, t.lexeme, "expected a clause (key=value)", suggest(to_lower(t.lexeme), clause_keys()));
        const ClauseInfo* info = find_clause(t.lexeme);
        if (!info) throw ParseError(t.pos, t.lexeme, "unknown clause", suggest(to_lower(t.lexeme), clause_keys()));
        if (!info->takes_value) throw ParseError(t.pos, t.lexeme, "'" + t.lexeme + "' is a flag and takes no value");
        mark_seen(t, *info);
        const std::string& key = info->key;
        if (key == "using") return parse_using(t);
        if (key == "with") return parse_with(t);
        if (key == "include") return parse_include(t);
        if (key == "attach") return parse_attach(t);
        if (key == "field") return parse_field(t);
        if (key == "expect") return parse_expect(t);
        if (key == "as") return parse_as(t);
        if (key == "to") return ToClause{require_value(t)};
        if (key == "retry") return parse_retry(t);
        if (key == "backoff") return parse_backoff(t);
        if (key == "timeout") return TimeoutClause{positive_duration(t)};
        if (key == "under") return parse_under(t);
        if (key == "via") return parse_via(t);
        if (key == "follow") return parse_follow(t);
        if (key == "insecure") return parse_insecure(t);
        if (key == "pick") return parse_pick(t);
        if (key == "every") return EveryClause{positive_duration(t)};
        if (key == "until") return UntilClause{parse_expect_check(require_value(t), t.pos)};
        throw ParseError(t.pos, t.lexeme, "unhandled clause");
    }

    static const std::string& require_value(const Token& t) {
        if (trim(t.value).empty()) throw ParseError(t.pos, t.lexeme + "=", "missing value for '" + t.lexeme + "='");
        return t.value;
    }

    static std::chrono::milliseconds positive_duration(const Token& t) {
        auto d = parse_duration(require_value(t));
        if (!d) throw ParseError(t.pos, t.value, "invalid duration for " + t.lexeme + "= (e.g. 500ms, 10s, 1m)");
        if (d->count() <= 0) throw ParseError(t.pos, t.value, t.lexeme + "= must be greater than zero");
        return *d;
    }

    UsingClause parse_using(const Token& t) {
        std::string method = to_upper(trim(require_value(t)));
        for (auto &m : k_methods) if (m == method) return UsingClause{method};
        throw ParseError(t.pos, t.value, "invalid HTTP method", suggest(method, k_methods));
    }

    WithClause parse_with(const Token& t) {
        WithClause w;
        std::string content = require_value(t);
        std::string tag = to_lower(t.type_tag);
        if (tag == "json" || tag == "form" || tag == "raw") {
            w.type = tag; content = t.typed_value;
            if (content.empty()) throw ParseError(t.pos, t.value, "with=" + tag + ": needs content");
        }
        if (content == "@-") { w.source = WithClause::Source::Stdin; return w; }
        if (!content.empty() && content[0] == '@') {
            w.source = WithClause::Source::File;
            w.value = content.substr(1);
            if (w.value.empty()) throw ParseError(t.pos, t.value, "with=@ needs a file path");
            return w;
        }
        w.value = content;
        return w;
    }

    IncludeClause parse_include(const Token& t) {
        IncludeClause clause;
        for (auto &raw_item : split_items(require_value(t), ';')) {
            std::string item = trim(raw_item);
            if (item.empty()) continue;
            std::string tag = leading_tag(item);
            if (tag.empty())
                throw ParseError(t.pos, item, "include item must start with header:, param:, cookie: or basic:");
            std::string rest = after_tag(item);
            if (tag == "header") {
                auto colon = rest.find(':');
                std::string name = colon == std::string::npos ? "" : trim(rest.substr(0, colon));
                if (name.empty()) throw ParseError(t.pos, item, "header item needs 'header: Name: Value'");
                clause.items.push_back({IncludeItem::Kind::Header, name, unquote(trim(rest.substr(colon + 1)))});
            } else if (tag == "param" || tag == "cookie") {
                auto eq = rest.find('=');
                std::string name = eq == std::string::npos ? "" : trim(rest.substr(0, eq));
                if (name.empty()) throw ParseError(t.pos, item, tag + " item needs '" + tag + ": name=value'");
                auto kind = tag == "param" ? IncludeItem::Kind::Param : IncludeItem::Kind::Cookie;
                clause.items.push_back({kind, name, unquote(trim(rest.substr(eq + 1)))});
            } else if (tag == "basic") {
                std::string cred = unquote(rest);
                std::size_t colons = 0;
                for (char c : cred) if (c == ':') ++colons;
                if (colons != 1) throw ParseError(t.pos, item, "basic item needs exactly one ':' in 'user:pass'");
                clause.items.push_back({IncludeItem::Kind::Basic, "", cred});
            } else {
                throw ParseError(t.pos, tag + ":", "unknown include item type", suggest(tag, k_include_tags));
            }
        }
        if (clause.items.empty()) throw ParseError(t.pos, t.lexeme + "=", "include= has no items");
        return clause;
    }

    AttachPart parse_part(const Token& t, const std::string& item, const std::string& fields) {
        AttachPart part;
        std::set<std::string> keys;
        for (auto &raw_kv : split_top_level(fields, ',')) {
            std::string kv = trim(raw_kv);
            if (kv.empty()) continue;
            auto eq = kv.find('=');
            if (eq == std::string::npos) throw ParseError(t.pos, kv, "part settings are key=value pairs");
            std::string key = to_lower(trim(kv.substr(0, eq)));
            std::string val = unquote(trim(kv.substr(eq + 1)));
            if (!keys.insert(key).second) throw ParseError(t.pos, kv, "part key '" + key + "' given twice");
            if (key == "name") part.name = val;
            else if (key == "file") {
                if (val.size() < 2 || val[0] != '@') throw ParseError(t.pos, kv, "file= must be written as file=@path");
                part.file_path = val.substr(1);
            }
            else if (key == "value") part.value = val;
            else if (key == "filename") part.filename = val;
            else if (key == "type") part.type = val;
            else throw ParseError(t.pos, key, "unknown part key", suggest(key, k_part_keys));
        }
        if (part.name.empty()) throw ParseError(t.pos, item, "part needs name=");
        if (part.file_path && part.value) throw ParseError(t.pos, item, "part takes either file= or value=, not both");
        if (!part.file_path && !part.value) throw ParseError(t.pos, item, "part needs file=@path or value=");
        return part;
    }

    AttachClause parse_attach(const Token& t) {
        AttachClause clause;
        for (auto &raw_item : split_items(require_value(t), ';')) {
            std::string item = trim(raw_item);
            if (item.empty()) continue;
            std::string tag = leading_tag(item);
            if (tag == "part") {
                clause.parts.push_back(parse_part(t, item, after_tag(item)));
            } else if (tag == "boundary") {
                std::string b = unquote(after_tag(item));
                if (b.empty() || b.size() > 70) throw ParseError(t.pos, item, "boundary must be 1 to 70 characters");
                clause.boundary = b;
            } else if (tag.empty()) {
                throw ParseError(t.pos, item, "attach item must start with part: or boundary:");
            } else {
                throw ParseError(t.pos, tag + ":", "unknown attach item type", suggest(tag, k_attach_tags));
            }
        }
        if (clause.parts.empty() && clause.boundary.empty()) throw ParseError(t.pos, t.lexeme + "=", "attach= has no parts");
        return clause;
    }

    FieldClause parse_field(const Token& t) {
        const std::string& v = require_value(t);
        auto eq = v.find('=');
        if (eq == std::string::npos || trim(v.substr(0, eq)).empty())
            throw ParseError(t.pos, v, "field= needs name=value");
        return FieldClause{trim(v.substr(0, eq)), unquote(trim(v.substr(eq + 1)))};
    }

    ExpectClause parse_expect(const Token& t) {
        ExpectClause clause;
        for (auto &raw_item : split_items(require_value(t), ',')) {
            std::string item = trim(raw_item);
            if (item.empty()) continue;
            clause.checks.push_back(parse_expect_check(item, t.pos));
        }
        if (clause.checks.empty()) throw ParseError(t.pos, t.lexeme + "=", "expect= has no checks");
        return clause;
    }

    AsClause parse_as(const Token& t) {
        return AsClause{to_lower(trim(require_value(t)))};
    }

    RetryClause parse_retry(const Token& t) {
        std::string v = trim(require_value(t));
        if (!all_digits(v) || v.size() > 6) throw ParseError(t.pos, v, "retry= needs a non-negative integer");
        return RetryClause{std::stoi(v)};
    }

    BackoffClause parse_backoff(const Token& t) {
        std::string v = trim(require_value(t));
        auto dots = v.find("..");
        if (dots == std::string::npos) throw ParseError(t.pos, v, "backoff= needs a range like 200ms..5s");
        auto lo = parse_duration(v.substr(0, dots));
        auto hi = parse_duration(v.substr(dots + 2));
        if (!lo || !hi) throw ParseError(t.pos, v, "invalid duration in backoff= range");
        if (*lo > *hi) throw ParseError(t.pos, v, "backoff= minimum is larger than maximum");
        return BackoffClause{*lo, *hi};
    }

    UnderClause parse_under(const Token& t) {
        std::string v = trim(require_value(t));
        UnderClause u;
        if (auto d = parse_duration(v)) {
            if (d->count() <= 0) throw ParseError(t.pos, v, "under= duration must be greater than zero");
            u.duration = *d;
            return u;
        }
        if (auto s = parse_size(v)) {
            if (*s == 0) throw ParseError(t.pos, v, "under= size must be greater than zero");
            u.size = *s;
            return u;
        }
        throw ParseError(t.pos, v, "under= needs a duration (30s) or a size (10MB)");
    }

    ViaClause parse_via(const Token& t) {
        std::string v = trim(require_value(t));
        if (!looks_like_url(v)) throw ParseError(t.pos, v, "via= needs an http:// or https:// proxy URL");
        return ViaClause{v};
    }

    FollowClause parse_follow(const Token& t) {
        std::string v = to_lower(trim(require_value(t)));
        if (v != "smart") throw ParseError(t.pos, v, "unknown follow policy", suggest(v, {"smart"}));
        return FollowClause{v};
    }

    InsecureClause parse_insecure(const Token& t) {
        std::string v = to_lower(trim(require_value(t)));
        if (v == "true" || v == "1" || v == "yes") return InsecureClause{true};
        if (v == "false" || v == "0" || v == "no") return InsecureClause{false};
        throw ParseError(t.pos, v, "insecure= needs true or false");
    }

    PickClause parse_pick(const Token& t) {
        std::string v = trim(require_value(t));
        try {
            compile_jsonpath(v);
        } catch (const JsonPathError& e) {
            throw ParseError(t.pos, v, e.what());
        }
        return PickClause{v};
    }

    const TokenStream& m_ts;
    std::size_t m_index = 0;
    std::set<std::string> m_seen;
};

} // namespace

ParseError::ParseError(std::size_t position, std::string token, std::string message, std::string suggestion)
    : std::runtime_error(build_message(position, token, message, suggestion)),
      m_position(position), m_token(std::move(token)), m_message(std::move(message)), m_suggestion(std::move(suggestion)) {}

ExpectCheck parse_expect_check(const std::string& raw, std::size_t pos) {
    std::string text = trim(raw);
    std::string tag = leading_tag(text);
    if (tag.empty()) throw ParseError(pos, text, "expected a check like status:200", suggest(to_lower(text), k_expect_tags));
    std::string rest = after_tag(text);
    ExpectCheck c{ExpectCheck::Kind::Status, "", "", ""};
    if (tag == "status") {
        if (!all_digits(rest)) throw ParseError(pos, text, "status check needs a numeric code");
        c.value = rest;
    } else if (tag == "header") {
        auto eq = rest.find('=');
        if (eq == std::string::npos || trim(rest.substr(0, eq)).empty())
            throw ParseError(pos, text, "header check needs 'header:Name=Value'");
        c.kind = ExpectCheck::Kind::Header;
        c.name = trim(rest.substr(0, eq));
        c.value = unquote(trim(rest.substr(eq + 1)));
    } else if (tag == "contains") {
        c.kind = ExpectCheck::Kind::Contains;
        c.value = unquote(rest);
        if (c.value.empty()) throw ParseError(pos, text, "contains check needs text");
    } else if (tag == "jsonpath") {
        c.kind = ExpectCheck::Kind::JsonPath;
        auto eq = find_assignment(rest);
        c.path = trim(rest.substr(0, eq));
        if (eq == std::string::npos) c.has_value = false;
        else c.value = unquote(trim(rest.substr(eq + 1)));
        if (c.path.empty()) throw ParseError(pos, text, "jsonpath check needs a path");
        try {
            compile_jsonpath(c.path);
        } catch (const JsonPathError& e) {
            throw ParseError(pos, c.path, e.what());
        }
    } else if (tag == "matches") {
        c.kind = ExpectCheck::Kind::Matches;
        std::string pattern = unquote(rest);
        if (pattern.size() >= 2 && pattern.front() == '/' && pattern.back() == '/') pattern = pattern.substr(1, pattern.size() - 2);
        if (pattern.empty()) throw ParseError(pos, text, "matches check needs a regular expression");
        try {
            std::regex probe(pattern);
        } catch (const std::regex_error& e) {
            throw ParseError(pos, pattern, std::string("invalid regular expression: ") + e.what());
        }
        c.value = pattern;
    } else {
        throw ParseError(pos, tag + ":", "unknown check type", suggest(tag, k_expect_tags));
    }
    return c;
}

Command parse_tokens(const TokenStream& ts) {
    Parser p(ts);
    return p.parse_line();
}

Command parse_command(const std::string& line) {
    Lexer lx(line);
    return parse_tokens(lx.run());
}

} // namespace reqline
