/*
 * Reqline AST Definitions
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Typed command produced by the parser: a verb, a target URL and an ordered
 *   list of clauses. Clause is a closed std::variant, so every std::visit over it
 *   must handle each alternative. Each alternative has already been validated
 *   by its sub-grammar when the Command is built.
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
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace reqline {

enum class Verb { Read, Save, Send, Upload, Watch, Inspect, Authenticate, Session };

enum class SessionSubcommand { None, Show, Clear, Use };

const char* to_string(Verb v);
std::optional<Verb> verb_from_string(const std::string& s);
const char* to_string(SessionSubcommand s);

struct IncludeItem {
    enum class Kind { Header, Param, Cookie, Basic } kind;
    std::string name;   // empty for Basic
    std::string value;  // for Basic: "user:pass" still unencoded
};

struct AttachPart {
    std::string name;
    std::optional<std::string> file_path;  // file=@path
    std::optional<std::string> value;      // value=...
    std::string filename;
    std::string type;
};

struct ExpectCheck {
    enum class Kind { Status, Header, Contains, JsonPath, Matches } kind;
    std::string name;        // Header: header name
    std::string value;       // status code, header value, substring, regex, or jsonpath expected value
    std::string path;        // JsonPath: expression
    bool has_value = true;   // JsonPath: false when only existence is asserted
};

const char* to_string(IncludeItem::Kind k);
const char* to_string(ExpectCheck::Kind k);

struct UsingClause { std::string method; };
struct WithClause {
    enum class Source { Inline, File, Stdin } source = Source::Inline;
    std::string type;   // json, form, raw; empty when not given
    std::string value;  // inline text or file path
};
struct IncludeClause { std::vector<IncludeItem> items; };
struct AttachClause { std::vector<AttachPart> parts; std::string boundary; };
struct FieldClause { std::string name; std::string value; };
struct ExpectClause { std::vector<ExpectCheck> checks; };
struct AsClause { std::string format; };
struct ToClause { std::string destination; };
struct RetryClause { int count = 0; };
struct BackoffClause { std::chrono::milliseconds min{0}; std::chrono::milliseconds max{0}; };
struct TimeoutClause { std::chrono::milliseconds duration{0}; };
struct UnderClause {
    std::optional<std::chrono::milliseconds> duration;
    std::optional<std::uint64_t> size;
};
struct ViaClause { std::string url; };
struct FollowClause { std::string policy; };
struct InsecureClause { bool value = true; };
struct PickClause { std::string path; };
struct EveryClause { std::chrono::milliseconds interval{0}; };
struct UntilClause { ExpectCheck check; };
struct VerboseClause {};
struct ResumeClause {};

using Clause = std::variant<
    UsingClause, WithClause, IncludeClause, AttachClause, FieldClause, ExpectClause,
    AsClause, ToClause, RetryClause, BackoffClause, TimeoutClause, UnderClause,
    ViaClause, FollowClause, InsecureClause, PickClause, EveryClause, UntilClause,
    VerboseClause, ResumeClause>;

struct Command {
    Verb verb = Verb::Read;
    std::string target;  // URL; for session a bare host is promoted to https://host
    std::vector<Clause> clauses;
    SessionSubcommand session_subcommand = SessionSubcommand::None;
};

} // namespace reqline
