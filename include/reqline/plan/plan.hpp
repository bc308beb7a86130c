/*
 * Reqline Execution Plan
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "reqline/parse/ast.hpp"
#include "reqline/util/strings.hpp"

namespace reqline {

enum class BodyKind { Json, Form, Raw, Multipart };
enum class BodySource { Inline, File, Stdin };
enum class FollowPolicy { Default, Smart };

const char* to_string(BodyKind k);
const char* to_string(BodySource s);
const char* to_string(FollowPolicy f);

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

struct BodyPlan {
    BodyKind kind = BodyKind::Raw;
    BodySource source = BodySource::Inline;
    std::string content;              // Inline
    std::string file_path;            // File
    std::vector<AttachPart> parts;    // Multipart
    std::string boundary;             // Multipart, empty = generated
    bool inferred_json = false;       // kind chosen from a leading { or [
};

struct OutputPlan {
    std::string format = "auto";      // json, text, csv, raw, auto
    std::string destination;
    std::string pick;                 // JSONPath
};

struct RetryPlan {
    int count = 0;                    // extra attempts after the first
    std::chrono::milliseconds backoff_min{200};
    std::chrono::milliseconds backoff_max{5000};
};

struct PollPlan {
    std::chrono::milliseconds interval{0};
    std::optional<ExpectCheck> until;
};

// Fully resolved description of one exchange. Built by Planner, read-only afterwards.
struct ExecutionPlan {
    Verb verb = Verb::Read;
    std::string method = "GET";       // always one of GET POST PUT PATCH DELETE HEAD OPTIONS
    std::string url;
    HeaderMap headers;                // last write wins per name
    QueryParams query_params;         // insertion order, duplicates kept
    std::map<std::string, std::string> cookies;
    std::optional<BodyPlan> body;
    OutputPlan output;
    std::optional<RetryPlan> retry;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::uint64_t> size_limit;
    std::string proxy;
    bool insecure = false;
    bool verbose = false;
    bool resume = false;
    FollowPolicy follow = FollowPolicy::Default;
    std::vector<ExpectCheck> expect;
    std::optional<PollPlan> poll;
};

} // namespace reqline
