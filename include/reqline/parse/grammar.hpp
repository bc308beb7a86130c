/*
 * Reqline Grammar Table
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Canonical list of verbs and clause keys with their descriptions, multiplicity
 *   and examples. The lexer uses it to find clause boundaries, the parser for
 *   suggestions and duplicate detection, and main for help output.
 *
 * License (MIT): see lexer.hpp.
 */
#pragma once
#include <string>
#include <vector>

namespace reqline {

struct VerbInfo {
    std::string name;
    std::string description;
};

struct ClauseInfo {
    std::string key;          // without '='
    std::string description;
    bool repeatable = false;
    bool bare_flag = false;   // may appear as a bare word (insecure, verbose, resume)
    bool takes_value = true;  // false for verbose/resume
    std::string example;
};

const std::vector<VerbInfo>& grammar_verbs();
const std::vector<ClauseInfo>& grammar_clauses();

const ClauseInfo* find_clause(const std::string& key);
bool is_clause_key(const std::string& key);   // keys written as key=
bool is_flag_word(const std::string& word);   // keys written bare

std::vector<std::string> verb_names();
std::vector<std::string> clause_keys();

std::string format_help();
// Stable machine-readable listing used to detect grammar drift.
std::string grammar_snapshot_json();

} // namespace reqline
