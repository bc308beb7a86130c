/*
 * Reqline Planner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Folds a parsed Command into an ExecutionPlan: verb defaults first, then each
 * clause in order, then validation and save-destination inference.
 */
#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include "reqline/parse/ast.hpp"
#include "reqline/plan/plan.hpp"

namespace reqline {

class PlanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PlannerConfig {
    std::chrono::milliseconds default_backoff_min{200};
    std::chrono::milliseconds default_backoff_max{5000};
    int default_retry_count = 3;      // used when backoff= is given without retry=
    bool probe_filesystem = true;     // check whether to= names an existing directory
};

class Planner {
public:
    Planner() = default;
    explicit Planner(const PlannerConfig& cfg) : m_cfg(cfg) {}

    ExecutionPlan plan(const Command& cmd) const;
private:
    PlannerConfig m_cfg;
    void apply_verb_defaults(ExecutionPlan& p) const;
    void validate(const ExecutionPlan& p) const;
    void infer_destination(ExecutionPlan& p) const;
};

bool method_allowed_for(Verb verb, const std::string& method);

// Last path segment, percent-decoded; "download" when empty or extension-less.
std::string filename_from_url(const std::string& url);

} // namespace reqline
