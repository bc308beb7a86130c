/*
 * Plan JSON - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "reqline/plan/plan.hpp"

namespace reqline {

// Empty and default-valued fields are omitted; durations use format_duration().
nlohmann::json plan_to_json(const ExecutionPlan& plan);

std::string to_json(const ExecutionPlan& plan, bool pretty);

} // namespace reqline
