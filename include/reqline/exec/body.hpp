/*
 * Request Body - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "reqline/plan/plan.hpp"

namespace reqline {

// Unreadable body file or stdin.
class BodyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct PreparedBody {
    std::string content;
    std::string content_type;   // empty for raw bodies
};

// Reads file and stdin sources up front. Prints the inferred-JSON note to diag.
PreparedBody prepare_body(const BodyPlan& plan, std::istream& in, std::ostream& diag);

std::string build_multipart(const std::vector<AttachPart>& parts, const std::string& boundary);
std::string generate_boundary();
std::string read_file(const std::string& path);

} // namespace reqline
