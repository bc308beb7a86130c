/*
 * Request Body - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <reqline/exec/body.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

namespace reqline {

namespace {

std::string escape_quotes(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw BodyError("cannot read file '" + path + "'");
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw BodyError("error reading file '" + path + "'");
    return ss.str();
}

std::string generate_boundary() {
    static const char* hex = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> d(0, 15);
    std::string b = "reqline-";
    for (int i = 0; i < 32; ++i) b.push_back(hex[d(gen)]);
    return b;
}

std::string build_multipart(const std::vector<AttachPart>& parts, const std::string& boundary) {
    std::string out;
    for (auto &p : parts) {
        std::string filename = p.filename;
        if (filename.empty() && p.file_path) filename = std::filesystem::path(*p.file_path).filename().string();
        out += "--" + boundary + "\r\n";
        out += "Content-Disposition: form-data; name=\"" + escape_quotes(p.name) + "\"";
        if (!filename.empty()) out += "; filename=\"" + escape_quotes(filename) + "\"";
        out += "\r\n";
        std::string type = p.type;
        if (type.empty() && p.file_path) type = "application/octet-stream";
        if (!type.empty()) out += "Content-Type: " + type + "\r\n";
        out += "\r\n";
        out += p.file_path ? read_file(*p.file_path) : p.value.value_or("");
        out += "\r\n";
    }
    out += "--" + boundary + "--\r\n";
    return out;
}

PreparedBody prepare_body(const BodyPlan& plan, std::istream& in, std::ostream& diag) {
    PreparedBody pb;
    if (plan.kind == BodyKind::Multipart) {
        std::string boundary = plan.boundary.empty() ? generate_boundary() : plan.boundary;
        pb.content = build_multipart(plan.parts, boundary);
        pb.content_type = "multipart/form-data; boundary=" + boundary;
        return pb;
    }
    switch (plan.source) {
        case BodySource::Inline: pb.content = plan.content; break;
        case BodySource::File: pb.content = read_file(plan.file_path); break;
        case BodySource::Stdin:
            pb.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
            if (in.bad()) throw BodyError("error reading request body from stdin");
            break;
    }
    if (plan.kind == BodyKind::Json) {
        pb.content_type = "application/json";
        if (plan.inferred_json) diag << "Inferred Content-Type: application/json\n";
    } else if (plan.kind == BodyKind::Form) {
        pb.content_type = "application/x-www-form-urlencoded";
    }
    return pb;
}

} // namespace reqline
