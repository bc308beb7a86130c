/*
 * Request body tests - Reqline
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <reqline/exec/body.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace reqline;
namespace fs = std::filesystem;

namespace {

fs::path scratch_dir(const std::string& name) {
    fs::path d = fs::temp_directory_path() / ("reqline_body_" + name + "_" + std::to_string(::getpid()));
    fs::remove_all(d);
    fs::create_directories(d);
    return d;
}

void write_text(const fs::path& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary);
    f << s;
}

} // namespace

TEST(BodyPrepare, InlineJsonInferredNote) {
    BodyPlan plan;
    plan.kind = BodyKind::Json;
    plan.content = "{\"a\":1}";
    plan.inferred_json = true;
    std::istringstream in;
    std::ostringstream diag;
    auto pb = prepare_body(plan, in, diag);
    EXPECT_EQ(pb.content, "{\"a\":1}");
    EXPECT_EQ(pb.content_type, "application/json");
    EXPECT_EQ(diag.str(), "Inferred Content-Type: application/json\n");
}

TEST(BodyPrepare, ExplicitTypesHaveNoNote) {
    BodyPlan json;
    json.kind = BodyKind::Json;
    json.content = "[]";
    std::istringstream in;
    std::ostringstream diag;
    EXPECT_EQ(prepare_body(json, in, diag).content_type, "application/json");
    EXPECT_TRUE(diag.str().empty());

    BodyPlan form;
    form.kind = BodyKind::Form;
    form.content = "a=1";
    EXPECT_EQ(prepare_body(form, in, diag).content_type, "application/x-www-form-urlencoded");

    BodyPlan raw;
    raw.content = "hello";
    auto pb = prepare_body(raw, in, diag);
    EXPECT_EQ(pb.content, "hello");
    EXPECT_TRUE(pb.content_type.empty());
}

TEST(BodyPrepare, FileAndStdinSources) {
    auto dir = scratch_dir("sources");
    write_text(dir / "payload.bin", std::string("a\0b", 3));
    BodyPlan file;
    file.source = BodySource::File;
    file.file_path = (dir / "payload.bin").string();
    std::istringstream empty;
    std::ostringstream diag;
    EXPECT_EQ(prepare_body(file, empty, diag).content, std::string("a\0b", 3));

    BodyPlan in_plan;
    in_plan.source = BodySource::Stdin;
    in_plan.kind = BodyKind::Json;
    std::istringstream in("{\"from\":\"stdin\"}");
    auto pb = prepare_body(in_plan, in, diag);
    EXPECT_EQ(pb.content, "{\"from\":\"stdin\"}");
    EXPECT_EQ(pb.content_type, "application/json");
    fs::remove_all(dir);
}

TEST(BodyPrepare, MissingFileIsBodyError) {
    BodyPlan plan;
    plan.source = BodySource::File;
    plan.file_path = "/nonexistent/reqline/payload.json";
    std::istringstream in;
    std::ostringstream diag;
    try {
        prepare_body(plan, in, diag);
        FAIL() << "expected BodyError";
    } catch (const BodyError& e) {
        EXPECT_NE(std::string(e.what()).find("cannot read file"), std::string::npos);
    }
}

TEST(Multipart, LayoutWithFileAndValue) {
    auto dir = scratch_dir("multipart");
    write_text(dir / "avatar.png", "PNGDATA");
    AttachPart file;
    file.name = "avatar";
    file.file_path = (dir / "avatar.png").string();
    file.type = "image/png";
    AttachPart note;
    note.name = "note";
    note.value = "hi \"there\"";
    std::string body = build_multipart({file, note}, "XYZ");
    std::string expected =
        "--XYZ\r\n"
        "Content-Disposition: form-data; name=\"avatar\"; filename=\"avatar.png\"\r\n"
        "Content-Type: image/png\r\n"
        "\r\n"
        "PNGDATA\r\n"
        "--XYZ\r\n"
        "Content-Disposition: form-data; name=\"note\"\r\n"
        "\r\n"
        "hi \"there\"\r\n"
        "--XYZ--\r\n";
    EXPECT_EQ(body, expected);
    fs::remove_all(dir);
}

TEST(Multipart, FileDefaultsAndFilenameOverride) {
    auto dir = scratch_dir("defaults");
    write_text(dir / "data.bin", "x");
    AttachPart p;
    p.name = "f";
    p.file_path = (dir / "data.bin").string();
    p.filename = "re\"named.bin";
    std::string body = build_multipart({p}, "B");
    EXPECT_NE(body.find("filename=\"re\\\"named.bin\""), std::string::npos);
    EXPECT_NE(body.find("Content-Type: application/octet-stream\r\n"), std::string::npos);
    fs::remove_all(dir);
}

TEST(Multipart, PreparedContentTypeCarriesBoundary) {
    BodyPlan plan;
    plan.kind = BodyKind::Multipart;
    AttachPart p;
    p.name = "a";
    p.value = "1";
    plan.parts.push_back(p);
    std::istringstream in;
    std::ostringstream diag;
    auto generated = prepare_body(plan, in, diag);
    const std::string prefix = "multipart/form-data; boundary=reqline-";
    ASSERT_EQ(generated.content_type.rfind(prefix, 0), 0u);
    EXPECT_EQ(generated.content_type.size(), prefix.size() + 32);

    plan.boundary = "fixed";
    auto fixed = prepare_body(plan, in, diag);
    EXPECT_EQ(fixed.content_type, "multipart/form-data; boundary=fixed");
    EXPECT_EQ(fixed.content.rfind("--fixed\r\n", 0), 0u);
}

TEST(Multipart, BoundariesDiffer) {
    EXPECT_NE(generate_boundary(), generate_boundary());
}
