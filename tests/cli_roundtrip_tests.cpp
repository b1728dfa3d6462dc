#include <gtest/gtest.h>

#include "m2tools/anim.h"
#include "m2tools/m2.h"
#include "m2tools/skin.h"

#include "m2_test_models.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace m2tools;

namespace {

std::string shell_quote(const fs::path& p) {
    std::string s = p.string();
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

fs::path test_tmp_dir() {
    const auto base = fs::temp_directory_path() / "m2tools_cli_tests";
    std::error_code ec;
    fs::create_directories(base, ec);
    return base;
}

fs::path tool_path(const std::string& name) {
    return fs::path(M2TOOLS_BINARY_DIR) / "tools" / name / name;
}

// run executes a tool with a config path that never exists, so a user
// config cannot change the outcome.
int run(const std::string& tool, const std::string& args) {
    auto cmd = "M2TOOLS_CONFIG=" + shell_quote(test_tmp_dir() / "no_config.json") + " " +
               shell_quote(tool_path(tool)) + " " + args;
    return std::system(cmd.c_str());
}

json read_json(const fs::path& p) {
    std::ifstream f(p);
    EXPECT_TRUE(f.is_open()) << p;
    json j;
    f >> j;
    return j;
}

} // namespace

TEST(cli_roundtrip, convert_model_upgrade) {
    auto in = test_tmp_dir() / "classic.m2";
    auto out = test_tmp_dir() / "wotlk.m2";
    m2::save(m2::testing::make_model(version::FormatVersion::Classic), in);

    ASSERT_EQ(run("m2_convert", "--version wrath " + shell_quote(in) + " " + shell_quote(out)), 0);
    auto model = m2::load(out);
    EXPECT_EQ(model.version(), version::FormatVersion::WotLK);
    EXPECT_FALSE(model.has("PLAY"));
    EXPECT_TRUE(m2::validate(model).empty());

    EXPECT_EQ(run("m2_validate", shell_quote(out)), 0);
}

TEST(cli_roundtrip, convert_failure_leaves_no_output) {
    auto model = m2::testing::make_model(version::FormatVersion::WotLK);
    model.header.skin_profile_count = 3;
    auto in = test_tmp_dir() / "needs_sfid.m2";
    auto out = test_tmp_dir() / "needs_sfid_legion.m2";
    fs::remove(out);
    m2::save(model, in);

    EXPECT_NE(run("m2_convert", "--version legion " + shell_quote(in) + " " + shell_quote(out)), 0);
    EXPECT_FALSE(fs::exists(out));
}

TEST(cli_roundtrip, validate_reports_dangling_bone) {
    auto model = m2::testing::make_model(version::FormatVersion::TBC);
    model.find<m2::Attachments>()->entries[0].bone = 9;
    auto in = test_tmp_dir() / "dangling.m2";
    m2::save(model, in);
    EXPECT_NE(run("m2_validate", shell_quote(in)), 0);
}

TEST(cli_roundtrip, info_json_report) {
    auto in = test_tmp_dir() / "info.m2";
    auto report = test_tmp_dir() / "info.json";
    m2::save(m2::testing::make_model(version::FormatVersion::Legion), in);

    ASSERT_EQ(run("m2_info", "--json " + shell_quote(in) + " > " + shell_quote(report)), 0);
    auto doc = read_json(report);
    EXPECT_EQ(doc["kind"], "model");
    EXPECT_EQ(doc["version"], "Legion");
    EXPECT_EQ(doc["header"]["name"], "test_model");
    EXPECT_TRUE(doc["issues"].empty());
    ASSERT_FALSE(doc["chunks"].empty());
    EXPECT_EQ(doc["chunks"][0]["tag"], "VRTX");
}

TEST(cli_roundtrip, convert_skin_layout) {
    skin::Skin s;
    s.vertex_indices = {0, 1, 2};
    s.triangles = {0, 1, 2};
    skin::Submesh sub;
    sub.vertex_count = 3;
    sub.triangle_count = 3;
    s.submeshes.push_back(sub);

    auto in = test_tmp_dir() / "old.skin";
    auto out = test_tmp_dir() / "new.skin";
    skin::save(s, version::FormatVersion::TBC, in);
    ASSERT_EQ(run("m2_convert", "--version legion " + shell_quote(in) + " " + shell_quote(out)), 0);

    auto converted = skin::load(out);
    EXPECT_TRUE(converted.is_modern());
    EXPECT_EQ(converted.submeshes, s.submeshes);
}

TEST(cli_roundtrip, convert_anim_to_modern) {
    anim::AnimFile file;
    anim::AnimSection section;
    section.header = {0, 0, 500};
    anim::BoneAnimation bone;
    bone.translation.timestamps = {0, 500};
    bone.translation.values = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}};
    section.bones.push_back(bone);
    file.sections.push_back(section);

    auto in = test_tmp_dir() / "legacy.anim";
    auto out = test_tmp_dir() / "modern.anim";
    anim::save(file, in);
    ASSERT_EQ(run("m2_convert", "--version legion " + shell_quote(in) + " " + shell_quote(out)), 0);

    auto converted = anim::load(out);
    EXPECT_FALSE(converted.is_legacy_format());
    EXPECT_EQ(converted.sections, file.sections);
    EXPECT_EQ(run("m2_validate", "--strict " + shell_quote(out)), 0);
}

TEST(cli_roundtrip, strict_fails_low_confidence_anim) {
    auto in = test_tmp_dir() / "garbage.anim";
    {
        std::ofstream f(in, std::ios::binary);
        f << "not an animation";
    }
    EXPECT_EQ(run("m2_validate", shell_quote(in)), 0);
    EXPECT_NE(run("m2_validate", "--strict " + shell_quote(in)), 0);
}
