#include <gtest/gtest.h>

#include "tool_config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using m2tools::tools::ToolConfig;

namespace {

fs::path test_tmp_dir() {
    const auto base = fs::temp_directory_path() / "m2tools_config_tests";
    std::error_code ec;
    fs::create_directories(base, ec);
    return base;
}

void write_text(const fs::path& p, const std::string& text) {
    std::ofstream f(p);
    f << text;
}

} // namespace

TEST(tool_config, missing_file_yields_defaults) {
    auto cfg = m2tools::tools::load_config(test_tmp_dir() / "does_not_exist.json");
    EXPECT_EQ(cfg.default_version, "wotlk");
    EXPECT_EQ(cfg.skin_mode, "auto");
    EXPECT_FALSE(cfg.pretty);
    EXPECT_FALSE(cfg.strict);
    EXPECT_EQ(cfg.verbosity, 0);
}

TEST(tool_config, reads_known_keys) {
    auto path = test_tmp_dir() / "full.json";
    write_text(path, R"({"default_version": "legion", "skin_mode": "modern",
                         "pretty": true, "strict": true, "verbosity": 7, "extra": 1})");
    auto cfg = m2tools::tools::load_config(path);
    EXPECT_EQ(cfg.default_version, "legion");
    EXPECT_EQ(cfg.skin_mode, "modern");
    EXPECT_TRUE(cfg.pretty);
    EXPECT_TRUE(cfg.strict);
    EXPECT_EQ(cfg.verbosity, 2);
}

TEST(tool_config, malformed_file_yields_defaults) {
    auto path = test_tmp_dir() / "broken.json";
    write_text(path, R"({"default_version": "tbc", "pretty": )");
    EXPECT_EQ(m2tools::tools::load_config(path).default_version, "wotlk");

    write_text(path, R"({"default_version": "tbc", "pretty": "yes"})");
    auto cfg = m2tools::tools::load_config(path);
    EXPECT_EQ(cfg.default_version, "wotlk");
    EXPECT_FALSE(cfg.pretty);
}

TEST(tool_config, save_then_load) {
    ToolConfig cfg;
    cfg.default_version = "mop";
    cfg.strict = true;
    auto path = test_tmp_dir() / "nested" / "saved.json";
    m2tools::tools::save_config(cfg, path);
    auto loaded = m2tools::tools::load_config(path);
    EXPECT_EQ(loaded.default_version, "mop");
    EXPECT_TRUE(loaded.strict);
}

TEST(tool_config, environment_overrides_location) {
    auto path = test_tmp_dir() / "from_env.json";
    ASSERT_EQ(setenv("M2TOOLS_CONFIG", path.c_str(), 1), 0);
    EXPECT_EQ(m2tools::tools::config_path().string(), path.string());
    unsetenv("M2TOOLS_CONFIG");
    EXPECT_NE(m2tools::tools::config_path().string(), path.string());
}
