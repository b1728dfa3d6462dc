#include "tool_config.h"

#include "cli_logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace m2tools::tools {

static fs::path exe_dir() {
    std::error_code ec;
    auto p = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) return p.parent_path();
    return fs::current_path();
}

fs::path config_path() {
    if (const char* env = std::getenv("M2TOOLS_CONFIG"); env && *env) return env;

    auto beside = exe_dir() / "m2tools.json";
    if (fs::exists(beside)) return beside;

    if (const char* home = std::getenv("HOME"))
        return fs::path(home) / ".config" / "m2tools" / "m2tools.json";
    return beside;
}

static void from_json(const json& j, ToolConfig& cfg) {
    if (j.contains("default_version")) j.at("default_version").get_to(cfg.default_version);
    if (j.contains("skin_mode")) j.at("skin_mode").get_to(cfg.skin_mode);
    if (j.contains("pretty")) j.at("pretty").get_to(cfg.pretty);
    if (j.contains("strict")) j.at("strict").get_to(cfg.strict);
    if (j.contains("verbosity"))
        cfg.verbosity = std::clamp(j.at("verbosity").get<int>(), 0, 2);
}

static void to_json(json& j, const ToolConfig& cfg) {
    j = json{
        {"default_version", cfg.default_version},
        {"skin_mode", cfg.skin_mode},
        {"pretty", cfg.pretty},
        {"strict", cfg.strict},
        {"verbosity", cfg.verbosity},
    };
}

ToolConfig load_config(const fs::path& path) {
    ToolConfig cfg;
    std::ifstream f(path);
    if (!f.is_open()) return cfg;

    try {
        json j = json::parse(f);
        ToolConfig parsed;
        from_json(j, parsed);
        cfg = parsed;
    } catch (const json::exception& e) {
        LOGW("ignoring config", path.string(), e.what());
    }
    return cfg;
}

void save_config(const ToolConfig& cfg, const fs::path& path) {
    json j;
    to_json(j, cfg);
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream f(path);
    if (!f.is_open()) throw std::runtime_error("cannot write config " + path.string());
    f << j.dump(2) << "\n";
}

} // namespace m2tools::tools
