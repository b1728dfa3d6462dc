#pragma once

#include <filesystem>
#include <string>

namespace m2tools::tools {

// ToolConfig holds the settings shared by the command-line tools. Flags given
// on the command line override them.
struct ToolConfig {
    std::string default_version = "wotlk"; // m2_convert target without --version
    std::string skin_mode = "auto";        // auto, legacy or modern
    bool pretty = false;                   // pretty-print JSON reports
    bool strict = false;                   // fail on low-confidence legacy ANIM files
    int verbosity = 0;                     // 0 quiet, 1 verbose, 2 debug
};

// Returns the config file location: $M2TOOLS_CONFIG, then m2tools.json next
// to the executable, then ~/.config/m2tools/m2tools.json. The returned file
// need not exist.
std::filesystem::path config_path();

// Loads the config from path. A missing file yields defaults; an unreadable
// or malformed one yields defaults and a warning.
ToolConfig load_config(const std::filesystem::path& path);

inline ToolConfig load_config() { return load_config(config_path()); }

// Writes cfg as pretty-printed JSON, creating parent directories.
void save_config(const ToolConfig& cfg, const std::filesystem::path& path);

} // namespace m2tools::tools
