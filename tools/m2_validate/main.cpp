#include "m2tools/anim.h"
#include "m2tools/binutil.h"
#include "m2tools/m2.h"
#include "m2tools/skin.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/file_kind.h"
#include "../common/tool_config.h"

namespace fs = std::filesystem;
using namespace m2tools;

namespace {

struct Findings {
    std::vector<ValidationIssue> issues;
    std::vector<std::string> warnings;
    bool low_confidence = false;
};

Findings check_model(std::span<const uint8_t> data) {
    Findings f;
    auto model = m2::load(data);
    f.issues = m2::validate(model);
    for (const auto& [tag, value] : model.chunks) {
        if (std::holds_alternative<m2::RawChunk>(value))
            f.warnings.push_back("unknown chunk " + tag.str() + " kept as raw bytes");
    }
    return f;
}

Findings check_skin(std::span<const uint8_t> data, skin::SkinMode mode) {
    Findings f;
    f.issues = skin::validate(skin::load(data, mode));
    return f;
}

Findings check_anim(std::span<const uint8_t> data) {
    Findings f;
    auto file = anim::load(data);
    if (const auto* hints = file.hints(); hints && !hints->appears_valid) {
        f.low_confidence = true;
        f.warnings.push_back("legacy block structure is low confidence (" +
                             std::to_string(hints->estimated_blocks) + " blocks)");
    }
    if (const auto* legacy = std::get_if<anim::LegacyMetadata>(&file.metadata);
        legacy && !legacy->trailing.empty())
        f.warnings.push_back(std::to_string(legacy->trailing.size()) +
                             " unparsed trailing bytes");
    return f;
}

void print_usage() {
    m2tools::cli::print("Usage: m2_validate [flags] <file.m2|file.skin|file.anim>");
    m2tools::cli::print("Checks references and counts; exits 1 when issues are found.");
    m2tools::cli::print("");
    m2tools::cli::print("Flags:");
    m2tools::cli::print("  --warnings  Also print non-fatal findings");
    m2tools::cli::print("  --strict    Fail on low-confidence legacy animation files");
    m2tools::cli::print("  --legacy    Read skins with the legacy header layout");
    m2tools::cli::print("  --modern    Read skins with the modern header layout");
    m2tools::cli::print("  -v, -vv     Verbose / debug logging");
}

} // namespace

int main(int argc, char* argv[]) {
    auto cfg = m2tools::tools::load_config();
    int verbosity = cfg.verbosity;
    bool strict = cfg.strict;
    bool warnings = false;
    std::string skin_mode = cfg.skin_mode;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--warnings") == 0) {
            warnings = true;
        } else if (std::strcmp(argv[i], "--strict") == 0) {
            strict = true;
        } else if (std::strcmp(argv[i], "--legacy") == 0) {
            skin_mode = "legacy";
        } else if (std::strcmp(argv[i], "--modern") == 0) {
            skin_mode = "modern";
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbosity = std::min(verbosity + 1, 2);
        } else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0) {
            verbosity = 2;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    m2tools::cli::set_verbosity(verbosity);

    if (positional.size() != 1) {
        print_usage();
        return 1;
    }

    fs::path input(positional[0]);
    Findings findings;
    try {
        auto data = binutil::read_file(input);
        auto kind = m2tools::tools::detect_kind(input, data);
        LOGI("Validating", input.string(), "as", m2tools::tools::to_string(kind));
        switch (kind) {
            case m2tools::tools::FileKind::Model: findings = check_model(data); break;
            case m2tools::tools::FileKind::Skin:
                findings = check_skin(data, skin::mode_from_string(skin_mode));
                break;
            case m2tools::tools::FileKind::Anim: findings = check_anim(data); break;
        }
    } catch (const std::exception& e) {
        LOGE("parsing", input.string(), e.what());
        return 1;
    }

    for (const auto& issue : findings.issues)
        m2tools::cli::print(to_string(issue.kind), issue.chunk, issue.message);
    if (warnings) {
        for (const auto& w : findings.warnings) LOGW(w);
    }

    bool failed = !findings.issues.empty() || (strict && findings.low_confidence);
    if (!failed) {
        m2tools::cli::print(input.filename().string(), "OK");
        return 0;
    }
    LOGI(findings.issues.size(), "issues");
    return 1;
}
