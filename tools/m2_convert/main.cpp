#include "m2tools/anim.h"
#include "m2tools/binutil.h"
#include "m2tools/m2.h"
#include "m2tools/m2_convert.h"
#include "m2tools/skin.h"
#include "m2tools/version.h"

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

static void convert_model(std::span<const uint8_t> data, version::FormatVersion target,
                          const fs::path& output) {
    auto model = m2::load(data);
    LOGI("Model version:", version::name(model.version()), "->", version::name(target));
    auto result = m2::convert(model, target);
    for (const auto& note : result.notes) LOGW(note);
    m2::save(result.model, output);
    LOGI("Wrote", m2::summarize(result.model).size(), "chunks");
}

static void convert_skin(std::span<const uint8_t> data, skin::SkinMode mode,
                         version::FormatVersion target, const fs::path& output) {
    auto s = skin::load(data, mode);
    LOGI("Skin layout:", s.is_modern() ? "modern" : "legacy", "->",
         skin::to_string(skin::layout_for(target)));
    skin::save(s, target, output);
}

static void convert_anim(std::span<const uint8_t> data, version::FormatVersion target,
                         const fs::path& output) {
    auto file = anim::load(data);
    auto converted = anim::convert(file, target);
    LOGI("Animation format:", anim::to_string(file.format()), "->",
         anim::to_string(converted.format()));
    if (const auto* hints = converted.hints(); hints && !hints->appears_valid)
        LOGW("legacy block structure is low confidence:", hints->estimated_blocks,
             "blocks recovered");
    if (const auto* legacy = std::get_if<anim::LegacyMetadata>(&file.metadata);
        legacy && !legacy->trailing.empty() && !converted.is_legacy_format())
        LOGW("dropping", legacy->trailing.size(), "unparsed trailing bytes");
    if (const auto* legacy = std::get_if<anim::LegacyMetadata>(&converted.metadata);
        legacy && !legacy->implausible_sections.empty()) {
        for (auto i : legacy->implausible_sections)
            LOGW("section", i, "fails the legacy block checks");
        LOGW("a reload keeps only the first", legacy->implausible_sections.front(), "sections");
    }
    anim::save(converted, output);
}

static void print_usage() {
    m2tools::cli::print("Usage: m2_convert [flags] <input> <output>");
    m2tools::cli::print("Converts a model, skin or animation file to another format version.");
    m2tools::cli::print("");
    m2tools::cli::print("Flags:");
    m2tools::cli::print("  --version <name>  Target version (classic, tbc, wotlk, cata, mop, wod, legion)");
    m2tools::cli::print("  --legacy          Read skins with the legacy header layout");
    m2tools::cli::print("  --modern          Read skins with the modern header layout");
    m2tools::cli::print("  -v, -vv           Verbose / debug logging");
}

int main(int argc, char* argv[]) {
    auto cfg = m2tools::tools::load_config();
    int verbosity = cfg.verbosity;
    std::string target_name = cfg.default_version;
    std::string skin_mode = cfg.skin_mode;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--version") == 0 && i + 1 < argc) {
            target_name = argv[++i];
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

    if (positional.size() != 2) {
        print_usage();
        return 1;
    }

    fs::path input(positional[0]);
    fs::path output(positional[1]);
    try {
        auto target = version::from_expansion_name(target_name);
        auto data = binutil::read_file(input);
        auto kind = m2tools::tools::detect_kind(input, data);
        LOGI("Converting", input.string(), "(", m2tools::tools::to_string(kind), ") to",
             version::name(target));

        switch (kind) {
            case m2tools::tools::FileKind::Model:
                convert_model(data, target, output);
                break;
            case m2tools::tools::FileKind::Skin:
                convert_skin(data, skin::mode_from_string(skin_mode), target, output);
                break;
            case m2tools::tools::FileKind::Anim:
                convert_anim(data, target, output);
                break;
        }
    } catch (const ConversionError& e) {
        LOGE("converting", input.string(), to_string(e.kind()), e.what());
        for (const auto& issue : e.issues())
            LOGE(" ", to_string(issue.kind), issue.chunk, issue.message);
        return 1;
    } catch (const std::exception& e) {
        LOGE("converting", input.string(), e.what());
        return 1;
    }

    LOGI("Output:", output.string());
    return 0;
}
