#include "m2tools/anim.h"
#include "m2tools/binutil.h"
#include "m2tools/m2.h"
#include "m2tools/skin.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/file_kind.h"
#include "../common/tool_config.h"

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;
using namespace m2tools;

static json vec3_json(const std::array<float, 3>& v) { return json::array({v[0], v[1], v[2]}); }

static json issues_json(const std::vector<ValidationIssue>& issues) {
    json out = json::array();
    for (const auto& i : issues)
        out.push_back({{"kind", to_string(i.kind)}, {"chunk", i.chunk}, {"message", i.message}});
    return out;
}

static json hints_json(const anim::LegacyHints& h) {
    return {
        {"appearsValid", h.appears_valid},
        {"estimatedBlocks", h.estimated_blocks},
        {"hasTimestamps", h.has_timestamps},
    };
}

static json model_json(const m2::Model& model) {
    const auto& h = model.header;
    json chunks = json::array();
    for (const auto& c : m2::summarize(model)) {
        chunks.push_back({
            {"tag", c.tag.str()},
            {"name", c.name},
            {"size", c.size},
            {"elements", c.elements},
        });
    }
    return {
        {"kind", "model"},
        {"version", std::string(version::name(h.version))},
        {"headerNumber", h.header_number},
        {"savedHeaderNumber", m2::stored_header_number(h)},
        {"header", {
            {"name", h.name},
            {"globalFlags", h.global_flags},
            {"skinProfileCount", h.skin_profile_count},
            {"boundingBoxMin", vec3_json(h.bounding_box_min)},
            {"boundingBoxMax", vec3_json(h.bounding_box_max)},
            {"boundingRadius", h.bounding_radius},
            {"collisionBoxMin", vec3_json(h.collision_box_min)},
            {"collisionBoxMax", vec3_json(h.collision_box_max)},
            {"collisionRadius", h.collision_radius},
        }},
        {"chunks", chunks},
        {"issues", issues_json(m2::validate(model))},
    };
}

static json skin_json(const skin::Skin& s) {
    json submeshes = json::array();
    for (const auto& m : s.submeshes) {
        submeshes.push_back({
            {"id", m.id},
            {"vertexStart", m.vertex_start},
            {"vertexCount", m.vertex_count},
            {"triangleStart", m.first_triangle()},
            {"triangleCount", m.triangle_count},
            {"boneCount", m.bone_count},
            {"boneInfluences", m.bone_influences},
            {"center", vec3_json(m.center)},
            {"sortRadius", m.sort_radius},
        });
    }
    json batches = json::array();
    for (const auto& b : s.batches) {
        batches.push_back({
            {"flags", b.flags},
            {"priorityPlane", b.priority_plane},
            {"shaderId", b.shader_id},
            {"submeshIndex", b.submesh_index},
            {"materialIndex", b.material_index},
            {"textureCount", b.texture_count},
            {"textureComboIndex", b.texture_combo_index},
        });
    }
    return {
        {"kind", "skin"},
        {"layout", s.is_modern() ? "modern" : "legacy"},
        {"vertexIndices", s.vertex_indices.size()},
        {"triangles", s.triangles.size()},
        {"properties", s.properties.size()},
        {"boneCountMax", s.bone_count_max},
        {"submeshes", submeshes},
        {"batches", batches},
        {"issues", issues_json(skin::validate(s))},
    };
}

static json anim_json(const anim::AnimFile& file) {
    json metadata;
    if (const auto* legacy = std::get_if<anim::LegacyMetadata>(&file.metadata)) {
        metadata = hints_json(legacy->hints);
        metadata["trailingBytes"] = legacy->trailing.size();
    } else {
        const auto& modern = std::get<anim::ModernMetadata>(file.metadata);
        json entries = json::array();
        for (const auto& e : modern.entries)
            entries.push_back({{"id", e.id}, {"offset", e.offset}, {"size", e.size}});
        metadata = {
            {"headerVersion", modern.header.version},
            {"idCount", modern.header.id_count},
            {"entryOffset", modern.header.entry_offset},
            {"entries", entries},
        };
        if (modern.source_hints) metadata["sourceHints"] = hints_json(*modern.source_hints);
    }

    json sections = json::array();
    for (const auto& s : file.sections) {
        size_t keys = 0;
        for (const auto& b : s.bones)
            keys += b.translation.size() + b.rotation.size() + b.scaling.size();
        sections.push_back({
            {"id", s.header.id},
            {"start", s.header.start},
            {"end", s.header.end},
            {"bones", s.bones.size()},
            {"keyframes", keys},
        });
    }

    auto usage = file.memory_usage();
    return {
        {"kind", "anim"},
        {"format", std::string(anim::to_string(file.format()))},
        {"version", std::string(version::name(file.version))},
        {"animationCount", file.animation_count()},
        {"metadata", metadata},
        {"sections", sections},
        {"memory", {
            {"sections", usage.section_bytes()},
            {"bones", usage.bone_bytes()},
            {"translation", usage.translation_bytes()},
            {"rotation", usage.rotation_bytes()},
            {"scaling", usage.scaling_bytes()},
            {"total", usage.total()},
        }},
    };
}

static void print_text(const json& doc) {
    m2tools::cli::print("File:", doc["filename"].get<std::string>());
    m2tools::cli::print("Kind:", doc["kind"].get<std::string>());
    const auto kind = doc["kind"].get<std::string>();
    if (kind == "model") {
        m2tools::cli::print("Version:", doc["version"].get<std::string>());
        m2tools::cli::print("Name:", doc["header"]["name"].get<std::string>());
        for (const auto& c : doc["chunks"]) {
            m2tools::cli::print(" ", c["tag"].get<std::string>(), c["name"].get<std::string>(),
                                c["size"].get<size_t>(), "bytes,",
                                c["elements"].get<size_t>(), "elements");
        }
    } else if (kind == "skin") {
        m2tools::cli::print("Layout:", doc["layout"].get<std::string>());
        m2tools::cli::print("Submeshes:", doc["submeshes"].size(),
                            "Batches:", doc["batches"].size(),
                            "Triangles:", doc["triangles"].get<size_t>());
    } else {
        m2tools::cli::print("Format:", doc["format"].get<std::string>());
        m2tools::cli::print("Animations:", doc["animationCount"].get<size_t>());
        m2tools::cli::print("Memory (bytes):", doc["memory"]["total"].get<size_t>());
    }
    if (doc.contains("issues")) {
        for (const auto& i : doc["issues"])
            m2tools::cli::print("Issue:", i["kind"].get<std::string>(),
                                i["chunk"].get<std::string>(), i["message"].get<std::string>());
    }
}

static void print_usage() {
    m2tools::cli::print("Usage: m2_info [flags] <file.m2|file.skin|file.anim>");
    m2tools::cli::print("Prints the structure of a model, skin or animation file.");
    m2tools::cli::print("");
    m2tools::cli::print("Flags:");
    m2tools::cli::print("  --json     Write a JSON report to stdout");
    m2tools::cli::print("  --pretty   Pretty-print JSON output");
    m2tools::cli::print("  --legacy   Force the legacy skin header layout");
    m2tools::cli::print("  --modern   Force the modern skin header layout");
    m2tools::cli::print("  -v, -vv    Verbose / debug logging");
}

int main(int argc, char* argv[]) {
    auto cfg = m2tools::tools::load_config();
    bool pretty = cfg.pretty;
    bool json_stdout = false;
    int verbosity = cfg.verbosity;
    std::string skin_mode = cfg.skin_mode;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--pretty") == 0) {
            pretty = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            json_stdout = true;
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
    json doc;
    try {
        auto data = binutil::read_file(input);
        auto kind = m2tools::tools::detect_kind(input, data);
        LOGI("Reading", input.string(), "as", m2tools::tools::to_string(kind));
        LOGD("Input size (bytes):", data.size());

        json body;
        switch (kind) {
            case m2tools::tools::FileKind::Model:
                body = model_json(m2::load(data));
                break;
            case m2tools::tools::FileKind::Skin:
                body = skin_json(skin::load(data, skin::mode_from_string(skin_mode)));
                break;
            case m2tools::tools::FileKind::Anim:
                body = anim_json(anim::load(data));
                break;
        }
        doc = {{"schemaVersion", 1}, {"filename", input.filename().string()}};
        doc.update(body);
    } catch (const std::exception& e) {
        LOGE("parsing", input.string(), e.what());
        return 1;
    }

    if (json_stdout) {
        if (pretty)
            std::cout << std::setw(2) << doc << '\n';
        else
            std::cout << doc << '\n';
    } else {
        print_text(doc);
    }
    return 0;
}
