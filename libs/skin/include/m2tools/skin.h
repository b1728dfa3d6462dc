#pragma once

#include "m2tools/chunk.h"
#include "m2tools/errors.h"
#include "m2tools/version.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace m2tools::skin {

using version::FormatVersion;

inline constexpr chunk::Tag kSkinTag = "SKIN";

// Size of the pointer table shared by both header layouts.
inline constexpr size_t kPointerTableSize = 44;
inline constexpr size_t kSubmeshSize = 48;
inline constexpr size_t kBatchSize = 24;

// ArrayRef locates one list: element count and byte offset. Legacy offsets
// count from the file start, modern offsets from the SKIN payload start.
struct ArrayRef {
    uint32_t count = 0;
    uint32_t offset = 0;

    bool operator==(const ArrayRef&) const = default;
};

struct PointerTable {
    ArrayRef vertex_indices;
    ArrayRef triangles;
    ArrayRef properties;
    ArrayRef submeshes;
    ArrayRef batches;
    uint32_t bone_count_max = 0;

    bool operator==(const PointerTable&) const = default;
};

// LegacySkinHeader is the bare pointer table at offset 0.
struct LegacySkinHeader {
    PointerTable table;

    bool operator==(const LegacySkinHeader&) const = default;
};

// ModernSkinHeader wraps the pointer table in a SKIN chunk.
struct ModernSkinHeader {
    uint32_t payload_size = 0;
    PointerTable table;

    bool operator==(const ModernSkinHeader&) const = default;
};

using SkinHeader = std::variant<LegacySkinHeader, ModernSkinHeader>;

struct Submesh {
    uint16_t id = 0;
    uint16_t level = 0; // high word of the first triangle index
    uint16_t vertex_start = 0;
    uint16_t vertex_count = 0;
    uint16_t triangle_start = 0;
    uint16_t triangle_count = 0;
    uint16_t bone_count = 0;
    uint16_t bone_combo_index = 0;
    uint16_t bone_influences = 0;
    uint16_t center_bone_index = 0;
    std::array<float, 3> center{};
    std::array<float, 3> sort_center{};
    float sort_radius = 0.0f;

    uint32_t first_triangle() const {
        return static_cast<uint32_t>(triangle_start) + (static_cast<uint32_t>(level) << 16);
    }

    bool operator==(const Submesh&) const = default;
};

struct Batch {
    uint8_t flags = 0;
    int8_t priority_plane = 0;
    uint16_t shader_id = 0;
    uint16_t submesh_index = 0;
    uint16_t geoset_index = 0;
    int16_t color_index = -1;
    uint16_t material_index = 0;
    uint16_t material_layer = 0;
    uint16_t texture_count = 0;
    uint16_t texture_combo_index = 0;
    uint16_t texture_coord_combo_index = 0;
    uint16_t texture_weight_combo_index = 0;
    uint16_t texture_transform_combo_index = 0;

    bool operator==(const Batch&) const = default;
};

// Skin is the normalized mesh partition. The lists are the same whichever
// header layout the file used; only `header` remembers the source layout.
struct Skin {
    SkinHeader header;
    std::vector<uint16_t> vertex_indices;
    std::vector<uint16_t> triangles;
    std::vector<std::array<uint8_t, 4>> properties;
    std::vector<Submesh> submeshes;
    std::vector<Batch> batches;
    uint32_t bone_count_max = 0;

    bool is_modern() const { return std::holds_alternative<ModernSkinHeader>(header); }
    const PointerTable& table() const;

    bool operator==(const Skin&) const = default;
};

enum class SkinMode { Auto, Legacy, Modern };

std::string_view to_string(SkinMode mode);

// mode_from_string accepts "auto", "legacy" and "modern". Throws
// std::invalid_argument.
SkinMode mode_from_string(std::string_view name);

// load decodes a skin file. Auto selects the modern layout when the buffer
// starts with the SKIN tag. Throws ParseError: InvalidMagic when Modern is
// forced on an untagged buffer, Truncated when a list lies outside the
// buffer, MalformedChunk when a submesh range lies outside the index lists.
Skin load(std::span<const uint8_t> data, SkinMode mode = SkinMode::Auto);
Skin load(const std::filesystem::path& path, SkinMode mode = SkinMode::Auto);

// layout_for returns the header layout a version stores skins in.
SkinMode layout_for(FormatVersion v);

// save encodes the lists with the layout of version v, rebuilding the
// pointer table.
std::vector<uint8_t> save(const Skin& skin, FormatVersion v);
void save(const Skin& skin, FormatVersion v, const std::filesystem::path& path);

// convert returns the skin with its header rebuilt for version v, exactly as
// load(save(skin, v)) would produce it.
Skin convert(const Skin& skin, FormatVersion v);

// validate reports triangles outside the vertex index list, submesh ranges
// outside the index lists and batches referencing missing submeshes.
std::vector<ValidationIssue> validate(const Skin& skin);

} // namespace m2tools::skin
