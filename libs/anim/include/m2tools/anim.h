#pragma once

#include "m2tools/errors.h"
#include "m2tools/version.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace m2tools::anim {

using version::FormatVersion;

inline constexpr char kModernMagic[5] = "AFM2";
inline constexpr uint32_t kModernVersion = 1;
inline constexpr size_t kModernHeaderSize = 16;
inline constexpr size_t kEntrySize = 12;

// Plausibility limits of the legacy block walk.
inline constexpr uint32_t kMaxLegacyDuration = 3'600'000; // ms
inline constexpr uint32_t kMaxLegacyBones = 512;
inline constexpr uint16_t kMaxInterpolation = 3;

// Approximate in-memory cost of one keyframe, timestamp included.
inline constexpr size_t kTranslationKeyBytes = 16;
inline constexpr size_t kRotationKeyBytes = 12;
inline constexpr size_t kScalingKeyBytes = 16;
inline constexpr size_t kSectionBytes = 16;
inline constexpr size_t kBoneBytes = 28;

enum class AnimFormat { Legacy, Modern };

std::string_view to_string(AnimFormat format);

using Vec3 = std::array<float, 3>;
using CompQuat = std::array<int16_t, 4>;

template <typename T>
struct KeyTrack {
    uint16_t interpolation = 0;
    uint16_t reserved = 0;
    std::vector<uint32_t> timestamps;
    std::vector<T> values; // one per timestamp

    size_t size() const { return timestamps.size(); }

    bool operator==(const KeyTrack&) const = default;
};

struct BoneAnimation {
    uint16_t bone_id = 0;
    uint16_t flags = 0;
    KeyTrack<Vec3> translation;
    KeyTrack<CompQuat> rotation;
    KeyTrack<Vec3> scaling;

    bool operator==(const BoneAnimation&) const = default;
};

struct SectionHeader {
    uint32_t id = 0;
    uint32_t start = 0; // ms
    uint32_t end = 0;

    bool operator==(const SectionHeader&) const = default;
};

struct AnimSection {
    SectionHeader header;
    std::vector<BoneAnimation> bones;

    bool operator==(const AnimSection&) const = default;
};

// LegacyHints is the outcome of the legacy block walk. A legacy file has no
// header, so these are the only signal of how trustworthy the parse is.
struct LegacyHints {
    bool appears_valid = false;   // whole buffer consumed, at least one block
    uint32_t estimated_blocks = 0;
    bool has_timestamps = false;  // at least one keyframe was found

    bool operator==(const LegacyHints&) const = default;
};

struct LegacyMetadata {
    LegacyHints hints;
    std::vector<uint8_t> trailing; // bytes after the last plausible block
    // Positions of sections a legacy walk rejects. Only a transcode from the
    // modern layout fills it; a reload stops at the first listed section.
    std::vector<uint32_t> implausible_sections;

    bool operator==(const LegacyMetadata&) const = default;
};

struct ModernHeader {
    uint32_t version = kModernVersion;
    uint32_t id_count = 0;
    uint32_t entry_offset = kModernHeaderSize;

    bool operator==(const ModernHeader&) const = default;
};

struct EntryRecord {
    uint32_t id = 0;
    uint32_t offset = 0;
    uint32_t size = 0;

    bool operator==(const EntryRecord&) const = default;
};

struct ModernMetadata {
    ModernHeader header;
    std::vector<EntryRecord> entries;
    // Hints of the legacy file this one was transcoded from.
    std::optional<LegacyHints> source_hints;

    bool operator==(const ModernMetadata&) const = default;
};

using AnimMetadata = std::variant<LegacyMetadata, ModernMetadata>;

struct MemoryUsage {
    size_t sections = 0;
    size_t bones = 0;
    size_t translation_keys = 0;
    size_t rotation_keys = 0;
    size_t scaling_keys = 0;

    size_t section_bytes() const { return sections * kSectionBytes; }
    size_t bone_bytes() const { return bones * kBoneBytes; }
    size_t translation_bytes() const { return translation_keys * kTranslationKeyBytes; }
    size_t rotation_bytes() const { return rotation_keys * kRotationKeyBytes; }
    size_t scaling_bytes() const { return scaling_keys * kScalingKeyBytes; }
    size_t total() const {
        return section_bytes() + bone_bytes() + translation_bytes() + rotation_bytes() +
               scaling_bytes();
    }
};

struct AnimFile {
    FormatVersion version = FormatVersion::WotLK;
    AnimMetadata metadata;
    std::vector<AnimSection> sections;

    AnimFormat format() const;
    bool is_legacy_format() const { return format() == AnimFormat::Legacy; }
    size_t animation_count() const { return sections.size(); }
    MemoryUsage memory_usage() const;

    // hints returns the legacy walk result of this file, or of the legacy
    // source of a transcoded modern file; nullptr otherwise.
    const LegacyHints* hints() const;

    bool operator==(const AnimFile&) const = default;
};

// is_modern reports whether data carries a usable AFM2 header: at least 16
// bytes, the magic, version 1 and an entry table inside the buffer.
bool is_modern(std::span<const uint8_t> data);

// scan_legacy walks legacy blocks from the buffer start and reports how far
// the walk got. Never throws.
LegacyHints scan_legacy(std::span<const uint8_t> data);

// load_section decodes the section one modern entry locates. Throws
// ParseError{Truncated} when the entry lies outside data.
AnimSection load_section(std::span<const uint8_t> data, const EntryRecord& entry);

// load tries the modern header first and falls back to the legacy walk.
// Throws ParseError{Truncated} on an empty buffer or a modern file whose
// sections are out of range. A legacy file never fails to load; check hints().
AnimFile load(std::span<const uint8_t> data);
AnimFile load(const std::filesystem::path& path);

std::vector<uint8_t> save(const AnimFile& file);
void save(const AnimFile& file, const std::filesystem::path& path);

// required_format returns the layout version v stores animations in.
AnimFormat required_format(FormatVersion v);

// convert retags the file for target, transcoding when the required layout
// differs. Legacy to modern builds the entry table from the walked blocks
// and keeps their hints as source_hints; modern to legacy drops the entry
// table and renumbers sections by position. Keyframes are never changed.
AnimFile convert(const AnimFile& file, FormatVersion target);

} // namespace m2tools::anim
