#include "m2tools/anim.h"

#include "m2tools/binutil.h"

#include <algorithm>
#include <cstring>
#include <format>
#include <sstream>

namespace m2tools::anim {

namespace {

using namespace m2tools::binutil;

// Smallest possible bone record: ids plus three empty tracks.
constexpr size_t kMinBoneSize = 4 + 3 * 8;

// ---------------------------------------------------------------------------
// Section bodies
// ---------------------------------------------------------------------------

ParseError implausible(const std::string& message) {
    return ParseError(ParseErrorKind::MalformedChunk, "anim: " + message);
}

// read_keys reads one keyframe track. legacy enables the plausibility checks
// of the headerless layout.
template <typename T>
KeyTrack<T> read_keys(std::istream& r, bool legacy) {
    KeyTrack<T> t;
    t.interpolation = read_u16(r);
    t.reserved = read_u16(r);
    if (legacy && t.interpolation > kMaxInterpolation)
        throw implausible(std::format("interpolation {} out of range", t.interpolation));
    auto n = read_count(r, 4 + sizeof(T), "keyframe");
    t.timestamps = read_array<uint32_t>(r, n, "timestamp");
    if (legacy && !std::is_sorted(t.timestamps.begin(), t.timestamps.end()))
        throw implausible("timestamps are not monotonic");
    t.values = read_array<T>(r, n, "keyframe value");
    return t;
}

template <typename T>
void write_keys(std::ostream& w, const KeyTrack<T>& t) {
    if (t.values.size() != t.timestamps.size())
        throw std::runtime_error(std::format("anim: track has {} timestamps but {} values",
                                             t.timestamps.size(), t.values.size()));
    write_u16(w, t.interpolation);
    write_u16(w, t.reserved);
    write_u32(w, static_cast<uint32_t>(t.timestamps.size()));
    write_array(w, t.timestamps, "timestamp");
    write_array(w, t.values, "keyframe value");
}

AnimSection read_body(std::istream& r, bool legacy) {
    AnimSection s;
    s.header.start = read_u32(r);
    s.header.end = read_u32(r);
    if (legacy) {
        if (s.header.start > s.header.end)
            throw implausible(std::format("block ends at {} before it starts at {}",
                                          s.header.end, s.header.start));
        if (s.header.end - s.header.start > kMaxLegacyDuration)
            throw implausible(std::format("block lasts {} ms",
                                          s.header.end - s.header.start));
    }
    auto bone_count = read_count(r, kMinBoneSize, "bone");
    if (legacy && bone_count > kMaxLegacyBones)
        throw implausible(std::format("{} bones in one block", bone_count));

    s.bones.resize(bone_count);
    for (auto& b : s.bones) {
        b.bone_id = read_u16(r);
        b.flags = read_u16(r);
        b.translation = read_keys<Vec3>(r, legacy);
        b.rotation = read_keys<CompQuat>(r, legacy);
        b.scaling = read_keys<Vec3>(r, legacy);
    }
    return s;
}

void write_body(std::ostream& w, const AnimSection& s) {
    write_u32(w, s.header.start);
    write_u32(w, s.header.end);
    write_u32(w, static_cast<uint32_t>(s.bones.size()));
    for (const auto& b : s.bones) {
        write_u16(w, b.bone_id);
        write_u16(w, b.flags);
        write_keys(w, b.translation);
        write_keys(w, b.rotation);
        write_keys(w, b.scaling);
    }
}

bool has_keys(const std::vector<AnimSection>& sections) {
    return std::any_of(sections.begin(), sections.end(), [](const AnimSection& s) {
        return std::any_of(s.bones.begin(), s.bones.end(), [](const BoneAnimation& b) {
            return b.translation.size() + b.rotation.size() + b.scaling.size() > 0;
        });
    });
}

// ---------------------------------------------------------------------------
// Legacy walk
// ---------------------------------------------------------------------------

struct LegacyWalk {
    std::vector<AnimSection> sections;
    size_t consumed = 0;
    LegacyHints hints;
};

// A zero-length block without bones. Only the first block may be one; later
// ones are zero padding and stay in the trailing bytes.
bool is_empty_block(const AnimSection& s) {
    return s.header.start == 0 && s.header.end == 0 && s.bones.empty();
}

LegacyWalk walk_legacy(std::span<const uint8_t> data) {
    LegacyWalk walk;
    auto r = make_stream(data);
    while (walk.consumed < data.size()) {
        AnimSection s;
        try {
            s = read_body(r, true);
        } catch (const ParseError&) {
            break; // the first implausible block ends the walk
        }
        if (!walk.sections.empty() && is_empty_block(s)) break;
        s.header.id = static_cast<uint32_t>(walk.sections.size());
        walk.sections.push_back(std::move(s));
        walk.consumed = static_cast<size_t>(r.tellg());
    }
    walk.hints.estimated_blocks = static_cast<uint32_t>(walk.sections.size());
    walk.hints.appears_valid = !walk.sections.empty() && walk.consumed == data.size();
    walk.hints.has_timestamps = has_keys(walk.sections);
    return walk;
}

// legacy_rejects reports whether a legacy walk would stop at s, given
// whether s is the first block of the file.
bool legacy_rejects(const AnimSection& s, bool first) {
    if (!first && is_empty_block(s)) return true;
    std::ostringstream out(std::ios::binary);
    write_body(out, s);
    auto bytes = to_bytes(out);
    auto r = make_stream(bytes);
    try {
        read_body(r, true);
    } catch (const ParseError&) {
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Modern layout
// ---------------------------------------------------------------------------

struct ModernLayout {
    ModernMetadata metadata;
    std::vector<std::vector<uint8_t>> bodies; // id + body per section
};

// layout_modern places the entry table right after the header and the
// sections back to back after the table, in section order.
ModernLayout layout_modern(const std::vector<AnimSection>& sections) {
    ModernLayout layout;
    auto& meta = layout.metadata;
    meta.header.id_count = static_cast<uint32_t>(sections.size());
    meta.header.entry_offset = kModernHeaderSize;

    uint64_t offset = kModernHeaderSize + sections.size() * kEntrySize;
    for (const auto& s : sections) {
        std::ostringstream out(std::ios::binary);
        write_u32(out, s.header.id);
        write_body(out, s);
        auto bytes = to_bytes(out);
        if (offset + bytes.size() > UINT32_MAX)
            throw std::runtime_error("anim: modern file exceeds 4 GiB");
        meta.entries.push_back({s.header.id, static_cast<uint32_t>(offset),
                                static_cast<uint32_t>(bytes.size())});
        offset += bytes.size();
        layout.bodies.push_back(std::move(bytes));
    }
    return layout;
}

AnimFile load_modern(std::span<const uint8_t> data) {
    auto r = make_stream(data);
    read_signature(r);

    ModernMetadata meta;
    meta.header.version = read_u32(r);
    meta.header.id_count = read_u32(r);
    meta.header.entry_offset = read_u32(r);

    r.seekg(meta.header.entry_offset);
    meta.entries.resize(meta.header.id_count);
    for (auto& e : meta.entries) {
        e.id = read_u32(r);
        e.offset = read_u32(r);
        e.size = read_u32(r);
    }

    AnimFile file;
    file.version = FormatVersion::Legion;
    for (const auto& e : meta.entries) file.sections.push_back(load_section(data, e));
    file.metadata = std::move(meta);
    return file;
}

} // namespace

std::string_view to_string(AnimFormat format) {
    return format == AnimFormat::Modern ? "modern" : "legacy";
}

// ---------------------------------------------------------------------------
// AnimFile
// ---------------------------------------------------------------------------

AnimFormat AnimFile::format() const {
    return std::holds_alternative<ModernMetadata>(metadata) ? AnimFormat::Modern
                                                            : AnimFormat::Legacy;
}

MemoryUsage AnimFile::memory_usage() const {
    MemoryUsage usage;
    usage.sections = sections.size();
    for (const auto& s : sections) {
        usage.bones += s.bones.size();
        for (const auto& b : s.bones) {
            usage.translation_keys += b.translation.size();
            usage.rotation_keys += b.rotation.size();
            usage.scaling_keys += b.scaling.size();
        }
    }
    return usage;
}

const LegacyHints* AnimFile::hints() const {
    if (const auto* legacy = std::get_if<LegacyMetadata>(&metadata)) return &legacy->hints;
    const auto& modern = std::get<ModernMetadata>(metadata);
    return modern.source_hints ? &*modern.source_hints : nullptr;
}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------

bool is_modern(std::span<const uint8_t> data) {
    if (data.size() < kModernHeaderSize || std::memcmp(data.data(), kModernMagic, 4) != 0)
        return false;
    uint32_t version = 0, id_count = 0, entry_offset = 0;
    std::memcpy(&version, data.data() + 4, 4);
    std::memcpy(&id_count, data.data() + 8, 4);
    std::memcpy(&entry_offset, data.data() + 12, 4);
    return version == kModernVersion &&
           uint64_t(entry_offset) + uint64_t(id_count) * kEntrySize <= data.size();
}

LegacyHints scan_legacy(std::span<const uint8_t> data) { return walk_legacy(data).hints; }

AnimSection load_section(std::span<const uint8_t> data, const EntryRecord& entry) {
    if (entry.size < 4 || uint64_t(entry.offset) + entry.size > data.size())
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("anim: section {} ({} bytes at {}) is outside the {} byte file",
                                     entry.id, entry.size, entry.offset, data.size()));
    auto r = make_stream(data.subspan(entry.offset, entry.size));
    auto id = read_u32(r);
    if (id != entry.id)
        throw ParseError(ParseErrorKind::MalformedChunk,
                         std::format("anim: entry {} locates section {}", entry.id, id));
    auto section = read_body(r, false);
    section.header.id = id;
    require_consumed(r, std::format("anim: section {}", id));
    return section;
}

AnimFile load(std::span<const uint8_t> data) {
    if (data.empty()) throw ParseError(ParseErrorKind::Truncated, "anim: empty file");
    if (is_modern(data)) return load_modern(data);

    auto walk = walk_legacy(data);
    AnimFile file;
    file.version = FormatVersion::WotLK;
    LegacyMetadata meta;
    meta.hints = walk.hints;
    meta.trailing.assign(data.begin() + static_cast<std::ptrdiff_t>(walk.consumed), data.end());
    file.metadata = std::move(meta);
    file.sections = std::move(walk.sections);
    return file;
}

AnimFile load(const std::filesystem::path& path) {
    auto data = read_file(path);
    return load(data);
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

std::vector<uint8_t> save(const AnimFile& file) {
    std::ostringstream out(std::ios::binary);
    if (const auto* legacy = std::get_if<LegacyMetadata>(&file.metadata)) {
        for (const auto& s : file.sections) write_body(out, s);
        write_bytes(out, legacy->trailing);
        return to_bytes(out);
    }

    auto layout = layout_modern(file.sections);
    const auto& meta = layout.metadata;
    write_signature(out, kModernMagic);
    write_u32(out, meta.header.version);
    write_u32(out, meta.header.id_count);
    write_u32(out, meta.header.entry_offset);
    for (const auto& e : meta.entries) {
        write_u32(out, e.id);
        write_u32(out, e.offset);
        write_u32(out, e.size);
    }
    for (const auto& body : layout.bodies) write_bytes(out, body);
    return to_bytes(out);
}

void save(const AnimFile& file, const std::filesystem::path& path) {
    auto data = save(file);
    write_file(path, data);
}

// ---------------------------------------------------------------------------
// Conversion
// ---------------------------------------------------------------------------

AnimFormat required_format(FormatVersion v) {
    return version::has(v, version::Feature::ModernAnimLayout) ? AnimFormat::Modern
                                                               : AnimFormat::Legacy;
}

AnimFile convert(const AnimFile& file, FormatVersion target) {
    AnimFile out = file;
    out.version = target;
    auto want = required_format(target);
    if (want == file.format()) return out;

    if (want == AnimFormat::Modern) {
        auto meta = layout_modern(out.sections).metadata;
        meta.source_hints = std::get<LegacyMetadata>(file.metadata).hints;
        out.metadata = std::move(meta);
        return out;
    }

    LegacyMetadata meta;
    for (size_t i = 0; i < out.sections.size(); ++i) {
        out.sections[i].header.id = static_cast<uint32_t>(i);
        if (legacy_rejects(out.sections[i], i == 0))
            meta.implausible_sections.push_back(static_cast<uint32_t>(i));
    }
    out.metadata = std::move(meta);
    // Hints describe the flattened blocks exactly as a later load would see them.
    std::get<LegacyMetadata>(out.metadata).hints = scan_legacy(save(out));
    return out;
}

} // namespace m2tools::anim
