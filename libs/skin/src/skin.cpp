#include "m2tools/skin.h"

#include "m2tools/binutil.h"

#include <algorithm>
#include <format>
#include <sstream>
#include <stdexcept>

namespace m2tools::skin {

namespace {

using namespace m2tools::binutil;

// ---------------------------------------------------------------------------
// Pointer table
// ---------------------------------------------------------------------------

ArrayRef read_ref(std::istream& r) {
    ArrayRef ref;
    ref.count = read_u32(r);
    ref.offset = read_u32(r);
    return ref;
}

void write_ref(std::ostream& w, const ArrayRef& ref) {
    write_u32(w, ref.count);
    write_u32(w, ref.offset);
}

PointerTable read_table(std::istream& r) {
    PointerTable t;
    t.vertex_indices = read_ref(r);
    t.triangles = read_ref(r);
    t.properties = read_ref(r);
    t.submeshes = read_ref(r);
    t.batches = read_ref(r);
    t.bone_count_max = read_u32(r);
    return t;
}

void write_table(std::ostream& w, const PointerTable& t) {
    write_ref(w, t.vertex_indices);
    write_ref(w, t.triangles);
    write_ref(w, t.properties);
    write_ref(w, t.submeshes);
    write_ref(w, t.batches);
    write_u32(w, t.bone_count_max);
}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

Submesh read_submesh(std::istream& r) {
    Submesh s;
    s.id = read_u16(r);
    s.level = read_u16(r);
    s.vertex_start = read_u16(r);
    s.vertex_count = read_u16(r);
    s.triangle_start = read_u16(r);
    s.triangle_count = read_u16(r);
    s.bone_count = read_u16(r);
    s.bone_combo_index = read_u16(r);
    s.bone_influences = read_u16(r);
    s.center_bone_index = read_u16(r);
    s.center = read_vec3(r);
    s.sort_center = read_vec3(r);
    s.sort_radius = read_f32(r);
    return s;
}

void write_submesh(std::ostream& w, const Submesh& s) {
    write_u16(w, s.id);
    write_u16(w, s.level);
    write_u16(w, s.vertex_start);
    write_u16(w, s.vertex_count);
    write_u16(w, s.triangle_start);
    write_u16(w, s.triangle_count);
    write_u16(w, s.bone_count);
    write_u16(w, s.bone_combo_index);
    write_u16(w, s.bone_influences);
    write_u16(w, s.center_bone_index);
    write_vec3(w, s.center);
    write_vec3(w, s.sort_center);
    write_f32(w, s.sort_radius);
}

Batch read_batch(std::istream& r) {
    Batch b;
    b.flags = read_u8(r);
    b.priority_plane = read_i8(r);
    b.shader_id = read_u16(r);
    b.submesh_index = read_u16(r);
    b.geoset_index = read_u16(r);
    b.color_index = read_i16(r);
    b.material_index = read_u16(r);
    b.material_layer = read_u16(r);
    b.texture_count = read_u16(r);
    b.texture_combo_index = read_u16(r);
    b.texture_coord_combo_index = read_u16(r);
    b.texture_weight_combo_index = read_u16(r);
    b.texture_transform_combo_index = read_u16(r);
    return b;
}

void write_batch(std::ostream& w, const Batch& b) {
    write_u8(w, b.flags);
    write_i8(w, b.priority_plane);
    write_u16(w, b.shader_id);
    write_u16(w, b.submesh_index);
    write_u16(w, b.geoset_index);
    write_i16(w, b.color_index);
    write_u16(w, b.material_index);
    write_u16(w, b.material_layer);
    write_u16(w, b.texture_count);
    write_u16(w, b.texture_combo_index);
    write_u16(w, b.texture_coord_combo_index);
    write_u16(w, b.texture_weight_combo_index);
    write_u16(w, b.texture_transform_combo_index);
}

// list_stream returns a stream over the bytes one pointer table entry
// describes, after checking they lie inside data.
std::istringstream list_stream(std::span<const uint8_t> data, const ArrayRef& ref,
                               size_t elem_size, const char* what) {
    uint64_t end = uint64_t(ref.offset) + uint64_t(ref.count) * elem_size;
    if (ref.count > 0 && end > data.size())
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("skin: {} list ({} x {} bytes at {}) exceeds {} bytes",
                                     what, ref.count, elem_size, ref.offset, data.size()));
    if (ref.count == 0) return make_stream({});
    return make_stream(data.subspan(ref.offset, static_cast<size_t>(end - ref.offset)));
}

template <typename T, typename ReadFn>
std::vector<T> read_list(std::span<const uint8_t> data, const ArrayRef& ref, size_t elem_size,
                         const char* what, ReadFn read_one) {
    auto r = list_stream(data, ref, elem_size, what);
    std::vector<T> out;
    out.reserve(ref.count);
    for (uint32_t i = 0; i < ref.count; ++i) out.push_back(read_one(r));
    return out;
}

void check_submesh_ranges(const Skin& skin) {
    for (size_t i = 0; i < skin.submeshes.size(); ++i) {
        const auto& s = skin.submeshes[i];
        if (size_t(s.vertex_start) + s.vertex_count > skin.vertex_indices.size())
            throw ParseError(
                ParseErrorKind::MalformedChunk,
                std::format("skin: submesh {} vertices [{}, {}) exceed {} vertex indices", i,
                            s.vertex_start, s.vertex_start + s.vertex_count,
                            skin.vertex_indices.size()));
        if (size_t(s.first_triangle()) + s.triangle_count > skin.triangles.size())
            throw ParseError(
                ParseErrorKind::MalformedChunk,
                std::format("skin: submesh {} triangles [{}, {}) exceed {} triangle indices", i,
                            s.first_triangle(), size_t(s.first_triangle()) + s.triangle_count,
                            skin.triangles.size()));
    }
}

// decode_lists resolves the pointer table against data (the whole legacy
// file, or the modern SKIN payload).
void decode_lists(std::span<const uint8_t> data, const PointerTable& t, Skin& out) {
    out.vertex_indices =
        read_list<uint16_t>(data, t.vertex_indices, 2, "vertex index", read_u16);
    out.triangles = read_list<uint16_t>(data, t.triangles, 2, "triangle", read_u16);
    out.properties = read_list<std::array<uint8_t, 4>>(
        data, t.properties, 4, "property",
        [](std::istream& r) { return read_pod<std::array<uint8_t, 4>>(r, "property"); });
    out.submeshes = read_list<Submesh>(data, t.submeshes, kSubmeshSize, "submesh", read_submesh);
    out.batches = read_list<Batch>(data, t.batches, kBatchSize, "batch", read_batch);
    out.bone_count_max = t.bone_count_max;
    check_submesh_ranges(out);
}

PointerTable read_table_at_start(std::span<const uint8_t> data) {
    if (data.size() < kPointerTableSize)
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("skin: {} bytes is too small for the pointer table",
                                     data.size()));
    auto r = make_stream(data.first(kPointerTableSize));
    return read_table(r);
}

bool starts_with_tag(std::span<const uint8_t> data) {
    return data.size() >= 4 && std::equal(kSkinTag.bytes.begin(), kSkinTag.bytes.end(),
                                          reinterpret_cast<const char*>(data.data()));
}

// encode_payload lays out the pointer table followed by the lists in table
// order. Offsets are relative to the payload start.
std::vector<uint8_t> encode_payload(const Skin& skin) {
    PointerTable t;
    uint32_t offset = kPointerTableSize;
    auto place = [&offset](ArrayRef& ref, size_t count, size_t elem_size) {
        ref.count = static_cast<uint32_t>(count);
        ref.offset = count > 0 ? offset : 0;
        offset += static_cast<uint32_t>(count * elem_size);
    };
    place(t.vertex_indices, skin.vertex_indices.size(), 2);
    place(t.triangles, skin.triangles.size(), 2);
    place(t.properties, skin.properties.size(), 4);
    place(t.submeshes, skin.submeshes.size(), kSubmeshSize);
    place(t.batches, skin.batches.size(), kBatchSize);
    t.bone_count_max = skin.bone_count_max;

    std::ostringstream out(std::ios::binary);
    write_table(out, t);
    write_array(out, skin.vertex_indices, "vertex index");
    write_array(out, skin.triangles, "triangle");
    write_array(out, skin.properties, "property");
    for (const auto& s : skin.submeshes) write_submesh(out, s);
    for (const auto& b : skin.batches) write_batch(out, b);
    return to_bytes(out);
}

} // namespace

const PointerTable& Skin::table() const {
    return std::visit([](const auto& h) -> const PointerTable& { return h.table; }, header);
}

std::string_view to_string(SkinMode mode) {
    switch (mode) {
        case SkinMode::Auto: return "auto";
        case SkinMode::Legacy: return "legacy";
        case SkinMode::Modern: return "modern";
    }
    return "auto";
}

SkinMode mode_from_string(std::string_view name) {
    if (name == "auto") return SkinMode::Auto;
    if (name == "legacy") return SkinMode::Legacy;
    if (name == "modern") return SkinMode::Modern;
    throw std::invalid_argument(std::format("unknown skin mode '{}'", name));
}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------

Skin load(std::span<const uint8_t> data, SkinMode mode) {
    if (mode == SkinMode::Auto)
        mode = starts_with_tag(data) ? SkinMode::Modern : SkinMode::Legacy;

    Skin skin;
    if (mode == SkinMode::Legacy) {
        LegacySkinHeader header{read_table_at_start(data)};
        decode_lists(data, header.table, skin);
        skin.header = header;
        return skin;
    }

    if (!starts_with_tag(data))
        throw ParseError(ParseErrorKind::InvalidMagic, "skin: missing SKIN tag");
    chunk::ChunkReader reader(data);
    auto rec = reader.next();
    ModernSkinHeader header;
    header.payload_size = rec->size;
    header.table = read_table_at_start(rec->payload);
    decode_lists(rec->payload, header.table, skin);
    skin.header = header;
    return skin;
}

Skin load(const std::filesystem::path& path, SkinMode mode) {
    auto data = read_file(path);
    return load(data, mode);
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

SkinMode layout_for(FormatVersion v) {
    return version::has(v, version::Feature::ModernSkinHeader) ? SkinMode::Modern
                                                               : SkinMode::Legacy;
}

std::vector<uint8_t> save(const Skin& skin, FormatVersion v) {
    auto payload = encode_payload(skin);
    if (layout_for(v) == SkinMode::Legacy) return payload;

    std::ostringstream out(std::ios::binary);
    chunk::write_chunk(out, kSkinTag, payload);
    return to_bytes(out);
}

void save(const Skin& skin, FormatVersion v, const std::filesystem::path& path) {
    auto data = save(skin, v);
    write_file(path, data);
}

Skin convert(const Skin& skin, FormatVersion v) {
    auto bytes = save(skin, v);
    return load(bytes, layout_for(v));
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

std::vector<ValidationIssue> validate(const Skin& skin) {
    std::vector<ValidationIssue> issues;
    auto add = [&issues](ValidationErrorKind kind, std::string message) {
        issues.push_back({kind, "SKIN", std::move(message)});
    };

    for (size_t i = 0; i < skin.triangles.size(); ++i) {
        if (skin.triangles[i] >= skin.vertex_indices.size())
            add(ValidationErrorKind::OutOfBoundsIndex,
                std::format("triangle index {} refers to vertex index {} of {}", i,
                            skin.triangles[i], skin.vertex_indices.size()));
    }
    for (size_t i = 0; i < skin.submeshes.size(); ++i) {
        const auto& s = skin.submeshes[i];
        if (size_t(s.vertex_start) + s.vertex_count > skin.vertex_indices.size())
            add(ValidationErrorKind::OutOfBoundsIndex,
                std::format("submesh {} vertex range exceeds {} vertex indices", i,
                            skin.vertex_indices.size()));
        if (size_t(s.first_triangle()) + s.triangle_count > skin.triangles.size())
            add(ValidationErrorKind::OutOfBoundsIndex,
                std::format("submesh {} triangle range exceeds {} triangle indices", i,
                            skin.triangles.size()));
    }
    for (size_t i = 0; i < skin.batches.size(); ++i) {
        if (skin.batches[i].submesh_index >= skin.submeshes.size())
            add(ValidationErrorKind::DanglingReference,
                std::format("batch {} references submesh {} of {}", i,
                            skin.batches[i].submesh_index, skin.submeshes.size()));
    }
    return issues;
}

} // namespace m2tools::skin
