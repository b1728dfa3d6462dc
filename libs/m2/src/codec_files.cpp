#include "codecs.h"

namespace m2tools::m2::detail {

using namespace m2tools::binutil;

// File reference and extension chunks exist only in Legion, so none of them
// changes layout between versions.

// SKID, PFID

void decode(std::istream& r, FormatVersion, SingleFileId& out) { out.file_id = read_u32(r); }

void encode(std::ostream& w, const SingleFileId& in, FormatVersion) {
    write_u32(w, in.file_id);
}

SingleFileId transform(const SingleFileId& in, ConvertContext&) { return in; }

size_t count(const SingleFileId&) { return 1; }

// TXID, GPID, RPID, SFID, BFID

void decode(std::istream& r, FormatVersion, FileIdTable& out) {
    out.file_ids = read_array<uint32_t>(r, stride_count(r, 4), "file id");
}

void encode(std::ostream& w, const FileIdTable& in, FormatVersion) {
    write_array(w, in.file_ids, "file id");
}

FileIdTable transform(const FileIdTable& in, ConvertContext&) { return in; }

size_t count(const FileIdTable& in) { return in.file_ids.size(); }

// PGD1, PABC

void decode(std::istream& r, FormatVersion, U16Table& out) {
    out.values = read_array<uint16_t>(r, stride_count(r, 2), "u16 entry");
}

void encode(std::ostream& w, const U16Table& in, FormatVersion) {
    write_array(w, in.values, "u16 entry");
}

U16Table transform(const U16Table& in, ConvertContext&) { return in; }

size_t count(const U16Table& in) { return in.values.size(); }

// AFID

void decode(std::istream& r, FormatVersion, AnimationFileIds& out) {
    out.entries.resize(stride_count(r, 8));
    for (auto& e : out.entries) {
        e.animation_id = read_u16(r);
        e.sub_animation_id = read_u16(r);
        e.file_id = read_u32(r);
    }
}

void encode(std::ostream& w, const AnimationFileIds& in, FormatVersion) {
    for (const auto& e : in.entries) {
        write_u16(w, e.animation_id);
        write_u16(w, e.sub_animation_id);
        write_u32(w, e.file_id);
    }
}

AnimationFileIds transform(const AnimationFileIds& in, ConvertContext&) { return in; }

size_t count(const AnimationFileIds& in) { return in.entries.size(); }

// NERF

void decode(std::istream& r, FormatVersion, AlphaAttenuation& out) {
    out.coefficients = read_pod<std::array<float, 2>>(r, "alpha attenuation");
}

void encode(std::ostream& w, const AlphaAttenuation& in, FormatVersion) {
    write_pod(w, in.coefficients, "alpha attenuation");
}

AlphaAttenuation transform(const AlphaAttenuation& in, ConvertContext&) { return in; }

size_t count(const AlphaAttenuation&) { return 1; }

// EDGF

void decode(std::istream& r, FormatVersion, EdgeFades& out) {
    out.entries.resize(stride_count(r, 16));
    for (auto& e : out.entries) {
        e.values = read_pod<std::array<float, 2>>(r, "edge fade");
        e.scale = read_f32(r);
        e.padding = read_u32(r);
    }
}

void encode(std::ostream& w, const EdgeFades& in, FormatVersion) {
    for (const auto& e : in.entries) {
        write_pod(w, e.values, "edge fade");
        write_f32(w, e.scale);
        write_u32(w, e.padding);
    }
}

EdgeFades transform(const EdgeFades& in, ConvertContext&) { return in; }

size_t count(const EdgeFades& in) { return in.entries.size(); }

} // namespace m2tools::m2::detail
