#include "codecs.h"

#include <format>

namespace m2tools::m2::detail {

using namespace m2tools::binutil;
using version::Feature;

// ---------------------------------------------------------------------------
// TEXS
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion, Textures& out) {
    auto n = read_count(r, 12, "texture");
    out.textures.resize(n);
    for (auto& t : out.textures) {
        t.type = read_u32(r);
        t.flags = read_u32(r);
        t.filename = read_string(r);
    }
}

void encode(std::ostream& w, const Textures& in, FormatVersion) {
    write_u32(w, static_cast<uint32_t>(in.textures.size()));
    for (const auto& t : in.textures) {
        write_u32(w, t.type);
        write_u32(w, t.flags);
        write_string(w, t.filename);
    }
}

Textures transform(const Textures& in, ConvertContext&) { return in; }

size_t count(const Textures& in) { return in.textures.size(); }

// ---------------------------------------------------------------------------
// MATS
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion, Materials& out) {
    out.materials.resize(stride_count(r, 4));
    for (auto& m : out.materials) {
        m.flags = read_u16(r);
        m.blend_mode = read_u16(r);
    }
}

void encode(std::ostream& w, const Materials& in, FormatVersion) {
    for (const auto& m : in.materials) {
        write_u16(w, m.flags);
        write_u16(w, m.blend_mode);
    }
}

Materials transform(const Materials& in, ConvertContext& ctx) {
    Materials out = in;
    if (!ctx.loses(Feature::BlendAddMode)) return out;
    size_t changed = 0;
    for (auto& m : out.materials) {
        if (m.blend_mode == kBlendBlendAdd) {
            m.blend_mode = kBlendAdd;
            ++changed;
        }
    }
    if (changed > 0)
        ctx.note(std::format("MATS: {} materials with blend mode 7 now use additive (4)",
                             changed));
    return out;
}

size_t count(const Materials& in) { return in.materials.size(); }

// ---------------------------------------------------------------------------
// TXAC
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion, TextureCombiners& out) {
    out.entries.resize(stride_count(r, 2));
    for (auto& e : out.entries) e = read_pod<std::array<uint8_t, 2>>(r, "combiner");
}

void encode(std::ostream& w, const TextureCombiners& in, FormatVersion) {
    for (const auto& e : in.entries) write_pod(w, e, "combiner");
}

TextureCombiners transform(const TextureCombiners& in, ConvertContext&) { return in; }

size_t count(const TextureCombiners& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// COLR
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, ColorAnimations& out) {
    auto n = read_count(r, 16, "color animation");
    out.entries.resize(n);
    for (auto& e : out.entries) {
        e.color = read_track<Vec3>(r, v);
        e.alpha = read_track<Fixed16>(r, v);
    }
}

void encode(std::ostream& w, const ColorAnimations& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& e : in.entries) {
        write_track(w, e.color, v);
        write_track(w, e.alpha, v);
    }
}

ColorAnimations transform(const ColorAnimations& in, ConvertContext& ctx) {
    ColorAnimations out = in;
    for (auto& e : out.entries) {
        ctx.convert(e.color, "COLR");
        ctx.convert(e.alpha, "COLR");
    }
    return out;
}

size_t count(const ColorAnimations& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// TRAN
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, TransparencyAnimations& out) {
    auto n = read_count(r, 8, "transparency animation");
    out.entries.resize(n);
    for (auto& e : out.entries) e.weight = read_track<Fixed16>(r, v);
}

void encode(std::ostream& w, const TransparencyAnimations& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& e : in.entries) write_track(w, e.weight, v);
}

TransparencyAnimations transform(const TransparencyAnimations& in, ConvertContext& ctx) {
    TransparencyAnimations out = in;
    for (auto& e : out.entries) ctx.convert(e.weight, "TRAN");
    return out;
}

size_t count(const TransparencyAnimations& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// TXAN
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, TextureTransforms& out) {
    auto n = read_count(r, 24, "texture transform");
    out.entries.resize(n);
    for (auto& e : out.entries) {
        e.translation = read_track<Vec3>(r, v);
        e.rotation = read_track<Quat>(r, v);
        e.scaling = read_track<Vec3>(r, v);
    }
    auto m = read_count(r, 2, "texture transform lookup");
    out.lookup = read_array<int16_t>(r, m, "texture transform lookup");
}

void encode(std::ostream& w, const TextureTransforms& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& e : in.entries) {
        write_track(w, e.translation, v);
        write_track(w, e.rotation, v);
        write_track(w, e.scaling, v);
    }
    write_u32(w, static_cast<uint32_t>(in.lookup.size()));
    write_array(w, in.lookup, "texture transform lookup");
}

TextureTransforms transform(const TextureTransforms& in, ConvertContext& ctx) {
    TextureTransforms out = in;
    for (auto& e : out.entries) {
        ctx.convert(e.translation, "TXAN");
        ctx.convert(e.rotation, "TXAN");
        ctx.convert(e.scaling, "TXAN");
    }
    return out;
}

size_t count(const TextureTransforms& in) { return in.entries.size(); }

} // namespace m2tools::m2::detail
