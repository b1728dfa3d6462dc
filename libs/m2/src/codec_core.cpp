#include "codecs.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace m2tools::m2::detail {

using namespace m2tools::binutil;
using version::Feature;

// ---------------------------------------------------------------------------
// VRTX
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion, Vertices& out) {
    out.vertices.resize(stride_count(r, 48));
    for (auto& vx : out.vertices) {
        vx.position = read_vec3(r);
        vx.bone_weights = read_pod<std::array<uint8_t, 4>>(r, "bone weights");
        vx.bone_indices = read_pod<std::array<uint8_t, 4>>(r, "bone indices");
        vx.normal = read_vec3(r);
        vx.tex_coords = read_pod<std::array<std::array<float, 2>, 2>>(r, "tex coords");
    }
}

void encode(std::ostream& w, const Vertices& in, FormatVersion) {
    for (const auto& vx : in.vertices) {
        write_vec3(w, vx.position);
        write_pod(w, vx.bone_weights, "bone weights");
        write_pod(w, vx.bone_indices, "bone indices");
        write_vec3(w, vx.normal);
        write_pod(w, vx.tex_coords, "tex coords");
    }
}

Vertices transform(const Vertices& in, ConvertContext&) { return in; }

size_t count(const Vertices& in) { return in.vertices.size(); }

// ---------------------------------------------------------------------------
// BONE
// ---------------------------------------------------------------------------

namespace {

constexpr float kQuatScale = 32767.0f;

int16_t compress_component(float v) {
    if (!(v >= -1.0f && v <= 1.0f))
        throw ConversionError(
            ConversionErrorKind::FieldOverflow, "BONE",
            std::format("BONE: quaternion component {} outside [-1, 1]", v));
    return static_cast<int16_t>(std::lround(v * kQuatScale));
}

} // namespace

void decode(std::istream& r, FormatVersion v, Bones& out) {
    auto n = read_count(r, 16, "bone");
    out.bones.resize(n);
    for (auto& b : out.bones) {
        b.key_bone_id = read_i32(r);
        b.flags = read_u32(r);
        b.parent_bone = read_i16(r);
        b.submesh_id = read_u16(r);
        if (version::has(v, Feature::CompressedQuaternions))
            b.bone_name_crc = read_u32(r);
        b.translation = read_track<Vec3>(r, v);
        if (version::has(v, Feature::CompressedQuaternions))
            b.rotation = read_track<CompQuat>(r, v);
        else
            b.rotation = read_track<Quat>(r, v);
        b.scale = read_track<Vec3>(r, v);
        b.pivot = read_vec3(r);
    }
}

void encode(std::ostream& w, const Bones& in, FormatVersion v) {
    bool compressed = version::has(v, Feature::CompressedQuaternions);
    write_u32(w, static_cast<uint32_t>(in.bones.size()));
    for (size_t i = 0; i < in.bones.size(); ++i) {
        const auto& b = in.bones[i];
        write_i32(w, b.key_bone_id);
        write_u32(w, b.flags);
        write_i16(w, b.parent_bone);
        write_u16(w, b.submesh_id);
        if (compressed) write_u32(w, b.bone_name_crc);
        write_track(w, b.translation, v);
        if (compressed) {
            const auto* rot = std::get_if<Track<CompQuat>>(&b.rotation);
            if (!rot)
                throw std::runtime_error(std::format(
                    "BONE: bone {} holds float rotations, {} needs compressed ones", i,
                    version::name(v)));
            write_track(w, *rot, v);
        } else {
            const auto* rot = std::get_if<Track<Quat>>(&b.rotation);
            if (!rot)
                throw std::runtime_error(std::format(
                    "BONE: bone {} holds compressed rotations, {} needs float ones", i,
                    version::name(v)));
            write_track(w, *rot, v);
        }
        write_track(w, b.scale, v);
        write_vec3(w, b.pivot);
    }
}

Bones transform(const Bones& in, ConvertContext& ctx) {
    Bones out = in;
    bool gains = ctx.gains(Feature::CompressedQuaternions);
    bool loses = ctx.loses(Feature::CompressedQuaternions);
    for (auto& b : out.bones) {
        ctx.convert(b.translation, "BONE");
        ctx.convert(b.scale, "BONE");
        std::visit([&](auto& t) { ctx.convert(t, "BONE"); }, b.rotation);

        if (gains) {
            const auto& src = std::get<Track<Quat>>(b.rotation);
            b.rotation = map_track_values<CompQuat>(src, [](const Quat& q) {
                return CompQuat{compress_component(q[0]), compress_component(q[1]),
                                compress_component(q[2]), compress_component(q[3])};
            });
            b.bone_name_crc = 0;
        } else if (loses) {
            const auto& src = std::get<Track<CompQuat>>(b.rotation);
            b.rotation = map_track_values<Quat>(src, [](const CompQuat& q) {
                return Quat{q[0] / kQuatScale, q[1] / kQuatScale, q[2] / kQuatScale,
                            q[3] / kQuatScale};
            });
            b.bone_name_crc = 0;
        }
    }
    if (loses && !out.bones.empty())
        ctx.note(std::format("BONE: {} rotation tracks widened to float, name CRCs dropped",
                             out.bones.size()));
    return out;
}

size_t count(const Bones& in) { return in.bones.size(); }

// ---------------------------------------------------------------------------
// SEQS
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, Sequences& out) {
    bool per_seq = version::has(v, Feature::PerSequenceTracks);
    bool split = version::has(v, Feature::SplitBlendTime);
    auto n = read_count(r, 60, "sequence");
    out.sequences.resize(n);
    for (auto& s : out.sequences) {
        s.id = read_u16(r);
        s.variation_index = read_u16(r);
        if (per_seq) {
            s.duration = read_u32(r);
        } else {
            s.start_timestamp = read_u32(r);
            s.end_timestamp = read_u32(r);
        }
        s.move_speed = read_f32(r);
        s.flags = read_u32(r);
        s.frequency = read_i16(r);
        s.padding = read_u16(r);
        s.replay_min = read_u32(r);
        s.replay_max = read_u32(r);
        if (split) {
            s.blend_time_in = read_u16(r);
            s.blend_time_out = read_u16(r);
        } else {
            s.blend_time = read_u32(r);
        }
        s.bounds_min = read_vec3(r);
        s.bounds_max = read_vec3(r);
        s.bounds_radius = read_f32(r);
        s.variation_next = read_i16(r);
        s.alias_next = read_u16(r);
    }
    auto g = read_count(r, 4, "global sequence");
    out.global_sequences = read_array<uint32_t>(r, g, "global sequence");
    auto m = read_count(r, 2, "sequence lookup");
    out.lookup = read_array<int16_t>(r, m, "sequence lookup");
}

void encode(std::ostream& w, const Sequences& in, FormatVersion v) {
    bool per_seq = version::has(v, Feature::PerSequenceTracks);
    bool split = version::has(v, Feature::SplitBlendTime);
    write_u32(w, static_cast<uint32_t>(in.sequences.size()));
    for (const auto& s : in.sequences) {
        write_u16(w, s.id);
        write_u16(w, s.variation_index);
        if (per_seq) {
            write_u32(w, s.duration);
        } else {
            write_u32(w, s.start_timestamp);
            write_u32(w, s.end_timestamp);
        }
        write_f32(w, s.move_speed);
        write_u32(w, s.flags);
        write_i16(w, s.frequency);
        write_u16(w, s.padding);
        write_u32(w, s.replay_min);
        write_u32(w, s.replay_max);
        if (split) {
            write_u16(w, s.blend_time_in);
            write_u16(w, s.blend_time_out);
        } else {
            write_u32(w, s.blend_time);
        }
        write_vec3(w, s.bounds_min);
        write_vec3(w, s.bounds_max);
        write_f32(w, s.bounds_radius);
        write_i16(w, s.variation_next);
        write_u16(w, s.alias_next);
    }
    write_u32(w, static_cast<uint32_t>(in.global_sequences.size()));
    write_array(w, in.global_sequences, "global sequence");
    write_u32(w, static_cast<uint32_t>(in.lookup.size()));
    write_array(w, in.lookup, "sequence lookup");
}

Sequences transform(const Sequences& in, ConvertContext& ctx) {
    Sequences out = in;

    if (ctx.gains(Feature::PerSequenceTracks)) {
        for (size_t i = 0; i < out.sequences.size(); ++i) {
            auto& s = out.sequences[i];
            if (s.end_timestamp < s.start_timestamp)
                throw ConversionError(
                    ConversionErrorKind::FieldOverflow, "SEQS",
                    std::format("SEQS: sequence {} ends at {} before its start {}", i,
                                s.end_timestamp, s.start_timestamp));
            s.duration = s.end_timestamp - s.start_timestamp;
            s.start_timestamp = 0;
            s.end_timestamp = 0;
        }
    } else if (ctx.loses(Feature::PerSequenceTracks)) {
        uint64_t cursor = 0;
        for (size_t i = 0; i < out.sequences.size(); ++i) {
            auto& s = out.sequences[i];
            uint64_t end = cursor + s.duration;
            if (end > std::numeric_limits<uint32_t>::max())
                throw ConversionError(
                    ConversionErrorKind::FieldOverflow, "SEQS",
                    std::format("SEQS: sequence {} ends at {}, past the u32 timeline", i, end));
            s.start_timestamp = static_cast<uint32_t>(cursor);
            s.end_timestamp = static_cast<uint32_t>(end);
            s.duration = 0;
            cursor = end;
        }
        if (!out.sequences.empty())
            ctx.note(std::format("SEQS: {} sequences laid out back to back on a shared timeline",
                                 out.sequences.size()));
    }

    if (ctx.gains(Feature::SplitBlendTime)) {
        for (size_t i = 0; i < out.sequences.size(); ++i) {
            auto& s = out.sequences[i];
            if (s.blend_time > std::numeric_limits<uint16_t>::max())
                throw ConversionError(
                    ConversionErrorKind::FieldOverflow, "SEQS",
                    std::format("SEQS: sequence {} blend time {} does not fit in 16 bits", i,
                                s.blend_time));
            s.blend_time_in = static_cast<uint16_t>(s.blend_time);
            s.blend_time_out = static_cast<uint16_t>(s.blend_time);
            s.blend_time = 0;
        }
    } else if (ctx.loses(Feature::SplitBlendTime)) {
        size_t merged = 0;
        for (auto& s : out.sequences) {
            if (s.blend_time_in != s.blend_time_out) ++merged;
            s.blend_time = std::max(s.blend_time_in, s.blend_time_out);
            s.blend_time_in = 0;
            s.blend_time_out = 0;
        }
        if (merged > 0)
            ctx.note(std::format("SEQS: {} sequences with distinct blend in/out times merged",
                                 merged));
    }
    return out;
}

size_t count(const Sequences& in) { return in.sequences.size(); }

// ---------------------------------------------------------------------------
// PLAY
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion, PlayableAnimations& out) {
    out.entries.resize(stride_count(r, 4));
    for (auto& e : out.entries) {
        e.fallback_animation_id = read_u16(r);
        e.flags = read_u16(r);
    }
}

void encode(std::ostream& w, const PlayableAnimations& in, FormatVersion) {
    for (const auto& e : in.entries) {
        write_u16(w, e.fallback_animation_id);
        write_u16(w, e.flags);
    }
}

PlayableAnimations transform(const PlayableAnimations& in, ConvertContext&) { return in; }

size_t count(const PlayableAnimations& in) { return in.entries.size(); }

} // namespace m2tools::m2::detail
