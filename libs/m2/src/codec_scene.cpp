#include "codecs.h"

#include <format>

namespace m2tools::m2::detail {

using namespace m2tools::binutil;
using version::Feature;

// ---------------------------------------------------------------------------
// ATCH
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, Attachments& out) {
    auto n = read_count(r, 28, "attachment");
    out.entries.resize(n);
    for (auto& a : out.entries) {
        a.id = read_u32(r);
        a.bone = read_u16(r);
        a.unknown = read_u16(r);
        a.position = read_vec3(r);
        a.animate_attached = read_track<uint8_t>(r, v);
    }
}

void encode(std::ostream& w, const Attachments& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& a : in.entries) {
        write_u32(w, a.id);
        write_u16(w, a.bone);
        write_u16(w, a.unknown);
        write_vec3(w, a.position);
        write_track(w, a.animate_attached, v);
    }
}

Attachments transform(const Attachments& in, ConvertContext& ctx) {
    Attachments out = in;
    for (auto& a : out.entries) ctx.convert(a.animate_attached, "ATCH");
    return out;
}

size_t count(const Attachments& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// EVTS
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, Events& out) {
    auto n = read_count(r, 32, "event");
    out.entries.resize(n);
    for (auto& e : out.entries) {
        e.identifier = read_pod<std::array<char, 4>>(r, "event identifier");
        e.data = read_u32(r);
        e.bone = read_u32(r);
        e.position = read_vec3(r);
        e.enabled = read_track<NoValue>(r, v);
    }
}

void encode(std::ostream& w, const Events& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& e : in.entries) {
        write_pod(w, e.identifier, "event identifier");
        write_u32(w, e.data);
        write_u32(w, e.bone);
        write_vec3(w, e.position);
        write_track(w, e.enabled, v);
    }
}

Events transform(const Events& in, ConvertContext& ctx) {
    Events out = in;
    for (auto& e : out.entries) ctx.convert(e.enabled, "EVTS");
    return out;
}

size_t count(const Events& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// LITE
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, Lights& out) {
    auto n = read_count(r, 16, "light");
    out.entries.resize(n);
    for (auto& l : out.entries) {
        l.type = read_u16(r);
        l.bone = read_i16(r);
        l.position = read_vec3(r);
        l.ambient_color = read_track<Vec3>(r, v);
        l.ambient_intensity = read_track<float>(r, v);
        l.diffuse_color = read_track<Vec3>(r, v);
        l.diffuse_intensity = read_track<float>(r, v);
        l.attenuation_start = read_track<float>(r, v);
        l.attenuation_end = read_track<float>(r, v);
        l.visibility = read_track<uint8_t>(r, v);
    }
}

void encode(std::ostream& w, const Lights& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& l : in.entries) {
        write_u16(w, l.type);
        write_i16(w, l.bone);
        write_vec3(w, l.position);
        write_track(w, l.ambient_color, v);
        write_track(w, l.ambient_intensity, v);
        write_track(w, l.diffuse_color, v);
        write_track(w, l.diffuse_intensity, v);
        write_track(w, l.attenuation_start, v);
        write_track(w, l.attenuation_end, v);
        write_track(w, l.visibility, v);
    }
}

Lights transform(const Lights& in, ConvertContext& ctx) {
    Lights out = in;
    for (auto& l : out.entries) {
        ctx.convert(l.ambient_color, "LITE");
        ctx.convert(l.ambient_intensity, "LITE");
        ctx.convert(l.diffuse_color, "LITE");
        ctx.convert(l.diffuse_intensity, "LITE");
        ctx.convert(l.attenuation_start, "LITE");
        ctx.convert(l.attenuation_end, "LITE");
        ctx.convert(l.visibility, "LITE");
    }
    return out;
}

size_t count(const Lights& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// CAMS
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, Cameras& out) {
    bool fov_track = version::has(v, Feature::AnimatedCameraFov);
    auto n = read_count(r, 40, "camera");
    out.entries.resize(n);
    for (auto& c : out.entries) {
        c.type = read_u32(r);
        if (!fov_track) c.fov = read_f32(r);
        c.far_clip = read_f32(r);
        c.near_clip = read_f32(r);
        c.positions = read_track<Vec3>(r, v);
        c.position_base = read_vec3(r);
        c.target_positions = read_track<Vec3>(r, v);
        c.target_position_base = read_vec3(r);
        c.roll = read_track<float>(r, v);
        if (fov_track) c.fov_track = read_track<float>(r, v);
    }
}

void encode(std::ostream& w, const Cameras& in, FormatVersion v) {
    bool fov_track = version::has(v, Feature::AnimatedCameraFov);
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& c : in.entries) {
        write_u32(w, c.type);
        if (!fov_track) write_f32(w, c.fov);
        write_f32(w, c.far_clip);
        write_f32(w, c.near_clip);
        write_track(w, c.positions, v);
        write_vec3(w, c.position_base);
        write_track(w, c.target_positions, v);
        write_vec3(w, c.target_position_base);
        write_track(w, c.roll, v);
        if (fov_track) write_track(w, c.fov_track, v);
    }
}

Cameras transform(const Cameras& in, ConvertContext& ctx) {
    Cameras out = in;
    for (auto& c : out.entries) {
        ctx.convert(c.positions, "CAMS");
        ctx.convert(c.target_positions, "CAMS");
        ctx.convert(c.roll, "CAMS");

        if (ctx.gains(Feature::AnimatedCameraFov)) {
            // One constant key per sequence keeps the track count consistent.
            c.fov_track = Track<float>{};
            for (size_t i = 0; i < ctx.tracks.target_starts.size(); ++i)
                c.fov_track.sequences.push_back(TrackKeys<float>{{0}, {c.fov}});
            c.fov = 0.0f;
        } else if (ctx.loses(Feature::AnimatedCameraFov)) {
            float fov = kDefaultCameraFov;
            for (const auto& keys : c.fov_track.sequences) {
                if (!keys.values.empty()) {
                    fov = keys.values.front();
                    break;
                }
            }
            if (c.fov_track.key_count() > 1)
                ctx.note(std::format("CAMS: animated field of view flattened to {}", fov));
            c.fov = fov;
            c.fov_track = Track<float>{};
        } else {
            ctx.convert(c.fov_track, "CAMS");
        }
    }
    return out;
}

size_t count(const Cameras& in) { return in.entries.size(); }

} // namespace m2tools::m2::detail
