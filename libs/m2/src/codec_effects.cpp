#include "codecs.h"

#include <format>

namespace m2tools::m2::detail {

using namespace m2tools::binutil;
using version::Feature;

// ---------------------------------------------------------------------------
// PRTE
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, ParticleEmitters& out) {
    bool wind = version::has(v, Feature::ParticleWind);
    auto n = read_count(r, 64, "particle emitter");
    out.emitters.resize(n);
    for (auto& p : out.emitters) {
        p.id = read_i32(r);
        p.flags = read_u32(r);
        p.position = read_vec3(r);
        p.bone = read_u16(r);
        p.texture = read_u16(r);
        p.geometry_model = read_string(r);
        p.recursion_model = read_string(r);
        p.blending_type = read_u8(r);
        p.emitter_type = read_u8(r);
        p.particle_color_index = read_u16(r);
        p.particle_type = read_u8(r);
        p.head_or_tail = read_u8(r);
        p.texture_tile_rotation = read_u16(r);
        p.texture_rows = read_u16(r);
        p.texture_cols = read_u16(r);
        p.emission_speed = read_track<float>(r, v);
        p.speed_variation = read_track<float>(r, v);
        p.vertical_range = read_track<float>(r, v);
        p.horizontal_range = read_track<float>(r, v);
        p.gravity = read_track<float>(r, v);
        p.lifespan = read_track<float>(r, v);
        p.emission_rate = read_track<float>(r, v);
        p.z_source = read_track<float>(r, v);
        p.enabled = read_track<uint8_t>(r, v);
        p.mid_point = read_f32(r);
        p.colors = read_pod<std::array<std::array<uint8_t, 4>, 3>>(r, "particle colors");
        p.scales = read_vec3(r);
        p.drag = read_f32(r);
        p.spin = read_f32(r);
        if (wind) {
            p.wind_vector = read_vec3(r);
            p.wind_time = read_f32(r);
            p.follow_speed1 = read_f32(r);
            p.follow_scale1 = read_f32(r);
            p.follow_speed2 = read_f32(r);
            p.follow_scale2 = read_f32(r);
        }
    }
}

void encode(std::ostream& w, const ParticleEmitters& in, FormatVersion v) {
    bool wind = version::has(v, Feature::ParticleWind);
    write_u32(w, static_cast<uint32_t>(in.emitters.size()));
    for (const auto& p : in.emitters) {
        write_i32(w, p.id);
        write_u32(w, p.flags);
        write_vec3(w, p.position);
        write_u16(w, p.bone);
        write_u16(w, p.texture);
        write_string(w, p.geometry_model);
        write_string(w, p.recursion_model);
        write_u8(w, p.blending_type);
        write_u8(w, p.emitter_type);
        write_u16(w, p.particle_color_index);
        write_u8(w, p.particle_type);
        write_u8(w, p.head_or_tail);
        write_u16(w, p.texture_tile_rotation);
        write_u16(w, p.texture_rows);
        write_u16(w, p.texture_cols);
        write_track(w, p.emission_speed, v);
        write_track(w, p.speed_variation, v);
        write_track(w, p.vertical_range, v);
        write_track(w, p.horizontal_range, v);
        write_track(w, p.gravity, v);
        write_track(w, p.lifespan, v);
        write_track(w, p.emission_rate, v);
        write_track(w, p.z_source, v);
        write_track(w, p.enabled, v);
        write_f32(w, p.mid_point);
        write_pod(w, p.colors, "particle colors");
        write_vec3(w, p.scales);
        write_f32(w, p.drag);
        write_f32(w, p.spin);
        if (wind) {
            write_vec3(w, p.wind_vector);
            write_f32(w, p.wind_time);
            write_f32(w, p.follow_speed1);
            write_f32(w, p.follow_scale1);
            write_f32(w, p.follow_speed2);
            write_f32(w, p.follow_scale2);
        }
    }
}

ParticleEmitters transform(const ParticleEmitters& in, ConvertContext& ctx) {
    ParticleEmitters out = in;
    size_t unpacked = 0;
    for (auto& p : out.emitters) {
        ctx.convert(p.emission_speed, "PRTE");
        ctx.convert(p.speed_variation, "PRTE");
        ctx.convert(p.vertical_range, "PRTE");
        ctx.convert(p.horizontal_range, "PRTE");
        ctx.convert(p.gravity, "PRTE");
        ctx.convert(p.lifespan, "PRTE");
        ctx.convert(p.emission_rate, "PRTE");
        ctx.convert(p.z_source, "PRTE");
        ctx.convert(p.enabled, "PRTE");

        if (ctx.crosses(Feature::ParticleWind)) {
            p.wind_vector = {0.0f, 0.0f, 0.0f};
            p.wind_time = 0.0f;
            p.follow_speed1 = 0.0f;
            p.follow_scale1 = 0.0f;
            p.follow_speed2 = 0.0f;
            p.follow_scale2 = 0.0f;
        }
        if (ctx.loses(Feature::MultiTextureParticles) && (p.flags & kParticleMultiTexture)) {
            p.flags &= ~kParticleMultiTexture;
            p.texture = packed_texture(p.texture, 0);
            ++unpacked;
        }
    }
    if (ctx.loses(Feature::ParticleWind) && !out.emitters.empty())
        ctx.note(std::format("PRTE: wind block dropped from {} emitters", out.emitters.size()));
    if (unpacked > 0)
        ctx.note(std::format("PRTE: {} multi-texture emitters reduced to their first texture",
                             unpacked));
    return out;
}

size_t count(const ParticleEmitters& in) { return in.emitters.size(); }

// ---------------------------------------------------------------------------
// EXP2
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, ExtendedParticles& out) {
    auto n = read_count(r, 20, "extended particle");
    out.entries.resize(n);
    for (auto& e : out.entries) {
        e.z_source = read_f32(r);
        e.color_mult = read_f32(r);
        e.alpha_mult = read_f32(r);
        e.alpha_cutoff = read_track<Fixed16>(r, v);
    }
}

void encode(std::ostream& w, const ExtendedParticles& in, FormatVersion v) {
    write_u32(w, static_cast<uint32_t>(in.entries.size()));
    for (const auto& e : in.entries) {
        write_f32(w, e.z_source);
        write_f32(w, e.color_mult);
        write_f32(w, e.alpha_mult);
        write_track(w, e.alpha_cutoff, v);
    }
}

ExtendedParticles transform(const ExtendedParticles& in, ConvertContext& ctx) {
    ExtendedParticles out = in;
    for (auto& e : out.entries) ctx.convert(e.alpha_cutoff, "EXP2");
    return out;
}

size_t count(const ExtendedParticles& in) { return in.entries.size(); }

// ---------------------------------------------------------------------------
// RIBB
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, RibbonEmitters& out) {
    bool priority = version::has(v, Feature::RibbonPriorityPlane);
    auto n = read_count(r, 48, "ribbon emitter");
    out.ribbons.resize(n);
    for (auto& rb : out.ribbons) {
        rb.id = read_i32(r);
        rb.bone = read_u32(r);
        rb.position = read_vec3(r);
        auto tn = read_count(r, 2, "ribbon texture");
        rb.texture_indices = read_array<uint16_t>(r, tn, "ribbon texture");
        auto mn = read_count(r, 2, "ribbon material");
        rb.material_indices = read_array<uint16_t>(r, mn, "ribbon material");
        rb.color = read_track<Vec3>(r, v);
        rb.alpha = read_track<Fixed16>(r, v);
        rb.height_above = read_track<float>(r, v);
        rb.height_below = read_track<float>(r, v);
        rb.edges_per_second = read_f32(r);
        rb.edge_lifetime = read_f32(r);
        rb.gravity = read_f32(r);
        rb.texture_rows = read_u16(r);
        rb.texture_cols = read_u16(r);
        rb.tex_slot = read_track<uint16_t>(r, v);
        rb.visibility = read_track<uint8_t>(r, v);
        if (priority) {
            rb.priority_plane = read_i16(r);
            rb.padding = read_u16(r);
        }
    }
}

void encode(std::ostream& w, const RibbonEmitters& in, FormatVersion v) {
    bool priority = version::has(v, Feature::RibbonPriorityPlane);
    write_u32(w, static_cast<uint32_t>(in.ribbons.size()));
    for (const auto& rb : in.ribbons) {
        write_i32(w, rb.id);
        write_u32(w, rb.bone);
        write_vec3(w, rb.position);
        write_u32(w, static_cast<uint32_t>(rb.texture_indices.size()));
        write_array(w, rb.texture_indices, "ribbon texture");
        write_u32(w, static_cast<uint32_t>(rb.material_indices.size()));
        write_array(w, rb.material_indices, "ribbon material");
        write_track(w, rb.color, v);
        write_track(w, rb.alpha, v);
        write_track(w, rb.height_above, v);
        write_track(w, rb.height_below, v);
        write_f32(w, rb.edges_per_second);
        write_f32(w, rb.edge_lifetime);
        write_f32(w, rb.gravity);
        write_u16(w, rb.texture_rows);
        write_u16(w, rb.texture_cols);
        write_track(w, rb.tex_slot, v);
        write_track(w, rb.visibility, v);
        if (priority) {
            write_i16(w, rb.priority_plane);
            write_u16(w, rb.padding);
        }
    }
}

RibbonEmitters transform(const RibbonEmitters& in, ConvertContext& ctx) {
    RibbonEmitters out = in;
    for (auto& rb : out.ribbons) {
        ctx.convert(rb.color, "RIBB");
        ctx.convert(rb.alpha, "RIBB");
        ctx.convert(rb.height_above, "RIBB");
        ctx.convert(rb.height_below, "RIBB");
        ctx.convert(rb.tex_slot, "RIBB");
        ctx.convert(rb.visibility, "RIBB");
        if (ctx.crosses(Feature::RibbonPriorityPlane)) {
            rb.priority_plane = 0;
            rb.padding = 0;
        }
    }
    return out;
}

size_t count(const RibbonEmitters& in) { return in.ribbons.size(); }

// ---------------------------------------------------------------------------
// PHYS
// ---------------------------------------------------------------------------

void decode(std::istream& r, FormatVersion v, Physics& out) {
    bool material = version::has(v, Feature::PhysicsMaterial);
    auto n = read_count(r, 28, "physics shape");
    out.shapes.resize(n);
    for (auto& s : out.shapes) {
        s.type = read_u16(r);
        s.bone = read_u16(r);
        s.position = read_vec3(r);
        s.dimensions = read_vec3(r);
        if (material) {
            s.friction = read_f32(r);
            s.restitution = read_f32(r);
            s.density = read_f32(r);
        }
    }
    auto j = read_count(r, 20, "physics joint");
    out.joints.resize(j);
    for (auto& jt : out.joints) {
        jt.shape_a = read_u16(r);
        jt.shape_b = read_u16(r);
        jt.type = read_u16(r);
        jt.padding = read_u16(r);
        jt.anchor = read_vec3(r);
    }
}

void encode(std::ostream& w, const Physics& in, FormatVersion v) {
    bool material = version::has(v, Feature::PhysicsMaterial);
    write_u32(w, static_cast<uint32_t>(in.shapes.size()));
    for (const auto& s : in.shapes) {
        write_u16(w, s.type);
        write_u16(w, s.bone);
        write_vec3(w, s.position);
        write_vec3(w, s.dimensions);
        if (material) {
            write_f32(w, s.friction);
            write_f32(w, s.restitution);
            write_f32(w, s.density);
        }
    }
    write_u32(w, static_cast<uint32_t>(in.joints.size()));
    for (const auto& jt : in.joints) {
        write_u16(w, jt.shape_a);
        write_u16(w, jt.shape_b);
        write_u16(w, jt.type);
        write_u16(w, jt.padding);
        write_vec3(w, jt.anchor);
    }
}

Physics transform(const Physics& in, ConvertContext& ctx) {
    Physics out = in;
    if (ctx.gains(Feature::PhysicsMaterial)) {
        for (auto& s : out.shapes) {
            s.friction = 0.5f;
            s.restitution = 0.0f;
            s.density = 1.0f;
        }
    } else if (ctx.loses(Feature::PhysicsMaterial)) {
        for (auto& s : out.shapes) {
            s.friction = 0.0f;
            s.restitution = 0.0f;
            s.density = 0.0f;
        }
        if (!out.shapes.empty())
            ctx.note(std::format("PHYS: material block dropped from {} shapes",
                                 out.shapes.size()));
    }
    return out;
}

size_t count(const Physics& in) { return in.shapes.size(); }

} // namespace m2tools::m2::detail
