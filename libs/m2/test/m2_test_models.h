#pragma once

// Small but complete models used by the m2 tests.

#include "m2tools/m2.h"

#include <cstdint>
#include <vector>

namespace m2tools::m2::testing {

inline bool per_sequence(FormatVersion v) {
    return version::has(v, version::Feature::PerSequenceTracks);
}

// animated builds a track over the two fixture sequences: keys at 0 and 500
// in the first sequence and at 500 in the second (1500 on the shared
// timeline, where the second sequence starts at 1000).
template <typename T>
Track<T> animated(FormatVersion v, const std::vector<T>& values) {
    Track<T> t;
    t.interpolation = static_cast<uint16_t>(Interpolation::Linear);
    if (!per_sequence(v)) {
        t.ranges = {{0, 2}, {2, 3}};
        t.sequences = {TrackKeys<T>{{0, 500, 1500}, values}};
    } else {
        t.sequences = {TrackKeys<T>{{0, 500}, {values[0], values[1]}},
                       TrackKeys<T>{{500}, {values[2]}}};
    }
    return t;
}

inline Sequences make_sequences(FormatVersion v) {
    Sequences seqs;
    for (int i = 0; i < 2; ++i) {
        Sequence s;
        s.id = i == 0 ? 0 : 4; // Stand, Walk
        s.move_speed = i == 0 ? 0.0f : 2.5f;
        s.flags = 0x20;
        s.frequency = 32767;
        uint32_t start = i == 0 ? 0 : 1000;
        uint32_t length = i == 0 ? 1000 : 2000;
        if (per_sequence(v)) {
            s.duration = length;
        } else {
            s.start_timestamp = start;
            s.end_timestamp = start + length;
        }
        if (version::has(v, version::Feature::SplitBlendTime)) {
            s.blend_time_in = 150;
            s.blend_time_out = 150;
        } else {
            s.blend_time = 150;
        }
        s.bounds_min = {-1.0f, -1.0f, 0.0f};
        s.bounds_max = {1.0f, 1.0f, 2.0f};
        s.bounds_radius = 1.5f;
        seqs.sequences.push_back(s);
    }
    seqs.lookup = {0, -1, -1, -1, 1};
    return seqs;
}

inline Bones make_bones(FormatVersion v) {
    Bones bones;
    for (int i = 0; i < 2; ++i) {
        Bone b;
        b.key_bone_id = i == 0 ? 26 : -1;
        b.parent_bone = static_cast<int16_t>(i - 1);
        b.pivot = {0.0f, 0.0f, static_cast<float>(i)};
        if (version::has(v, version::Feature::CompressedQuaternions))
            b.rotation = Track<CompQuat>{};
        if (i == 1) {
            b.translation = animated<Vec3>(v, {{0, 0, 0}, {0, 0, 1}, {0, 0, 2}});
            if (version::has(v, version::Feature::CompressedQuaternions))
                b.rotation = animated<CompQuat>(
                    v, {{0, 0, 0, 32767}, {0, 0, 32767, 0}, {0, 0, 0, -32767}});
            else
                b.rotation = animated<Quat>(v, {{0, 0, 0, 1}, {0, 0, 1, 0}, {0, 0, 0, -1}});
        }
        bones.bones.push_back(std::move(b));
    }
    return bones;
}

// make_model returns a model that validates cleanly in version v.
inline Model make_model(FormatVersion v) {
    Model m;
    m.header.version = v;
    m.header.header_number = version::header_number(v);
    m.header.global_flags = 0x1;
    m.header.skin_profile_count = 1;
    m.header.bounding_box_min = {-1.0f, -1.0f, 0.0f};
    m.header.bounding_box_max = {1.0f, 1.0f, 2.0f};
    m.header.bounding_radius = 1.5f;
    m.header.collision_radius = 1.0f;
    m.header.name = "test_model";

    Vertices vrtx;
    for (uint8_t i = 0; i < 2; ++i) {
        Vertex vx;
        vx.position = {static_cast<float>(i), 0.0f, 0.0f};
        vx.bone_weights = {255, 0, 0, 0};
        vx.bone_indices = {i, 0, 0, 0};
        vx.normal = {0.0f, 0.0f, 1.0f};
        vrtx.vertices.push_back(vx);
    }
    m.set(vrtx);
    m.set(make_bones(v));
    m.set(make_sequences(v));
    if (!per_sequence(v)) m.set(PlayableAnimations{{{0, 0}, {4, 0}}});

    m.set(Textures{{{0, 0, "textures/body.blp"}}});
    m.set(Materials{{{0, 2}}});

    Attachment atch;
    atch.id = 1;
    atch.bone = 1;
    atch.position = {0.0f, 0.0f, 1.0f};
    atch.animate_attached = animated<uint8_t>(v, {1, 1, 0});
    m.set(Attachments{{atch}});

    Camera cam;
    cam.type = 0;
    cam.far_clip = 100.0f;
    cam.near_clip = 0.1f;
    cam.position_base = {0.0f, 5.0f, 1.0f};
    if (version::has(v, version::Feature::AnimatedCameraFov)) {
        cam.fov_track.sequences = {TrackKeys<float>{{0}, {0.8f}}, TrackKeys<float>{{0}, {0.8f}}};
    } else {
        cam.fov = 0.8f;
    }
    m.set(Cameras{{cam}});

    if (v >= FormatVersion::Legion) {
        m.set(TextureCombiners{{{0, 0}}});
        SkinFileIds sfid;
        sfid.file_ids = {1234};
        m.set(sfid);
    }
    return m;
}

} // namespace m2tools::m2::testing
