#pragma once

#include "m2tools/chunk.h"
#include "m2tools/m2_track.h"

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace m2tools::m2 {

// Decoded chunk payloads. Fields that exist only in some versions are always
// present in memory and stay zero outside their version range.

// --- VRTX ---

struct Vertex {
    Vec3 position = {0.0f, 0.0f, 0.0f};
    std::array<uint8_t, 4> bone_weights = {0, 0, 0, 0};
    std::array<uint8_t, 4> bone_indices = {0, 0, 0, 0};
    Vec3 normal = {0.0f, 0.0f, 0.0f};
    std::array<std::array<float, 2>, 2> tex_coords = {};

    bool operator==(const Vertex&) const = default;
};

struct Vertices {
    static constexpr chunk::Tag kTag{"VRTX"};
    std::vector<Vertex> vertices;

    bool operator==(const Vertices&) const = default;
};

// --- BONE ---

// BoneRotation holds float quaternions (Classic) or compressed quaternions.
using BoneRotation = std::variant<Track<Quat>, Track<CompQuat>>;

struct Bone {
    int32_t key_bone_id = -1;
    uint32_t flags = 0;
    int16_t parent_bone = -1;
    uint16_t submesh_id = 0;
    uint32_t bone_name_crc = 0; // TBC+
    Track<Vec3> translation;
    BoneRotation rotation;
    Track<Vec3> scale;
    Vec3 pivot = {0.0f, 0.0f, 0.0f};

    bool operator==(const Bone&) const = default;
};

struct Bones {
    static constexpr chunk::Tag kTag{"BONE"};
    std::vector<Bone> bones;

    bool operator==(const Bones&) const = default;
};

// --- SEQS ---

inline constexpr uint32_t kSequenceAliasFlag = 0x40;

struct Sequence {
    uint16_t id = 0;
    uint16_t variation_index = 0;
    uint32_t start_timestamp = 0; // before WotLK
    uint32_t end_timestamp = 0;   // before WotLK
    uint32_t duration = 0;        // WotLK+
    float move_speed = 0.0f;
    uint32_t flags = 0;
    int16_t frequency = 0;
    uint16_t padding = 0;
    uint32_t replay_min = 0;
    uint32_t replay_max = 0;
    uint32_t blend_time = 0;      // before MoP
    uint16_t blend_time_in = 0;   // MoP+
    uint16_t blend_time_out = 0;  // MoP+
    Vec3 bounds_min = {0.0f, 0.0f, 0.0f};
    Vec3 bounds_max = {0.0f, 0.0f, 0.0f};
    float bounds_radius = 0.0f;
    int16_t variation_next = -1;
    uint16_t alias_next = 0;

    bool operator==(const Sequence&) const = default;
};

struct Sequences {
    static constexpr chunk::Tag kTag{"SEQS"};
    std::vector<Sequence> sequences;
    std::vector<uint32_t> global_sequences; // loop lengths
    std::vector<int16_t> lookup;            // animation id -> sequence index

    bool operator==(const Sequences&) const = default;
};

// --- PLAY ---

struct PlayableAnimation {
    uint16_t fallback_animation_id = 0;
    uint16_t flags = 0;

    bool operator==(const PlayableAnimation&) const = default;
};

struct PlayableAnimations {
    static constexpr chunk::Tag kTag{"PLAY"};
    std::vector<PlayableAnimation> entries;

    bool operator==(const PlayableAnimations&) const = default;
};

// --- Single file ids (SKID, PFID) ---

struct SingleFileId {
    uint32_t file_id = 0;

    bool operator==(const SingleFileId&) const = default;
};

struct SkeletonFileId : SingleFileId {
    static constexpr chunk::Tag kTag{"SKID"};
};

struct PhysicsFileId : SingleFileId {
    static constexpr chunk::Tag kTag{"PFID"};
};

// --- File id tables (TXID, GPID, RPID, SFID, BFID) ---

struct FileIdTable {
    std::vector<uint32_t> file_ids;

    bool operator==(const FileIdTable&) const = default;
};

struct TextureFileIds : FileIdTable {
    static constexpr chunk::Tag kTag{"TXID"};
};

struct GeometryParticleIds : FileIdTable {
    static constexpr chunk::Tag kTag{"GPID"};
};

struct RecursiveParticleIds : FileIdTable {
    static constexpr chunk::Tag kTag{"RPID"};
};

struct SkinFileIds : FileIdTable {
    static constexpr chunk::Tag kTag{"SFID"};
};

struct BoneFileIds : FileIdTable {
    static constexpr chunk::Tag kTag{"BFID"};
};

// --- u16 tables (PGD1, PABC) ---

struct U16Table {
    std::vector<uint16_t> values;

    bool operator==(const U16Table&) const = default;
};

// ParticleGeosets holds the geoset of each particle emitter.
struct ParticleGeosets : U16Table {
    static constexpr chunk::Tag kTag{"PGD1"};
};

// ParentAnimationBlacklist lists animation ids not inherited from the parent
// skeleton.
struct ParentAnimationBlacklist : U16Table {
    static constexpr chunk::Tag kTag{"PABC"};
};

// --- TEXS ---

struct Texture {
    uint32_t type = 0;
    uint32_t flags = 0;
    std::string filename;

    bool operator==(const Texture&) const = default;
};

struct Textures {
    static constexpr chunk::Tag kTag{"TEXS"};
    std::vector<Texture> textures;

    bool operator==(const Textures&) const = default;
};

// --- MATS, TXAC ---

inline constexpr uint16_t kBlendAlphaKey = 1;
inline constexpr uint16_t kBlendAdd = 4;
inline constexpr uint16_t kBlendBlendAdd = 7; // Cataclysm+

struct Material {
    uint16_t flags = 0;
    uint16_t blend_mode = 0;

    bool operator==(const Material&) const = default;
};

struct Materials {
    static constexpr chunk::Tag kTag{"MATS"};
    std::vector<Material> materials;

    bool operator==(const Materials&) const = default;
};

struct TextureCombiners {
    static constexpr chunk::Tag kTag{"TXAC"};
    std::vector<std::array<uint8_t, 2>> entries; // one per material

    bool operator==(const TextureCombiners&) const = default;
};

// --- COLR, TRAN, TXAN ---

struct ColorAnimation {
    Track<Vec3> color;
    Track<Fixed16> alpha;

    bool operator==(const ColorAnimation&) const = default;
};

struct ColorAnimations {
    static constexpr chunk::Tag kTag{"COLR"};
    std::vector<ColorAnimation> entries;

    bool operator==(const ColorAnimations&) const = default;
};

struct TransparencyAnimation {
    Track<Fixed16> weight;

    bool operator==(const TransparencyAnimation&) const = default;
};

struct TransparencyAnimations {
    static constexpr chunk::Tag kTag{"TRAN"};
    std::vector<TransparencyAnimation> entries;

    bool operator==(const TransparencyAnimations&) const = default;
};

struct TextureTransform {
    Track<Vec3> translation;
    Track<Quat> rotation;
    Track<Vec3> scaling;

    bool operator==(const TextureTransform&) const = default;
};

struct TextureTransforms {
    static constexpr chunk::Tag kTag{"TXAN"};
    std::vector<TextureTransform> entries;
    std::vector<int16_t> lookup;

    bool operator==(const TextureTransforms&) const = default;
};

// --- ATCH, EVTS, LITE, CAMS ---

struct Attachment {
    uint32_t id = 0;
    uint16_t bone = 0;
    uint16_t unknown = 0;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    Track<uint8_t> animate_attached;

    bool operator==(const Attachment&) const = default;
};

struct Attachments {
    static constexpr chunk::Tag kTag{"ATCH"};
    std::vector<Attachment> entries;

    bool operator==(const Attachments&) const = default;
};

struct Event {
    std::array<char, 4> identifier = {0, 0, 0, 0};
    uint32_t data = 0;
    uint32_t bone = 0;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    Track<NoValue> enabled;

    bool operator==(const Event&) const = default;
};

struct Events {
    static constexpr chunk::Tag kTag{"EVTS"};
    std::vector<Event> entries;

    bool operator==(const Events&) const = default;
};

struct Light {
    uint16_t type = 0;
    int16_t bone = -1;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    Track<Vec3> ambient_color;
    Track<float> ambient_intensity;
    Track<Vec3> diffuse_color;
    Track<float> diffuse_intensity;
    Track<float> attenuation_start;
    Track<float> attenuation_end;
    Track<uint8_t> visibility;

    bool operator==(const Light&) const = default;
};

struct Lights {
    static constexpr chunk::Tag kTag{"LITE"};
    std::vector<Light> entries;

    bool operator==(const Lights&) const = default;
};

inline constexpr float kDefaultCameraFov = 0.7f;

struct Camera {
    uint32_t type = 0;
    float fov = 0.0f; // before Cataclysm
    float far_clip = 0.0f;
    float near_clip = 0.0f;
    Track<Vec3> positions;
    Vec3 position_base = {0.0f, 0.0f, 0.0f};
    Track<Vec3> target_positions;
    Vec3 target_position_base = {0.0f, 0.0f, 0.0f};
    Track<float> roll;
    Track<float> fov_track; // Cataclysm+

    bool operator==(const Camera&) const = default;
};

struct Cameras {
    static constexpr chunk::Tag kTag{"CAMS"};
    std::vector<Camera> entries;

    bool operator==(const Cameras&) const = default;
};

// --- PRTE, EXP2 ---

inline constexpr uint32_t kParticleMultiTexture = 0x10000000; // Cataclysm+
inline constexpr uint8_t kParticleTypeModel = 2;

// packed_texture returns texture index i (0..2) of a multi-texture emitter.
inline uint16_t packed_texture(uint16_t texture, int i) {
    return static_cast<uint16_t>((texture >> (5 * i)) & 0x1F);
}

struct ParticleEmitter {
    int32_t id = -1;
    uint32_t flags = 0;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    uint16_t bone = 0;
    uint16_t texture = 0;
    std::string geometry_model;
    std::string recursion_model;
    uint8_t blending_type = 0;
    uint8_t emitter_type = 0;
    uint16_t particle_color_index = 0;
    uint8_t particle_type = 0;
    uint8_t head_or_tail = 0;
    uint16_t texture_tile_rotation = 0;
    uint16_t texture_rows = 0;
    uint16_t texture_cols = 0;
    Track<float> emission_speed;
    Track<float> speed_variation;
    Track<float> vertical_range;
    Track<float> horizontal_range;
    Track<float> gravity;
    Track<float> lifespan;
    Track<float> emission_rate;
    Track<float> z_source;
    Track<uint8_t> enabled;
    float mid_point = 0.0f;
    std::array<std::array<uint8_t, 4>, 3> colors = {};
    Vec3 scales = {0.0f, 0.0f, 0.0f};
    float drag = 0.0f;
    float spin = 0.0f;
    // WotLK+ wind block
    Vec3 wind_vector = {0.0f, 0.0f, 0.0f};
    float wind_time = 0.0f;
    float follow_speed1 = 0.0f;
    float follow_scale1 = 0.0f;
    float follow_speed2 = 0.0f;
    float follow_scale2 = 0.0f;

    bool operator==(const ParticleEmitter&) const = default;
};

struct ParticleEmitters {
    static constexpr chunk::Tag kTag{"PRTE"};
    std::vector<ParticleEmitter> emitters;

    bool operator==(const ParticleEmitters&) const = default;
};

struct ExtendedParticle {
    float z_source = 0.0f;
    float color_mult = 0.0f;
    float alpha_mult = 0.0f;
    Track<Fixed16> alpha_cutoff;

    bool operator==(const ExtendedParticle&) const = default;
};

struct ExtendedParticles {
    static constexpr chunk::Tag kTag{"EXP2"};
    std::vector<ExtendedParticle> entries; // one per particle emitter

    bool operator==(const ExtendedParticles&) const = default;
};

// --- RIBB ---

struct RibbonEmitter {
    int32_t id = -1;
    uint32_t bone = 0;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    std::vector<uint16_t> texture_indices;
    std::vector<uint16_t> material_indices;
    Track<Vec3> color;
    Track<Fixed16> alpha;
    Track<float> height_above;
    Track<float> height_below;
    float edges_per_second = 0.0f;
    float edge_lifetime = 0.0f;
    float gravity = 0.0f;
    uint16_t texture_rows = 0;
    uint16_t texture_cols = 0;
    Track<uint16_t> tex_slot;
    Track<uint8_t> visibility;
    int16_t priority_plane = 0; // WotLK+
    uint16_t padding = 0;       // WotLK+

    bool operator==(const RibbonEmitter&) const = default;
};

struct RibbonEmitters {
    static constexpr chunk::Tag kTag{"RIBB"};
    std::vector<RibbonEmitter> ribbons;

    bool operator==(const RibbonEmitters&) const = default;
};

// --- PHYS ---

enum class ShapeType : uint16_t { Box = 0, Sphere = 1, Capsule = 2 };

struct PhysicsShape {
    uint16_t type = 0;
    uint16_t bone = 0;
    Vec3 position = {0.0f, 0.0f, 0.0f};
    Vec3 dimensions = {0.0f, 0.0f, 0.0f};
    // WoD+ material block
    float friction = 0.0f;
    float restitution = 0.0f;
    float density = 0.0f;

    bool operator==(const PhysicsShape&) const = default;
};

struct PhysicsJoint {
    uint16_t shape_a = 0;
    uint16_t shape_b = 0;
    uint16_t type = 0;
    uint16_t padding = 0;
    Vec3 anchor = {0.0f, 0.0f, 0.0f};

    bool operator==(const PhysicsJoint&) const = default;
};

struct Physics {
    static constexpr chunk::Tag kTag{"PHYS"};
    std::vector<PhysicsShape> shapes;
    std::vector<PhysicsJoint> joints;

    bool operator==(const Physics&) const = default;
};

// --- AFID, NERF, EDGF ---

struct AnimationFileId {
    uint16_t animation_id = 0;
    uint16_t sub_animation_id = 0;
    uint32_t file_id = 0;

    bool operator==(const AnimationFileId&) const = default;
};

struct AnimationFileIds {
    static constexpr chunk::Tag kTag{"AFID"};
    std::vector<AnimationFileId> entries;

    bool operator==(const AnimationFileIds&) const = default;
};

struct AlphaAttenuation {
    static constexpr chunk::Tag kTag{"NERF"};
    std::array<float, 2> coefficients = {0.0f, 0.0f};

    bool operator==(const AlphaAttenuation&) const = default;
};

struct EdgeFade {
    std::array<float, 2> values = {0.0f, 0.0f};
    float scale = 0.0f;
    uint32_t padding = 0;

    bool operator==(const EdgeFade&) const = default;
};

struct EdgeFades {
    static constexpr chunk::Tag kTag{"EDGF"};
    std::vector<EdgeFade> entries;

    bool operator==(const EdgeFades&) const = default;
};

// --- Unknown tags ---

// RawChunk keeps the payload of a tag this library does not decode.
struct RawChunk {
    chunk::Tag tag;
    std::vector<uint8_t> data;

    bool operator==(const RawChunk&) const = default;
};

using ChunkValue = std::variant<
    Vertices, Bones, Sequences, PlayableAnimations, SkeletonFileId, Textures,
    TextureFileIds, Materials, TextureCombiners, ColorAnimations,
    TransparencyAnimations, TextureTransforms, Attachments, Events, Lights,
    Cameras, ParticleEmitters, ExtendedParticles, ParticleGeosets,
    GeometryParticleIds, RecursiveParticleIds, RibbonEmitters, Physics,
    PhysicsFileId, SkinFileIds, AnimationFileIds, BoneFileIds,
    ParentAnimationBlacklist, AlphaAttenuation, EdgeFades, RawChunk>;

// tag_of returns the tag a chunk value is stored under.
chunk::Tag tag_of(const ChunkValue& value);

} // namespace m2tools::m2
