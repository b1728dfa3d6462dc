#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace m2tools::version {

// FormatVersion is ordered by release: comparing two versions tells whether a
// conversion is an upgrade or a downgrade.
enum class FormatVersion : int {
    Classic = 0,
    TBC = 1,
    WotLK = 2,
    Cataclysm = 3,
    MoP = 4,
    WoD = 5,
    Legion = 6,
};

inline constexpr FormatVersion kOldest = FormatVersion::Classic;
inline constexpr FormatVersion kLatest = FormatVersion::Legion;

// VersionInfo is one row of the version lookup table.
struct VersionInfo {
    FormatVersion version;
    const char* name;         // canonical expansion name
    const char* patch;        // last client patch of the expansion
    uint32_t header_number;   // number written into the model header
    uint32_t header_min;      // accepted header numbers (inclusive)
    uint32_t header_max;
    uint32_t flag_mask;       // global flag bits legal in this version
};

// Layout features that switch on at a given version.
enum class Feature {
    CompressedQuaternions,   // i16 bone rotations, bone name CRC
    PerSequenceTracks,       // per-sequence track arrays, sequence duration
    ParticleWind,            // particle emitter wind block
    RibbonPriorityPlane,
    ModernSkinHeader,
    AnimatedCameraFov,
    BlendAddMode,            // material blend mode 7
    MultiTextureParticles,
    SplitBlendTime,          // sequence blend time in/out
    Physics,
    PhysicsMaterial,
    ChunkedFileReferences,   // file-id and extension chunks
    ModernAnimLayout,
};

const std::array<VersionInfo, 7>& all_versions();

const VersionInfo& info(FormatVersion v);

std::string_view name(FormatVersion v);

uint32_t header_number(FormatVersion v);

uint32_t flag_mask(FormatVersion v);

// from_expansion_name accepts an expansion name, a short alias or a client
// patch ("WotLK", "wrath", "3.3.5a"). Throws UnknownVersionError.
FormatVersion from_expansion_name(std::string_view name);

// from_header_version maps the number stored in a model header to a version.
// Throws UnknownVersionError.
FormatVersion from_header_version(uint32_t number);

FormatVersion threshold(Feature f);

inline bool has(FormatVersion v, Feature f) { return v >= threshold(f); }

} // namespace m2tools::version
