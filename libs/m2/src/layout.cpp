#include "m2tools/m2_layout.h"

#include <algorithm>
#include <array>

namespace m2tools::m2 {

namespace {

constexpr auto Classic = FormatVersion::Classic;
constexpr auto TBC = FormatVersion::TBC;
constexpr auto MoP = FormatVersion::MoP;
constexpr auto Legion = FormatVersion::Legion;

constexpr ChunkRule always_in(const char (&tag)[5], const char* name, bool integrity,
                           uint32_t stride = 0) {
    return {tag, name, Classic, Legion, Classic, false, integrity, false, stride, 0};
}

constexpr ChunkRule optional_in(const char (&tag)[5], const char* name, FormatVersion first,
                             FormatVersion last, uint32_t stride = 0, uint32_t exact = 0) {
    return {tag, name, first, last, Legion, true, false, false, stride, exact};
}

constexpr std::array kRules = {
    always_in("VRTX", "vertices", true, 48),
    always_in("BONE", "bones", true),
    always_in("SEQS", "sequences", true),
    optional_in("PLAY", "playable animation lookup", Classic, TBC, 4),
    ChunkRule{"SKID", "skeleton file id", Legion, Legion, Legion, true, true, false, 0, 4},
    optional_in("TEXS", "textures", Classic, Legion),
    optional_in("TXID", "texture file ids", Legion, Legion, 4),
    optional_in("MATS", "materials", Classic, Legion, 4),
    ChunkRule{"TXAC", "texture combiner settings", Legion, Legion, Legion, false, false, false, 2, 0},
    optional_in("COLR", "color animations", Classic, Legion),
    optional_in("TRAN", "transparency animations", Classic, Legion),
    optional_in("TXAN", "texture transforms", Classic, Legion),
    optional_in("ATCH", "attachments", Classic, Legion),
    optional_in("EVTS", "events", Classic, Legion),
    optional_in("LITE", "lights", Classic, Legion),
    optional_in("CAMS", "cameras", Classic, Legion),
    optional_in("PRTE", "particle emitters", Classic, Legion),
    optional_in("EXP2", "extended particle data", Legion, Legion),
    optional_in("PGD1", "particle geosets", Legion, Legion, 2),
    optional_in("GPID", "geometry particle file ids", Legion, Legion, 4),
    optional_in("RPID", "recursive particle file ids", Legion, Legion, 4),
    optional_in("RIBB", "ribbon emitters", Classic, Legion),
    optional_in("PHYS", "physics", MoP, Legion),
    optional_in("PFID", "physics file id", Legion, Legion, 0, 4),
    ChunkRule{"SFID", "skin profile file ids", Legion, Legion, Legion, false, false, false, 4, 0},
    ChunkRule{"AFID", "animation file ids", Legion, Legion, Legion, true, false, true, 8, 0},
    optional_in("BFID", "bone file ids", Legion, Legion, 4),
    optional_in("PABC", "parent animation blacklist", Legion, Legion, 2),
    optional_in("NERF", "alpha attenuation", Legion, Legion, 0, 8),
    optional_in("EDGF", "edge fades", Legion, Legion, 16),
};

} // namespace

std::span<const ChunkRule> chunk_rules() { return kRules; }

const ChunkRule* find_rule(const chunk::Tag& tag) {
    auto it = std::find_if(kRules.begin(), kRules.end(),
                           [&](const ChunkRule& r) { return r.tag == tag; });
    return it == kRules.end() ? nullptr : &*it;
}

Presence presence(const ChunkRule& rule, FormatVersion v) {
    if (v < rule.first || v > rule.last) return Presence::Forbidden;
    if (!rule.optional_always && v >= rule.required) return Presence::Required;
    return Presence::Optional;
}

Presence presence(const chunk::Tag& tag, FormatVersion v) {
    const auto* rule = find_rule(tag);
    return rule ? presence(*rule, v) : Presence::Optional;
}

const char* to_string(Presence p) {
    switch (p) {
        case Presence::Forbidden: return "forbidden";
        case Presence::Optional: return "optional";
        case Presence::Required: return "required";
    }
    return "unknown";
}

} // namespace m2tools::m2
