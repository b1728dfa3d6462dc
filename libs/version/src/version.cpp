#include "m2tools/version.h"

#include "m2tools/errors.h"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace m2tools::version {

namespace {

constexpr std::array<VersionInfo, 7> kVersions = {{
    {FormatVersion::Classic, "Classic", "1.12.1", 256, 256, 257, 0x0003},
    {FormatVersion::TBC, "TBC", "2.4.3", 263, 260, 263, 0x0003},
    {FormatVersion::WotLK, "WotLK", "3.3.5a", 264, 264, 264, 0x000B},
    {FormatVersion::Cataclysm, "Cataclysm", "4.3.4", 265, 265, 271, 0x001B},
    {FormatVersion::MoP, "MoP", "5.4.8", 272, 272, 272, 0x00BB},
    {FormatVersion::WoD, "WoD", "6.2.4", 273, 273, 273, 0x01BB},
    {FormatVersion::Legion, "Legion", "7.3.5", 274, 274, 274, 0x3FBB},
}};

// Aliases are matched after normalization (lowercase, no spaces, '-' or '_').
constexpr std::pair<std::string_view, FormatVersion> kAliases[] = {
    {"classic", FormatVersion::Classic},
    {"vanilla", FormatVersion::Classic},
    {"1.12", FormatVersion::Classic},
    {"1.12.1", FormatVersion::Classic},
    {"tbc", FormatVersion::TBC},
    {"bc", FormatVersion::TBC},
    {"burningcrusade", FormatVersion::TBC},
    {"theburningcrusade", FormatVersion::TBC},
    {"2.4.3", FormatVersion::TBC},
    {"wotlk", FormatVersion::WotLK},
    {"wrath", FormatVersion::WotLK},
    {"wrathofthelichking", FormatVersion::WotLK},
    {"3.3.5", FormatVersion::WotLK},
    {"3.3.5a", FormatVersion::WotLK},
    {"cata", FormatVersion::Cataclysm},
    {"cataclysm", FormatVersion::Cataclysm},
    {"4.3.4", FormatVersion::Cataclysm},
    {"mop", FormatVersion::MoP},
    {"pandaria", FormatVersion::MoP},
    {"mistsofpandaria", FormatVersion::MoP},
    {"5.4.8", FormatVersion::MoP},
    {"wod", FormatVersion::WoD},
    {"draenor", FormatVersion::WoD},
    {"warlordsofdraenor", FormatVersion::WoD},
    {"6.2.4", FormatVersion::WoD},
    {"legion", FormatVersion::Legion},
    {"7.3.5", FormatVersion::Legion},
};

std::string normalize_name(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' || c == '-' || c == '_') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

const std::array<VersionInfo, 7>& all_versions() {
    return kVersions;
}

const VersionInfo& info(FormatVersion v) {
    return kVersions[static_cast<size_t>(v)];
}

std::string_view name(FormatVersion v) {
    return info(v).name;
}

uint32_t header_number(FormatVersion v) {
    return info(v).header_number;
}

uint32_t flag_mask(FormatVersion v) {
    return info(v).flag_mask;
}

FormatVersion from_expansion_name(std::string_view name) {
    auto key = normalize_name(name);
    for (const auto& [alias, v] : kAliases) {
        if (alias == key) return v;
    }
    throw UnknownVersionError(std::format("unknown expansion name '{}'", name));
}

FormatVersion from_header_version(uint32_t number) {
    auto it = std::find_if(kVersions.begin(), kVersions.end(), [&](const VersionInfo& vi) {
        return number >= vi.header_min && number <= vi.header_max;
    });
    if (it == kVersions.end())
        throw UnknownVersionError(std::format("unknown model header version {}", number));
    return it->version;
}

FormatVersion threshold(Feature f) {
    switch (f) {
        case Feature::CompressedQuaternions: return FormatVersion::TBC;
        case Feature::PerSequenceTracks:
        case Feature::ParticleWind:
        case Feature::RibbonPriorityPlane:
        case Feature::ModernSkinHeader: return FormatVersion::WotLK;
        case Feature::AnimatedCameraFov:
        case Feature::BlendAddMode:
        case Feature::MultiTextureParticles: return FormatVersion::Cataclysm;
        case Feature::SplitBlendTime:
        case Feature::Physics: return FormatVersion::MoP;
        case Feature::PhysicsMaterial: return FormatVersion::WoD;
        case Feature::ChunkedFileReferences:
        case Feature::ModernAnimLayout: return FormatVersion::Legion;
    }
    return kLatest;
}

} // namespace m2tools::version
