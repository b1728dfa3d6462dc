#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <span>
#include <string>

namespace m2tools::tools {

enum class FileKind { Model, Skin, Anim };

inline const char* to_string(FileKind kind) {
    switch (kind) {
        case FileKind::Model: return "model";
        case FileKind::Skin: return "skin";
        case FileKind::Anim: return "anim";
    }
    return "model";
}

// detect_kind picks the file kind from the extension, falling back to the
// leading magic for unknown extensions.
inline FileKind detect_kind(const std::filesystem::path& path, std::span<const uint8_t> data) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".m2") return FileKind::Model;
    if (ext == ".skin") return FileKind::Skin;
    if (ext == ".anim") return FileKind::Anim;

    auto starts = [&data](const char* magic) {
        return data.size() >= 4 && std::memcmp(data.data(), magic, 4) == 0;
    };
    if (starts("SKIN")) return FileKind::Skin;
    if (starts("AFM2")) return FileKind::Anim;
    return FileKind::Model;
}

} // namespace m2tools::tools
