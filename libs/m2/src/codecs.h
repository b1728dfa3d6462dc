#pragma once

// Internal chunk codec table shared by load, save, validate and convert.

#include "m2tools/binutil.h"
#include "m2tools/m2_chunks.h"
#include "m2tools/m2_track.h"

#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace m2tools::m2::detail {

// ConvertContext is the state shared by the per-chunk transforms of one
// conversion.
struct ConvertContext {
    FormatVersion from = FormatVersion::WotLK;
    FormatVersion to = FormatVersion::WotLK;
    TrackContext tracks;
    std::vector<std::string>* notes = nullptr;

    bool crosses(version::Feature f) const {
        return version::has(from, f) != version::has(to, f);
    }
    bool gains(version::Feature f) const {
        return !version::has(from, f) && version::has(to, f);
    }
    bool loses(version::Feature f) const {
        return version::has(from, f) && !version::has(to, f);
    }

    void note(std::string text) const {
        if (notes) notes->push_back(std::move(text));
    }

    template <typename T>
    void convert(Track<T>& t, const char* where) const {
        t = convert_track(t, tracks, where);
    }
};

// ChunkCodec is one entry of the closed codec table, keyed by tag.
struct ChunkCodec {
    chunk::Tag tag;
    ChunkValue (*decode)(std::span<const uint8_t> payload, FormatVersion v);
    std::vector<uint8_t> (*encode)(const ChunkValue& value, FormatVersion v);
    ChunkValue (*transform)(const ChunkValue& value, ConvertContext& ctx);
    size_t (*count)(const ChunkValue& value);
};

// find_codec returns nullptr for tags without a codec (opaque chunks).
const ChunkCodec* find_codec(const chunk::Tag& tag);

// stride_count returns the number of fixed-size entries left in a stream.
inline size_t stride_count(std::istream& r, size_t stride) {
    return binutil::remaining(r) / stride;
}

// --- Per-chunk codec functions (codec_*.cpp) ---

#define M2TOOLS_DECLARE_CODEC(Type)                                  \
    void decode(std::istream& r, FormatVersion v, Type& out);        \
    void encode(std::ostream& w, const Type& in, FormatVersion v);   \
    Type transform(const Type& in, ConvertContext& ctx);             \
    size_t count(const Type& in);

// codec_core.cpp
M2TOOLS_DECLARE_CODEC(Vertices)
M2TOOLS_DECLARE_CODEC(Bones)
M2TOOLS_DECLARE_CODEC(Sequences)
M2TOOLS_DECLARE_CODEC(PlayableAnimations)

// codec_render.cpp
M2TOOLS_DECLARE_CODEC(Textures)
M2TOOLS_DECLARE_CODEC(Materials)
M2TOOLS_DECLARE_CODEC(TextureCombiners)
M2TOOLS_DECLARE_CODEC(ColorAnimations)
M2TOOLS_DECLARE_CODEC(TransparencyAnimations)
M2TOOLS_DECLARE_CODEC(TextureTransforms)

// codec_scene.cpp
M2TOOLS_DECLARE_CODEC(Attachments)
M2TOOLS_DECLARE_CODEC(Events)
M2TOOLS_DECLARE_CODEC(Lights)
M2TOOLS_DECLARE_CODEC(Cameras)

// codec_effects.cpp
M2TOOLS_DECLARE_CODEC(ParticleEmitters)
M2TOOLS_DECLARE_CODEC(ExtendedParticles)
M2TOOLS_DECLARE_CODEC(RibbonEmitters)
M2TOOLS_DECLARE_CODEC(Physics)

// codec_files.cpp
M2TOOLS_DECLARE_CODEC(SingleFileId)
M2TOOLS_DECLARE_CODEC(FileIdTable)
M2TOOLS_DECLARE_CODEC(U16Table)
M2TOOLS_DECLARE_CODEC(AnimationFileIds)
M2TOOLS_DECLARE_CODEC(AlphaAttenuation)
M2TOOLS_DECLARE_CODEC(EdgeFades)

#undef M2TOOLS_DECLARE_CODEC

} // namespace m2tools::m2::detail
