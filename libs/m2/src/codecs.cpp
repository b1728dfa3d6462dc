#include "codecs.h"

#include "m2tools/m2_layout.h"

#include <algorithm>
#include <array>
#include <format>
#include <sstream>

namespace m2tools::m2 {

namespace detail {

namespace {

// check_payload_size enforces the fixed-size and stride rules of a tag.
void check_payload_size(const chunk::Tag& tag, size_t size) {
    const auto* rule = find_rule(tag);
    if (!rule) return;
    if (rule->exact_size != 0 && size != rule->exact_size)
        throw ParseError(ParseErrorKind::MalformedChunk,
                         std::format("{}: payload is {} bytes, expected {}", tag.str(), size,
                                     rule->exact_size));
    if (rule->stride != 0 && size % rule->stride != 0)
        throw ParseError(ParseErrorKind::MalformedChunk,
                         std::format("{}: payload of {} bytes is not a multiple of {}",
                                     tag.str(), size, rule->stride));
}

template <typename T>
ChunkCodec make_codec() {
    return ChunkCodec{
        T::kTag,
        [](std::span<const uint8_t> payload, FormatVersion v) -> ChunkValue {
            check_payload_size(T::kTag, payload.size());
            auto r = binutil::make_stream(payload);
            T out{};
            decode(r, v, out);
            binutil::require_consumed(r, T::kTag.str());
            return out;
        },
        [](const ChunkValue& value, FormatVersion v) {
            std::ostringstream w(std::ios::binary);
            encode(w, std::get<T>(value), v);
            return binutil::to_bytes(w);
        },
        [](const ChunkValue& value, ConvertContext& ctx) -> ChunkValue {
            auto converted = transform(std::get<T>(value), ctx);
            T out{};
            static_cast<decltype(converted)&>(out) = std::move(converted);
            return out;
        },
        [](const ChunkValue& value) { return count(std::get<T>(value)); },
    };
}

const std::array kCodecs = {
    make_codec<Vertices>(),
    make_codec<Bones>(),
    make_codec<Sequences>(),
    make_codec<PlayableAnimations>(),
    make_codec<SkeletonFileId>(),
    make_codec<Textures>(),
    make_codec<TextureFileIds>(),
    make_codec<Materials>(),
    make_codec<TextureCombiners>(),
    make_codec<ColorAnimations>(),
    make_codec<TransparencyAnimations>(),
    make_codec<TextureTransforms>(),
    make_codec<Attachments>(),
    make_codec<Events>(),
    make_codec<Lights>(),
    make_codec<Cameras>(),
    make_codec<ParticleEmitters>(),
    make_codec<ExtendedParticles>(),
    make_codec<ParticleGeosets>(),
    make_codec<GeometryParticleIds>(),
    make_codec<RecursiveParticleIds>(),
    make_codec<RibbonEmitters>(),
    make_codec<Physics>(),
    make_codec<PhysicsFileId>(),
    make_codec<SkinFileIds>(),
    make_codec<AnimationFileIds>(),
    make_codec<BoneFileIds>(),
    make_codec<ParentAnimationBlacklist>(),
    make_codec<AlphaAttenuation>(),
    make_codec<EdgeFades>(),
};

} // namespace

const ChunkCodec* find_codec(const chunk::Tag& tag) {
    auto it = std::find_if(kCodecs.begin(), kCodecs.end(),
                           [&](const ChunkCodec& c) { return c.tag == tag; });
    return it == kCodecs.end() ? nullptr : &*it;
}

} // namespace detail

chunk::Tag tag_of(const ChunkValue& value) {
    return std::visit(
        [](const auto& v) -> chunk::Tag {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, RawChunk>)
                return v.tag;
            else
                return T::kTag;
        },
        value);
}

} // namespace m2tools::m2
