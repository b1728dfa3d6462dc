#include "m2tools/m2_convert.h"

#include "codecs.h"

#include <algorithm>
#include <bit>
#include <format>
#include <optional>

namespace m2tools::m2 {

namespace {

using version::Feature;

// sequence_starts returns the shared-timeline start of every sequence as laid
// out in version v.
std::vector<uint32_t> sequence_starts(const Sequences* seqs, FormatVersion v) {
    std::vector<uint32_t> starts;
    if (!seqs) return starts;
    uint64_t cursor = 0;
    for (const auto& s : seqs->sequences) {
        if (version::has(v, Feature::PerSequenceTracks)) {
            starts.push_back(static_cast<uint32_t>(cursor));
            cursor += s.duration;
        } else {
            starts.push_back(s.start_timestamp);
        }
    }
    return starts;
}

uint32_t convert_flags(uint32_t flags, FormatVersion to, std::vector<std::string>& notes) {
    uint32_t mask = version::flag_mask(to);
    uint32_t cleared = flags & ~mask;
    while (cleared != 0) {
        int bit = std::countr_zero(cleared);
        notes.push_back(std::format("header: global flag 0x{:X} is not supported in {}, cleared",
                                    1u << bit, version::name(to)));
        cleared &= cleared - 1;
    }
    return flags & mask;
}

// default_chunk synthesizes a chunk the target requires but the source lacks.
ChunkValue default_chunk(const ChunkRule& rule, const Model& out) {
    if (rule.tag == TextureCombiners::kTag) {
        TextureCombiners txac;
        const auto* mats = out.find<Materials>();
        txac.entries.assign(mats ? mats->materials.size() : 0, {0, 0});
        return txac;
    }
    if (rule.tag == SkinFileIds::kTag && out.header.skin_profile_count == 0)
        return SkinFileIds{};
    throw ConversionError(
        ConversionErrorKind::MissingRequiredChunk, rule.tag.str(),
        std::format("{} ({}) is required in {} and has no safe default", rule.tag.str(),
                    rule.name, version::name(out.version())));
}

} // namespace

ConversionResult convert(const Model& source, FormatVersion target) {
    ConversionResult result;
    auto& out = result.model;
    auto from = source.version();

    if (from == target) {
        out = source;
        return result;
    }

    out.header = source.header;
    out.header.version = target;
    out.header.header_number = version::header_number(target);
    out.header.global_flags = convert_flags(source.header.global_flags, target, result.notes);

    detail::ConvertContext ctx;
    ctx.from = from;
    ctx.to = target;
    ctx.tracks.from = from;
    ctx.tracks.to = target;
    ctx.notes = &result.notes;

    // Every track, bones included, is rebased against both sequence tables, so
    // SEQS is converted ahead of the table walk.
    std::optional<ChunkValue> sequences;
    if (auto it = source.chunks.find(Sequences::kTag); it != source.chunks.end()) {
        sequences = detail::find_codec(Sequences::kTag)->transform(it->second, ctx);
        ctx.tracks.source_starts = sequence_starts(source.find<Sequences>(), from);
        ctx.tracks.target_starts =
            sequence_starts(std::get_if<Sequences>(&*sequences), target);
    }

    for (const auto& rule : chunk_rules()) {
        auto it = source.chunks.find(rule.tag);
        auto target_presence = presence(rule, target);

        if (it == source.chunks.end()) {
            if (target_presence == Presence::Required) {
                out.chunks.emplace(rule.tag, default_chunk(rule, out));
                result.notes.push_back(std::format("{}: synthesized default for {}",
                                                   rule.tag.str(), version::name(target)));
            }
            continue;
        }

        if (target_presence == Presence::Forbidden) {
            if (rule.integrity)
                throw ConversionError(
                    ConversionErrorKind::CannotDropRequiredChunk, rule.tag.str(),
                    std::format("{} ({}) cannot be dropped for {}", rule.tag.str(), rule.name,
                                version::name(target)));
            result.notes.push_back(std::format("{}: dropped, not supported in {}",
                                               rule.tag.str(), version::name(target)));
            continue;
        }

        if (rule.tag == Sequences::kTag) {
            out.chunks.emplace(rule.tag, std::move(*sequences));
            continue;
        }
        const auto* codec = detail::find_codec(rule.tag);
        out.chunks.emplace(rule.tag, codec->transform(it->second, ctx));
    }

    // Opaque chunks pass through untouched.
    for (const auto& [tag, value] : source.chunks) {
        if (!find_rule(tag)) out.chunks.emplace(tag, value);
    }

    // First-seen order of the survivors, then synthesized chunks in table order.
    for (const auto& tag : source.order)
        if (out.chunks.contains(tag)) out.order.push_back(tag);
    for (const auto& rule : chunk_rules())
        if (out.chunks.contains(rule.tag) &&
            std::find(out.order.begin(), out.order.end(), rule.tag) == out.order.end())
            out.order.push_back(rule.tag);
    if (target < FormatVersion::Legion) out.order = output_order(out);

    auto issues = validate(out);
    if (!issues.empty())
        throw ConversionError(
            ConversionErrorKind::PostConversionValidationFailed, issues.front().chunk,
            std::format("converted model fails validation for {} ({} issues, first: {})",
                        version::name(target), issues.size(), issues.front().message),
            std::move(issues));
    return result;
}

} // namespace m2tools::m2
