#include "m2tools/anim.h"

#include <gtest/gtest.h>

#include <cstring>
#include <filesystem>
#include <functional>

using namespace m2tools;
using namespace m2tools::anim;

namespace {

AnimSection make_section(uint32_t id, uint32_t start, uint32_t end) {
    AnimSection s;
    s.header = {id, start, end};

    BoneAnimation moving;
    moving.bone_id = 1;
    moving.translation.interpolation = 1;
    moving.translation.timestamps = {start, end};
    moving.translation.values = {{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}};
    moving.rotation.interpolation = 1;
    moving.rotation.timestamps = {start, end};
    moving.rotation.values = {{0, 0, 0, 32767}, {0, 0, 32767, 0}};
    moving.scaling.timestamps = {start};
    moving.scaling.values = {{1.0f, 1.0f, 1.0f}};
    s.bones.push_back(moving);

    BoneAnimation still;
    still.bone_id = 2;
    s.bones.push_back(still);
    return s;
}

AnimFile make_legacy() {
    AnimFile f;
    f.version = FormatVersion::WotLK;
    f.metadata = LegacyMetadata{};
    f.sections = {make_section(0, 0, 1000), make_section(1, 1000, 2500)};
    return f;
}

AnimFile make_modern() {
    AnimFile f;
    f.version = FormatVersion::Legion;
    f.metadata = ModernMetadata{};
    f.sections = {make_section(10, 0, 1000), make_section(20, 0, 1500)};
    return f;
}

AnimSection make_translation_section(uint32_t id, uint32_t start, uint32_t end) {
    AnimSection s;
    s.header = {id, start, end};
    BoneAnimation bone;
    bone.bone_id = 1;
    bone.translation.interpolation = 1;
    bone.translation.timestamps = {start, end};
    bone.translation.values = {{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}};
    s.bones.push_back(bone);
    return s;
}

// Bytes of one section body in the fixture: 12 header bytes, a keyed bone of
// 100 bytes and an empty bone of 28.
constexpr size_t kBodySize = 12 + 100 + 28;

} // namespace

TEST(Anim, LegacyLayout) {
    auto bytes = save(make_legacy());
    EXPECT_EQ(bytes.size(), 2 * kBodySize);

    auto file = load(bytes);
    EXPECT_TRUE(file.is_legacy_format());
    EXPECT_EQ(file.version, FormatVersion::WotLK);
    EXPECT_EQ(file.sections, make_legacy().sections);
    ASSERT_NE(file.hints(), nullptr);
    EXPECT_TRUE(file.hints()->appears_valid);
    EXPECT_EQ(file.hints()->estimated_blocks, 2u);
    EXPECT_TRUE(file.hints()->has_timestamps);
    EXPECT_EQ(save(file), bytes);
}

TEST(Anim, ModernLayout) {
    auto bytes = save(make_modern());
    EXPECT_EQ(bytes.size(), kModernHeaderSize + 2 * kEntrySize + 2 * (4 + kBodySize));
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "AFM2");
    EXPECT_TRUE(is_modern(bytes));

    auto file = load(bytes);
    EXPECT_FALSE(file.is_legacy_format());
    EXPECT_EQ(file.version, FormatVersion::Legion);
    EXPECT_EQ(file.sections, make_modern().sections);
    EXPECT_EQ(file.hints(), nullptr);

    const auto& meta = std::get<ModernMetadata>(file.metadata);
    EXPECT_EQ(meta.header.id_count, 2u);
    EXPECT_EQ(meta.header.entry_offset, kModernHeaderSize);
    ASSERT_EQ(meta.entries.size(), 2u);
    EXPECT_EQ(meta.entries[0], (EntryRecord{10, 40, 4 + kBodySize}));
    EXPECT_EQ(meta.entries[1].offset, 40 + 4 + kBodySize);
    EXPECT_EQ(save(file), bytes);
}

TEST(Anim, SectionRandomAccess) {
    auto bytes = save(make_modern());
    auto file = load(bytes);
    const auto& meta = std::get<ModernMetadata>(file.metadata);
    EXPECT_EQ(load_section(bytes, meta.entries[1]), make_modern().sections[1]);

    auto wrong = meta.entries[1];
    wrong.id = 99;
    try {
        load_section(bytes, wrong);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::MalformedChunk);
    }
}

TEST(Anim, EmptyBufferIsTruncated) {
    try {
        load(std::span<const uint8_t>{});
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::Truncated);
    }
}

TEST(Anim, ModernSectionOutOfRangeIsTruncated) {
    auto bytes = save(make_modern());
    uint32_t size = 100000;
    std::memcpy(bytes.data() + kModernHeaderSize + kEntrySize + 8, &size, 4);
    try {
        load(bytes);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::Truncated);
    }
}

TEST(Anim, UnknownModernVersionFallsBackToLegacy) {
    auto bytes = save(make_modern());
    uint32_t version = 2;
    std::memcpy(bytes.data() + 4, &version, 4);
    EXPECT_FALSE(is_modern(bytes));

    auto file = load(bytes);
    EXPECT_TRUE(file.is_legacy_format());
    EXPECT_FALSE(file.hints()->appears_valid);
}

TEST(Anim, TrailingBytesAreKept) {
    auto bytes = save(make_legacy());
    bytes.insert(bytes.end(), {0xFF, 0xFF, 0xFF});

    auto file = load(bytes);
    EXPECT_EQ(file.sections.size(), 2u);
    EXPECT_FALSE(file.hints()->appears_valid);
    EXPECT_EQ(file.hints()->estimated_blocks, 2u);
    EXPECT_EQ(std::get<LegacyMetadata>(file.metadata).trailing,
              (std::vector<uint8_t>{0xFF, 0xFF, 0xFF}));
    EXPECT_EQ(save(file), bytes);
}

TEST(Anim, TrailingZeroPaddingIsNotABlock) {
    auto bytes = save(make_legacy());
    bytes.insert(bytes.end(), 12, 0);

    auto file = load(bytes);
    EXPECT_EQ(file.sections.size(), 2u);
    EXPECT_EQ(file.animation_count(), 2u);
    EXPECT_FALSE(file.hints()->appears_valid);
    EXPECT_EQ(file.hints()->estimated_blocks, 2u);
    EXPECT_EQ(std::get<LegacyMetadata>(file.metadata).trailing, std::vector<uint8_t>(12, 0));
    EXPECT_EQ(save(file), bytes);
}

TEST(Anim, LeadingEmptyBlockIsAccepted) {
    std::vector<uint8_t> bytes(12, 0);
    auto file = load(bytes);
    ASSERT_EQ(file.sections.size(), 1u);
    EXPECT_TRUE(file.sections[0].bones.empty());
    EXPECT_TRUE(file.hints()->appears_valid);
    EXPECT_TRUE(std::get<LegacyMetadata>(file.metadata).trailing.empty());
}

TEST(Anim, ImplausibleBlocksStopTheWalk) {
    std::vector<std::function<void(AnimSection&)>> corruptions = {
        [](AnimSection& s) { s.header.start = 2000; },
        [](AnimSection& s) { s.header.end = kMaxLegacyDuration + 1; },
        [](AnimSection& s) { s.bones.resize(kMaxLegacyBones + 1); },
        [](AnimSection& s) { s.bones[0].rotation.interpolation = 4; },
        [](AnimSection& s) { s.bones[0].translation.timestamps = {1000, 0}; },
    };
    for (size_t i = 0; i < corruptions.size(); ++i) {
        SCOPED_TRACE(i);
        auto f = make_legacy();
        corruptions[i](f.sections[0]);
        auto bytes = save(f);

        auto hints = scan_legacy(bytes);
        EXPECT_FALSE(hints.appears_valid);
        EXPECT_EQ(hints.estimated_blocks, 0u);
        EXPECT_FALSE(hints.has_timestamps);

        auto file = load(bytes);
        EXPECT_TRUE(file.sections.empty());
        EXPECT_EQ(std::get<LegacyMetadata>(file.metadata).trailing, bytes);
    }
}

TEST(Anim, MemoryUsage) {
    auto usage = make_legacy().memory_usage();
    EXPECT_EQ(usage.sections, 2u);
    EXPECT_EQ(usage.bones, 4u);
    EXPECT_EQ(usage.translation_keys, 4u);
    EXPECT_EQ(usage.rotation_keys, 4u);
    EXPECT_EQ(usage.scaling_keys, 2u);
    EXPECT_EQ(usage.total(), 2u * 16 + 4 * 28 + 4 * 16 + 4 * 12 + 2 * 16);
    EXPECT_EQ(make_legacy().animation_count(), 2u);
}

TEST(Anim, RequiredFormat) {
    EXPECT_EQ(required_format(FormatVersion::Classic), AnimFormat::Legacy);
    EXPECT_EQ(required_format(FormatVersion::WoD), AnimFormat::Legacy);
    EXPECT_EQ(required_format(FormatVersion::Legion), AnimFormat::Modern);
}

TEST(Anim, FormatPreservingConvert) {
    auto legacy = load(save(make_legacy()));
    auto converted = convert(legacy, FormatVersion::TBC);
    EXPECT_TRUE(converted.is_legacy_format());
    EXPECT_EQ(converted.version, FormatVersion::TBC);
    EXPECT_EQ(converted.sections, legacy.sections);
    EXPECT_EQ(converted.metadata, legacy.metadata);
}

TEST(Anim, LegacyModernLegacyKeepsKeyframes) {
    auto legacy = load(save(make_legacy()));
    auto modern = convert(legacy, FormatVersion::Legion);
    EXPECT_FALSE(modern.is_legacy_format());
    const auto& meta = std::get<ModernMetadata>(modern.metadata);
    EXPECT_EQ(meta.entries.size(), 2u);
    ASSERT_TRUE(meta.source_hints.has_value());
    EXPECT_TRUE(meta.source_hints->appears_valid);

    // the synthesized entry table matches what a load of the saved file sees
    auto reloaded = load(save(modern));
    EXPECT_EQ(std::get<ModernMetadata>(reloaded.metadata).entries, meta.entries);
    EXPECT_EQ(reloaded.sections, legacy.sections);

    auto back = convert(modern, FormatVersion::WotLK);
    EXPECT_TRUE(back.is_legacy_format());
    EXPECT_EQ(back.sections, legacy.sections);
    EXPECT_EQ(back.memory_usage().total(), legacy.memory_usage().total());
    EXPECT_EQ(*back.hints(), *legacy.hints());
}

TEST(Anim, LowConfidenceTranscodeKeepsHints) {
    auto bytes = save(make_legacy());
    bytes.push_back(0x01);
    auto legacy = load(bytes);

    auto modern = convert(legacy, FormatVersion::Legion);
    ASSERT_NE(modern.hints(), nullptr);
    EXPECT_FALSE(modern.hints()->appears_valid);
    EXPECT_EQ(modern.animation_count(), 2u);

    auto back = convert(modern, FormatVersion::Classic);
    EXPECT_TRUE(std::get<LegacyMetadata>(back.metadata).trailing.empty());
    EXPECT_TRUE(back.hints()->appears_valid);
}

TEST(Anim, ModernToLegacyRenumbersSections) {
    auto legacy = convert(make_modern(), FormatVersion::Cataclysm);
    ASSERT_EQ(legacy.sections.size(), 2u);
    EXPECT_EQ(legacy.sections[0].header.id, 0u);
    EXPECT_EQ(legacy.sections[1].header.id, 1u);
    EXPECT_EQ(legacy.sections[1].bones, make_modern().sections[1].bones);
    EXPECT_EQ(load(save(legacy)).sections, legacy.sections);
}

TEST(Anim, ModernToLegacyFlagsImplausibleSections) {
    AnimFile modern;
    modern.version = FormatVersion::Legion;
    modern.metadata = ModernMetadata{};
    modern.sections = {make_translation_section(0, 0, 4000000),
                       make_translation_section(1, 0, 1000)};

    auto legacy = convert(modern, FormatVersion::WotLK);
    ASSERT_TRUE(legacy.is_legacy_format());
    EXPECT_EQ(std::get<LegacyMetadata>(legacy.metadata).implausible_sections,
              (std::vector<uint32_t>{0}));
    EXPECT_FALSE(legacy.hints()->appears_valid);
    EXPECT_EQ(legacy.hints()->estimated_blocks, 0u);

    auto bytes = save(legacy);
    auto reloaded = load(bytes);
    EXPECT_TRUE(reloaded.sections.empty());
    EXPECT_EQ(std::get<LegacyMetadata>(reloaded.metadata).trailing, bytes);
    EXPECT_TRUE(std::get<LegacyMetadata>(reloaded.metadata).implausible_sections.empty());
}

TEST(Anim, ModernToLegacyFlagsLaterEmptySection) {
    auto modern = make_modern();
    modern.sections.push_back(AnimSection{{30, 0, 0}, {}});

    auto legacy = convert(modern, FormatVersion::WoD);
    EXPECT_EQ(std::get<LegacyMetadata>(legacy.metadata).implausible_sections,
              (std::vector<uint32_t>{2}));
    EXPECT_EQ(load(save(legacy)).sections.size(), 2u);

    auto clean = convert(make_modern(), FormatVersion::WoD);
    EXPECT_TRUE(std::get<LegacyMetadata>(clean.metadata).implausible_sections.empty());
    EXPECT_TRUE(clean.hints()->appears_valid);
}

TEST(Anim, FileRoundTrip) {
    auto path = std::filesystem::temp_directory_path() / "m2tools_anim_test.anim";
    save(make_modern(), path);
    auto file = load(path);
    std::filesystem::remove(path);
    EXPECT_EQ(file.sections, make_modern().sections);
    EXPECT_THROW(load(path), IoError);
}
