#include "m2tools/m2.h"
#include "m2tools/m2_convert.h"

#include "m2_test_models.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <sstream>

using namespace m2tools;
using namespace m2tools::m2;
using m2tools::m2::testing::make_model;

namespace {

std::vector<uint8_t> with_chunk(std::vector<uint8_t> bytes, const chunk::Tag& tag,
                                const std::vector<uint8_t>& payload) {
    std::ostringstream out(std::ios::binary);
    chunk::write_chunk(out, tag, payload);
    auto s = out.str();
    bytes.insert(bytes.end(), s.begin(), s.end());
    return bytes;
}

size_t chunks_start(const Model& m) { return 76 + m.header.name.size(); }

std::vector<std::string> saved_tags(const Model& m) {
    auto bytes = save(m);
    std::vector<std::string> tags;
    for (const auto& rec : chunk::read_all(bytes, chunks_start(m))) tags.push_back(rec.tag.str());
    return tags;
}

ParseErrorKind load_error(const std::vector<uint8_t>& bytes) {
    try {
        load(bytes);
    } catch (const ParseError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "load succeeded";
    return ParseErrorKind::Truncated;
}

} // namespace

TEST(M2, RoundTripEveryVersion) {
    for (const auto& info : version::all_versions()) {
        SCOPED_TRACE(info.name);
        auto model = make_model(info.version);
        auto bytes = save(model);
        auto loaded = load(bytes);
        EXPECT_EQ(loaded, model);
        EXPECT_EQ(save(loaded), bytes);
        EXPECT_TRUE(validate(loaded).empty());
    }
}

TEST(M2, HeaderFields) {
    auto model = make_model(FormatVersion::TBC);
    auto bytes = save(model);
    ASSERT_GE(bytes.size(), 76u);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "MD20");
    uint32_t number = 0;
    std::memcpy(&number, bytes.data() + 4, 4);
    EXPECT_EQ(number, 263u);

    auto loaded = load(bytes);
    EXPECT_EQ(loaded.version(), FormatVersion::TBC);
    EXPECT_EQ(loaded.header.name, "test_model");
    EXPECT_EQ(loaded.header.skin_profile_count, 1u);
    EXPECT_FLOAT_EQ(loaded.header.bounding_radius, 1.5f);
}

TEST(M2, AcceptsHeaderNumberRange) {
    auto bytes = save(make_model(FormatVersion::Cataclysm));
    uint32_t number = 270;
    std::memcpy(bytes.data() + 4, &number, 4);
    auto loaded = load(bytes);
    EXPECT_EQ(loaded.version(), FormatVersion::Cataclysm);
    EXPECT_EQ(loaded.header.header_number, 270u);
    EXPECT_EQ(stored_header_number(loaded.header), 270u);

    auto saved = save(loaded);
    uint32_t saved_number = 0;
    std::memcpy(&saved_number, saved.data() + 4, 4);
    EXPECT_EQ(saved_number, 270u);
    EXPECT_EQ(load(saved), loaded);
}

TEST(M2, HeaderNumberOutsideRangeSavesCanonical) {
    auto model = make_model(FormatVersion::Cataclysm);
    model.header.header_number = 0;
    EXPECT_EQ(stored_header_number(model.header), 265u);
    model.header.header_number = 264;
    EXPECT_EQ(stored_header_number(model.header), 265u);

    auto bytes = save(model);
    uint32_t number = 0;
    std::memcpy(&number, bytes.data() + 4, 4);
    EXPECT_EQ(number, 265u);
    EXPECT_EQ(load(bytes).header.header_number, 265u);
}

TEST(M2, ConvertResetsHeaderNumber) {
    auto bytes = save(make_model(FormatVersion::Cataclysm));
    uint32_t number = 270;
    std::memcpy(bytes.data() + 4, &number, 4);
    auto converted = convert(load(bytes), FormatVersion::MoP).model;
    EXPECT_EQ(converted.header.header_number, 272u);
}

TEST(M2, PreLegionOutOfOrderFileRoundTrips) {
    auto model = make_model(FormatVersion::WotLK);
    auto bytes = save(model);
    auto records = chunk::read_all(bytes, chunks_start(model));
    auto texs = std::find_if(records.begin(), records.end(),
                             [](const chunk::ChunkRecord& r) { return r.tag == chunk::Tag("TEXS"); });
    ASSERT_NE(texs, records.end());
    std::rotate(records.begin(), texs, texs + 1);
    ASSERT_EQ(records.front().tag.str(), "TEXS");

    std::ostringstream out(std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(chunks_start(model)));
    for (const auto& rec : records) chunk::write_chunk(out, rec.tag, rec.payload);
    auto s = out.str();
    std::vector<uint8_t> shuffled(s.begin(), s.end());

    auto loaded = load(shuffled);
    EXPECT_TRUE(validate(loaded).empty());
    ASSERT_FALSE(loaded.order.empty());
    EXPECT_EQ(loaded.order.front().str(), "VRTX");
    EXPECT_EQ(load(save(loaded)), loaded);
    EXPECT_EQ(save(loaded), bytes);
}

TEST(M2, InvalidMagic) {
    auto bytes = save(make_model(FormatVersion::WotLK));
    bytes[0] = 'X';
    EXPECT_EQ(load_error(bytes), ParseErrorKind::InvalidMagic);
}

TEST(M2, UnknownHeaderVersion) {
    auto bytes = save(make_model(FormatVersion::WotLK));
    uint32_t number = 999;
    std::memcpy(bytes.data() + 4, &number, 4);
    EXPECT_EQ(load_error(bytes), ParseErrorKind::UnknownVersion);
}

TEST(M2, TruncatedHeader) {
    auto bytes = save(make_model(FormatVersion::WotLK));
    bytes.resize(40);
    EXPECT_EQ(load_error(bytes), ParseErrorKind::Truncated);
    EXPECT_EQ(load_error({}), ParseErrorKind::Truncated);
}

TEST(M2, TruncatedChunkPayload) {
    auto model = make_model(FormatVersion::WotLK);
    auto bytes = save(model);
    // 8-byte header claiming 100 bytes, only 10 present.
    const uint8_t header[] = {'Z', 'Z', 'Z', 'Z', 100, 0, 0, 0};
    bytes.insert(bytes.end(), std::begin(header), std::end(header));
    bytes.insert(bytes.end(), 10, 0xAB);
    EXPECT_EQ(load_error(bytes), ParseErrorKind::Truncated);
}

TEST(M2, IllegalChunkForVersion) {
    auto bytes = with_chunk(save(make_model(FormatVersion::WotLK)), "PLAY", {0, 0, 0, 0});
    EXPECT_EQ(load_error(bytes), ParseErrorKind::IllegalChunkForVersion);
}

TEST(M2, DuplicateChunk) {
    auto model = make_model(FormatVersion::WotLK);
    auto texs = encode_chunk(model.chunks.at("TEXS"), model.version());
    auto bytes = with_chunk(save(model), "TEXS", texs);
    EXPECT_EQ(load_error(bytes), ParseErrorKind::DuplicateChunk);
}

TEST(M2, DuplicateUnknownChunk) {
    auto bytes = save(make_model(FormatVersion::WotLK));
    bytes = with_chunk(bytes, "ZZZZ", {1});
    bytes = with_chunk(bytes, "ZZZZ", {2});
    EXPECT_EQ(load_error(bytes), ParseErrorKind::DuplicateChunk);
}

TEST(M2, StrideMismatchIsMalformed) {
    auto model = make_model(FormatVersion::WotLK);
    model.erase("MATS");
    auto bytes = with_chunk(save(model), "MATS", {0, 0, 1, 0, 0, 0});
    EXPECT_EQ(load_error(bytes), ParseErrorKind::MalformedChunk);
}

TEST(M2, ExactSizeMismatchIsMalformed) {
    auto model = make_model(FormatVersion::Legion);
    auto bytes = with_chunk(save(model), "SKID", {1, 2, 3, 4, 5});
    EXPECT_EQ(load_error(bytes), ParseErrorKind::MalformedChunk);
}

TEST(M2, TrailingPayloadBytesAreMalformed) {
    auto model = make_model(FormatVersion::WotLK);
    auto texs = encode_chunk(model.chunks.at("TEXS"), model.version());
    texs.push_back(0);
    model.erase("TEXS");
    auto bytes = with_chunk(save(model), "TEXS", texs);
    EXPECT_EQ(load_error(bytes), ParseErrorKind::MalformedChunk);
}

TEST(M2, ImpossibleCountIsTruncated) {
    auto model = make_model(FormatVersion::WotLK);
    model.erase("TEXS");
    auto bytes = with_chunk(save(model), "TEXS", {0xFF, 0xFF, 0xFF, 0x0F});
    EXPECT_EQ(load_error(bytes), ParseErrorKind::Truncated);
}

TEST(M2, UnknownChunkRoundTrips) {
    auto model = make_model(FormatVersion::MoP);
    model.set(RawChunk{"ZZZZ", {1, 2, 3}});
    auto bytes = save(model);
    auto loaded = load(bytes);
    const auto* raw = std::get_if<RawChunk>(&loaded.chunks.at("ZZZZ"));
    ASSERT_NE(raw, nullptr);
    EXPECT_EQ(raw->data, (std::vector<uint8_t>{1, 2, 3}));
    EXPECT_EQ(save(loaded), bytes);
}

TEST(M2, AnimationFileIdsMerge) {
    auto model = make_model(FormatVersion::Legion);
    auto bytes = save(model);
    bytes = with_chunk(bytes, "AFID", {0, 0, 0, 0, 0x10, 0, 0, 0});
    bytes = with_chunk(bytes, "AFID", {4, 0, 0, 0, 0x20, 0, 0, 0});
    auto loaded = load(bytes);
    const auto* afid = loaded.find<AnimationFileIds>();
    ASSERT_NE(afid, nullptr);
    ASSERT_EQ(afid->entries.size(), 2u);
    EXPECT_EQ(afid->entries[0].file_id, 0x10u);
    EXPECT_EQ(afid->entries[1].animation_id, 4);
    EXPECT_EQ(afid->entries[1].file_id, 0x20u);

    auto tags = saved_tags(loaded);
    EXPECT_EQ(std::count(tags.begin(), tags.end(), "AFID"), 1);
}

TEST(M2, PreLegionWritesTableOrder) {
    Model model;
    model.header.version = FormatVersion::WotLK;
    model.set(RawChunk{"ZZZZ", {}});
    model.set(Textures{});
    model.set(Sequences{});
    model.set(Bones{});
    model.set(Vertices{});
    EXPECT_EQ(saved_tags(model),
              (std::vector<std::string>{"VRTX", "BONE", "SEQS", "TEXS", "ZZZZ"}));
}

TEST(M2, LegionKeepsFirstSeenOrder) {
    Model model;
    model.header.version = FormatVersion::Legion;
    model.header.skin_profile_count = 0;
    model.set(SkinFileIds{});
    model.set(Textures{});
    model.set(RawChunk{"ZZZZ", {}});
    model.set(Vertices{});
    model.set(Bones{});
    model.set(Sequences{});
    model.set(TextureCombiners{});
    auto tags = saved_tags(model);
    EXPECT_EQ(tags, (std::vector<std::string>{"SFID", "TEXS", "ZZZZ", "VRTX", "BONE", "SEQS",
                                              "TXAC"}));
    EXPECT_EQ(load(save(model)).order, model.order);
}

TEST(M2, ChunkSizeFieldMatchesPayload) {
    auto model = make_model(FormatVersion::Legion);
    auto bytes = save(model);
    auto records = chunk::read_all(bytes, chunks_start(model));
    ASSERT_EQ(records.size(), model.chunks.size());
    for (const auto& rec : records) {
        EXPECT_EQ(rec.size, rec.payload.size());
        EXPECT_EQ(rec.payload.size(), encode_chunk(model.chunks.at(rec.tag), model.version()).size());
    }
}

TEST(M2, SaveRejectsChunkIllegalForVersion) {
    auto model = make_model(FormatVersion::WotLK);
    model.set(PlayableAnimations{});
    EXPECT_THROW(save(model), std::runtime_error);
}

TEST(M2, SaveRejectsWrongRotationLayout) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Bones>()->bones[0].rotation = Track<Quat>{};
    EXPECT_THROW(save(model), std::runtime_error);
}

TEST(M2, VersionSpecificFields) {
    auto classic = load(save(make_model(FormatVersion::Classic)));
    const auto& s = classic.find<Sequences>()->sequences[1];
    EXPECT_EQ(s.start_timestamp, 1000u);
    EXPECT_EQ(s.end_timestamp, 3000u);
    EXPECT_EQ(s.duration, 0u);
    EXPECT_TRUE(std::holds_alternative<Track<Quat>>(classic.find<Bones>()->bones[1].rotation));

    auto mop = load(save(make_model(FormatVersion::MoP)));
    const auto& ms = mop.find<Sequences>()->sequences[1];
    EXPECT_EQ(ms.duration, 2000u);
    EXPECT_EQ(ms.blend_time_in, 150);
    EXPECT_EQ(ms.blend_time, 0u);
    EXPECT_EQ(mop.find<Cameras>()->entries[0].fov_track.sequences.size(), 2u);
}

TEST(M2, SummarizeListsChunks) {
    auto model = make_model(FormatVersion::WotLK);
    auto summary = summarize(model);
    ASSERT_EQ(summary.size(), model.chunks.size());
    EXPECT_EQ(summary[0].tag.str(), "VRTX");
    EXPECT_EQ(summary[0].name, "vertices");
    EXPECT_EQ(summary[0].elements, 2u);
    EXPECT_EQ(summary[0].size, 96u);
}

TEST(M2, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "m2tools_m2_test.m2";
    auto model = make_model(FormatVersion::Cataclysm);
    save(model, path);
    EXPECT_EQ(load(path), model);
    std::filesystem::remove(path);
    EXPECT_THROW(load(path), IoError);
}

// --- Validation ---

namespace {

bool has_issue(const std::vector<ValidationIssue>& issues, ValidationErrorKind kind,
               const std::string& chunk) {
    return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& i) {
        return i.kind == kind && i.chunk == chunk;
    });
}

} // namespace

TEST(M2Validate, CleanModel) {
    for (const auto& info : version::all_versions())
        EXPECT_TRUE(validate(make_model(info.version)).empty()) << info.name;
}

TEST(M2Validate, DanglingAttachmentBone) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Attachments>()->entries[0].bone = 7;
    auto issues = validate(model);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, ValidationErrorKind::DanglingReference);
    EXPECT_EQ(issues[0].chunk, "ATCH");
}

TEST(M2Validate, VertexBoneIndex) {
    auto model = make_model(FormatVersion::WotLK);
    auto& vx = model.find<Vertices>()->vertices[0];
    vx.bone_indices[1] = 9; // zero weight, ignored
    EXPECT_TRUE(validate(model).empty());
    vx.bone_weights[1] = 10;
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::OutOfBoundsIndex, "VRTX"));
}

TEST(M2Validate, BoneParent) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Bones>()->bones[1].parent_bone = 1;
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::OutOfBoundsIndex, "BONE"));
}

TEST(M2Validate, SequenceLookup) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Sequences>()->lookup.push_back(5);
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::OutOfBoundsIndex, "SEQS"));
}

TEST(M2Validate, TrackGlobalSequence) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Bones>()->bones[0].translation.global_sequence = 0;
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::DanglingReference, "BONE"));
    model.find<Sequences>()->global_sequences.push_back(1000);
    EXPECT_TRUE(validate(model).empty());
}

TEST(M2Validate, TrackSequenceCount) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Bones>()->bones[1].translation.sequences.pop_back();
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::CountMismatch, "BONE"));

    auto classic = make_model(FormatVersion::Classic);
    classic.find<Attachments>()->entries[0].animate_attached.ranges.pop_back();
    EXPECT_TRUE(has_issue(validate(classic), ValidationErrorKind::CountMismatch, "ATCH"));
}

TEST(M2Validate, TrackRangeOutsideKeys) {
    auto model = make_model(FormatVersion::Classic);
    model.find<Bones>()->bones[1].translation.ranges[1] = {2, 5};
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::OutOfBoundsIndex, "BONE"));
}

TEST(M2Validate, ParticleTexturesAndGeometry) {
    auto model = make_model(FormatVersion::Cataclysm);
    ParticleEmitter p;
    p.bone = 0;
    p.flags = kParticleMultiTexture;
    p.texture = static_cast<uint16_t>(0 | (0 << 5) | (3 << 10));
    p.particle_type = kParticleTypeModel;
    model.set(ParticleEmitters{{p}});
    auto issues = validate(model);
    EXPECT_EQ(std::count_if(issues.begin(), issues.end(),
                            [](const ValidationIssue& i) { return i.chunk == "PRTE"; }),
              2);

    auto& emitter = model.find<ParticleEmitters>()->emitters[0];
    emitter.texture = 0;
    emitter.geometry_model = "spells/orb.m2";
    EXPECT_TRUE(validate(model).empty());
}

TEST(M2Validate, RibbonReferences) {
    auto model = make_model(FormatVersion::WotLK);
    RibbonEmitter rb;
    rb.bone = 1;
    rb.texture_indices = {0};
    rb.material_indices = {3};
    model.set(RibbonEmitters{{rb}});
    auto issues = validate(model);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].chunk, "RIBB");
}

TEST(M2Validate, PhysicsJoints) {
    auto model = make_model(FormatVersion::MoP);
    Physics phys;
    phys.shapes.push_back(PhysicsShape{});
    phys.joints.push_back(PhysicsJoint{0, 1, 0, 0, {}});
    model.set(phys);
    EXPECT_TRUE(has_issue(validate(model), ValidationErrorKind::OutOfBoundsIndex, "PHYS"));
}

TEST(M2Validate, CountConsistency) {
    auto model = make_model(FormatVersion::Legion);
    TextureFileIds txid;
    txid.file_ids = {1, 2};
    model.set(txid);
    model.find<TextureCombiners>()->entries.push_back({1, 1});
    model.find<SkinFileIds>()->file_ids.push_back(99);
    auto issues = validate(model);
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::CountMismatch, "TXID"));
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::CountMismatch, "TXAC"));
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::CountMismatch, "SFID"));
}

TEST(M2Validate, AnimationIds) {
    auto model = make_model(FormatVersion::Legion);
    AnimationFileIds afid;
    afid.entries = {{0, 0, 10}, {13, 0, 11}};
    model.set(afid);
    ParentAnimationBlacklist pabc;
    pabc.values = {4, 5};
    model.set(pabc);
    auto issues = validate(model);
    EXPECT_EQ(issues.size(), 2u);
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::DanglingReference, "AFID"));
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::DanglingReference, "PABC"));
}

TEST(M2Validate, MissingRequiredChunk) {
    auto model = make_model(FormatVersion::Legion);
    model.erase("TXAC");
    model.erase("BONE");
    auto issues = validate(model);
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::MissingRequiredChunk, "TXAC"));
    EXPECT_TRUE(has_issue(issues, ValidationErrorKind::MissingRequiredChunk, "BONE"));
}

TEST(M2Validate, DoesNotModifyModel) {
    auto model = make_model(FormatVersion::WotLK);
    model.find<Attachments>()->entries[0].bone = 7;
    auto copy = model;
    validate(model);
    EXPECT_EQ(model, copy);
}
