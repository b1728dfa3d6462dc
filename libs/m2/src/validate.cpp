#include "m2tools/m2.h"

#include <algorithm>
#include <format>
#include <set>

namespace m2tools::m2 {

namespace {

using version::Feature;

class Checker {
public:
    explicit Checker(const Model& model) : model_(model), v_(model.version()) {
        if (const auto* seqs = model.find<Sequences>()) {
            sequence_count_ = seqs->sequences.size();
            global_count_ = seqs->global_sequences.size();
            for (const auto& s : seqs->sequences) sequence_ids_.insert(s.id);
        }
        if (const auto* bones = model.find<Bones>()) bone_count_ = bones->bones.size();
        if (const auto* tex = model.find<Textures>()) texture_count_ = tex->textures.size();
        if (const auto* mats = model.find<Materials>()) material_count_ = mats->materials.size();
        if (const auto* prte = model.find<ParticleEmitters>())
            emitter_count_ = prte->emitters.size();
    }

    std::vector<ValidationIssue> run() {
        check_required();
        check_vertices();
        check_bones();
        check_sequences();
        check_scene();
        check_effects();
        check_counts();
        check_animation_ids();
        return std::move(issues_);
    }

private:
    void add(ValidationErrorKind kind, std::string chunk, std::string message) {
        issues_.push_back({kind, std::move(chunk), std::move(message)});
    }

    void check_bone(const char* chunk, const std::string& where, int64_t bone,
                    bool allow_none = false) {
        if (allow_none && bone == -1) return;
        if (bone < 0 || static_cast<uint64_t>(bone) >= bone_count_)
            add(ValidationErrorKind::DanglingReference, chunk,
                std::format("{}: {} references bone {} of {}", chunk, where, bone, bone_count_));
    }

    void check_texture(const char* chunk, const std::string& where, size_t index) {
        if (index >= texture_count_)
            add(ValidationErrorKind::DanglingReference, chunk,
                std::format("{}: {} references texture {} of {}", chunk, where, index,
                            texture_count_));
    }

    template <typename T>
    void track(const Track<T>& t, const char* chunk, const std::string& where) {
        if (t.global_sequence >= 0 && static_cast<size_t>(t.global_sequence) >= global_count_)
            add(ValidationErrorKind::DanglingReference, chunk,
                std::format("{}: {} uses global sequence {} of {}", chunk, where,
                            t.global_sequence, global_count_));

        for (size_t i = 0; i < t.sequences.size(); ++i) {
            const auto& keys = t.sequences[i];
            if (keys.values.size() != keys.timestamps.size())
                add(ValidationErrorKind::CountMismatch, chunk,
                    std::format("{}: {} key run {} has {} timestamps and {} values", chunk,
                                where, i, keys.timestamps.size(), keys.values.size()));
        }

        bool global = t.global_sequence >= 0;
        if (!version::has(v_, Feature::PerSequenceTracks)) {
            if (t.sequences.size() > 1)
                add(ValidationErrorKind::CountMismatch, chunk,
                    std::format("{}: {} holds {} key runs on a shared timeline", chunk, where,
                                t.sequences.size()));
            if (!global && !t.ranges.empty() && t.ranges.size() != sequence_count_)
                add(ValidationErrorKind::CountMismatch, chunk,
                    std::format("{}: {} has {} ranges for {} sequences", chunk, where,
                                t.ranges.size(), sequence_count_));
            size_t keys = t.sequences.empty() ? 0 : t.sequences[0].size();
            for (size_t i = 0; i < t.ranges.size(); ++i) {
                const auto& range = t.ranges[i];
                if (range.first > range.end || range.end > keys)
                    add(ValidationErrorKind::OutOfBoundsIndex, chunk,
                        std::format("{}: {} range {} [{}, {}) exceeds {} keys", chunk, where, i,
                                    range.first, range.end, keys));
            }
            return;
        }

        if (!t.ranges.empty())
            add(ValidationErrorKind::CountMismatch, chunk,
                std::format("{}: {} carries {} key ranges in a per-sequence layout", chunk,
                            where, t.ranges.size()));
        if (!global && !t.sequences.empty() && t.sequences.size() != sequence_count_)
            add(ValidationErrorKind::CountMismatch, chunk,
                std::format("{}: {} has {} key runs for {} sequences", chunk, where,
                            t.sequences.size(), sequence_count_));
    }

    void check_required() {
        for (const auto& rule : chunk_rules()) {
            if (presence(rule, v_) == Presence::Required && !model_.has(rule.tag))
                add(ValidationErrorKind::MissingRequiredChunk, rule.tag.str(),
                    std::format("{} ({}) is required in {}", rule.tag.str(), rule.name,
                                version::name(v_)));
        }
    }

    void check_vertices() {
        const auto* vrtx = model_.find<Vertices>();
        if (!vrtx) return;
        for (size_t i = 0; i < vrtx->vertices.size(); ++i) {
            const auto& vx = vrtx->vertices[i];
            for (size_t k = 0; k < 4; ++k) {
                if (vx.bone_weights[k] != 0 && vx.bone_indices[k] >= bone_count_)
                    add(ValidationErrorKind::OutOfBoundsIndex, "VRTX",
                        std::format("VRTX: vertex {} weights bone {} of {}", i,
                                    vx.bone_indices[k], bone_count_));
            }
        }
    }

    void check_bones() {
        const auto* bones = model_.find<Bones>();
        if (!bones) return;
        for (size_t i = 0; i < bones->bones.size(); ++i) {
            const auto& b = bones->bones[i];
            if (b.parent_bone != -1 &&
                (b.parent_bone < 0 || static_cast<size_t>(b.parent_bone) >= bone_count_ ||
                 static_cast<size_t>(b.parent_bone) == i))
                add(ValidationErrorKind::OutOfBoundsIndex, "BONE",
                    std::format("BONE: bone {} has parent {}", i, b.parent_bone));
            auto where = std::format("bone {}", i);
            track(b.translation, "BONE", where);
            std::visit([&](const auto& t) { track(t, "BONE", where); }, b.rotation);
            track(b.scale, "BONE", where);
        }
    }

    void check_sequences() {
        const auto* seqs = model_.find<Sequences>();
        if (!seqs) return;
        auto valid = [&](int64_t index) {
            return index >= 0 && static_cast<size_t>(index) < sequence_count_;
        };
        for (size_t i = 0; i < seqs->lookup.size(); ++i) {
            auto entry = seqs->lookup[i];
            if (entry != -1 && !valid(entry))
                add(ValidationErrorKind::OutOfBoundsIndex, "SEQS",
                    std::format("SEQS: lookup entry {} points at sequence {}", i, entry));
        }
        for (size_t i = 0; i < seqs->sequences.size(); ++i) {
            const auto& s = seqs->sequences[i];
            if (s.variation_next != -1 && !valid(s.variation_next))
                add(ValidationErrorKind::OutOfBoundsIndex, "SEQS",
                    std::format("SEQS: sequence {} variation_next {}", i, s.variation_next));
            if ((s.flags & kSequenceAliasFlag) && !valid(s.alias_next))
                add(ValidationErrorKind::OutOfBoundsIndex, "SEQS",
                    std::format("SEQS: alias sequence {} points at {}", i, s.alias_next));
        }
    }

    void check_scene() {
        if (const auto* colr = model_.find<ColorAnimations>()) {
            for (size_t i = 0; i < colr->entries.size(); ++i) {
                auto where = std::format("color {}", i);
                track(colr->entries[i].color, "COLR", where);
                track(colr->entries[i].alpha, "COLR", where);
            }
        }
        if (const auto* tran = model_.find<TransparencyAnimations>()) {
            for (size_t i = 0; i < tran->entries.size(); ++i)
                track(tran->entries[i].weight, "TRAN", std::format("transparency {}", i));
        }
        if (const auto* txan = model_.find<TextureTransforms>()) {
            for (size_t i = 0; i < txan->entries.size(); ++i) {
                auto where = std::format("transform {}", i);
                track(txan->entries[i].translation, "TXAN", where);
                track(txan->entries[i].rotation, "TXAN", where);
                track(txan->entries[i].scaling, "TXAN", where);
            }
            for (size_t i = 0; i < txan->lookup.size(); ++i) {
                auto entry = txan->lookup[i];
                if (entry != -1 && (entry < 0 || static_cast<size_t>(entry) >= txan->entries.size()))
                    add(ValidationErrorKind::OutOfBoundsIndex, "TXAN",
                        std::format("TXAN: lookup entry {} points at transform {}", i, entry));
            }
        }
        if (const auto* atch = model_.find<Attachments>()) {
            for (size_t i = 0; i < atch->entries.size(); ++i) {
                auto where = std::format("attachment {}", i);
                check_bone("ATCH", where, atch->entries[i].bone);
                track(atch->entries[i].animate_attached, "ATCH", where);
            }
        }
        if (const auto* evts = model_.find<Events>()) {
            for (size_t i = 0; i < evts->entries.size(); ++i) {
                auto where = std::format("event {}", i);
                check_bone("EVTS", where, evts->entries[i].bone);
                track(evts->entries[i].enabled, "EVTS", where);
            }
        }
        if (const auto* lite = model_.find<Lights>()) {
            for (size_t i = 0; i < lite->entries.size(); ++i) {
                const auto& l = lite->entries[i];
                auto where = std::format("light {}", i);
                check_bone("LITE", where, l.bone, true);
                track(l.ambient_color, "LITE", where);
                track(l.ambient_intensity, "LITE", where);
                track(l.diffuse_color, "LITE", where);
                track(l.diffuse_intensity, "LITE", where);
                track(l.attenuation_start, "LITE", where);
                track(l.attenuation_end, "LITE", where);
                track(l.visibility, "LITE", where);
            }
        }
        if (const auto* cams = model_.find<Cameras>()) {
            for (size_t i = 0; i < cams->entries.size(); ++i) {
                const auto& c = cams->entries[i];
                auto where = std::format("camera {}", i);
                track(c.positions, "CAMS", where);
                track(c.target_positions, "CAMS", where);
                track(c.roll, "CAMS", where);
                track(c.fov_track, "CAMS", where);
            }
        }
    }

    void check_effects() {
        const auto* gpid = model_.find<GeometryParticleIds>();
        if (const auto* prte = model_.find<ParticleEmitters>()) {
            bool packed_allowed = version::has(v_, Feature::MultiTextureParticles);
            for (size_t i = 0; i < prte->emitters.size(); ++i) {
                const auto& p = prte->emitters[i];
                auto where = std::format("emitter {}", i);
                check_bone("PRTE", where, p.bone);
                if (packed_allowed && (p.flags & kParticleMultiTexture)) {
                    for (int k = 0; k < 3; ++k)
                        check_texture("PRTE", where, packed_texture(p.texture, k));
                } else {
                    check_texture("PRTE", where, p.texture);
                }
                if (p.particle_type == kParticleTypeModel && p.geometry_model.empty()) {
                    bool by_id = gpid && i < gpid->file_ids.size() && gpid->file_ids[i] != 0;
                    if (!by_id)
                        add(ValidationErrorKind::DanglingReference, "PRTE",
                            std::format("PRTE: model {} has no geometry reference", where));
                }
                for (const auto* t : {&p.emission_speed, &p.speed_variation, &p.vertical_range,
                                      &p.horizontal_range, &p.gravity, &p.lifespan,
                                      &p.emission_rate, &p.z_source})
                    track(*t, "PRTE", where);
                track(p.enabled, "PRTE", where);
            }
        }
        if (const auto* exp2 = model_.find<ExtendedParticles>()) {
            for (size_t i = 0; i < exp2->entries.size(); ++i)
                track(exp2->entries[i].alpha_cutoff, "EXP2", std::format("entry {}", i));
        }
        if (const auto* ribb = model_.find<RibbonEmitters>()) {
            for (size_t i = 0; i < ribb->ribbons.size(); ++i) {
                const auto& rb = ribb->ribbons[i];
                auto where = std::format("ribbon {}", i);
                check_bone("RIBB", where, rb.bone);
                for (auto t : rb.texture_indices) check_texture("RIBB", where, t);
                for (auto m : rb.material_indices) {
                    if (m >= material_count_)
                        add(ValidationErrorKind::DanglingReference, "RIBB",
                            std::format("RIBB: {} references material {} of {}", where, m,
                                        material_count_));
                }
                track(rb.color, "RIBB", where);
                track(rb.alpha, "RIBB", where);
                track(rb.height_above, "RIBB", where);
                track(rb.height_below, "RIBB", where);
                track(rb.tex_slot, "RIBB", where);
                track(rb.visibility, "RIBB", where);
            }
        }
        if (const auto* phys = model_.find<Physics>()) {
            for (size_t i = 0; i < phys->shapes.size(); ++i)
                check_bone("PHYS", std::format("shape {}", i), phys->shapes[i].bone);
            for (size_t i = 0; i < phys->joints.size(); ++i) {
                const auto& j = phys->joints[i];
                if (j.shape_a >= phys->shapes.size() || j.shape_b >= phys->shapes.size())
                    add(ValidationErrorKind::OutOfBoundsIndex, "PHYS",
                        std::format("PHYS: joint {} links shapes {} and {} of {}", i, j.shape_a,
                                    j.shape_b, phys->shapes.size()));
            }
        }
    }

    void count_match(const char* chunk, size_t have, const char* what, size_t want) {
        if (have != want)
            add(ValidationErrorKind::CountMismatch, chunk,
                std::format("{}: {} entries for {} {}", chunk, have, want, what));
    }

    void check_counts() {
        if (const auto* txid = model_.find<TextureFileIds>())
            count_match("TXID", txid->file_ids.size(), "textures", texture_count_);
        if (const auto* txac = model_.find<TextureCombiners>())
            count_match("TXAC", txac->entries.size(), "materials", material_count_);
        if (const auto* exp2 = model_.find<ExtendedParticles>())
            count_match("EXP2", exp2->entries.size(), "particle emitters", emitter_count_);
        if (const auto* pgd1 = model_.find<ParticleGeosets>())
            count_match("PGD1", pgd1->values.size(), "particle emitters", emitter_count_);
        if (const auto* sfid = model_.find<SkinFileIds>())
            count_match("SFID", sfid->file_ids.size(), "skin profiles",
                        model_.header.skin_profile_count);
    }

    void check_animation_ids() {
        if (const auto* afid = model_.find<AnimationFileIds>()) {
            for (size_t i = 0; i < afid->entries.size(); ++i) {
                auto id = afid->entries[i].animation_id;
                if (!sequence_ids_.contains(id))
                    add(ValidationErrorKind::DanglingReference, "AFID",
                        std::format("AFID: entry {} names animation {} without a sequence", i,
                                    id));
            }
        }
        if (const auto* pabc = model_.find<ParentAnimationBlacklist>()) {
            for (size_t i = 0; i < pabc->values.size(); ++i) {
                if (!sequence_ids_.contains(pabc->values[i]))
                    add(ValidationErrorKind::DanglingReference, "PABC",
                        std::format("PABC: entry {} names animation {} without a sequence", i,
                                    pabc->values[i]));
            }
        }
    }

    const Model& model_;
    FormatVersion v_;
    size_t sequence_count_ = 0;
    size_t global_count_ = 0;
    size_t bone_count_ = 0;
    size_t texture_count_ = 0;
    size_t material_count_ = 0;
    size_t emitter_count_ = 0;
    std::set<uint16_t> sequence_ids_;
    std::vector<ValidationIssue> issues_;
};

} // namespace

std::vector<ValidationIssue> validate(const Model& model) {
    return Checker(model).run();
}

} // namespace m2tools::m2
