#pragma once

#include "m2tools/binutil.h"
#include "m2tools/errors.h"
#include "m2tools/version.h"

#include <array>
#include <cstdint>
#include <format>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace m2tools::m2 {

using version::FormatVersion;

using Vec3 = std::array<float, 3>;
using Quat = std::array<float, 4>;       // x, y, z, w
using CompQuat = std::array<int16_t, 4>; // x, y, z, w scaled by 32767
using Fixed16 = int16_t;                 // 0..32767 maps to 0.0..1.0

// NoValue is the value type of timeline-only tracks (events).
struct NoValue {
    bool operator==(const NoValue&) const = default;
};

enum class Interpolation : uint16_t { None = 0, Linear = 1, Bezier = 2, Hermite = 3 };

// KeyRange is the half-open key index span of one sequence in a ranged
// (pre-WotLK) track.
struct KeyRange {
    uint32_t first = 0;
    uint32_t end = 0;

    bool operator==(const KeyRange&) const = default;
};

template <typename T>
struct TrackKeys {
    std::vector<uint32_t> timestamps;
    std::vector<T> values;

    size_t size() const { return timestamps.size(); }
    bool operator==(const TrackKeys&) const = default;
};

// Track is an animated value. Ranged tracks (before WotLK) hold one key run on
// the shared timeline plus per-sequence ranges; per-sequence tracks hold one
// key run per sequence with sequence-relative timestamps.
template <typename T>
struct Track {
    uint16_t interpolation = 0;
    int16_t global_sequence = -1;
    std::vector<KeyRange> ranges;
    std::vector<TrackKeys<T>> sequences;

    size_t key_count() const {
        size_t n = 0;
        for (const auto& s : sequences) n += s.size();
        return n;
    }

    bool empty() const { return key_count() == 0; }
    bool operator==(const Track&) const = default;
};

// --- Value encodings ---

namespace detail {

inline void read_value(std::istream& r, float& v) { v = binutil::read_f32(r); }
inline void read_value(std::istream& r, int16_t& v) { v = binutil::read_i16(r); }
inline void read_value(std::istream& r, uint16_t& v) { v = binutil::read_u16(r); }
inline void read_value(std::istream& r, uint8_t& v) { v = binutil::read_u8(r); }
inline void read_value(std::istream& r, Vec3& v) { v = binutil::read_vec3(r); }
inline void read_value(std::istream& r, Quat& v) { v = binutil::read_pod<Quat>(r, "quat"); }
inline void read_value(std::istream& r, CompQuat& v) { v = binutil::read_pod<CompQuat>(r, "quat16"); }
inline void read_value(std::istream&, NoValue&) {}

inline void write_value(std::ostream& w, float v) { binutil::write_f32(w, v); }
inline void write_value(std::ostream& w, int16_t v) { binutil::write_i16(w, v); }
inline void write_value(std::ostream& w, uint16_t v) { binutil::write_u16(w, v); }
inline void write_value(std::ostream& w, uint8_t v) { binutil::write_u8(w, v); }
inline void write_value(std::ostream& w, const Vec3& v) { binutil::write_vec3(w, v); }
inline void write_value(std::ostream& w, const Quat& v) { binutil::write_pod(w, v, "quat"); }
inline void write_value(std::ostream& w, const CompQuat& v) { binutil::write_pod(w, v, "quat16"); }
inline void write_value(std::ostream&, const NoValue&) {}

template <typename T>
constexpr size_t value_size() {
    if constexpr (std::is_same_v<T, NoValue>) return 0;
    else return sizeof(T);
}

template <typename T>
TrackKeys<T> read_keys(std::istream& r, uint32_t n) {
    TrackKeys<T> keys;
    keys.timestamps = binutil::read_array<uint32_t>(r, n, "timestamp");
    keys.values.resize(n);
    for (auto& v : keys.values) read_value(r, v);
    return keys;
}

template <typename T>
void write_keys(std::ostream& w, const TrackKeys<T>& keys) {
    if (keys.values.size() != keys.timestamps.size())
        throw std::runtime_error("m2: track key run has mismatched timestamp and value counts");
    binutil::write_array(w, keys.timestamps, "timestamp");
    for (const auto& v : keys.values) write_value(w, v);
}

} // namespace detail

template <typename T>
Track<T> read_track(std::istream& r, FormatVersion v) {
    Track<T> t;
    t.interpolation = binutil::read_u16(r);
    t.global_sequence = binutil::read_i16(r);

    if (!version::has(v, version::Feature::PerSequenceTracks)) {
        auto range_count = binutil::read_count(r, 8, "track range");
        t.ranges.resize(range_count);
        for (auto& range : t.ranges) {
            range.first = binutil::read_u32(r);
            range.end = binutil::read_u32(r);
        }
        auto key_count = binutil::read_count(r, 4 + detail::value_size<T>(), "track key");
        if (key_count > 0)
            t.sequences.push_back(detail::read_keys<T>(r, key_count));
        return t;
    }

    auto seq_count = binutil::read_count(r, 4, "track sequence");
    t.sequences.reserve(seq_count);
    for (uint32_t i = 0; i < seq_count; ++i) {
        auto key_count = binutil::read_count(r, 4 + detail::value_size<T>(), "track key");
        t.sequences.push_back(detail::read_keys<T>(r, key_count));
    }
    return t;
}

template <typename T>
void write_track(std::ostream& w, const Track<T>& t, FormatVersion v) {
    binutil::write_u16(w, t.interpolation);
    binutil::write_i16(w, t.global_sequence);

    if (!version::has(v, version::Feature::PerSequenceTracks)) {
        if (t.sequences.size() > 1)
            throw std::runtime_error(std::format(
                "m2: ranged track holds {} key runs, expected at most one", t.sequences.size()));
        binutil::write_u32(w, static_cast<uint32_t>(t.ranges.size()));
        for (const auto& range : t.ranges) {
            binutil::write_u32(w, range.first);
            binutil::write_u32(w, range.end);
        }
        if (t.sequences.empty()) {
            binutil::write_u32(w, 0);
        } else {
            binutil::write_u32(w, static_cast<uint32_t>(t.sequences[0].size()));
            detail::write_keys(w, t.sequences[0]);
        }
        return;
    }

    if (!t.ranges.empty())
        throw std::runtime_error("m2: per-sequence track still carries key ranges");
    binutil::write_u32(w, static_cast<uint32_t>(t.sequences.size()));
    for (const auto& keys : t.sequences) {
        binutil::write_u32(w, static_cast<uint32_t>(keys.size()));
        detail::write_keys(w, keys);
    }
}

// --- Conversion between ranged and per-sequence layouts ---

// TrackContext carries the sequence start timestamps needed to move keys
// between the shared timeline and sequence-relative time.
struct TrackContext {
    FormatVersion from = FormatVersion::WotLK;
    FormatVersion to = FormatVersion::WotLK;
    std::vector<uint32_t> source_starts; // per sequence, source model
    std::vector<uint32_t> target_starts; // per sequence, converted model
};

template <typename T>
Track<T> convert_track(const Track<T>& t, const TrackContext& ctx, const char* where) {
    bool from_per = version::has(ctx.from, version::Feature::PerSequenceTracks);
    bool to_per = version::has(ctx.to, version::Feature::PerSequenceTracks);
    if (from_per == to_per) return t;

    Track<T> out;
    out.interpolation = t.interpolation;
    out.global_sequence = t.global_sequence;

    if (!from_per) {
        // ranged -> per-sequence
        if (t.global_sequence >= 0 || t.ranges.empty()) {
            out.sequences = t.sequences;
            return out;
        }
        static const TrackKeys<T> kNoKeys;
        const auto& run = t.sequences.empty() ? kNoKeys : t.sequences[0];
        for (size_t i = 0; i < t.ranges.size(); ++i) {
            const auto& range = t.ranges[i];
            if (range.first > range.end || range.end > run.size())
                throw ConversionError(
                    ConversionErrorKind::FieldOverflow, where,
                    std::format("{}: key range {} [{}, {}) exceeds {} keys", where, i,
                                range.first, range.end, run.size()));
            uint32_t start = i < ctx.source_starts.size() ? ctx.source_starts[i] : 0;
            TrackKeys<T> keys;
            for (uint32_t k = range.first; k < range.end; ++k) {
                if (run.timestamps[k] < start)
                    throw ConversionError(
                        ConversionErrorKind::FieldOverflow, where,
                        std::format("{}: key at {} precedes sequence {} start {}", where,
                                    run.timestamps[k], i, start));
                keys.timestamps.push_back(run.timestamps[k] - start);
                keys.values.push_back(run.values[k]);
            }
            out.sequences.push_back(std::move(keys));
        }
        return out;
    }

    // per-sequence -> ranged
    TrackKeys<T> run;
    bool global = t.global_sequence >= 0;
    for (size_t i = 0; i < t.sequences.size(); ++i) {
        const auto& keys = t.sequences[i];
        uint32_t start = 0;
        if (!global && i < ctx.target_starts.size()) start = ctx.target_starts[i];
        auto first = static_cast<uint32_t>(run.size());
        for (size_t k = 0; k < keys.size(); ++k) {
            uint64_t ts = static_cast<uint64_t>(keys.timestamps[k]) + start;
            if (ts > std::numeric_limits<uint32_t>::max())
                throw ConversionError(
                    ConversionErrorKind::FieldOverflow, where,
                    std::format("{}: timestamp {} of sequence {} overflows the shared timeline",
                                where, ts, i));
            run.timestamps.push_back(static_cast<uint32_t>(ts));
            run.values.push_back(keys.values[k]);
        }
        if (!global) out.ranges.push_back({first, static_cast<uint32_t>(run.size())});
    }
    if (run.size() > 0) out.sequences.push_back(std::move(run));
    return out;
}

// map_track_values rebuilds a track with every value passed through fn.
template <typename To, typename From, typename Fn>
Track<To> map_track_values(const Track<From>& t, Fn fn) {
    Track<To> out;
    out.interpolation = t.interpolation;
    out.global_sequence = t.global_sequence;
    out.ranges = t.ranges;
    for (const auto& keys : t.sequences) {
        TrackKeys<To> mapped;
        mapped.timestamps = keys.timestamps;
        mapped.values.reserve(keys.values.size());
        for (const auto& v : keys.values) mapped.values.push_back(fn(v));
        out.sequences.push_back(std::move(mapped));
    }
    return out;
}

} // namespace m2tools::m2
