#pragma once

#include "m2tools/chunk.h"
#include "m2tools/errors.h"
#include "m2tools/m2_chunks.h"
#include "m2tools/m2_layout.h"
#include "m2tools/version.h"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <map>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace m2tools::m2 {

inline constexpr char kModelMagic[] = "MD20";

// Header is the fixed part of a model file, identical in every version
// except for the header number.
struct Header {
    FormatVersion version = FormatVersion::WotLK;
    // header_number is the number stored in the file. save() writes it back
    // when it is in the accepted range of version, the canonical number
    // otherwise (0 always selects the canonical number).
    uint32_t header_number = 0;
    uint32_t global_flags = 0;
    uint32_t skin_profile_count = 0;
    Vec3 bounding_box_min = {0.0f, 0.0f, 0.0f};
    Vec3 bounding_box_max = {0.0f, 0.0f, 0.0f};
    float bounding_radius = 0.0f;
    Vec3 collision_box_min = {0.0f, 0.0f, 0.0f};
    Vec3 collision_box_max = {0.0f, 0.0f, 0.0f};
    float collision_radius = 0.0f;
    std::string name;

    bool operator==(const Header&) const = default;
};

// Model is a decoded model file: the header plus one decoded value per chunk
// tag. From Legion on, order keeps the first-seen tag order of the source
// file; before Legion, load() and convert() leave it in save order. Chunks
// added later are appended.
struct Model {
    Header header;
    std::map<chunk::Tag, ChunkValue> chunks;
    std::vector<chunk::Tag> order;

    FormatVersion version() const { return header.version; }

    bool has(const chunk::Tag& tag) const { return chunks.contains(tag); }

    template <typename T>
    const T* find() const {
        auto it = chunks.find(T::kTag);
        return it == chunks.end() ? nullptr : std::get_if<T>(&it->second);
    }

    template <typename T>
    T* find() {
        auto it = chunks.find(T::kTag);
        return it == chunks.end() ? nullptr : std::get_if<T>(&it->second);
    }

    // set stores value under its tag, replacing any previous value.
    void set(ChunkValue value);

    // erase removes the chunk stored under tag. Returns false if absent.
    bool erase(const chunk::Tag& tag);

    bool operator==(const Model&) const = default;
};

// stored_header_number returns the number save() writes for h.
uint32_t stored_header_number(const Header& h);

// ChunkSummary describes one stored chunk for reports.
struct ChunkSummary {
    chunk::Tag tag;
    std::string name;   // layout name, "unknown" for opaque chunks
    size_t size = 0;    // encoded payload size at the model's version
    size_t elements = 0;
};

// load parses a model file. Throws ParseError.
Model load(std::span<const uint8_t> data);
Model load(const std::filesystem::path& path);
Model read(std::istream& r);

// save encodes the model at its declared version. Chunks are written in table
// order before Legion and in first-seen order from Legion on. Throws
// std::runtime_error when a stored chunk is illegal for the declared version
// or a value cannot be represented.
std::vector<uint8_t> save(const Model& model);
void save(const Model& model, const std::filesystem::path& path);
void write(std::ostream& w, const Model& model);

// output_order returns the tags save() writes, in write order.
std::vector<chunk::Tag> output_order(const Model& model);

// encode_chunk returns the payload of one chunk encoded for version v.
std::vector<uint8_t> encode_chunk(const ChunkValue& value, FormatVersion v);

// element_count returns the number of top-level entries of a chunk value.
size_t element_count(const ChunkValue& value);

std::vector<ChunkSummary> summarize(const Model& model);

// validate checks referential integrity and count consistency. It never
// modifies the model and reports every finding.
std::vector<ValidationIssue> validate(const Model& model);

} // namespace m2tools::m2
