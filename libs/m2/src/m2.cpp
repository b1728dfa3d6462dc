#include "m2tools/m2.h"

#include "codecs.h"

#include <algorithm>
#include <format>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace m2tools::m2 {

using namespace m2tools::binutil;

// ---------------------------------------------------------------------------
// Model
// ---------------------------------------------------------------------------

void Model::set(ChunkValue value) {
    auto tag = tag_of(value);
    if (!chunks.contains(tag)) order.push_back(tag);
    chunks.insert_or_assign(tag, std::move(value));
}

bool Model::erase(const chunk::Tag& tag) {
    if (chunks.erase(tag) == 0) return false;
    order.erase(std::remove(order.begin(), order.end(), tag), order.end());
    return true;
}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------

uint32_t stored_header_number(const Header& h) {
    const auto& info = version::info(h.version);
    if (h.header_number >= info.header_min && h.header_number <= info.header_max)
        return h.header_number;
    return info.header_number;
}

namespace {

Header read_header(std::istream& r) {
    if (read_signature(r) != "MD20")
        throw ParseError(ParseErrorKind::InvalidMagic, "m2: missing MD20 magic");

    Header h;
    auto number = read_u32(r);
    try {
        h.version = version::from_header_version(number);
        h.header_number = number;
    } catch (const UnknownVersionError& e) {
        throw ParseError(ParseErrorKind::UnknownVersion, e.what());
    }
    h.global_flags = read_u32(r);
    h.skin_profile_count = read_u32(r);
    h.bounding_box_min = read_vec3(r);
    h.bounding_box_max = read_vec3(r);
    h.bounding_radius = read_f32(r);
    h.collision_box_min = read_vec3(r);
    h.collision_box_max = read_vec3(r);
    h.collision_radius = read_f32(r);
    h.name = read_string(r);
    return h;
}

void write_header(std::ostream& w, const Header& h) {
    write_signature(w, "MD20");
    write_u32(w, stored_header_number(h));
    write_u32(w, h.global_flags);
    write_u32(w, h.skin_profile_count);
    write_vec3(w, h.bounding_box_min);
    write_vec3(w, h.bounding_box_max);
    write_f32(w, h.bounding_radius);
    write_vec3(w, h.collision_box_min);
    write_vec3(w, h.collision_box_max);
    write_f32(w, h.collision_radius);
    write_string(w, h.name);
}

} // namespace

Model load(std::span<const uint8_t> data) {
    auto r = make_stream(data);
    Model model;
    model.header = read_header(r);
    auto v = model.header.version;

    chunk::ChunkReader reader(data, static_cast<size_t>(r.tellg()));
    while (auto rec = reader.next()) {
        const auto* rule = find_rule(rec->tag);
        if (rule && presence(*rule, v) == Presence::Forbidden)
            throw ParseError(ParseErrorKind::IllegalChunkForVersion,
                             std::format("m2: chunk {} at offset {} is not legal in {}",
                                         rec->tag.str(), rec->offset, version::name(v)));

        bool seen = model.has(rec->tag);
        if (seen && !(rule && rule->repeatable))
            throw ParseError(ParseErrorKind::DuplicateChunk,
                             std::format("m2: chunk {} repeated at offset {}", rec->tag.str(),
                                         rec->offset));

        const auto* codec = detail::find_codec(rec->tag);
        if (!codec) {
            model.set(RawChunk{
                rec->tag, std::vector<uint8_t>(rec->payload.begin(), rec->payload.end())});
            continue;
        }

        auto value = codec->decode(rec->payload, v);
        if (seen) {
            // AFID is the only repeatable chunk: entries merge in file order.
            auto& merged = std::get<AnimationFileIds>(model.chunks.at(rec->tag));
            auto& more = std::get<AnimationFileIds>(value);
            merged.entries.insert(merged.entries.end(), more.entries.begin(), more.entries.end());
        } else {
            model.set(std::move(value));
        }
    }
    // Order only matters from Legion on; older files are always written in
    // table order, so keep the order save() will produce.
    if (v < FormatVersion::Legion) model.order = output_order(model);
    return model;
}

Model load(const std::filesystem::path& path) {
    auto data = read_file(path);
    return load(data);
}

Model read(std::istream& r) {
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(r)),
                              std::istreambuf_iterator<char>());
    return load(data);
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

std::vector<chunk::Tag> output_order(const Model& model) {
    std::vector<chunk::Tag> tags;
    if (model.version() >= FormatVersion::Legion) {
        tags = model.order;
        for (const auto& [tag, value] : model.chunks)
            if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(tag);
        return tags;
    }
    for (const auto& rule : chunk_rules())
        if (model.has(rule.tag)) tags.push_back(rule.tag);
    for (const auto& tag : model.order)
        if (!find_rule(tag) && model.has(tag)) tags.push_back(tag);
    for (const auto& [tag, value] : model.chunks)
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(tag);
    return tags;
}

std::vector<uint8_t> encode_chunk(const ChunkValue& value, FormatVersion v) {
    if (const auto* raw = std::get_if<RawChunk>(&value)) return raw->data;
    const auto* codec = detail::find_codec(tag_of(value));
    if (!codec)
        throw std::runtime_error(
            std::format("m2: no codec for chunk {}", tag_of(value).str()));
    return codec->encode(value, v);
}

void write(std::ostream& w, const Model& model) {
    auto v = model.version();
    write_header(w, model.header);
    for (const auto& tag : output_order(model)) {
        if (presence(tag, v) == Presence::Forbidden)
            throw std::runtime_error(std::format("m2: chunk {} is not legal in {}", tag.str(),
                                                 version::name(v)));
        const auto& value = model.chunks.at(tag);
        if (tag_of(value) != tag)
            throw std::runtime_error(
                std::format("m2: chunk stored under {} holds {}", tag.str(), tag_of(value).str()));
        auto payload = encode_chunk(value, v);
        chunk::write_chunk(w, tag, payload);
    }
}

std::vector<uint8_t> save(const Model& model) {
    std::ostringstream out(std::ios::binary);
    write(out, model);
    return to_bytes(out);
}

void save(const Model& model, const std::filesystem::path& path) {
    auto data = save(model);
    write_file(path, data);
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

size_t element_count(const ChunkValue& value) {
    if (const auto* raw = std::get_if<RawChunk>(&value)) return raw->data.size();
    const auto* codec = detail::find_codec(tag_of(value));
    return codec ? codec->count(value) : 0;
}

std::vector<ChunkSummary> summarize(const Model& model) {
    std::vector<ChunkSummary> out;
    for (const auto& tag : output_order(model)) {
        const auto& value = model.chunks.at(tag);
        const auto* rule = find_rule(tag);
        ChunkSummary s;
        s.tag = tag;
        s.name = rule ? rule->name : "unknown";
        s.size = encode_chunk(value, model.version()).size();
        s.elements = element_count(value);
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace m2tools::m2
