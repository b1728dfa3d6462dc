#include "m2tools/chunk.h"

#include "m2tools/binutil.h"
#include "m2tools/errors.h"

#include <cstring>
#include <format>

namespace m2tools::chunk {

std::string Tag::str() const {
    std::string out;
    for (char c : bytes) {
        auto u = static_cast<unsigned char>(c);
        if (u >= 0x20 && u < 0x7F)
            out.push_back(c);
        else
            out += std::format("\\x{:02X}", u);
    }
    return out;
}

ChunkReader::ChunkReader(std::span<const uint8_t> data, size_t start)
    : data_(data), pos_(start) {}

std::optional<ChunkRecord> ChunkReader::next() {
    if (pos_ >= data_.size()) return std::nullopt;

    size_t left = data_.size() - pos_;
    if (left < kChunkHeaderSize)
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("chunk: {} stray bytes at offset {}, expected an 8-byte header",
                                     left, pos_));

    ChunkRecord rec;
    rec.offset = pos_;
    std::memcpy(rec.tag.bytes.data(), data_.data() + pos_, 4);
    std::memcpy(&rec.size, data_.data() + pos_ + 4, 4);

    left -= kChunkHeaderSize;
    if (rec.size > left)
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("chunk: {} at offset {} declares {} bytes, only {} remain",
                                     rec.tag.str(), pos_, rec.size, left));

    rec.payload = data_.subspan(pos_ + kChunkHeaderSize, rec.size);
    pos_ += kChunkHeaderSize + rec.size;
    return rec;
}

std::vector<ChunkRecord> read_all(std::span<const uint8_t> data, size_t start) {
    std::vector<ChunkRecord> out;
    ChunkReader reader(data, start);
    while (auto rec = reader.next())
        out.push_back(*rec);
    return out;
}

void write_chunk(std::ostream& w, const Tag& tag, std::span<const uint8_t> payload) {
    if (!w.write(tag.bytes.data(), 4))
        throw std::runtime_error("chunk: failed to write tag");
    binutil::write_u32(w, static_cast<uint32_t>(payload.size()));
    binutil::write_bytes(w, payload);
}

} // namespace m2tools::chunk
