#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace m2tools::chunk {

// Tag is a four byte chunk identifier in file byte order. Tags need not be
// printable.
struct Tag {
    std::array<char, 4> bytes{};

    constexpr Tag() = default;
    constexpr Tag(const char (&s)[5]) : bytes{s[0], s[1], s[2], s[3]} {}
    constexpr explicit Tag(const std::array<char, 4>& b) : bytes(b) {}

    // str returns the tag text with non-printable bytes escaped as \xNN.
    std::string str() const;

    auto operator<=>(const Tag&) const = default;
};

// ChunkRecord is one tagged, length-prefixed record. The payload view points
// into the buffer handed to the reader.
struct ChunkRecord {
    Tag tag;
    uint32_t size = 0;
    std::span<const uint8_t> payload;
    size_t offset = 0; // offset of the 8-byte chunk header in the buffer
};

inline constexpr size_t kChunkHeaderSize = 8;

// ChunkReader splits a byte buffer into chunk records, in buffer order.
// Single pass: create a fresh reader for every buffer.
class ChunkReader {
public:
    explicit ChunkReader(std::span<const uint8_t> data, size_t start = 0);

    // next returns the following record, or std::nullopt at the end of the
    // buffer. Throws ParseError{Truncated} when fewer than 8 bytes remain for
    // a header or the declared size exceeds the remaining bytes.
    std::optional<ChunkRecord> next();

    size_t position() const { return pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

// read_all drains a reader over data into a vector.
std::vector<ChunkRecord> read_all(std::span<const uint8_t> data, size_t start = 0);

// write_chunk writes tag, payload size and payload. The size field always
// equals the payload length.
void write_chunk(std::ostream& w, const Tag& tag, std::span<const uint8_t> payload);

} // namespace m2tools::chunk
