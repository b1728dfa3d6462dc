#pragma once

#include "m2tools/errors.h"

#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <vector>

namespace m2tools::binutil {

// Assumes little-endian (x86/x64). Fail at compile time otherwise.
static_assert(std::endian::native == std::endian::little,
              "m2tools requires a little-endian platform");

// --- Read helpers (throw ParseError{Truncated} on short input) ---

template <typename T>
inline T read_pod(std::istream& r, const char* what) {
    T v;
    if (!r.read(reinterpret_cast<char*>(&v), sizeof(T)))
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("binutil: failed to read {}", what));
    return v;
}

inline uint8_t read_u8(std::istream& r) { return read_pod<uint8_t>(r, "u8"); }
inline int8_t read_i8(std::istream& r) { return read_pod<int8_t>(r, "i8"); }
inline uint16_t read_u16(std::istream& r) { return read_pod<uint16_t>(r, "u16"); }
inline int16_t read_i16(std::istream& r) { return read_pod<int16_t>(r, "i16"); }
inline uint32_t read_u32(std::istream& r) { return read_pod<uint32_t>(r, "u32"); }
inline int32_t read_i32(std::istream& r) { return read_pod<int32_t>(r, "i32"); }
inline float read_f32(std::istream& r) { return read_pod<float>(r, "f32"); }

inline std::array<float, 3> read_vec3(std::istream& r) {
    return read_pod<std::array<float, 3>>(r, "vec3");
}

inline std::string read_signature(std::istream& r) {
    char buf[4];
    if (!r.read(buf, 4))
        throw ParseError(ParseErrorKind::Truncated, "binutil: failed to read signature");
    return {buf, 4};
}

inline std::vector<uint8_t> read_bytes(std::istream& r, size_t n) {
    std::vector<uint8_t> buf(n);
    if (n > 0 && !r.read(reinterpret_cast<char*>(buf.data()),
                          static_cast<std::streamsize>(n)))
        throw ParseError(ParseErrorKind::Truncated, "binutil: failed to read bytes");
    return buf;
}

// remaining returns the number of unread bytes in a seekable stream.
inline size_t remaining(std::istream& r) {
    auto cur = r.tellg();
    if (cur == std::istream::pos_type(-1)) return 0;
    r.seekg(0, std::ios::end);
    auto end = r.tellg();
    r.seekg(cur);
    return static_cast<size_t>(end - cur);
}

// read_count reads a u32 element count and checks that count elements of at
// least min_elem_size bytes can still be present.
inline uint32_t read_count(std::istream& r, size_t min_elem_size, const char* what) {
    auto count = read_u32(r);
    if (static_cast<uint64_t>(count) * min_elem_size > remaining(r))
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("binutil: {} count {} exceeds remaining data", what, count));
    return count;
}

// read_string reads a u32 length followed by that many bytes (no terminator).
inline std::string read_string(std::istream& r) {
    auto len = read_count(r, 1, "string");
    std::string s(len, '\0');
    if (len > 0 && !r.read(s.data(), static_cast<std::streamsize>(len)))
        throw ParseError(ParseErrorKind::Truncated, "binutil: failed to read string");
    return s;
}

template <typename T>
inline std::vector<T> read_array(std::istream& r, size_t n, const char* what) {
    std::vector<T> out(n);
    if (n > 0 && !r.read(reinterpret_cast<char*>(out.data()),
                          static_cast<std::streamsize>(n * sizeof(T))))
        throw ParseError(ParseErrorKind::Truncated,
                         std::format("binutil: failed to read {} array", what));
    return out;
}

// require_consumed fails when a fully decoded payload still has bytes left.
inline void require_consumed(std::istream& r, const std::string& what) {
    if (r.peek() != std::char_traits<char>::eof())
        throw ParseError(ParseErrorKind::MalformedChunk,
                         std::format("{}: {} unexpected trailing bytes", what, remaining(r)));
}

inline std::istringstream make_stream(std::span<const uint8_t> data) {
    std::string s(reinterpret_cast<const char*>(data.data()), data.size());
    return std::istringstream(std::move(s), std::ios::binary);
}

// --- Write helpers (throw on failure) ---

template <typename T>
inline void write_pod(std::ostream& w, const T& v, const char* what) {
    if (!w.write(reinterpret_cast<const char*>(&v), sizeof(T)))
        throw std::runtime_error(std::format("binutil: failed to write {}", what));
}

inline void write_u8(std::ostream& w, uint8_t v) { write_pod(w, v, "u8"); }
inline void write_i8(std::ostream& w, int8_t v) { write_pod(w, v, "i8"); }
inline void write_u16(std::ostream& w, uint16_t v) { write_pod(w, v, "u16"); }
inline void write_i16(std::ostream& w, int16_t v) { write_pod(w, v, "i16"); }
inline void write_u32(std::ostream& w, uint32_t v) { write_pod(w, v, "u32"); }
inline void write_i32(std::ostream& w, int32_t v) { write_pod(w, v, "i32"); }
inline void write_f32(std::ostream& w, float v) { write_pod(w, v, "f32"); }
inline void write_vec3(std::ostream& w, const std::array<float, 3>& v) { write_pod(w, v, "vec3"); }

inline void write_bytes(std::ostream& w, std::span<const uint8_t> data) {
    if (!data.empty() && !w.write(reinterpret_cast<const char*>(data.data()),
                                  static_cast<std::streamsize>(data.size())))
        throw std::runtime_error("binutil: failed to write bytes");
}

inline void write_signature(std::ostream& w, const char (&sig)[5]) {
    if (!w.write(sig, 4))
        throw std::runtime_error("binutil: failed to write signature");
}

inline void write_string(std::ostream& w, const std::string& s) {
    write_u32(w, static_cast<uint32_t>(s.size()));
    if (!s.empty() && !w.write(s.data(), static_cast<std::streamsize>(s.size())))
        throw std::runtime_error("binutil: failed to write string");
}

template <typename T>
inline void write_array(std::ostream& w, const std::vector<T>& values, const char* what) {
    if (!values.empty() && !w.write(reinterpret_cast<const char*>(values.data()),
                                    static_cast<std::streamsize>(values.size() * sizeof(T))))
        throw std::runtime_error(std::format("binutil: failed to write {} array", what));
}

inline std::vector<uint8_t> to_bytes(const std::ostringstream& out) {
    auto s = out.str();
    return std::vector<uint8_t>(s.begin(), s.end());
}

// --- Whole-file I/O (throw IoError) ---

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
        throw IoError(path, std::format("cannot open {}", path.string()));
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
    if (f.bad())
        throw IoError(path, std::format("failed to read {}", path.string()));
    return data;
}

inline void write_file(const std::filesystem::path& path, std::span<const uint8_t> data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
        throw IoError(path, std::format("cannot create {}", path.string()));
    if (!data.empty() && !f.write(reinterpret_cast<const char*>(data.data()),
                                  static_cast<std::streamsize>(data.size())))
        throw IoError(path, std::format("failed to write {}", path.string()));
}

} // namespace m2tools::binutil
