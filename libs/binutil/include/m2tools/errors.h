#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace m2tools {

// --- Parse errors (fatal to a load call) ---

enum class ParseErrorKind {
    Truncated,
    InvalidMagic,
    IllegalChunkForVersion,
    DuplicateChunk,
    UnknownVersion,
    MalformedChunk,
};

constexpr const char* to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::Truncated: return "Truncated";
        case ParseErrorKind::InvalidMagic: return "InvalidMagic";
        case ParseErrorKind::IllegalChunkForVersion: return "IllegalChunkForVersion";
        case ParseErrorKind::DuplicateChunk: return "DuplicateChunk";
        case ParseErrorKind::UnknownVersion: return "UnknownVersion";
        case ParseErrorKind::MalformedChunk: return "MalformedChunk";
    }
    return "Unknown";
}

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ParseErrorKind kind() const noexcept { return kind_; }

private:
    ParseErrorKind kind_;
};

// --- Validation findings (collected, never thrown on their own) ---

enum class ValidationErrorKind {
    DanglingReference,
    CountMismatch,
    OutOfBoundsIndex,
    MissingRequiredChunk,
};

constexpr const char* to_string(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::DanglingReference: return "DanglingReference";
        case ValidationErrorKind::CountMismatch: return "CountMismatch";
        case ValidationErrorKind::OutOfBoundsIndex: return "OutOfBoundsIndex";
        case ValidationErrorKind::MissingRequiredChunk: return "MissingRequiredChunk";
    }
    return "Unknown";
}

struct ValidationIssue {
    ValidationErrorKind kind = ValidationErrorKind::DanglingReference;
    std::string chunk;   // tag of the chunk holding the bad reference
    std::string message;

    bool operator==(const ValidationIssue&) const = default;
};

// --- Conversion errors (transactional: the source is never modified) ---

enum class ConversionErrorKind {
    CannotDropRequiredChunk,
    MissingRequiredChunk,
    FieldOverflow,
    PostConversionValidationFailed,
};

constexpr const char* to_string(ConversionErrorKind kind) {
    switch (kind) {
        case ConversionErrorKind::CannotDropRequiredChunk: return "CannotDropRequiredChunk";
        case ConversionErrorKind::MissingRequiredChunk: return "MissingRequiredChunk";
        case ConversionErrorKind::FieldOverflow: return "FieldOverflow";
        case ConversionErrorKind::PostConversionValidationFailed:
            return "PostConversionValidationFailed";
    }
    return "Unknown";
}

class ConversionError : public std::runtime_error {
public:
    ConversionError(ConversionErrorKind kind, std::string chunk, const std::string& message,
                    std::vector<ValidationIssue> issues = {})
        : std::runtime_error(message),
          kind_(kind),
          chunk_(std::move(chunk)),
          issues_(std::move(issues)) {}

    ConversionErrorKind kind() const noexcept { return kind_; }
    const std::string& chunk() const noexcept { return chunk_; }
    const std::vector<ValidationIssue>& issues() const noexcept { return issues_; }

private:
    ConversionErrorKind kind_;
    std::string chunk_;
    std::vector<ValidationIssue> issues_;
};

// UnknownVersionError is raised when an expansion name or header number
// does not map to a known format version.
class UnknownVersionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// IoError reports a failed whole-file read or write.
class IoError : public std::runtime_error {
public:
    IoError(const std::filesystem::path& path, const std::string& message)
        : std::runtime_error(message), path_(path) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace m2tools
