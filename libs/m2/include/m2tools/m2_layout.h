#pragma once

#include "m2tools/chunk.h"
#include "m2tools/version.h"

#include <cstdint>
#include <span>

namespace m2tools::m2 {

using version::FormatVersion;

enum class Presence { Forbidden, Optional, Required };

// ChunkRule is one row of the chunk layout table. The table order is the
// conversion dependency order and the canonical pre-Legion output order.
struct ChunkRule {
    chunk::Tag tag;
    const char* name;
    FormatVersion first;     // first version where the chunk is legal
    FormatVersion last;      // last version where the chunk is legal
    FormatVersion required;  // required from this version on (within first..last)
    bool optional_always;    // never required
    bool integrity;          // conversion may never drop it
    bool repeatable;         // occurrences merge on load
    uint32_t stride;         // bare array element size, 0 when count-prefixed
    uint32_t exact_size;     // fixed payload size, 0 when variable
};

std::span<const ChunkRule> chunk_rules();

// find_rule returns the rule for tag, or nullptr for an unknown tag.
const ChunkRule* find_rule(const chunk::Tag& tag);

Presence presence(const ChunkRule& rule, FormatVersion v);

// presence of an unknown tag is Optional in every version.
Presence presence(const chunk::Tag& tag, FormatVersion v);

const char* to_string(Presence p);

} // namespace m2tools::m2
