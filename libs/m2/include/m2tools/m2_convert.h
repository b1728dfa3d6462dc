#pragma once

#include "m2tools/m2.h"

#include <string>
#include <vector>

namespace m2tools::m2 {

// ConversionResult is the converted model plus the informational notes of
// every lossy step taken (dropped chunks, cleared flags, narrowed fields).
struct ConversionResult {
    Model model;
    std::vector<std::string> notes;
};

// convert builds a new model for the target version. The source is never
// modified. Chunks are transformed in layout table order so that chunks
// depending on sequences see the converted sequence table.
// Throws ConversionError.
ConversionResult convert(const Model& source, FormatVersion target);

} // namespace m2tools::m2
