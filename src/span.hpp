#pragma once

#include <cstdint>

#include "source.hpp"

namespace kir {

// Offsets are byte offsets into the file. Synthetic nodes that have no
// position in user code carry `kUndefinedOffset` on both ends.
inline constexpr std::int32_t kUndefinedOffset = -1;

struct Span {
    FileId file = 0;
    std::int32_t start = kUndefinedOffset;
    std::int32_t end = kUndefinedOffset;

    bool is_undefined() const { return start == kUndefinedOffset; }
};

}  // namespace kir
