#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace s1gn3r::engine {

// copy of buffer with [offset, offset + 128) replaced by new_record.
// the replacement must be a complete record; the result keeps the buffer size.
result<std::vector<uint8_t>> patch(
    std::span<const uint8_t> buffer, size_t offset, std::span<const uint8_t> new_record
);

} // namespace s1gn3r::engine
