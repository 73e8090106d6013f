#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace s1gn3r::engine {

struct located_record {
  size_t offset = 0;
  std::span<const uint8_t> bytes;
};

// offset of the first signer marker; too_short when the record would run past the buffer
result<size_t> locate(std::span<const uint8_t> buffer);

// same as locate, plus a view of the full record bytes
result<located_record> locate_record(std::span<const uint8_t> buffer);

} // namespace s1gn3r::engine
