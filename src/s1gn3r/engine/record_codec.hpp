#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace s1gn3r::engine {

// decode a 128-byte signer record; only the size can make this fail
result<signer_record> decode(std::span<const uint8_t> record);

// fields in layout order, for reporting
std::vector<signer_field> record_fields(const signer_record& record);

} // namespace s1gn3r::engine
