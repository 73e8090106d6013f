#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace s1gn3r::utils {

// file offset formatting, 0x-prefixed, at least six upper-case digits
std::string format_offset(uint64_t offset);

// space separated lower-case hex bytes
std::string format_bytes(std::span<const uint8_t> bytes);

} // namespace s1gn3r::utils
