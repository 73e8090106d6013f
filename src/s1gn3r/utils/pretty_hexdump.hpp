#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace s1gn3r::utils {

/**
 * options for controlling hexdump layout.
 */
struct hexdump_options {
  size_t bytes_per_line = 16; // bytes shown per row
  bool show_ascii = true;     // trailing ascii column
  size_t max_lines = 16;      // rows before truncation
};

/**
 * hexdump of a byte range, offsets shown relative to base_offset.
 * colors follow the redlog color settings.
 */
std::string format_hexdump(std::span<const uint8_t> data, uint64_t base_offset = 0, const hexdump_options& opts = {});

/**
 * before/after rows for an in-place rewrite. changed bytes are highlighted,
 * before in cyan and after in red. both spans must have the same size.
 */
std::string format_patch_hexdump(
    std::span<const uint8_t> before, std::span<const uint8_t> after, uint64_t base_offset = 0,
    const hexdump_options& opts = {}
);

} // namespace s1gn3r::utils
