#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace s1gn3r::engine {

// exact byte sequence search with Boyer-Moore-Horspool skipping
class byte_matcher {
public:
  explicit byte_matcher(std::span<const uint8_t> needle);

  // first occurrence at or after start
  std::optional<size_t> find(std::span<const uint8_t> haystack, size_t start = 0) const;

  // every non-overlapping occurrence, left to right
  std::vector<size_t> find_all(std::span<const uint8_t> haystack) const;

  size_t size() const noexcept { return needle_.size(); }

  bool is_valid() const noexcept { return !needle_.empty(); }

private:
  std::vector<uint8_t> needle_;
  std::array<size_t, 256> shift_table_{};

  void build_shift_table();
  bool match_at_position(const uint8_t* data, size_t pos) const;
};

} // namespace s1gn3r::engine
