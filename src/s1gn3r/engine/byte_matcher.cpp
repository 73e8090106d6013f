#include "byte_matcher.hpp"

namespace s1gn3r::engine {

byte_matcher::byte_matcher(std::span<const uint8_t> needle) : needle_(needle.begin(), needle.end()) {
  build_shift_table();
}

void byte_matcher::build_shift_table() {
  const size_t needle_len = needle_.size();
  if (needle_len == 0) {
    return;
  }

  shift_table_.fill(needle_len);

  for (size_t i = 0; i + 1 < needle_len; ++i) {
    shift_table_[needle_[i]] = needle_len - 1 - i;
  }
}

std::optional<size_t> byte_matcher::find(std::span<const uint8_t> haystack, size_t start) const {
  const size_t needle_len = needle_.size();
  if (!is_valid() || start > haystack.size() || haystack.size() - start < needle_len) {
    return std::nullopt;
  }

  const uint8_t* data = haystack.data();
  size_t i = start;
  while (i + needle_len <= haystack.size()) {
    if (match_at_position(data, i)) {
      return i;
    }
    i += shift_table_[data[i + needle_len - 1]];
  }

  return std::nullopt;
}

std::vector<size_t> byte_matcher::find_all(std::span<const uint8_t> haystack) const {
  std::vector<size_t> results;
  size_t start = 0;
  while (auto pos = find(haystack, start)) {
    results.push_back(*pos);
    start = *pos + needle_.size();
  }
  return results;
}

bool byte_matcher::match_at_position(const uint8_t* data, size_t pos) const {
  for (size_t i = needle_.size(); i > 0; --i) {
    if (needle_[i - 1] != data[pos + i - 1]) {
      return false;
    }
  }
  return true;
}

} // namespace s1gn3r::engine
