#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

#include "s1gn3r/engine/types.hpp"

namespace s1gn3r::test_helpers {

inline std::vector<uint8_t> make_buffer(size_t size, uint8_t fill = 0x00) { return std::vector<uint8_t>(size, fill); }

inline void write_bytes(std::vector<uint8_t>& buffer, size_t offset, std::initializer_list<uint8_t> bytes) {
  if (offset >= buffer.size()) {
    return;
  }
  size_t count = std::min(buffer.size() - offset, bytes.size());
  std::copy(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(count), buffer.begin() + offset);
}

inline void write_string(std::vector<uint8_t>& buffer, size_t offset, std::string_view text) {
  if (offset >= buffer.size()) {
    return;
  }
  size_t count = std::min(buffer.size() - offset, text.size());
  std::copy(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(count), buffer.begin() + offset);
}

// utf-16le bytes of an ascii string
inline std::vector<uint8_t> utf16le(std::string_view text) {
  std::vector<uint8_t> out;
  for (char c : text) {
    out.push_back(static_cast<uint8_t>(c));
    out.push_back(0x00);
  }
  return out;
}

inline void write_raw(std::vector<uint8_t>& buffer, size_t offset, const std::vector<uint8_t>& bytes) {
  if (offset >= buffer.size()) {
    return;
  }
  size_t count = std::min(buffer.size() - offset, bytes.size());
  std::copy(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(count), buffer.begin() + offset);
}

struct record_spec {
  std::string_view number = "0001";
  std::string_view device_model = "F711BXXS8HXF2";
  std::string_view date = "20240601120000";
  std::string_view software_model = "SM-F711B";
  std::string_view software_version = "";
};

// well-formed 128-byte record; reserved bytes filled with reserved_fill
inline std::vector<uint8_t> make_record(const record_spec& fields = {}, uint8_t reserved_fill = 0x00) {
  auto record = make_buffer(engine::k_signer_record_size, reserved_fill);
  for (const auto& range : engine::k_signer_layout) {
    std::fill(
        record.begin() + static_cast<std::ptrdiff_t>(range.begin),
        record.begin() + static_cast<std::ptrdiff_t>(range.end), uint8_t{0x00}
    );
  }
  write_string(record, 0, engine::k_signer_marker);
  write_string(record, 16, fields.number);
  write_string(record, 32, fields.device_model);
  write_string(record, 64, fields.date);
  write_string(record, 80, fields.software_model);
  write_string(record, 112, fields.software_version);
  return record;
}

} // namespace s1gn3r::test_helpers
