#pragma once

#include "result.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace s1gn3r::engine {

// marker that opens every signer record
inline constexpr std::string_view k_signer_marker = "SignerVer02";

// signer records are fixed size; reserved bytes between fields are opaque
inline constexpr size_t k_signer_record_size = 128;

// rendered in place of a blank software_version
inline constexpr std::string_view k_empty_field_sentinel = "<empty>";

// byte range of a named field inside the record, end exclusive
struct field_range {
  std::string_view name;
  size_t begin = 0;
  size_t end = 0;

  constexpr size_t size() const noexcept { return end - begin; }
};

// record layout, in on-disk order
inline constexpr std::array<field_range, 6> k_signer_layout = {{
    {"signer_version", 0, 15},
    {"number", 16, 31},
    {"device_model", 32, 63},
    {"date", 64, 78},
    {"software_model", 80, 111},
    {"software_version", 112, 127},
}};

struct signer_field {
  std::string name;
  std::string value;
};

// decoded view of a signer record; never written back field by field
struct signer_record {
  std::string signer_version;
  std::string number;
  std::string device_model;
  std::string date;
  std::string software_model;
  std::string software_version;
};

enum class mutation_kind { signer_record, model_string };

inline const char* mutation_kind_name(mutation_kind kind) {
  switch (kind) {
  case mutation_kind::signer_record:
    return "signer_record";
  case mutation_kind::model_string:
    return "model_string";
  }
  return "unknown";
}

// one in-place rewrite, kept for reporting only
struct mutation {
  mutation_kind kind = mutation_kind::signer_record;
  uint64_t offset = 0;
  size_t old_length = 0;
  size_t new_length = 0;
  std::string detail;
};

} // namespace s1gn3r::engine
