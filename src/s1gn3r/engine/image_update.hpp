#pragma once

#include "engine/model_detector.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace s1gn3r::engine {

struct extracted_record {
  size_t offset = 0;
  std::vector<uint8_t> raw;
  signer_record record;
};

// locate and decode the signer record, keeping a copy of its raw bytes
result<extracted_record> extract_record(std::span<const uint8_t> buffer);

struct update_request {
  // complete replacement record, written over the located one
  std::optional<std::vector<uint8_t>> signer_record;
  std::string old_model;
  std::string new_model;
  std::string preferred_model;
  bool auto_detect_old_model = false;
  bool experimental_model_replace = false;
};

struct update_outcome {
  // full replacement image; equal to the input when nothing changed
  std::vector<uint8_t> buffer;
  std::vector<mutation> mutations;
  std::string old_model;
  std::optional<model_detection> detection;
  size_t model_replacements = 0;

  bool modified() const noexcept { return !mutations.empty(); }
};

// computes the whole updated image in memory; the caller writes it back only if modified()
result<update_outcome> update_image(std::span<const uint8_t> buffer, const update_request& request);

} // namespace s1gn3r::engine
