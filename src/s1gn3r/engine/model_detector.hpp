#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s1gn3r::engine {

// model tokens outside this length range are ignored
inline constexpr size_t k_model_min_length = 10;
inline constexpr size_t k_model_max_length = 20;

// which signal picked the head of the candidate list
enum class model_source { none, preferred, signer_record, first_match };

const char* model_source_name(model_source source);

struct model_detection {
  // head first, remaining candidates in sorted order
  std::vector<std::string> models;
  model_source source = model_source::none;
  std::optional<std::string> signer_model;

  bool empty() const noexcept { return models.empty(); }
};

// sorted, deduplicated tokens shaped like A999AA followed by 6-12 of [A-Z0-9]
std::vector<std::string> scan_model_tokens(std::span<const uint8_t> buffer);

// never fails; an empty token scan yields an empty result
model_detection detect(std::span<const uint8_t> buffer, std::string_view preferred = {});

} // namespace s1gn3r::engine
