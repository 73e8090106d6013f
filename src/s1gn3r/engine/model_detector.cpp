#include "model_detector.hpp"
#include "record_codec.hpp"
#include "record_locator.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <array>
#include <functional>

namespace s1gn3r::engine {

namespace {

constexpr size_t k_prefix_length = 6;
constexpr size_t k_tail_min = 6;
constexpr size_t k_tail_max = 12;

bool is_upper(uint8_t c) { return c >= 'A' && c <= 'Z'; }

bool is_digit(uint8_t c) { return c >= '0' && c <= '9'; }

bool is_upper_or_digit(uint8_t c) { return is_upper(c) || is_digit(c); }

// length of the greedy token starting at pos, 0 when the shape does not match
size_t match_token_at(std::span<const uint8_t> data, size_t pos) {
  if (data.size() - pos < k_prefix_length + k_tail_min) {
    return 0;
  }

  const uint8_t* p = data.data() + pos;
  if (!is_upper(p[0]) || !is_digit(p[1]) || !is_digit(p[2]) || !is_digit(p[3]) || !is_upper(p[4]) ||
      !is_upper(p[5])) {
    return 0;
  }

  size_t tail = 0;
  size_t limit = std::min(k_tail_max, data.size() - pos - k_prefix_length);
  while (tail < limit && is_upper_or_digit(p[k_prefix_length + tail])) {
    ++tail;
  }

  return tail >= k_tail_min ? k_prefix_length + tail : 0;
}

std::optional<std::string> read_signer_model(std::span<const uint8_t> buffer) {
  auto located = locate_record(buffer);
  if (!located.ok()) {
    return std::nullopt;
  }
  auto decoded = decode(located.value.bytes);
  if (!decoded.ok() || decoded.value.device_model.empty()) {
    return std::nullopt;
  }
  return decoded.value.device_model;
}

bool contains(const std::vector<std::string>& models, const std::string& model) {
  return std::binary_search(models.begin(), models.end(), model);
}

struct head_selector {
  model_source source;
  std::function<std::optional<std::string>()> select;
};

} // namespace

const char* model_source_name(model_source source) {
  switch (source) {
  case model_source::none:
    return "none";
  case model_source::preferred:
    return "preferred";
  case model_source::signer_record:
    return "signer_record";
  case model_source::first_match:
    return "first_match";
  }
  return "unknown";
}

std::vector<std::string> scan_model_tokens(std::span<const uint8_t> buffer) {
  std::vector<std::string> models;

  size_t pos = 0;
  while (pos < buffer.size()) {
    size_t length = match_token_at(buffer, pos);
    if (length == 0) {
      ++pos;
      continue;
    }
    if (length >= k_model_min_length && length <= k_model_max_length) {
      models.emplace_back(reinterpret_cast<const char*>(buffer.data() + pos), length);
    }
    pos += length;
  }

  std::sort(models.begin(), models.end());
  models.erase(std::unique(models.begin(), models.end()), models.end());
  return models;
}

model_detection detect(std::span<const uint8_t> buffer, std::string_view preferred) {
  auto log = redlog::get_logger("s1gn3r.detector");

  model_detection detection;
  auto models = scan_model_tokens(buffer);
  detection.signer_model = read_signer_model(buffer);

  log.dbg(
      "model scan finished", redlog::field("candidates", models.size()),
      redlog::field("signer_model", detection.signer_model.value_or("-"))
  );

  if (models.empty()) {
    log.wrn("no device models detected");
    return detection;
  }

  std::string preferred_model(preferred);

  // first selector returning a candidate wins; first_match always does
  const std::array<head_selector, 3> chain = {{
      {model_source::preferred,
       [&]() -> std::optional<std::string> {
         if (!preferred_model.empty() && contains(models, preferred_model)) {
           return preferred_model;
         }
         return std::nullopt;
       }},
      {model_source::signer_record,
       [&]() -> std::optional<std::string> {
         if (detection.signer_model && contains(models, *detection.signer_model)) {
           return detection.signer_model;
         }
         return std::nullopt;
       }},
      {model_source::first_match, [&]() -> std::optional<std::string> { return models.front(); }},
  }};

  for (const auto& selector : chain) {
    auto head = selector.select();
    if (!head) {
      continue;
    }

    detection.source = selector.source;
    detection.models.reserve(models.size());
    detection.models.push_back(*head);
    for (const auto& model : models) {
      if (model != *head) {
        detection.models.push_back(model);
      }
    }
    break;
  }

  log.inf(
      "detected device model", redlog::field("model", detection.models.front()),
      redlog::field("source", model_source_name(detection.source))
  );
  return detection;
}

} // namespace s1gn3r::engine
