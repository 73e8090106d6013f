#include "image_update.hpp"
#include "patch_engine.hpp"
#include "record_codec.hpp"
#include "record_locator.hpp"
#include "string_replacer.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace s1gn3r::engine {

result<extracted_record> extract_record(std::span<const uint8_t> buffer) {
  auto located = locate_record(buffer);
  if (!located.ok()) {
    return error_result<extracted_record>(located.status_info);
  }

  auto decoded = decode(located.value.bytes);
  if (!decoded.ok()) {
    return error_result<extracted_record>(decoded.status_info);
  }

  extracted_record extracted;
  extracted.offset = located.value.offset;
  extracted.raw.assign(located.value.bytes.begin(), located.value.bytes.end());
  extracted.record = std::move(decoded.value);
  return ok_result(std::move(extracted));
}

result<update_outcome> update_image(std::span<const uint8_t> buffer, const update_request& request) {
  auto log = redlog::get_logger("s1gn3r.updater");

  if (!request.signer_record && request.new_model.empty()) {
    return error_result<update_outcome>(
        error_code::invalid_argument, "a replacement signer record, a new model, or both are required"
    );
  }

  if (request.signer_record && request.signer_record->size() != k_signer_record_size) {
    log.err("replacement record has invalid size", redlog::field("size", request.signer_record->size()));
    return error_result<update_outcome>(
        error_code::invalid_size, "replacement SignerVer02 record has invalid size (" +
                                      std::to_string(request.signer_record->size()) + " bytes, expected " +
                                      std::to_string(k_signer_record_size) + ")"
    );
  }

  update_outcome outcome;
  outcome.old_model = request.old_model;

  // detection looks at the image as it was handed in
  if (request.auto_detect_old_model && outcome.old_model.empty()) {
    outcome.detection = detect(buffer, request.preferred_model);
    if (!outcome.detection->empty()) {
      outcome.old_model = outcome.detection->models.front();
    }
  }

  outcome.buffer.assign(buffer.begin(), buffer.end());

  if (request.signer_record) {
    auto offset = locate(outcome.buffer);
    if (offset.ok()) {
      auto patched = patch(outcome.buffer, offset.value, *request.signer_record);
      if (!patched.ok()) {
        return error_result<update_outcome>(patched.status_info);
      }
      outcome.buffer = std::move(patched.value);
      outcome.mutations.push_back(
          mutation{
              mutation_kind::signer_record, offset.value, k_signer_record_size, k_signer_record_size,
              std::string(k_signer_marker)
          }
      );
      log.inf("signer record replaced", redlog::field("offset", utils::format_offset(offset.value)));
    } else {
      log.wrn("signer record not replaced", redlog::field("reason", offset.status_info.message));
    }
  }

  if (request.experimental_model_replace && !outcome.old_model.empty() && !request.new_model.empty() &&
      outcome.old_model != request.new_model) {
    log.inf(
        "replacing device model", redlog::field("old", outcome.old_model), redlog::field("new", request.new_model)
    );
    auto replaced = replace_all(outcome.buffer, outcome.old_model, request.new_model);
    outcome.model_replacements = replaced.total;
    auto model_mutations = replaced.mutations();
    outcome.mutations.insert(outcome.mutations.end(), model_mutations.begin(), model_mutations.end());
    outcome.buffer = std::move(replaced.buffer);
  } else if (!request.new_model.empty()) {
    log.dbg(
        "model replacement not requested", redlog::field("experimental", request.experimental_model_replace),
        redlog::field("old", outcome.old_model), redlog::field("new", request.new_model)
    );
  }

  log.dbg("update computed", redlog::field("mutations", outcome.mutations.size()));
  return ok_result(std::move(outcome));
}

} // namespace s1gn3r::engine
