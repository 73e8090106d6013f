#include "update.hpp"

#include <iostream>
#include <sstream>

#include <redlog.hpp>

#include "s1gn3r/s1gn3r.hpp"

namespace s1gn3rx::commands {

namespace {

// "SignerVer02 at 0x000040, model 3x"
std::string summarize(const s1gn3r::engine::update_outcome& outcome) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& change : outcome.mutations) {
    if (change.kind != s1gn3r::engine::mutation_kind::signer_record) {
      continue;
    }
    oss << (first ? "" : ", ") << "SignerVer02 at " << s1gn3r::utils::format_offset(change.offset);
    first = false;
  }
  if (outcome.model_replacements > 0) {
    oss << (first ? "" : ", ") << "model " << outcome.model_replacements << "x";
  }
  return oss.str();
}

} // namespace

int update_file_command(const update_file_request& request) {
  auto log = redlog::get_logger("s1gn3rx.update");

  if (request.signer_section.empty() && request.new_model.empty()) {
    log.err("nothing to update");
    std::cerr << "error: --signer-section, --new-model, or both are required" << std::endl;
    return 1;
  }

  if (!s1gn3r::utils::file_exists(request.file)) {
    log.err("file does not exist", redlog::field("path", request.file));
    std::cerr << "error: file does not exist: " << request.file << std::endl;
    return 1;
  }

  s1gn3r::engine::update_request engine_request;
  engine_request.old_model = request.old_model;
  engine_request.new_model = request.new_model;
  engine_request.preferred_model = request.preferred_model;
  engine_request.auto_detect_old_model = request.auto_detect_old_model;
  engine_request.experimental_model_replace = request.experimental_model_replace;

  if (!request.signer_section.empty()) {
    auto section = s1gn3r::utils::read_file(request.signer_section);
    if (!section.ok()) {
      log.err("failed to read signer section", redlog::field("error", section.status_info.message));
      std::cerr << "error: " << section.status_info.message << std::endl;
      return 1;
    }
    if (section.value.size() != s1gn3r::engine::k_signer_record_size) {
      log.err(
          "signer section has invalid size", redlog::field("path", request.signer_section),
          redlog::field("size", section.value.size())
      );
      std::cerr << "error: " << request.signer_section << " has invalid size (" << section.value.size()
                << " bytes, expected " << s1gn3r::engine::k_signer_record_size << ")" << std::endl;
      return 1;
    }
    engine_request.signer_record = std::move(section.value);
  }

  log.inf("processing", redlog::field("file", request.file));

  auto file_data = s1gn3r::utils::read_file(request.file);
  if (!file_data.ok()) {
    log.err("failed to read file", redlog::field("error", file_data.status_info.message));
    std::cerr << "error: " << file_data.status_info.message << std::endl;
    return 1;
  }

  if (file_data.value.empty()) {
    log.err("file is empty", redlog::field("path", request.file));
    std::cerr << "error: file is empty: " << request.file << std::endl;
    return 1;
  }

  auto outcome = s1gn3r::engine::update_image(file_data.value, engine_request);
  if (!outcome.ok()) {
    log.err(
        "update failed", redlog::field("code", s1gn3r::engine::error_code_name(outcome.status_info.code)),
        redlog::field("error", outcome.status_info.message)
    );
    std::cerr << "error: " << outcome.status_info.message << std::endl;
    return 1;
  }

  if (outcome.value.detection) {
    if (outcome.value.old_model.empty()) {
      std::cout << "no device model detected in " << request.file << std::endl;
    } else {
      std::cout << "detected old model: " << outcome.value.old_model << " ("
                << s1gn3r::engine::model_source_name(outcome.value.detection->source) << ")" << std::endl;
    }
  }

  if (!outcome.value.modified()) {
    log.inf("no changes needed", redlog::field("file", request.file));
    std::cout << "no changes needed" << std::endl;
    return 1;
  }

  auto write_status = s1gn3r::utils::write_file_atomic(request.file, outcome.value.buffer);
  if (!write_status.ok()) {
    log.err("failed to write file", redlog::field("path", request.file), redlog::field("error", write_status.message));
    std::cerr << "error: " << write_status.message << std::endl;
    return 1;
  }

  log.inf(
      "file updated", redlog::field("file", request.file), redlog::field("mutations", outcome.value.mutations.size())
  );
  std::cout << "updated: " << summarize(outcome.value) << std::endl;
  return 0;
}

} // namespace s1gn3rx::commands
