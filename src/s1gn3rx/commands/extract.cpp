#include "extract.hpp"

#include <cstdint>
#include <iostream>
#include <span>

#include <nlohmann/json.hpp>
#include <redlog.hpp>

#include "s1gn3r/engine/image_update.hpp"
#include "s1gn3r/engine/record_codec.hpp"
#include "s1gn3r/utils/file_utils.hpp"
#include "s1gn3r/utils/hex_utils.hpp"
#include "s1gn3r/utils/pretty_hexdump.hpp"

namespace s1gn3rx::commands {

namespace {

bool write_output(const std::string& path, const std::string& what, std::span<const uint8_t> data) {
  auto log = redlog::get_logger("s1gn3rx.extract");

  auto dir_status = s1gn3r::utils::ensure_parent_directory(path);
  if (!dir_status.ok()) {
    log.err(
        "failed to create output directory", redlog::field("path", path), redlog::field("error", dir_status.message)
    );
    std::cerr << "error: " << dir_status.message << std::endl;
    return false;
  }

  auto write_status = s1gn3r::utils::write_file_atomic(path, data);
  if (!write_status.ok()) {
    log.err("failed to write output", redlog::field("path", path), redlog::field("error", write_status.message));
    std::cerr << "error: failed to write " << what << " file " << path << ": " << write_status.message << std::endl;
    return false;
  }

  log.inf("output written", redlog::field("kind", what), redlog::field("path", path));
  return true;
}

} // namespace

int extract_command(const extract_request& request) {
  auto log = redlog::get_logger("s1gn3rx.extract");

  if (!s1gn3r::utils::file_exists(request.image_file)) {
    log.err("image does not exist", redlog::field("path", request.image_file));
    std::cerr << "error: image does not exist: " << request.image_file << std::endl;
    return 1;
  }

  log.inf("extracting parameters", redlog::field("image", request.image_file));

  auto file_data = s1gn3r::utils::read_file(request.image_file);
  if (!file_data.ok()) {
    log.err("failed to read image", redlog::field("error", file_data.status_info.message));
    std::cerr << "error: " << file_data.status_info.message << std::endl;
    return 1;
  }

  if (file_data.value.empty()) {
    log.err("image is empty", redlog::field("path", request.image_file));
    std::cerr << "error: image is empty: " << request.image_file << std::endl;
    return 1;
  }

  auto extracted = s1gn3r::engine::extract_record(file_data.value);
  if (!extracted.ok()) {
    log.err(
        "signer record unavailable", redlog::field("code", s1gn3r::engine::error_code_name(extracted.status_info.code)),
        redlog::field("error", extracted.status_info.message)
    );
    std::cerr << "error: " << extracted.status_info.message << std::endl;
    return 1;
  }

  auto fields = s1gn3r::engine::record_fields(extracted.value.record);

  if (static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose)) {
    log.vrb(redlog::fmt("record\n%s", s1gn3r::utils::format_hexdump(extracted.value.raw, extracted.value.offset)));
  }

  std::cout << "SignerVer02 section at " << s1gn3r::utils::format_offset(extracted.value.offset) << ":" << std::endl;
  for (const auto& field : fields) {
    std::cout << "   " << field.name << ": " << field.value << std::endl;
  }

  if (!request.output_json.empty()) {
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
    for (const auto& field : fields) {
      metadata[field.name] = field.value;
    }
    std::string json_text = metadata.dump(2);
    auto json_bytes = reinterpret_cast<const uint8_t*>(json_text.data());
    if (!write_output(request.output_json, "json", std::span<const uint8_t>(json_bytes, json_text.size()))) {
      return 1;
    }
    std::cout << "metadata written to: " << request.output_json << std::endl;
  }

  if (!request.output_signer.empty()) {
    if (!write_output(request.output_signer, "signer", extracted.value.raw)) {
      return 1;
    }
    std::cout << "SignerVer02 section written to: " << request.output_signer << " (" << extracted.value.raw.size()
              << " bytes)" << std::endl;
  }

  return 0;
}

} // namespace s1gn3rx::commands
