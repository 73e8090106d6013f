#include "detect.hpp"

#include <iostream>

#include <redlog.hpp>

#include "s1gn3r/engine/model_detector.hpp"
#include "s1gn3r/utils/file_utils.hpp"

namespace s1gn3rx::commands {

int detect_command(const detect_request& request) {
  auto log = redlog::get_logger("s1gn3rx.detect");

  auto file_data = s1gn3r::utils::read_file(request.file);
  if (!file_data.ok()) {
    log.err("failed to read file", redlog::field("error", file_data.status_info.message));
    std::cerr << "error: " << file_data.status_info.message << std::endl;
    return 1;
  }

  auto detection = s1gn3r::engine::detect(file_data.value, request.preferred_model);
  if (detection.empty()) {
    std::cerr << "error: no device models detected in " << request.file << std::endl;
    return 1;
  }

  std::cout << "source: " << s1gn3r::engine::model_source_name(detection.source) << std::endl;
  if (detection.signer_model) {
    std::cout << "signer model: " << *detection.signer_model << std::endl;
  }
  std::cout << "models: " << detection.models.size() << std::endl;
  for (const auto& model : detection.models) {
    std::cout << model << "\n";
  }

  return 0;
}

} // namespace s1gn3rx::commands
