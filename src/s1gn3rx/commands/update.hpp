#pragma once

#include <string>

namespace s1gn3rx::commands {

struct update_file_request {
  std::string file;
  std::string signer_section;
  std::string new_model;
  std::string old_model;
  std::string preferred_model;
  bool auto_detect_old_model = false;
  bool experimental_model_replace = false;
};

/**
 * @brief Replace the SignerVer02 record and/or the device model of a file in place
 *
 * The file is rewritten atomically, and only when at least one change was made.
 *
 * @return 0 when the file was updated, 1 otherwise
 */
int update_file_command(const update_file_request& request);

} // namespace s1gn3rx::commands
