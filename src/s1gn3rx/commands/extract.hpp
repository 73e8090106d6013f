#pragma once

#include <string>

namespace s1gn3rx::commands {

struct extract_request {
  std::string image_file;
  std::string output_json;
  std::string output_signer;
};

/**
 * @brief Locate and decode the SignerVer02 record of an image
 *
 * Prints the decoded fields and optionally stores them as json and the raw
 * 128-byte record as a binary file.
 *
 * @return 0 for success, 1 for failure
 */
int extract_command(const extract_request& request);

} // namespace s1gn3rx::commands
