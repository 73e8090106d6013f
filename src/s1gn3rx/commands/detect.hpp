#pragma once

#include <string>

namespace s1gn3rx::commands {

struct detect_request {
  std::string file;
  std::string preferred_model;
};

int detect_command(const detect_request& request);

} // namespace s1gn3rx::commands
