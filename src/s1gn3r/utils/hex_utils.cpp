#include "hex_utils.hpp"
#include <iomanip>
#include <sstream>

namespace s1gn3r::utils {

std::string format_offset(uint64_t offset) {
  std::ostringstream oss;
  oss << "0x" << std::hex << std::uppercase << std::setw(6) << std::setfill('0') << offset;
  return oss.str();
}

std::string format_bytes(std::span<const uint8_t> bytes) {
  std::ostringstream oss;
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i > 0) {
      oss << " ";
    }
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
  }
  return oss.str();
}

} // namespace s1gn3r::utils
