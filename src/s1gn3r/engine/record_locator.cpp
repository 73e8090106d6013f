#include "record_locator.hpp"
#include "byte_matcher.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <string>

namespace s1gn3r::engine {

namespace {

std::span<const uint8_t> marker_bytes() {
  return {reinterpret_cast<const uint8_t*>(k_signer_marker.data()), k_signer_marker.size()};
}

} // namespace

result<size_t> locate(std::span<const uint8_t> buffer) {
  auto log = redlog::get_logger("s1gn3r.locator");

  if (buffer.empty()) {
    log.dbg("empty buffer");
    return error_result<size_t>(error_code::not_found, "buffer is empty");
  }

  byte_matcher matcher(marker_bytes());
  auto found = matcher.find(buffer);
  if (!found) {
    log.dbg("signer marker not found", redlog::field("buffer_size", buffer.size()));
    return error_result<size_t>(error_code::not_found, "SignerVer02 marker not found");
  }

  size_t offset = *found;
  size_t remaining = buffer.size() - offset;
  if (remaining < k_signer_record_size) {
    log.dbg(
        "signer record truncated", redlog::field("offset", utils::format_offset(offset)),
        redlog::field("remaining", remaining)
    );
    return error_result<size_t>(
        error_code::too_short, "SignerVer02 record is truncated (file size " + std::to_string(buffer.size()) +
                                   " bytes, record at " + utils::format_offset(offset) + ")"
    );
  }

  log.trc("signer marker located", redlog::field("offset", utils::format_offset(offset)));
  return ok_result(offset);
}

result<located_record> locate_record(std::span<const uint8_t> buffer) {
  auto offset = locate(buffer);
  if (!offset.ok()) {
    return error_result<located_record>(offset.status_info);
  }

  located_record located;
  located.offset = offset.value;
  located.bytes = buffer.subspan(offset.value, k_signer_record_size);
  return ok_result(located);
}

} // namespace s1gn3r::engine
