#include "patch_engine.hpp"
#include "pretty_logging.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <string>

namespace s1gn3r::engine {

result<std::vector<uint8_t>> patch(
    std::span<const uint8_t> buffer, size_t offset, std::span<const uint8_t> new_record
) {
  auto log = redlog::get_logger("s1gn3r.patch");

  if (new_record.size() != k_signer_record_size) {
    log.err(
        "replacement record has invalid size", redlog::field("size", new_record.size()),
        redlog::field("expected", k_signer_record_size)
    );
    return error_result<std::vector<uint8_t>>(
        error_code::invalid_size, "replacement SignerVer02 record has invalid size (" +
                                      std::to_string(new_record.size()) + " bytes, expected " +
                                      std::to_string(k_signer_record_size) + ")"
    );
  }

  if (offset > buffer.size() || buffer.size() - offset < k_signer_record_size) {
    log.err(
        "record range exceeds buffer", redlog::field("offset", utils::format_offset(offset)),
        redlog::field("buffer_size", buffer.size())
    );
    return error_result<std::vector<uint8_t>>(error_code::invalid_argument, "record range exceeds buffer bounds");
  }

  std::vector<uint8_t> patched(buffer.begin(), buffer.end());
  std::copy(new_record.begin(), new_record.end(), patched.begin() + static_cast<std::ptrdiff_t>(offset));

  pretty_logging::log_record_patch(log, offset, buffer.subspan(offset, k_signer_record_size), new_record);
  return ok_result(std::move(patched));
}

} // namespace s1gn3r::engine
