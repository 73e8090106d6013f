#pragma once

#include "engine/types.hpp"
#include "utils/hex_utils.hpp"
#include "utils/pretty_hexdump.hpp"
#include <redlog.hpp>
#include <cstdint>
#include <span>
#include <string>

namespace s1gn3r::engine::pretty_logging {

inline bool verbose_enabled() {
  return static_cast<int>(redlog::get_level()) >= static_cast<int>(redlog::level::verbose);
}

inline void log_record_patch(
    redlog::logger& log, uint64_t offset, std::span<const uint8_t> before, std::span<const uint8_t> after
) {
  if (!verbose_enabled()) {
    return;
  }

  log.vrb(
      "signer record rewritten", redlog::field("offset", utils::format_offset(offset)),
      redlog::field("size", after.size())
  );

  std::string record_hexdump = utils::format_patch_hexdump(before, after, offset);
  if (!record_hexdump.empty()) {
    log.vrb(redlog::fmt("record\n%s", record_hexdump));
  }
}

inline void log_token_match(
    redlog::logger& log, const char* encoding, uint64_t offset, std::span<const uint8_t> old_bytes,
    std::span<const uint8_t> new_bytes
) {
  if (!verbose_enabled()) {
    return;
  }

  log.vrb(
      "token replaced", redlog::field("encoding", encoding), redlog::field("offset", utils::format_offset(offset)),
      redlog::field("old", utils::format_bytes(old_bytes)), redlog::field("new", utils::format_bytes(new_bytes))
  );
}

} // namespace s1gn3r::engine::pretty_logging
