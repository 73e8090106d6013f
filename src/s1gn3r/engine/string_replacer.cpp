#include "string_replacer.hpp"
#include "byte_matcher.hpp"
#include "pretty_logging.hpp"
#include "utils/text_encoding.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace s1gn3r::engine {

const char* token_encoding_name(token_encoding encoding) {
  switch (encoding) {
  case token_encoding::ascii:
    return "ASCII";
  case token_encoding::utf8:
    return "UTF-8";
  case token_encoding::utf16le:
    return "UTF-16 LE";
  case token_encoding::ascii_nul:
    return "ASCII + null";
  case token_encoding::utf8_nul:
    return "UTF-8 + null";
  }
  return "unknown";
}

std::optional<std::vector<uint8_t>> encode_token(std::string_view token, token_encoding encoding) {
  auto raw = [token]() { return std::vector<uint8_t>(token.begin(), token.end()); };

  switch (encoding) {
  case token_encoding::ascii:
  case token_encoding::ascii_nul: {
    if (!utils::is_ascii(token)) {
      return std::nullopt;
    }
    auto bytes = raw();
    if (encoding == token_encoding::ascii_nul) {
      bytes.push_back(0x00);
    }
    return bytes;
  }
  case token_encoding::utf8:
  case token_encoding::utf8_nul: {
    if (!utils::decode_utf8(token)) {
      return std::nullopt;
    }
    auto bytes = raw();
    if (encoding == token_encoding::utf8_nul) {
      bytes.push_back(0x00);
    }
    return bytes;
  }
  case token_encoding::utf16le:
    return utils::encode_utf16le(token);
  }
  return std::nullopt;
}

std::vector<mutation> replace_report::mutations() const {
  std::vector<mutation> out;
  for (const auto& pass : passes) {
    for (uint64_t offset : pass.offsets) {
      out.push_back(
          mutation{
              mutation_kind::model_string, offset, pass.encoded_length, pass.encoded_length,
              token_encoding_name(pass.encoding)
          }
      );
    }
  }
  return out;
}

replace_report replace_all(std::span<const uint8_t> buffer, std::string_view old_token, std::string_view new_token) {
  auto log = redlog::get_logger("s1gn3r.replacer");

  replace_report report;
  report.buffer.assign(buffer.begin(), buffer.end());

  if (old_token.empty() || new_token.empty() || old_token == new_token) {
    log.wrn(
        "model replacement skipped: tokens are empty or identical", redlog::field("old", std::string(old_token)),
        redlog::field("new", std::string(new_token))
    );
    report.guarded = true;
    return report;
  }

  for (token_encoding encoding : k_replace_order) {
    encoding_pass pass;
    pass.encoding = encoding;

    auto old_bytes = encode_token(old_token, encoding);
    auto new_bytes = encode_token(new_token, encoding);
    if (!old_bytes || !new_bytes) {
      pass.skip_reason = "token not representable";
      log.dbg(
          "encoding pass skipped", redlog::field("encoding", token_encoding_name(encoding)),
          redlog::field("reason", pass.skip_reason)
      );
      report.passes.push_back(std::move(pass));
      continue;
    }

    if (old_bytes->size() != new_bytes->size()) {
      pass.skip_reason = "encoded length differs";
      log.dbg(
          "encoding pass skipped", redlog::field("encoding", token_encoding_name(encoding)),
          redlog::field("reason", pass.skip_reason), redlog::field("old_length", old_bytes->size()),
          redlog::field("new_length", new_bytes->size())
      );
      report.passes.push_back(std::move(pass));
      continue;
    }

    pass.attempted = true;
    pass.encoded_length = old_bytes->size();

    // matches are taken from the working buffer so earlier passes are visible.
    // they never overlap, so each write lands outside the remaining matches.
    byte_matcher matcher(*old_bytes);
    for (size_t pos : matcher.find_all(report.buffer)) {
      std::copy(new_bytes->begin(), new_bytes->end(), report.buffer.begin() + static_cast<std::ptrdiff_t>(pos));
      pass.offsets.push_back(pos);
      pretty_logging::log_token_match(log, token_encoding_name(encoding), pos, *old_bytes, *new_bytes);
    }

    if (pass.count() > 0) {
      log.inf(
          "replaced occurrences", redlog::field("encoding", token_encoding_name(encoding)),
          redlog::field("count", pass.count()), redlog::field("length", pass.encoded_length)
      );
    }

    report.total += pass.count();
    report.passes.push_back(std::move(pass));
  }

  log.dbg("model replacement finished", redlog::field("total", report.total));
  return report;
}

} // namespace s1gn3r::engine
