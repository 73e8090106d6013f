#pragma once

#include "engine/types.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s1gn3r::engine {

enum class token_encoding { ascii, utf8, utf16le, ascii_nul, utf8_nul };

// passes run in this order, each over the output of the previous one
inline constexpr std::array<token_encoding, 5> k_replace_order = {
    token_encoding::ascii,     token_encoding::utf8,     token_encoding::utf16le,
    token_encoding::ascii_nul, token_encoding::utf8_nul,
};

const char* token_encoding_name(token_encoding encoding);

// nullopt when the token has no representation in the encoding
std::optional<std::vector<uint8_t>> encode_token(std::string_view token, token_encoding encoding);

struct encoding_pass {
  token_encoding encoding = token_encoding::ascii;
  bool attempted = false;
  std::string skip_reason;
  size_t encoded_length = 0;
  std::vector<uint64_t> offsets;

  size_t count() const noexcept { return offsets.size(); }
};

struct replace_report {
  std::vector<uint8_t> buffer;
  size_t total = 0;
  // set when the inputs tripped the no-op guard; buffer is then an unchanged copy
  bool guarded = false;
  std::vector<encoding_pass> passes;

  // one model_string mutation per replaced occurrence
  std::vector<mutation> mutations() const;
};

// length-preserving replacement of old_token by new_token in every supported encoding.
// tokens are utf-8 text. empty or identical tokens leave the buffer untouched.
replace_report replace_all(std::span<const uint8_t> buffer, std::string_view old_token, std::string_view new_token);

} // namespace s1gn3r::engine
