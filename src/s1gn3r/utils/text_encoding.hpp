#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace s1gn3r::utils {

// substituted for bytes outside printable ascii
inline constexpr char k_placeholder_char = '?';

bool is_ascii(std::string_view text);

// strict utf-8 decode; rejects overlong forms, surrogates and truncated sequences
std::optional<std::u32string> decode_utf8(std::string_view text);

// utf-8 text re-encoded as utf-16 little endian, surrogate pairs above the bmp
std::optional<std::vector<uint8_t>> encode_utf16le(std::string_view text);

// bytes up to the first nul
std::span<const uint8_t> until_nul(std::span<const uint8_t> bytes);

// never fails; non-printable bytes become k_placeholder_char
std::string decode_ascii_lossy(std::span<const uint8_t> bytes);

} // namespace s1gn3r::utils
