#include "text_encoding.hpp"
#include <algorithm>

namespace s1gn3r::utils {

bool is_ascii(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

std::optional<std::u32string> decode_utf8(std::string_view text) {
  std::u32string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      out.push_back(lead);
      ++i;
      continue;
    }

    size_t extra = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((lead & 0xe0) == 0xc0) {
      extra = 1;
      cp = lead & 0x1f;
      min_cp = 0x80;
    } else if ((lead & 0xf0) == 0xe0) {
      extra = 2;
      cp = lead & 0x0f;
      min_cp = 0x800;
    } else if ((lead & 0xf8) == 0xf0) {
      extra = 3;
      cp = lead & 0x07;
      min_cp = 0x10000;
    } else {
      return std::nullopt;
    }

    if (text.size() - i <= extra) {
      return std::nullopt;
    }

    for (size_t k = 1; k <= extra; ++k) {
      auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xc0) != 0x80) {
        return std::nullopt;
      }
      cp = (cp << 6) | (cont & 0x3f);
    }

    if (cp < min_cp || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
      return std::nullopt;
    }

    out.push_back(cp);
    i += extra + 1;
  }

  return out;
}

std::optional<std::vector<uint8_t>> encode_utf16le(std::string_view text) {
  auto code_points = decode_utf8(text);
  if (!code_points) {
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(code_points->size() * 2);

  auto push_unit = [&out](uint16_t unit) {
    out.push_back(static_cast<uint8_t>(unit & 0xff));
    out.push_back(static_cast<uint8_t>(unit >> 8));
  };

  for (char32_t cp : *code_points) {
    if (cp < 0x10000) {
      push_unit(static_cast<uint16_t>(cp));
    } else {
      char32_t v = cp - 0x10000;
      push_unit(static_cast<uint16_t>(0xd800 + (v >> 10)));
      push_unit(static_cast<uint16_t>(0xdc00 + (v & 0x3ff)));
    }
  }

  return out;
}

std::span<const uint8_t> until_nul(std::span<const uint8_t> bytes) {
  auto nul = std::find(bytes.begin(), bytes.end(), uint8_t{0});
  return bytes.first(static_cast<size_t>(nul - bytes.begin()));
}

std::string decode_ascii_lossy(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (uint8_t byte : bytes) {
    out.push_back((byte >= 0x20 && byte <= 0x7e) ? static_cast<char>(byte) : k_placeholder_char);
  }
  return out;
}

} // namespace s1gn3r::utils
