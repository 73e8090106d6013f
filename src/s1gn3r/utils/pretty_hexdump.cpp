#include "pretty_hexdump.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace s1gn3r::utils {

namespace {

constexpr auto offset_color = redlog::color::bright_cyan;
constexpr auto unchanged_color = redlog::color::white;
constexpr auto before_change_color = redlog::color::cyan;
constexpr auto after_change_color = redlog::color::red;
constexpr auto ascii_color = redlog::color::bright_black;

std::string format_hex_byte(uint8_t byte, redlog::color color) {
  std::ostringstream oss;
  oss << std::hex << std::setw(2) << std::setfill('0') << std::nouppercase << static_cast<int>(byte);
  return redlog::detail::colorize(oss.str(), color);
}

std::string format_row_offset(uint64_t offset) {
  std::ostringstream oss;
  oss << std::hex << std::setw(8) << std::setfill('0') << std::nouppercase << offset << ":";
  return redlog::detail::colorize(oss.str(), offset_color);
}

// one row of hex bytes; highlighted positions use highlight_color
std::string format_hex_row(
    std::span<const uint8_t> row, size_t bytes_per_line, const std::vector<bool>& highlight,
    redlog::color highlight_color
) {
  std::ostringstream oss;
  for (size_t i = 0; i < bytes_per_line; ++i) {
    if (i > 0) {
      oss << " ";
    }
    if (i < row.size()) {
      bool marked = i < highlight.size() && highlight[i];
      oss << format_hex_byte(row[i], marked ? highlight_color : unchanged_color);
    } else {
      oss << "  ";
    }
    if (i == 7) {
      oss << " ";
    }
  }
  return oss.str();
}

std::string format_ascii_row(
    std::span<const uint8_t> row, const std::vector<bool>& highlight, redlog::color highlight_color
) {
  std::ostringstream oss;
  oss << "|";
  for (size_t i = 0; i < row.size(); ++i) {
    char c = (row[i] >= 32 && row[i] <= 126) ? static_cast<char>(row[i]) : '.';
    bool marked = i < highlight.size() && highlight[i];
    oss << redlog::detail::colorize(std::string(1, c), marked ? highlight_color : ascii_color);
  }
  oss << "|";
  return oss.str();
}

} // namespace

std::string format_hexdump(std::span<const uint8_t> data, uint64_t base_offset, const hexdump_options& opts) {
  if (data.empty() || opts.bytes_per_line == 0) {
    return "";
  }

  std::ostringstream result;
  size_t lines_shown = 0;
  const std::vector<bool> no_highlight;

  for (size_t offset = 0; offset < data.size(); offset += opts.bytes_per_line) {
    if (lines_shown >= opts.max_lines) {
      result << "... (truncated, " << (data.size() - offset) << " more bytes)\n";
      break;
    }

    auto row = data.subspan(offset, std::min(opts.bytes_per_line, data.size() - offset));
    result << format_row_offset(base_offset + offset) << "  ";
    result << format_hex_row(row, opts.bytes_per_line, no_highlight, redlog::color::none);
    if (opts.show_ascii) {
      result << "  " << format_ascii_row(row, no_highlight, redlog::color::none);
    }
    result << "\n";
    lines_shown++;
  }

  return result.str();
}

std::string format_patch_hexdump(
    std::span<const uint8_t> before, std::span<const uint8_t> after, uint64_t base_offset,
    const hexdump_options& opts
) {
  if (before.size() != after.size()) {
    return "error: before and after ranges must be same size\n";
  }
  if (before.empty() || opts.bytes_per_line == 0) {
    return "";
  }

  std::ostringstream result;
  size_t lines_shown = 0;

  for (size_t offset = 0; offset < before.size(); offset += opts.bytes_per_line) {
    if (lines_shown >= opts.max_lines) {
      result << "... (truncated, " << (before.size() - offset) << " more bytes)\n";
      break;
    }

    size_t line_size = std::min(opts.bytes_per_line, before.size() - offset);
    auto before_row = before.subspan(offset, line_size);
    auto after_row = after.subspan(offset, line_size);

    std::vector<bool> changed(line_size);
    for (size_t i = 0; i < line_size; ++i) {
      changed[i] = before_row[i] != after_row[i];
    }

    result << format_row_offset(base_offset + offset) << "  before: ";
    result << format_hex_row(before_row, opts.bytes_per_line, changed, before_change_color);
    if (opts.show_ascii) {
      result << "  " << format_ascii_row(before_row, changed, before_change_color);
    }
    result << "\n";

    result << "           after:  ";
    result << format_hex_row(after_row, opts.bytes_per_line, changed, after_change_color);
    if (opts.show_ascii) {
      result << "  " << format_ascii_row(after_row, changed, after_change_color);
    }
    result << "\n\n";

    lines_shown++;
  }

  return result.str();
}

} // namespace s1gn3r::utils
