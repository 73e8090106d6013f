#pragma once

#include "engine/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace s1gn3r::utils {

// whole-file read; io_error when the file cannot be opened or read
engine::result<std::vector<uint8_t>> read_file(const std::string& file_path);

// writes to a sibling temporary file and renames it over the target,
// so readers see either the old or the new content, never a partial file
// a symlink target is resolved first, so the link is kept and the file it names is replaced
engine::status write_file_atomic(const std::string& file_path, std::span<const uint8_t> data);
engine::status write_file_atomic(const std::string& file_path, const std::string& text);

// creates missing parent directories of file_path
engine::status ensure_parent_directory(const std::string& file_path);

bool file_exists(const std::string& file_path);

} // namespace s1gn3r::utils
