#include "file_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace s1gn3r::utils {

using engine::error_code;

engine::result<std::vector<uint8_t>> read_file(const std::string& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return engine::error_result<std::vector<uint8_t>>(error_code::io_error, "could not open file: " + file_path);
  }

  std::vector<uint8_t> data;
  data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return engine::error_result<std::vector<uint8_t>>(error_code::io_error, "failed to read file: " + file_path);
  }
  return engine::ok_result(std::move(data));
}

engine::status write_file_atomic(const std::string& file_path, std::span<const uint8_t> data) {
  namespace fs = std::filesystem;

  // a symlinked image is updated through its link, the link itself stays
  fs::path target(file_path);
  std::error_code link_ec;
  if (fs::is_symlink(fs::symlink_status(target, link_ec))) {
    auto resolved = fs::canonical(target, link_ec);
    if (link_ec) {
      return engine::make_status(
          error_code::io_error, "could not resolve link " + file_path + ": " + link_ec.message()
      );
    }
    target = resolved;
  }

  fs::path temp = target;
  temp += ".s1gn3r.tmp";

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return engine::make_status(error_code::io_error, "could not create file: " + temp.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file.good()) {
      file.close();
      std::error_code ignored;
      fs::remove(temp, ignored);
      return engine::make_status(error_code::io_error, "failed to write file: " + temp.string());
    }
  }

  std::error_code ec;
  auto existing = fs::status(target, ec);
  if (!ec && fs::exists(existing)) {
    fs::permissions(temp, existing.permissions(), fs::perm_options::replace, ec);
  }

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    return engine::make_status(error_code::io_error, "failed to replace " + file_path + ": " + ec.message());
  }

  return engine::ok_status();
}

engine::status write_file_atomic(const std::string& file_path, const std::string& text) {
  auto bytes = reinterpret_cast<const uint8_t*>(text.data());
  return write_file_atomic(file_path, std::span<const uint8_t>(bytes, text.size()));
}

engine::status ensure_parent_directory(const std::string& file_path) {
  namespace fs = std::filesystem;

  fs::path parent = fs::path(file_path).parent_path();
  if (parent.empty()) {
    return engine::ok_status();
  }

  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    return engine::make_status(
        error_code::io_error, "could not create directory " + parent.string() + ": " + ec.message()
    );
  }
  return engine::ok_status();
}

bool file_exists(const std::string& file_path) { return std::filesystem::exists(file_path); }

} // namespace s1gn3r::utils
