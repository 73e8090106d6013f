#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace s1gn3rx {

inline constexpr const char* k_default_config_file = "s1gn3r.conf";

// defaults for command line flags; explicit flags always win
struct s1gn3rx_config {
  int verbose = 0;
  std::string preferred_model;
  bool experimental_model_replace = false;
  bool auto_detect_old_model = false;

  enum class config_source { none, config_file, environment };

  config_source source = config_source::none;

  static bool parse_bool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return value == "1" || value == "true" || value == "yes" || value == "on";
  }

  static s1gn3rx_config from_environment() {
    s1gn3rx_config config;
    config.source = config_source::environment;

    if (const char* verbose_env = std::getenv("S1GN3R_VERBOSE")) {
      config.verbose = std::atoi(verbose_env);
    }

    if (const char* preferred_env = std::getenv("S1GN3R_PREFERRED_MODEL")) {
      config.preferred_model = preferred_env;
    }

    if (const char* replace_env = std::getenv("S1GN3R_EXPERIMENTAL_MODEL_REPLACE")) {
      config.experimental_model_replace = parse_bool(replace_env);
    }

    if (const char* detect_env = std::getenv("S1GN3R_AUTO_DETECT_OLD_MODEL")) {
      config.auto_detect_old_model = parse_bool(detect_env);
    }

    return config;
  }

  static std::optional<s1gn3rx_config> from_config_file(const std::string& config_path = k_default_config_file) {
    if (!std::filesystem::exists(config_path)) {
      return std::nullopt;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
      return std::nullopt;
    }

    s1gn3rx_config config;
    config.source = config_source::config_file;
    std::string line;

    while (std::getline(file, line)) {
      if (line.empty() || line[0] == '#') {
        continue;
      }

      auto pos = line.find('=');
      if (pos == std::string::npos) {
        continue;
      }

      std::string key = line.substr(0, pos);
      std::string value = line.substr(pos + 1);

      // trim whitespace
      key.erase(0, key.find_first_not_of(" \t"));
      key.erase(key.find_last_not_of(" \t") + 1);
      value.erase(0, value.find_first_not_of(" \t"));
      value.erase(value.find_last_not_of(" \t\r") + 1);

      if (key == "verbose") {
        config.verbose = std::atoi(value.c_str());
      } else if (key == "preferred_model") {
        config.preferred_model = value;
      } else if (key == "experimental_model_replace") {
        config.experimental_model_replace = parse_bool(value);
      } else if (key == "auto_detect_old_model") {
        config.auto_detect_old_model = parse_bool(value);
      }
    }

    return config;
  }

  static s1gn3rx_config discover(const std::string& config_path = k_default_config_file) {
    if (auto config = from_config_file(config_path)) {
      return *config;
    }

    return from_environment();
  }

  const char* source_string() const {
    switch (source) {
    case config_source::config_file:
      return "config_file";
    case config_source::environment:
      return "environment";
    default:
      return "none";
    }
  }
};

} // namespace s1gn3rx
