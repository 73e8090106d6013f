#pragma once

#include <string>
#include <utility>

namespace s1gn3r::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  not_found,
  too_short,
  invalid_size,
  invalid_argument,
  io_error
};

inline const char* error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::not_found:
    return "not_found";
  case error_code::too_short:
    return "too_short";
  case error_code::invalid_size:
    return "invalid_size";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::io_error:
    return "io_error";
  }
  return "unknown";
}

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(const status& cause) { return result<T>{T{}, cause}; }

} // namespace s1gn3r::engine
