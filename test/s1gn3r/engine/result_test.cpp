#include <doctest/doctest.h>

#include <string>

#include "s1gn3r/engine/result.hpp"

namespace {

using s1gn3r::engine::error_code;
using s1gn3r::engine::error_code_name;

} // namespace

TEST_CASE("every error code has a name") {
  CHECK(std::string(error_code_name(error_code::ok)) == "ok");
  CHECK(std::string(error_code_name(error_code::not_found)) == "not_found");
  CHECK(std::string(error_code_name(error_code::too_short)) == "too_short");
  CHECK(std::string(error_code_name(error_code::invalid_size)) == "invalid_size");
  CHECK(std::string(error_code_name(error_code::invalid_argument)) == "invalid_argument");
  CHECK(std::string(error_code_name(error_code::io_error)) == "io_error");
}

TEST_CASE("error results carry the status and a default value") {
  auto failed = s1gn3r::engine::error_result<int>(error_code::too_short, "record is truncated");
  CHECK_FALSE(failed.ok());
  CHECK(failed.value == 0);
  CHECK(failed.status_info.code == error_code::too_short);
  CHECK(failed.status_info.message == "record is truncated");

  auto forwarded = s1gn3r::engine::error_result<std::string>(failed.status_info);
  CHECK(forwarded.status_info.code == error_code::too_short);
  CHECK(forwarded.value.empty());

  auto done = s1gn3r::engine::ok_result(7);
  CHECK(done.ok());
  CHECK(done.value == 7);
}
