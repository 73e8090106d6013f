#include <doctest/doctest.h>

#include "s1gn3r/engine/record_locator.hpp"
#include "test_helpers.hpp"

#include <span>

namespace {

using s1gn3r::engine::error_code;
using s1gn3r::engine::k_signer_record_size;
using s1gn3r::engine::locate;
using s1gn3r::engine::locate_record;
using s1gn3r::test_helpers::make_buffer;
using s1gn3r::test_helpers::make_record;
using s1gn3r::test_helpers::write_raw;
using s1gn3r::test_helpers::write_string;

} // namespace

TEST_CASE("locator finds marker with a full record behind it") {
  auto buffer = make_buffer(200);
  write_raw(buffer, 50, make_record());

  auto offset = locate(buffer);
  REQUIRE(offset.ok());
  CHECK(offset.value == 50);
}

TEST_CASE("locator reports not found without marker") {
  auto buffer = make_buffer(512, 0x41);
  write_string(buffer, 100, "SignerVer01");

  auto offset = locate(buffer);
  CHECK_FALSE(offset.ok());
  CHECK(offset.status_info.code == error_code::not_found);
}

TEST_CASE("locator reports not found on empty buffer") {
  std::vector<uint8_t> buffer;

  auto offset = locate(buffer);
  CHECK_FALSE(offset.ok());
  CHECK(offset.status_info.code == error_code::not_found);
}

TEST_CASE("locator reports too short when record is truncated") {
  auto buffer = make_buffer(256);
  write_string(buffer, 256 - 100, "SignerVer02");

  auto offset = locate(buffer);
  CHECK_FALSE(offset.ok());
  CHECK(offset.status_info.code == error_code::too_short);
}

TEST_CASE("locator accepts a record ending exactly at buffer end") {
  auto buffer = make_buffer(300);
  write_raw(buffer, 300 - k_signer_record_size, make_record());

  auto offset = locate(buffer);
  REQUIRE(offset.ok());
  CHECK(offset.value == 300 - k_signer_record_size);
}

TEST_CASE("locator returns the first occurrence") {
  auto buffer = make_buffer(1024);
  write_raw(buffer, 64, make_record());
  write_raw(buffer, 512, make_record());

  auto offset = locate(buffer);
  REQUIRE(offset.ok());
  CHECK(offset.value == 64);
}

TEST_CASE("locator judges length from the first occurrence only") {
  auto buffer = make_buffer(200);
  write_string(buffer, 150, "SignerVer02");
  write_string(buffer, 180, "SignerVer02");

  auto offset = locate(buffer);
  CHECK(offset.status_info.code == error_code::too_short);
}

TEST_CASE("locate_record returns a view of the full record") {
  auto buffer = make_buffer(400, 0xff);
  auto record = make_record();
  write_raw(buffer, 77, record);

  auto located = locate_record(buffer);
  REQUIRE(located.ok());
  CHECK(located.value.offset == 77);
  REQUIRE(located.value.bytes.size() == k_signer_record_size);
  CHECK(std::equal(located.value.bytes.begin(), located.value.bytes.end(), record.begin()));
}
