#include <doctest/doctest.h>

#include "s1gn3r/engine/string_replacer.hpp"
#include "test_helpers.hpp"

#include <string>

namespace {

using s1gn3r::engine::encode_token;
using s1gn3r::engine::mutation_kind;
using s1gn3r::engine::replace_all;
using s1gn3r::engine::token_encoding;
using s1gn3r::test_helpers::make_buffer;
using s1gn3r::test_helpers::utf16le;
using s1gn3r::test_helpers::write_raw;
using s1gn3r::test_helpers::write_string;

const s1gn3r::engine::encoding_pass& pass_for(
    const s1gn3r::engine::replace_report& report, token_encoding encoding
) {
  for (const auto& pass : report.passes) {
    if (pass.encoding == encoding) {
      return pass;
    }
  }
  FAIL("missing encoding pass");
  return report.passes.front();
}

bool contains(const std::vector<uint8_t>& haystack, const std::vector<uint8_t>& needle) {
  return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
}

std::vector<uint8_t> bytes_of(std::string_view text) { return std::vector<uint8_t>(text.begin(), text.end()); }

} // namespace

TEST_CASE("replacer rewrites ascii, utf-8 and utf-16le occurrences") {
  auto buffer = make_buffer(512, 0xcc);
  write_string(buffer, 10, "F711BXXS8HXF2");
  write_string(buffer, 100, "F711BXXS8HXF2");
  buffer[113] = 0x00;
  write_raw(buffer, 200, utf16le("F711BXXS8HXF2"));
  write_raw(buffer, 300, utf16le("F711BXXS8HXF2"));
  write_raw(buffer, 400, utf16le("F711BXXS8HXF2"));

  auto report = replace_all(buffer, "F711BXXS8HXF2", "F711BXXSFJYGB");
  CHECK_FALSE(report.guarded);
  CHECK(report.buffer.size() == buffer.size());
  CHECK(report.total == 5);

  CHECK(pass_for(report, token_encoding::ascii).count() == 2);
  CHECK(pass_for(report, token_encoding::utf8).count() == 0);
  CHECK(pass_for(report, token_encoding::utf16le).count() == 3);
  CHECK(pass_for(report, token_encoding::ascii_nul).count() == 0);
  CHECK(pass_for(report, token_encoding::utf8_nul).count() == 0);

  CHECK_FALSE(contains(report.buffer, bytes_of("F711BXXS8HXF2")));
  CHECK_FALSE(contains(report.buffer, utf16le("F711BXXS8HXF2")));
  CHECK(contains(report.buffer, utf16le("F711BXXSFJYGB")));

  for (size_t i = 0; i < buffer.size(); ++i) {
    bool in_ascii = (i >= 10 && i < 23) || (i >= 100 && i < 113);
    bool in_utf16 = (i >= 200 && i < 226) || (i >= 300 && i < 326) || (i >= 400 && i < 426);
    if (!in_ascii && !in_utf16) {
      CHECK(report.buffer[i] == buffer[i]);
    }
  }
}

TEST_CASE("replacer reports match offsets as mutations") {
  auto buffer = make_buffer(128);
  write_string(buffer, 16, "F711BXXS8HXF2");
  write_raw(buffer, 64, utf16le("F711BXXS8HXF2"));

  auto report = replace_all(buffer, "F711BXXS8HXF2", "F711BXXSFJYGB");
  auto mutations = report.mutations();
  REQUIRE(mutations.size() == 2);
  CHECK(mutations[0].kind == mutation_kind::model_string);
  CHECK(mutations[0].offset == 16);
  CHECK(mutations[0].old_length == 13);
  CHECK(mutations[0].new_length == 13);
  CHECK(mutations[0].detail == "ASCII");
  CHECK(mutations[1].offset == 64);
  CHECK(mutations[1].old_length == 26);
  CHECK(mutations[1].detail == "UTF-16 LE");
}

TEST_CASE("replacer guards against identical tokens") {
  auto buffer = make_buffer(64);
  write_string(buffer, 8, "F711BXXS8HXF2");

  auto report = replace_all(buffer, "F711BXXS8HXF2", "F711BXXS8HXF2");
  CHECK(report.guarded);
  CHECK(report.total == 0);
  CHECK(report.passes.empty());
  CHECK(report.buffer == buffer);
}

TEST_CASE("replacer guards against empty tokens") {
  auto buffer = make_buffer(64);
  write_string(buffer, 8, "F711BXXS8HXF2");

  auto empty_old = replace_all(buffer, "", "F711BXXSFJYGB");
  CHECK(empty_old.guarded);
  CHECK(empty_old.total == 0);
  CHECK(empty_old.buffer == buffer);

  auto empty_new = replace_all(buffer, "F711BXXS8HXF2", "");
  CHECK(empty_new.guarded);
  CHECK(empty_new.total == 0);
  CHECK(empty_new.buffer == buffer);
}

TEST_CASE("replacer skips every pass when token lengths differ") {
  auto buffer = make_buffer(64);
  write_string(buffer, 8, "F711BXXS8HXF2");

  auto report = replace_all(buffer, "F711BXXS8HXF2", "F711BXXS8HXF23");
  CHECK_FALSE(report.guarded);
  CHECK(report.total == 0);
  CHECK(report.buffer == buffer);
  REQUIRE(report.passes.size() == 5);
  for (const auto& pass : report.passes) {
    CHECK_FALSE(pass.attempted);
  }
}

TEST_CASE("replacer does not double replace overlapping matches") {
  auto buffer = make_buffer(16);
  write_string(buffer, 0, "AAAAAA");

  auto report = replace_all(buffer, "AAAA", "BBBB");
  CHECK(report.total == 1);
  CHECK(report.buffer[0] == 'B');
  CHECK(report.buffer[3] == 'B');
  CHECK(report.buffer[4] == 'A');
  CHECK(report.buffer[5] == 'A');
}

TEST_CASE("replacer sweeps adjacent matches once per pass") {
  auto buffer = make_buffer(8);
  write_string(buffer, 0, "XYXY");

  auto report = replace_all(buffer, "XY", "YX");
  const auto& ascii = pass_for(report, token_encoding::ascii);
  REQUIRE(ascii.count() == 2);
  CHECK(ascii.offsets[0] == 0);
  CHECK(ascii.offsets[1] == 2);

  // "YXYX" holds a fresh match at 1 for the next pass
  const auto& utf8 = pass_for(report, token_encoding::utf8);
  REQUIRE(utf8.count() == 1);
  CHECK(utf8.offsets[0] == 1);

  CHECK(report.total == 3);
  CHECK(std::string(report.buffer.begin(), report.buffer.begin() + 4) == "YYXX");
  CHECK(report.buffer.size() == 8);
}

TEST_CASE("replacer passes see the output of earlier passes") {
  auto buffer = make_buffer(8);
  write_string(buffer, 2, "XY");

  auto report = replace_all(buffer, "XY", "YX");
  CHECK(report.total == 1);
  CHECK(pass_for(report, token_encoding::ascii).count() == 1);
  CHECK(pass_for(report, token_encoding::utf8).count() == 0);
  CHECK(report.buffer[2] == 'Y');
  CHECK(report.buffer[3] == 'X');
}

TEST_CASE("replacer handles non ascii tokens in utf-8 and utf-16le only") {
  // U+00E9 and U+00E8 followed by '1'
  const std::string old_token = "\xc3\xa9"
                                "1";
  const std::string new_token = "\xc3\xa8"
                                "1";

  auto buffer = make_buffer(32);
  write_string(buffer, 4, old_token);
  write_raw(buffer, 16, {0xe9, 0x00, 0x31, 0x00});

  auto report = replace_all(buffer, old_token, new_token);
  CHECK(report.total == 2);
  CHECK_FALSE(pass_for(report, token_encoding::ascii).attempted);
  CHECK_FALSE(pass_for(report, token_encoding::ascii_nul).attempted);
  CHECK(pass_for(report, token_encoding::utf8).count() == 1);
  CHECK(pass_for(report, token_encoding::utf16le).count() == 1);
  CHECK(report.buffer[5] == 0xa8);
  CHECK(report.buffer[16] == 0xe8);
}

TEST_CASE("encode_token produces the five encodings") {
  auto ascii = encode_token("AB", token_encoding::ascii);
  REQUIRE(ascii.has_value());
  CHECK(*ascii == std::vector<uint8_t>{'A', 'B'});

  auto ascii_nul = encode_token("AB", token_encoding::ascii_nul);
  REQUIRE(ascii_nul.has_value());
  CHECK(*ascii_nul == std::vector<uint8_t>{'A', 'B', 0x00});

  auto utf8_nul = encode_token("AB", token_encoding::utf8_nul);
  REQUIRE(utf8_nul.has_value());
  CHECK(*utf8_nul == std::vector<uint8_t>{'A', 'B', 0x00});

  auto utf16 = encode_token("AB", token_encoding::utf16le);
  REQUIRE(utf16.has_value());
  CHECK(*utf16 == std::vector<uint8_t>{'A', 0x00, 'B', 0x00});

  CHECK_FALSE(encode_token("\xff", token_encoding::utf8).has_value());
  CHECK_FALSE(encode_token("\xc3\xa9", token_encoding::ascii).has_value());
}
