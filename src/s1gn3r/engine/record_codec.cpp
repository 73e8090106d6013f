#include "record_codec.hpp"
#include "utils/text_encoding.hpp"
#include <redlog.hpp>
#include <string>

namespace s1gn3r::engine {

namespace {

// member for each entry of k_signer_layout, same order
constexpr std::array<std::string signer_record::*, k_signer_layout.size()> k_field_members = {
    &signer_record::signer_version, &signer_record::number,         &signer_record::device_model,
    &signer_record::date,           &signer_record::software_model, &signer_record::software_version,
};

std::string read_field(std::span<const uint8_t> record, const field_range& range) {
  auto bytes = record.subspan(range.begin, range.size());
  return utils::decode_ascii_lossy(utils::until_nul(bytes));
}

} // namespace

result<signer_record> decode(std::span<const uint8_t> record) {
  auto log = redlog::get_logger("s1gn3r.codec");

  if (record.size() != k_signer_record_size) {
    log.err(
        "signer record has invalid size", redlog::field("size", record.size()),
        redlog::field("expected", k_signer_record_size)
    );
    return error_result<signer_record>(
        error_code::invalid_size, "SignerVer02 record has invalid size (" + std::to_string(record.size()) +
                                      " bytes, expected " + std::to_string(k_signer_record_size) + ")"
    );
  }

  signer_record decoded;
  for (size_t i = 0; i < k_signer_layout.size(); ++i) {
    decoded.*k_field_members[i] = read_field(record, k_signer_layout[i]);
  }

  if (decoded.software_version.empty()) {
    decoded.software_version = std::string(k_empty_field_sentinel);
  }

  log.trc(
      "decoded signer record", redlog::field("signer_version", decoded.signer_version),
      redlog::field("device_model", decoded.device_model), redlog::field("date", decoded.date)
  );
  return ok_result(decoded);
}

std::vector<signer_field> record_fields(const signer_record& record) {
  std::vector<signer_field> fields;
  fields.reserve(k_signer_layout.size());
  for (size_t i = 0; i < k_signer_layout.size(); ++i) {
    fields.push_back(signer_field{std::string(k_signer_layout[i].name), record.*k_field_members[i]});
  }
  return fields;
}

} // namespace s1gn3r::engine
