#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/metadata.hpp"

namespace {

using workledger::util::Metadata;

void TestEncodeDecodeKeepsFields() {
  Metadata metadata;
  workledger::util::SetInt(metadata, "workload_id", 4242);
  workledger::util::SetIntList(metadata, "input_collections", {3, 5, 8});
  (*metadata.mutable_fields())["site"].set_string_value("CERN");

  const auto json    = workledger::util::EncodeMetadata(metadata);
  const auto decoded = workledger::util::DecodeMetadata(json);

  assert(workledger::util::Equals(metadata, decoded));
  assert(workledger::util::GetInt(decoded, "workload_id") == 4242);
  assert((workledger::util::GetIntList(decoded, "input_collections") == std::vector<int64_t>{3, 5, 8}));
}

void TestGetIntAcceptsNumericStrings() {
  const auto metadata = workledger::util::DecodeMetadata(R"({"workload_id":"77","name":"x","ratio":0.5})");
  assert(workledger::util::GetInt(metadata, "workload_id") == 77);
  assert(!workledger::util::GetInt(metadata, "name").has_value());
  assert(!workledger::util::GetInt(metadata, "ratio").has_value());
  assert(!workledger::util::GetInt(metadata, "missing").has_value());
}

void TestGetIntRejectsOutOfRangeValues() {
  const auto metadata = workledger::util::DecodeMetadata(
      R"({"huge":1e30,"tiny":-1e30,"edge":9223372036854775808,"low":-9223372036854775808,)"
      R"("long_text":"99999999999999999999","neg_text":"-99999999999999999999","big":4503599627370496})");
  assert(!workledger::util::GetInt(metadata, "huge").has_value());
  assert(!workledger::util::GetInt(metadata, "tiny").has_value());
  assert(!workledger::util::GetInt(metadata, "edge").has_value());
  assert(workledger::util::GetInt(metadata, "low") == INT64_MIN);
  assert(!workledger::util::GetInt(metadata, "long_text").has_value());
  assert(!workledger::util::GetInt(metadata, "neg_text").has_value());
  assert(workledger::util::GetInt(metadata, "big") == 4503599627370496);
}

void TestOutOfRangeListEntriesAreSkipped() {
  const auto metadata = workledger::util::DecodeMetadata(R"({"input_collections":[1,1e30,"2",2.5]})");
  assert((workledger::util::GetIntList(metadata, "input_collections") == std::vector<int64_t>{1, 2}));
}

void TestMissingListIsEmpty() {
  Metadata metadata;
  assert(workledger::util::GetIntList(metadata, "log_collections").empty());
}

void TestMalformedStoredTextThrows() {
  bool threw = false;
  try {
    (void)workledger::util::DecodeMetadata("{not json");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEncodeDecodeKeepsFields();
  TestGetIntAcceptsNumericStrings();
  TestGetIntRejectsOutOfRangeValues();
  TestOutOfRangeListEntriesAreSkipped();
  TestMissingListIsEmpty();
  TestMalformedStoredTextThrows();

  std::cout << "workledger_unit_metadata: pass\n";
  return 0;
}
