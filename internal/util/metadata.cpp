#include "metadata.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace workledger::util {

namespace {

// 2^63; every double in [-2^63, 2^63) converts to int64_t exactly.
constexpr double kInt64Bound = 9223372036854775808.0;

std::optional<int64_t> ToInt(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue: {
      const double number = value.number_value();
      if (!std::isfinite(number) || std::trunc(number) != number) {
        return std::nullopt;
      }
      if (number < -kInt64Bound || number >= kInt64Bound) {
        return std::nullopt;
      }
      return static_cast<int64_t>(number);
    }
    case google::protobuf::Value::kStringValue: {
      const auto& text   = value.string_value();
      char*       endptr = nullptr;
      errno              = 0;
      const auto parsed  = std::strtoll(text.c_str(), &endptr, 10);
      if (text.empty() || errno == ERANGE || (endptr && *endptr != '\0')) {
        return std::nullopt;
      }
      return static_cast<int64_t>(parsed);
    }
    default:
      return std::nullopt;
  }
}

} // namespace

std::string EncodeMetadata(const Metadata& metadata) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json);
  if (!status.ok()) {
    throw InvalidArgument("metadata is not representable as JSON: " + std::string(status.message()));
  }
  return json;
}

Metadata DecodeMetadata(const std::string& json) {
  Metadata metadata;
  auto     status = google::protobuf::util::JsonStringToMessage(json, &metadata);
  if (!status.ok()) {
    throw std::runtime_error("stored metadata is not valid JSON: " + std::string(status.message()));
  }
  return metadata;
}

std::optional<int64_t> GetInt(const Metadata& metadata, std::string_view key) {
  const auto it = metadata.fields().find(std::string(key));
  if (it == metadata.fields().end()) {
    return std::nullopt;
  }
  return ToInt(it->second);
}

void SetInt(Metadata& metadata, std::string_view key, int64_t value) {
  (*metadata.mutable_fields())[std::string(key)].set_number_value(static_cast<double>(value));
}

void SetIntList(Metadata& metadata, std::string_view key, const std::vector<uint64_t>& values) {
  auto* list = (*metadata.mutable_fields())[std::string(key)].mutable_list_value();
  list->clear_values();
  for (const auto value : values) {
    list->add_values()->set_number_value(static_cast<double>(value));
  }
}

std::vector<int64_t> GetIntList(const Metadata& metadata, std::string_view key) {
  std::vector<int64_t> out;
  const auto           it = metadata.fields().find(std::string(key));
  if (it == metadata.fields().end() || !it->second.has_list_value()) {
    return out;
  }
  for (const auto& value : it->second.list_value().values()) {
    if (auto as_int = ToInt(value)) {
      out.push_back(*as_int);
    }
  }
  return out;
}

bool Equals(const Metadata& lhs, const Metadata& rhs) {
  return google::protobuf::util::MessageDifferencer::Equals(lhs, rhs);
}

} // namespace workledger::util
