#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace workledger::util {

/*
  Free-form metadata attached to requests, transforms, collections and
  contents.

  Held in memory as google.protobuf.Struct and stored as its JSON mapping:
    postgres -> jsonb
    sqlite   -> text
    memory   -> Struct copy
*/
using Metadata = google::protobuf::Struct;

// Throws InvalidArgument when the struct cannot be represented as JSON.
std::string EncodeMetadata(const Metadata& metadata);

// Throws std::runtime_error on malformed stored text.
Metadata DecodeMetadata(const std::string& json);

// Integral view of a numeric (or numeric string) field. Fractional values
// and values outside the int64 range read as absent.
std::optional<int64_t> GetInt(const Metadata& metadata, std::string_view key);

void SetInt(Metadata& metadata, std::string_view key, int64_t value);
void SetIntList(Metadata& metadata, std::string_view key, const std::vector<uint64_t>& values);

std::vector<int64_t> GetIntList(const Metadata& metadata, std::string_view key);

bool Equals(const Metadata& lhs, const Metadata& rhs);

} // namespace workledger::util
