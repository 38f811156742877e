#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace workledger::db::sql {

/*
  Parameter abstraction.

  Postgres: $1 $2 $3
  SQLite:   ? ? ?

  Canonical SQL is written with '?' and both engines bind in order.
  nullptr binds SQL NULL.
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    std::string
>;

using Params = std::vector<Param>;

template <typename T>
Param OptionalParam(const std::optional<T>& v) {
  if (!v) return nullptr;
  return Param(*v);
}

}
