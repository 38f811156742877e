#pragma once

#include <string>
#include <vector>

namespace workledger::db::sql {

/*
  Table layout, one statement per entry.

    requests      lease state lives here (locking, locked_at_ms, lease_generation)
    transforms    no request column; the owner is transform_metadata.request_id
    collections   FK transforms ON DELETE CASCADE, unique (transform_id, scope, name)
    contents      FK collections ON DELETE CASCADE, unique identity key plus
                  a partial unique index for unranged file contents
*/

const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace workledger::db::sql
