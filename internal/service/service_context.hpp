#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/util/time.hpp"

namespace workledger::db {
class Repository;
}

namespace workledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<workledger::db::Repository> repository;

  // Overridden by tests that need to move time around.
  workledger::util::NowFn now;

  // Default chunk size for AddContents.
  std::size_t content_bulk_size = 100;

  uint64_t NowMs() const {
    return workledger::util::ToUnixMillis(now ? now() : workledger::util::Now());
  }
};

} // namespace workledger::service
