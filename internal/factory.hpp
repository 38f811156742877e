#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace workledger::db {
class Repository;
}
namespace workledger::service {
class RequestService;
class TransformService;
class CollectionService;
class ContentService;
class ProgressService;
} // namespace workledger::service
namespace workledger::lease {
class LeaseEngine;
class LockSweeper;
} // namespace workledger::lease
namespace workledger::core {
class TransformCommitter;
}

namespace workledger::factory {

/*
  Application

  Owns every long-lived component of a worker process. The sweeper is
  built but not started.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::RequestService>    requests;
  std::shared_ptr<service::TransformService>  transforms;
  std::shared_ptr<service::CollectionService> collections;
  std::shared_ptr<service::ContentService>    contents;
  std::shared_ptr<service::ProgressService>   progress;

  std::shared_ptr<lease::LeaseEngine>       leases;
  std::shared_ptr<core::TransformCommitter> committer;
  std::shared_ptr<lease::LockSweeper>       sweeper;
};

/*
  Build

  Composition root. The ONLY place that knows concrete DB types.
  Creates the schema when missing.
*/
Application Build(const workledger::runtime::config::RuntimeConfig& config, util::NowFn now = {});

std::shared_ptr<db::Repository> BuildRepository(const workledger::runtime::config::RuntimeConfig& config);

} // namespace workledger::factory
