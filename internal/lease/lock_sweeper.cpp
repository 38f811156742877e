#include "lock_sweeper.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "lease_engine.hpp"

namespace workledger::lease {

LockSweeper::LockSweeper(std::shared_ptr<LeaseEngine> engine, uint64_t lock_timeout_sec, std::chrono::milliseconds interval)
    : engine_(std::move(engine)), lock_timeout_sec_(lock_timeout_sec), interval_(interval) {
}

LockSweeper::~LockSweeper() {
  Stop();
}

void LockSweeper::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&LockSweeper::Run, this);
  WORKLEDGER_LOG_INFO("lock sweeper started", {observability::UintField("lock_timeout_sec", lock_timeout_sec_),
                                               observability::IntField("interval_ms", interval_.count())});
}

void LockSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    WORKLEDGER_LOG_INFO("lock sweeper stopped");
  }
}

uint64_t LockSweeper::Sweeps() const {
  std::lock_guard lock(mutex_);
  return sweeps_;
}

void LockSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    try {
      engine_->ReclaimExpiredLocks(lock_timeout_sec_);
    } catch (const std::exception& e) {
      WORKLEDGER_LOG_ERROR("lock sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
    ++sweeps_;

    cv_.wait_for(lock, interval_, [&] { return !running_; });
  }
}

} // namespace workledger::lease
