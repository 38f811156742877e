#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace workledger::lease {

class LeaseEngine;

/*
  Background thread that periodically resets expired request leases.

  Runs LeaseEngine::ReclaimExpiredLocks(lock_timeout_sec) once per
  interval. A failed sweep is logged and retried on the next tick.
*/
class LockSweeper {
 public:
  LockSweeper(std::shared_ptr<LeaseEngine> engine, uint64_t lock_timeout_sec, std::chrono::milliseconds interval);
  ~LockSweeper();

  LockSweeper(const LockSweeper&)            = delete;
  LockSweeper& operator=(const LockSweeper&) = delete;

  void Start();
  void Stop();

  // Sweeps completed since Start, successful or not.
  uint64_t Sweeps() const;

 private:
  void Run();

  std::shared_ptr<LeaseEngine> engine_;
  uint64_t                     lock_timeout_sec_;
  std::chrono::milliseconds    interval_;

  std::thread             thread_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  uint64_t                sweeps_  = 0;
};

} // namespace workledger::lease
