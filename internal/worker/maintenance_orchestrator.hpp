#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/deadletter/archive_trimmer.hpp"
#include "internal/lock/distributed_lock.hpp"
#include "internal/outbox/outbox_processor.hpp"
#include "internal/queue/reclaim_scheduler.hpp"
#include "internal/retention/retention_gc.hpp"

namespace redrive::worker {

struct MaintenanceOptions {
  std::string worker_id;

  std::chrono::milliseconds interval{60000};
  std::chrono::milliseconds lock_ttl{120000};
  // Budget for deadline-aware tasks (archive/trim, retention).
  std::chrono::milliseconds task_deadline{60000};

  queue::ReclaimOptions      reclaim;
  uint64_t                   dead_letter_max_length = 10000;
  uint64_t                   outbox_batch_size      = 100;
  retention::RetentionPolicy retention;
  uint64_t                   reclaim_attempts_ttl_sec = 604800;
};

struct TaskResult {
  std::string name;
  // false when another worker held the task lock.
  bool        ran = false;
  bool        ok  = true;
  std::string detail;
};

struct MaintenanceComponents {
  std::shared_ptr<queue::ReclaimScheduler>    reclaim;
  std::shared_ptr<deadletter::ArchiveTrimmer> trimmer;
  std::shared_ptr<outbox::OutboxProcessor>    outbox;
  // No outbox delivery when empty.
  outbox::OutboxSink                          outbox_sink;
  std::shared_ptr<retention::RetentionGC>     retention;
  std::shared_ptr<lock::DistributedLock>      locks;
};

/*
  Periodic maintenance cycle:

    reclaim -> archive/trim -> outbox -> retention -> reclaim-counter GC

  Each task runs under its own named DistributedLock so that, across a
  fleet of workers, one worker runs a given task at a time.
*/
class MaintenanceOrchestrator {
 public:
  MaintenanceOrchestrator(MaintenanceComponents components, MaintenanceOptions options);
  ~MaintenanceOrchestrator();

  MaintenanceOrchestrator(const MaintenanceOrchestrator&)            = delete;
  MaintenanceOrchestrator& operator=(const MaintenanceOrchestrator&) = delete;

  std::vector<TaskResult> RunCycle();

  void Start();
  void Stop();

  static std::string TaskLockName(const std::string& task);

 private:
  template <typename Fn>
  TaskResult RunTask(const std::string& name, Fn&& fn);

  TaskResult Reclaim();
  TaskResult ArchiveTrim();
  TaskResult Outbox();
  TaskResult Retention();
  TaskResult ReclaimCounterGc();

  void Run();

  MaintenanceComponents components_;
  MaintenanceOptions    options_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable wake_;
  bool                    running_ = false;
};

} // namespace redrive::worker
