#include "maintenance_orchestrator.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"

namespace redrive::worker {

using observability::BoolField;
using observability::StringField;

MaintenanceOrchestrator::MaintenanceOrchestrator(MaintenanceComponents components, MaintenanceOptions options)
    : components_(std::move(components)), options_(std::move(options)) {
}

MaintenanceOrchestrator::~MaintenanceOrchestrator() {
  Stop();
}

std::string MaintenanceOrchestrator::TaskLockName(const std::string& task) {
  return "redrive:maintenance:" + task;
}

template <typename Fn>
TaskResult MaintenanceOrchestrator::RunTask(const std::string& name, Fn&& fn) {
  TaskResult result;
  result.name = name;

  lock::ScopedLock held(*components_.locks, TaskLockName(name), options_.worker_id, options_.lock_ttl);
  if (!held) {
    result.detail = "lock held by another worker";
    REDRIVE_LOG_DEBUG("Maintenance task skipped", {StringField("task", name)});
    return result;
  }

  result.ran = true;
  try {
    fn(result);
  } catch (const std::exception& e) {
    result.ok     = false;
    result.detail = e.what();
  }

  if (result.ok) {
    REDRIVE_LOG_INFO("Maintenance task finished", {StringField("task", name), StringField("detail", result.detail)});
  } else {
    REDRIVE_LOG_ERROR("Maintenance task failed", {StringField("task", name), StringField("detail", result.detail)});
  }
  return result;
}

TaskResult MaintenanceOrchestrator::Reclaim() {
  return RunTask("reclaim", [&](TaskResult& result) {
    const auto s  = components_.reclaim->ReclaimStalled(options_.reclaim);
    result.ok     = s.errors == 0;
    result.detail = fmt::format("reclaimed={} dead_lettered={} skipped={} backoff_deferred={} claim_missed={} errors={}", s.reclaimed,
                                s.dead_lettered, s.skipped, s.backoff_deferred, s.claim_missed, s.errors);
  });
}

TaskResult MaintenanceOrchestrator::ArchiveTrim() {
  return RunTask("archive-trim", [&](TaskResult& result) {
    const auto s = components_.trimmer->ArchiveAndTrim(options_.dead_letter_max_length, util::Deadline::After(options_.task_deadline));
    result.ok    = s.errors == 0;
    result.detail =
        fmt::format("archived={} trimmed={} errors={} completed={}", s.archived, s.trimmed, s.errors, s.completed);
  });
}

TaskResult MaintenanceOrchestrator::Outbox() {
  return RunTask("outbox", [&](TaskResult& result) {
    if (!components_.outbox_sink) {
      result.detail = "no sink configured";
      return;
    }
    const auto s = components_.outbox->ProcessBatch(components_.outbox_sink, options_.worker_id, options_.outbox_batch_size);
    result.detail =
        fmt::format("claimed={} delivered={} failed={} ran={}", s.claimed, s.delivered, s.failed, s.ran);
  });
}

TaskResult MaintenanceOrchestrator::Retention() {
  return RunTask("retention", [&](TaskResult& result) {
    const auto locks  = components_.retention->CleanupExpiredLocks();
    const auto report = components_.retention->RunAll(options_.retention, util::Deadline::After(options_.task_deadline));

    std::string detail = fmt::format("expired_locks={}", locks);
    for (const auto& [table, counts] : report.tables) {
      detail += fmt::format(" {}={}/{}", table, counts.deleted, counts.candidates);
    }
    detail += fmt::format(" errors={}", report.errors);

    result.ok     = report.errors == 0;
    result.detail = std::move(detail);
  });
}

TaskResult MaintenanceOrchestrator::ReclaimCounterGc() {
  return RunTask("reclaim-counter-gc", [&](TaskResult& result) {
    const auto collected = components_.retention->CollectReclaimAttempts(options_.reclaim_attempts_ttl_sec, options_.retention.dry_run);
    if (!collected) {
      result.ok     = false;
      result.detail = "store unavailable";
      return;
    }
    result.detail = fmt::format("candidates={} deleted={}", collected->candidates, collected->deleted);
  });
}

std::vector<TaskResult> MaintenanceOrchestrator::RunCycle() {
  std::vector<TaskResult> results;
  results.push_back(Reclaim());
  results.push_back(ArchiveTrim());
  results.push_back(Outbox());
  results.push_back(Retention());
  results.push_back(ReclaimCounterGc());
  return results;
}

void MaintenanceOrchestrator::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
  }
  thread_ = std::thread(&MaintenanceOrchestrator::Run, this);
}

void MaintenanceOrchestrator::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void MaintenanceOrchestrator::Run() {
  REDRIVE_LOG_INFO("Maintenance loop started", {StringField("worker_id", options_.worker_id), BoolField("dry_run", options_.retention.dry_run)});

  std::unique_lock lock(mutex_);
  while (running_) {
    lock.unlock();
    RunCycle();
    lock.lock();
    wake_.wait_for(lock, options_.interval, [&] { return !running_; });
  }

  REDRIVE_LOG_INFO("Maintenance loop stopped", {StringField("worker_id", options_.worker_id)});
}

} // namespace redrive::worker
