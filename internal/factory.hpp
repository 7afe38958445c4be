#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/deadletter/archive_trimmer.hpp"
#include "internal/deadletter/dead_letter_pipeline.hpp"
#include "internal/lock/distributed_lock.hpp"
#include "internal/outbox/outbox_processor.hpp"
#include "internal/queue/durable_queue.hpp"
#include "internal/queue/reclaim_scheduler.hpp"
#include "internal/retention/retention_gc.hpp"
#include "internal/stream/stream_store.hpp"
#include "internal/worker/maintenance_orchestrator.hpp"

namespace redrive::factory {

/*
  RuntimeDependencies

  Owns all long-lived components used by the worker.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<stream::StreamStore>            streams;
  std::shared_ptr<queue::DurableQueue>            queue;
  std::shared_ptr<deadletter::DeadLetterPipeline> dead_letters;
  std::shared_ptr<queue::ReclaimScheduler>        reclaim;
  std::shared_ptr<deadletter::ArchiveTrimmer>     trimmer;
  std::shared_ptr<lock::DistributedLock>          locks;
  std::shared_ptr<outbox::OutboxProcessor>        outbox;
  std::shared_ptr<retention::RetentionGC>         retention;
};

/*
  BuildRepository

  Opens the configured backend and applies its schema. This is the ONLY
  place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const redrive::runtime::config::RuntimeConfig& config);

// Composition root: wires every component over one repository.
RuntimeDependencies BuildRuntime(const redrive::runtime::config::RuntimeConfig& config);

RuntimeDependencies BuildRuntime(const redrive::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository);

worker::MaintenanceOptions MaintenanceOptionsFrom(const redrive::runtime::config::RuntimeConfig& config);

} // namespace redrive::factory
