#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/maintenance_orchestrator.hpp"

using redrive::observability::BoolField;
using redrive::observability::IntField;
using redrive::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

struct Flags {
  std::string config_path;
  bool        once       = false;
  bool        dry_run    = false;
  bool        replay_all = false;
};

void PrintUsage() {
  std::cerr << "Usage: redrive-worker [--config <config.yaml>] [--once] [--dry-run] [--replay-all]" << std::endl;
}

bool ParseFlags(int argc, char** argv, Flags& flags) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      flags.config_path = argv[++i];
    } else if (arg == "--once") {
      flags.once = true;
    } else if (arg == "--dry-run") {
      flags.dry_run = true;
    } else if (arg == "--replay-all") {
      flags.replay_all = true;
    } else {
      return false;
    }
  }
  return true;
}

int ReplayDeadLetters(const redrive::factory::RuntimeDependencies& app, const redrive::runtime::config::RuntimeConfig& config) {
  redrive::deadletter::ReplayAllOptions options;
  options.batch_size  = config.dead_letter().replay_batch_size();
  options.max_replays = config.dead_letter().max_replays();
  options.deadline    = redrive::util::Deadline::After(std::chrono::milliseconds(config.worker().task_deadline_ms()));

  const auto summary = app.dead_letters->ReplayAll(options);
  REDRIVE_LOG_INFO("Dead-letter replay finished",
                   {IntField("replayed", static_cast<int64_t>(summary.replayed)), IntField("skipped", static_cast<int64_t>(summary.skipped)),
                    IntField("errors", static_cast<int64_t>(summary.errors)), BoolField("completed", summary.completed)});
  return summary.errors == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  Flags flags;
  if (!ParseFlags(argc, argv, flags)) {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = redrive::config::ConfigLoader::Load(flags.config_path);
    if (flags.dry_run) {
      config.mutable_retention()->set_dry_run(true);
    }

    redrive::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = redrive::factory::BuildRuntime(config);

    if (flags.replay_all) {
      const int rc = ReplayDeadLetters(app, config);
      redrive::observability::ShutdownLogging();
      return rc;
    }

    redrive::worker::MaintenanceComponents components{app.reclaim, app.trimmer, app.outbox, {}, app.retention, app.locks};
    redrive::worker::MaintenanceOrchestrator orchestrator(std::move(components), redrive::factory::MaintenanceOptionsFrom(config));

    if (flags.once) {
      int rc = 0;
      for (const auto& result : orchestrator.RunCycle()) {
        if (result.ran && !result.ok) {
          rc = 1;
        }
      }
      redrive::observability::ShutdownLogging();
      return rc;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    orchestrator.Start();
    REDRIVE_LOG_INFO("redrive worker started", {StringField("worker_id", config.worker().worker_id()),
                                                StringField("stream", config.queue().stream_key())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REDRIVE_LOG_INFO("Shutting down redrive worker");

    orchestrator.Stop();
    redrive::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    redrive::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
