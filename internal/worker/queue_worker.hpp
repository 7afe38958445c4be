#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "internal/queue/durable_queue.hpp"

namespace redrive::worker {

// Returns true when the delivery was handled and can be acked.
// false or an exception leaves it pending for the reclaim pass.
using DeliveryHandler = std::function<bool(const queue::Delivery&)>;

struct QueueWorkerOptions {
  uint64_t                  batch_size = 10;
  std::chrono::milliseconds block{2000};
};

struct WorkerPassSummary {
  uint64_t consumed = 0;
  uint64_t acked    = 0;
  uint64_t failed   = 0;
};

/*
  Consumer loop: consume a batch, handle each delivery, ack on success.
*/
class QueueWorker {
 public:
  QueueWorker(std::shared_ptr<queue::DurableQueue> queue, DeliveryHandler handler, QueueWorkerOptions options = {});
  ~QueueWorker();

  QueueWorker(const QueueWorker&)            = delete;
  QueueWorker& operator=(const QueueWorker&) = delete;

  void Start();
  void Stop();

  WorkerPassSummary RunOnce();

 private:
  void Run();

  std::shared_ptr<queue::DurableQueue> queue_;
  DeliveryHandler                      handler_;
  QueueWorkerOptions                   options_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace redrive::worker
