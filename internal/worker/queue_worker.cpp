#include "queue_worker.hpp"

#include "internal/observability/logging.hpp"

namespace redrive::worker {

using observability::StringField;

QueueWorker::QueueWorker(std::shared_ptr<queue::DurableQueue> queue, DeliveryHandler handler, QueueWorkerOptions options)
    : queue_(std::move(queue)), handler_(std::move(handler)), options_(options) {
}

QueueWorker::~QueueWorker() {
  Stop();
}

void QueueWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&QueueWorker::Run, this);
}

void QueueWorker::Stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

WorkerPassSummary QueueWorker::RunOnce() {
  WorkerPassSummary summary;

  const auto deliveries = queue_->ConsumeBatch(options_.batch_size, options_.block);
  summary.consumed      = deliveries.size();

  for (const auto& delivery : deliveries) {
    bool handled = false;
    try {
      handled = handler_(delivery);
    } catch (const std::exception& e) {
      REDRIVE_LOG_WARN("Handler failed, message left pending", {StringField("msg_id", delivery.id), StringField("error", e.what())});
    }

    if (handled && queue_->Ack(delivery.id)) {
      ++summary.acked;
    } else {
      ++summary.failed;
    }
  }
  return summary;
}

void QueueWorker::Run() {
  REDRIVE_LOG_INFO("Queue worker started", {StringField("stream", queue_->Options().stream_key)});
  while (running_) {
    RunOnce();
  }
  REDRIVE_LOG_INFO("Queue worker stopped", {StringField("stream", queue_->Options().stream_key)});
}

} // namespace redrive::worker
