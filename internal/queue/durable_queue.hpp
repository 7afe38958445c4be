#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/stream/stream_store.hpp"

namespace redrive::queue {

using stream::FieldMap;
using stream::MessageId;

using Delivery = stream::StreamMessage;

struct QueueOptions {
  std::string stream_key     = "redrive:work";
  std::string consumer_group = "redrive-workers";
  std::string consumer_name;

  // 0 disables trimming on enqueue.
  uint64_t                  max_stream_length = 100000;
  std::chrono::milliseconds block{2000};
};

// Typed producer payload; becomes the fields of one WorkMessage.
struct WorkItem {
  std::string                candidate_id;
  double                     priority = 0.0;
  std::optional<std::string> idempotency_key;
  std::optional<std::string> metadata_json;
};

/*
  Work queue over one stream and one consumer group.

  Store failures are logged and reported as empty results (nullopt,
  false, empty vector); nothing here throws to the caller.
*/
class DurableQueue {
 public:
  DurableQueue(std::shared_ptr<stream::StreamStore> store, QueueOptions options);

  // Creates stream and group if needed; an existing group is not an error.
  bool EnsureConsumerGroup();

  std::optional<MessageId> Enqueue(const FieldMap& fields, uint64_t max_length);
  std::optional<MessageId> Enqueue(const WorkItem& item);

  std::vector<Delivery> ConsumeBatch(uint64_t batch_size, std::chrono::milliseconds block);
  std::vector<Delivery> ConsumeBatch(uint64_t batch_size) {
    return ConsumeBatch(batch_size, options_.block);
  }

  // Also clears the message's reclaim counter.
  bool Ack(const MessageId& id);
  bool AckAndDelete(const MessageId& id);

  std::vector<stream::PendingInfo> Pending(uint64_t limit);
  std::optional<FieldMap>          Read(const MessageId& id);
  stream::StreamInfo               Info();

  uint64_t ReclaimAttempts(const MessageId& id);
  uint64_t IncrementReclaimAttempts(const MessageId& id);
  void     ClearReclaimAttempts(const MessageId& id);

  const QueueOptions& Options() const {
    return options_;
  }

  stream::StreamStore& Store() {
    return *store_;
  }

 private:
  std::shared_ptr<stream::StreamStore> store_;
  QueueOptions                         options_;
};

} // namespace redrive::queue
