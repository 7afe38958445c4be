#include "durable_queue.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"
#include "internal/util/best_effort.hpp"
#include "internal/util/time.hpp"

namespace redrive::queue {

using observability::IntField;
using observability::StringField;

DurableQueue::DurableQueue(std::shared_ptr<stream::StreamStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
}

bool DurableQueue::EnsureConsumerGroup() {
  try {
    if (store_->EnsureGroup(options_.stream_key, options_.consumer_group)) {
      REDRIVE_LOG_INFO("Created consumer group",
                       {StringField("stream", options_.stream_key), StringField("group", options_.consumer_group)});
    }
    return true;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to ensure consumer group", {StringField("group", options_.consumer_group), StringField("error", e.what())});
    return false;
  }
}

std::optional<MessageId> DurableQueue::Enqueue(const FieldMap& fields, uint64_t max_length) {
  try {
    const auto outcome = store_->Append(options_.stream_key, fields, max_length);
    REDRIVE_LOG_DEBUG("Enqueued message", {StringField("stream", options_.stream_key), StringField("msg_id", outcome.id)});
    return outcome.id;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to enqueue message", {StringField("stream", options_.stream_key), StringField("error", e.what())});
    return std::nullopt;
  }
}

std::optional<MessageId> DurableQueue::Enqueue(const WorkItem& item) {
  if (!EnsureConsumerGroup()) {
    return std::nullopt;
  }

  FieldMap fields;
  fields["candidate_id"] = item.candidate_id;
  fields["priority"]     = fmt::format("{}", item.priority);
  fields["enqueued_at"]  = util::ToIso8601(util::Now());
  if (item.idempotency_key) {
    fields["idempotency_key"] = *item.idempotency_key;
  }
  if (item.metadata_json) {
    fields["metadata"] = *item.metadata_json;
  }

  auto id = Enqueue(fields, options_.max_stream_length);
  if (!id) {
    REDRIVE_LOG_ERROR("Failed to enqueue candidate", {StringField("candidate_id", item.candidate_id)});
  }
  return id;
}

std::vector<Delivery> DurableQueue::ConsumeBatch(uint64_t batch_size, std::chrono::milliseconds block) {
  try {
    return store_->ReadGroup(options_.stream_key, options_.consumer_group, options_.consumer_name, batch_size, block);
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to consume from stream", {StringField("stream", options_.stream_key), StringField("error", e.what())});
    return {};
  }
}

bool DurableQueue::Ack(const MessageId& id) {
  try {
    const auto acked = store_->Ack(options_.stream_key, options_.consumer_group, id);
    REDRIVE_LOG_DEBUG("Acknowledged message", {StringField("msg_id", id), IntField("result", static_cast<int64_t>(acked))});

    if (acked > 0) {
      util::BestEffort("clear reclaim attempts", [&] { store_->ClearReclaimAttempts(options_.stream_key, id); });
    }
    return acked > 0;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to ack message", {StringField("msg_id", id), StringField("error", e.what())});
    return false;
  }
}

bool DurableQueue::AckAndDelete(const MessageId& id) {
  try {
    store_->Ack(options_.stream_key, options_.consumer_group, id);
    store_->Delete(options_.stream_key, id);
    util::BestEffort("clear reclaim attempts", [&] { store_->ClearReclaimAttempts(options_.stream_key, id); });
    return true;
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to ack+delete message", {StringField("msg_id", id), StringField("error", e.what())});
    return false;
  }
}

std::vector<stream::PendingInfo> DurableQueue::Pending(uint64_t limit) {
  try {
    return store_->Pending(options_.stream_key, options_.consumer_group, limit);
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to list pending messages", {StringField("stream", options_.stream_key), StringField("error", e.what())});
    return {};
  }
}

std::optional<FieldMap> DurableQueue::Read(const MessageId& id) {
  try {
    auto message = store_->Get(options_.stream_key, id);
    if (!message) return std::nullopt;
    return std::move(message->fields);
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to read message", {StringField("msg_id", id), StringField("error", e.what())});
    return std::nullopt;
  }
}

stream::StreamInfo DurableQueue::Info() {
  try {
    return store_->Info(options_.stream_key, options_.consumer_group);
  } catch (const std::exception& e) {
    REDRIVE_LOG_ERROR("Failed to get stream info", {StringField("stream", options_.stream_key), StringField("error", e.what())});
    return {};
  }
}

uint64_t DurableQueue::ReclaimAttempts(const MessageId& id) {
  try {
    return store_->ReclaimAttempts(options_.stream_key, id);
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("Failed to read reclaim attempts", {StringField("msg_id", id), StringField("error", e.what())});
    return 0;
  }
}

uint64_t DurableQueue::IncrementReclaimAttempts(const MessageId& id) {
  try {
    return store_->IncrementReclaimAttempts(options_.stream_key, id);
  } catch (const std::exception& e) {
    REDRIVE_LOG_WARN("Failed to increment reclaim attempts", {StringField("msg_id", id), StringField("error", e.what())});
    return 0;
  }
}

void DurableQueue::ClearReclaimAttempts(const MessageId& id) {
  util::BestEffort("clear reclaim attempts", [&] { store_->ClearReclaimAttempts(options_.stream_key, id); });
}

} // namespace redrive::queue
