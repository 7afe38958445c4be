#include "stream_store.hpp"

#include <algorithm>
#include <charconv>

#include "internal/db/api/run_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace redrive::stream {

namespace {

StreamMessage ToMessage(const db::model::StreamEntryRecord& record) {
  return StreamMessage{FormatId(record.offset), record.fields};
}

} // namespace

MessageId FormatId(uint64_t offset) {
  return std::to_string(offset);
}

std::optional<uint64_t> ParseId(std::string_view id) {
  uint64_t value = 0;
  const auto* end = id.data() + id.size();
  const auto [ptr, ec] = std::from_chars(id.data(), end, value);
  if (id.empty() || ec != std::errc() || ptr != end || value == 0) {
    return std::nullopt;
  }
  return value;
}

StreamStore::StreamStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::optional<uint64_t> StreamStore::LookupStream(const std::string& stream) {
  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto                        it = stream_ids_.find(stream);
    if (it != stream_ids_.end()) return it->second;
  }

  const auto record = db::RunTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetStreamByName(tx, stream); });
  if (!record.has_value()) return std::nullopt;

  std::lock_guard<std::mutex> lock(cache_mutex_);
  stream_ids_[stream] = record->stream_id;
  return record->stream_id;
}

uint64_t StreamStore::EnsureStream(const std::string& stream) {
  if (auto id = LookupStream(stream)) return *id;

  const auto stream_id = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    if (auto existing = repository_->GetStreamByName(tx, stream)) {
      return existing->stream_id;
    }

    db::model::StreamRecord record;
    record.name          = stream;
    record.created_at_ms = util::NowMillis();
    db::ThrowIfError(repository_->CreateStream(tx, record), "create stream");
    return record.stream_id;
  });

  REDRIVE_LOG_DEBUG("Stream ready", {observability::StringField("stream", stream), observability::IntField("stream_id", stream_id)});

  std::lock_guard<std::mutex> lock(cache_mutex_);
  stream_ids_[stream] = stream_id;
  return stream_id;
}

bool StreamStore::EnsureGroup(const std::string& stream, const std::string& group) {
  const auto stream_id = EnsureStream(stream);

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    db::model::ConsumerGroupRecord record;
    record.stream_id     = stream_id;
    record.group_name    = group;
    record.created_at_ms = util::NowMillis();

    const auto result = repository_->CreateConsumerGroup(tx, record);
    if (result.code == db::ErrorCode::AlreadyExists) {
      return false;
    }
    db::ThrowIfError(result, "create consumer group");
    return true;
  });
}

AppendOutcome StreamStore::Append(const std::string& stream, const FieldMap& fields, uint64_t max_length, const std::string& dedupe_key) {
  const auto stream_id = EnsureStream(stream);

  auto outcome = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    std::vector<db::model::StreamEntryRecord> records(1);
    records[0].fields         = fields;
    records[0].dedupe_key     = dedupe_key;
    records[0].append_time_ms = util::NowMillis();

    const auto result = repository_->AppendStreamEntries(tx, stream_id, records);
    if (result.code == db::ErrorCode::AlreadyExists && !dedupe_key.empty()) {
      auto existing = repository_->FindStreamEntryByDedupeKey(tx, stream_id, dedupe_key);
      if (!existing.has_value()) {
        throw util::StoreUnavailable("append: dedupe key reported but entry not found");
      }
      return AppendOutcome{FormatId(existing->offset), true};
    }
    db::ThrowIfError(result, "append");

    if (max_length > 0) {
      db::ThrowIfError(repository_->TrimStreamEntriesToMaxCount(tx, stream_id, max_length), "append trim");
    }
    return AppendOutcome{FormatId(records[0].offset), false};
  });

  if (!outcome.duplicate) {
    NotifyAppend();
  }
  return outcome;
}

void StreamStore::NotifyAppend() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    ++append_seq_;
  }
  appended_.notify_all();
}

std::vector<StreamMessage> StreamStore::ReadGroupOnce(uint64_t stream_id, const std::string& group, const std::string& consumer,
                                                      uint64_t count) {
  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto cursor = repository_->GetConsumerGroup(tx, stream_id, group);
    if (!cursor.has_value()) {
      throw util::NotFound("read group: consumer group " + group + " does not exist");
    }

    const auto entries = repository_->ReadStreamEntries(tx, stream_id, cursor->last_delivered_offset + 1, count);
    if (entries.empty()) {
      return std::vector<StreamMessage>{};
    }

    const auto                 now_ms = util::NowMillis();
    std::vector<StreamMessage> out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
      db::model::PendingEntryRecord pending;
      pending.stream_id       = stream_id;
      pending.group_name      = group;
      pending.offset          = entry.offset;
      pending.consumer        = consumer;
      pending.delivered_at_ms = now_ms;
      pending.delivery_count  = 1;
      db::ThrowIfError(repository_->InsertPendingEntry(tx, pending), "read group pending");
      out.push_back(ToMessage(entry));
    }

    db::ThrowIfError(repository_->AdvanceConsumerGroup(tx, stream_id, group, entries.back().offset), "read group advance");
    return out;
  });
}

std::vector<StreamMessage> StreamStore::ReadGroup(const std::string& stream, const std::string& group, const std::string& consumer,
                                                  uint64_t count, std::chrono::milliseconds block) {
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) {
    throw util::NotFound("read group: stream " + stream + " does not exist");
  }

  const auto deadline = std::chrono::steady_clock::now() + block;
  for (;;) {
    uint64_t seen;
    {
      std::lock_guard<std::mutex> lock(wait_mutex_);
      seen = append_seq_;
    }

    auto messages = ReadGroupOnce(*stream_id, group, consumer, count);
    if (!messages.empty() || block.count() <= 0) {
      return messages;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return {};
    }

    std::unique_lock<std::mutex> lock(wait_mutex_);
    appended_.wait_until(lock, std::min(deadline, now + kPollInterval), [&] { return append_seq_ != seen; });
  }
}

uint64_t StreamStore::Ack(const std::string& stream, const std::string& group, const MessageId& id) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) return 0;

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto result = repository_->DeletePendingEntry(tx, *stream_id, group, *offset);
    db::ThrowIfError(result, "ack");
    return result.affected;
  });
}

bool StreamStore::Delete(const std::string& stream, const MessageId& id) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) return false;

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto result = repository_->DeleteStreamEntry(tx, *stream_id, *offset);
    db::ThrowIfError(result, "delete entry");
    return result.affected > 0;
  });
}

std::vector<PendingInfo> StreamStore::Pending(const std::string& stream, const std::string& group, uint64_t limit) {
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) return {};

  const auto records =
      db::RunTransaction(*repository_, [&](db::Transaction& tx) { return repository_->ListPendingEntries(tx, *stream_id, group, limit); });

  const auto               now_ms = util::NowMillis();
  std::vector<PendingInfo> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    PendingInfo info;
    info.id             = FormatId(r.offset);
    info.consumer       = r.consumer;
    info.idle_ms        = now_ms > r.delivered_at_ms ? now_ms - r.delivered_at_ms : 0;
    info.delivery_count = r.delivery_count;
    out.push_back(std::move(info));
  }
  return out;
}

std::optional<StreamMessage> StreamStore::Claim(const std::string& stream, const std::string& group, const std::string& consumer,
                                                const MessageId& id, uint64_t min_idle_ms) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) return std::nullopt;

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) -> std::optional<StreamMessage> {
    const auto result = repository_->ClaimPendingEntry(tx, *stream_id, group, *offset, consumer, min_idle_ms, util::NowMillis());
    db::ThrowIfError(result, "claim");
    if (result.affected == 0) {
      return std::nullopt;
    }

    auto entry = repository_->GetStreamEntry(tx, *stream_id, *offset);
    if (!entry.has_value()) {
      // Entry was trimmed while pending; drop the dangling pending record.
      db::ThrowIfError(repository_->DeletePendingEntry(tx, *stream_id, group, *offset), "claim drop dangling");
      return std::nullopt;
    }
    return ToMessage(*entry);
  });
}

std::vector<StreamMessage> StreamStore::Range(const std::string& stream, const MessageId& after, uint64_t count) {
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) return {};

  uint64_t start = 1;
  if (!after.empty()) {
    const auto offset = ParseId(after);
    if (!offset.has_value()) {
      throw util::InvalidState("range: malformed message id " + after);
    }
    start = *offset + 1;
  }

  const auto records = db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->ReadStreamEntries(tx, *stream_id, start, count);
  });

  std::vector<StreamMessage> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToMessage(r));
  }
  return out;
}

std::optional<StreamMessage> StreamStore::Get(const std::string& stream, const MessageId& id) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) return std::nullopt;

  const auto record =
      db::RunTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetStreamEntry(tx, *stream_id, *offset); });
  if (!record.has_value()) return std::nullopt;
  return ToMessage(*record);
}

std::optional<StreamMessage> StreamStore::FindByDedupeKey(const std::string& stream, const std::string& dedupe_key) {
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) return std::nullopt;

  const auto record = db::RunTransaction(
      *repository_, [&](db::Transaction& tx) { return repository_->FindStreamEntryByDedupeKey(tx, *stream_id, dedupe_key); });
  if (!record.has_value()) return std::nullopt;
  return ToMessage(*record);
}

uint64_t StreamStore::Length(const std::string& stream) {
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) return 0;

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) { return repository_->CountStreamEntries(tx, *stream_id); });
}

uint64_t StreamStore::Trim(const std::string& stream, uint64_t max_length) {
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) return 0;

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto result = repository_->TrimStreamEntriesToMaxCount(tx, *stream_id, max_length);
    db::ThrowIfError(result, "trim");
    return result.affected;
  });
}

StreamInfo StreamStore::Info(const std::string& stream, const std::string& group) {
  StreamInfo info;
  const auto stream_id = LookupStream(stream);
  if (!stream_id.has_value()) return info;

  db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    info.length  = repository_->CountStreamEntries(tx, *stream_id);
    info.pending = repository_->CountPendingEntries(tx, *stream_id, group);

    const auto first = repository_->ReadStreamEntries(tx, *stream_id, 1, 1);
    info.first_id    = first.empty() ? MessageId{} : FormatId(first.front().offset);

    const auto cursor      = repository_->GetConsumerGroup(tx, *stream_id, group);
    info.last_delivered_id = cursor && cursor->last_delivered_offset > 0 ? FormatId(cursor->last_delivered_offset) : MessageId{};
  });
  return info;
}

uint64_t StreamStore::ReclaimAttempts(const std::string& stream, const MessageId& id) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) return 0;

  const auto record =
      db::RunTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetReclaimAttempts(tx, *stream_id, *offset); });
  return record ? record->attempts : 0;
}

uint64_t StreamStore::IncrementReclaimAttempts(const std::string& stream, const MessageId& id) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) {
    throw util::NotFound("increment reclaim attempts: unknown message " + stream + "/" + id);
  }

  return db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfError(repository_->IncrementReclaimAttempts(tx, *stream_id, *offset, util::NowMillis()), "increment reclaim attempts");
    const auto record = repository_->GetReclaimAttempts(tx, *stream_id, *offset);
    return record ? record->attempts : uint64_t{0};
  });
}

void StreamStore::ClearReclaimAttempts(const std::string& stream, const MessageId& id) {
  const auto stream_id = LookupStream(stream);
  const auto offset    = ParseId(id);
  if (!stream_id.has_value() || !offset.has_value()) return;

  db::RunTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfError(repository_->DeleteReclaimAttempts(tx, *stream_id, *offset), "clear reclaim attempts");
  });
}

} // namespace redrive::stream
