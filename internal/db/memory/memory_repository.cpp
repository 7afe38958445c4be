#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace redrive::db::memory {

namespace {

bool OutboxDue(const model::OutboxRecord& r, uint64_t now_ms, uint64_t stale_claim_before_ms) {
  if (r.processed_at_ms.has_value() || r.process_after_ms > now_ms) {
    return false;
  }
  return !r.claimed_by.has_value() || (r.claimed_at_ms.has_value() && *r.claimed_at_ms <= stale_claim_before_ms);
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

Result MemoryRepository::CreateStream(Transaction& t, model::StreamRecord& r) {
  if (TX(t).View().stream_name_to_id.contains(r.name)) {
    return Result::Err(ErrorCode::AlreadyExists);
  }

  auto& s     = TX(t).Mutable();
  r.stream_id = s.next_stream_id++;
  if (r.created_at_ms == 0) {
    r.created_at_ms = util::NowMillis();
  }

  s.streams[r.stream_id]     = r;
  s.stream_name_to_id[r.name] = r.stream_id;
  s.next_stream_offset.try_emplace(r.stream_id, 1);
  return Result::Ok(1);
}

std::optional<model::StreamRecord> MemoryRepository::GetStreamByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  const auto  it = s.stream_name_to_id.find(name);
  if (it == s.stream_name_to_id.end()) {
    return std::nullopt;
  }
  return s.streams.at(it->second);
}

Result MemoryRepository::AppendStreamEntries(Transaction& t, uint64_t stream_id, std::vector<model::StreamEntryRecord>& entries) {
  const auto& view = TX(t).View();
  if (!view.streams.contains(stream_id)) {
    return Result::Err(ErrorCode::NotFound);
  }

  for (const auto& entry : entries) {
    if (!entry.dedupe_key.empty() && FindStreamEntryByDedupeKey(t, stream_id, entry.dedupe_key).has_value()) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate dedupe key " + entry.dedupe_key);
    }
  }

  auto&    s              = TX(t).Mutable();
  uint64_t next_offset    = s.next_stream_offset[stream_id];
  auto&    stream_entries = s.stream_entries[stream_id];
  for (auto& entry : entries) {
    entry.stream_id = stream_id;
    entry.offset    = next_offset++;
    if (entry.append_time_ms == 0) {
      entry.append_time_ms = util::NowMillis();
    }
    stream_entries[entry.offset] = entry;
  }
  s.next_stream_offset[stream_id] = next_offset;
  return Result::Ok(entries.size());
}

std::vector<model::StreamEntryRecord> MemoryRepository::ReadStreamEntries(Transaction& t, uint64_t stream_id, uint64_t start_offset,
                                                                          std::optional<uint64_t> max_entries) {
  std::vector<model::StreamEntryRecord> out;
  const auto&                           s  = TX(t).View();
  const auto                            it = s.stream_entries.find(stream_id);
  if (it == s.stream_entries.end()) {
    return out;
  }

  for (auto e = it->second.lower_bound(start_offset); e != it->second.end(); ++e) {
    if (max_entries.has_value() && out.size() >= *max_entries) {
      break;
    }
    out.push_back(e->second);
  }
  return out;
}

std::optional<model::StreamEntryRecord> MemoryRepository::GetStreamEntry(Transaction& t, uint64_t stream_id, uint64_t offset) {
  const auto& s  = TX(t).View();
  const auto  it = s.stream_entries.find(stream_id);
  if (it == s.stream_entries.end()) {
    return std::nullopt;
  }
  const auto e = it->second.find(offset);
  if (e == it->second.end()) {
    return std::nullopt;
  }
  return e->second;
}

std::optional<model::StreamEntryRecord> MemoryRepository::FindStreamEntryByDedupeKey(Transaction& t, uint64_t stream_id,
                                                                                     const std::string& dedupe_key) {
  const auto& s  = TX(t).View();
  const auto  it = s.stream_entries.find(stream_id);
  if (it == s.stream_entries.end() || dedupe_key.empty()) {
    return std::nullopt;
  }
  for (const auto& [_, entry] : it->second) {
    if (entry.dedupe_key == dedupe_key) {
      return entry;
    }
  }
  return std::nullopt;
}

uint64_t MemoryRepository::CountStreamEntries(Transaction& t, uint64_t stream_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.stream_entries.find(stream_id);
  return it == s.stream_entries.end() ? 0 : it->second.size();
}

Result MemoryRepository::DeleteStreamEntry(Transaction& t, uint64_t stream_id, uint64_t offset) {
  if (!GetStreamEntry(t, stream_id, offset).has_value()) {
    return Result::Ok(0);
  }
  TX(t).Mutable().stream_entries[stream_id].erase(offset);
  return Result::Ok(1);
}

Result MemoryRepository::TrimStreamEntriesToMaxCount(Transaction& t, uint64_t stream_id, uint64_t max_entries) {
  const auto count = CountStreamEntries(t, stream_id);
  if (count <= max_entries) {
    return Result::Ok(0);
  }

  auto&    entries = TX(t).Mutable().stream_entries[stream_id];
  uint64_t removed = 0;
  while (entries.size() > max_entries) {
    entries.erase(entries.begin());
    ++removed;
  }
  return Result::Ok(removed);
}

// ------------------------------------------------------------------
// Consumer groups / pending-entry list
// ------------------------------------------------------------------

Result MemoryRepository::CreateConsumerGroup(Transaction& t, const model::ConsumerGroupRecord& r) {
  const GroupKey key{r.stream_id, r.group_name};
  if (TX(t).View().consumer_groups.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  if (!TX(t).View().streams.contains(r.stream_id)) {
    return Result::Err(ErrorCode::NotFound);
  }
  auto record = r;
  if (record.created_at_ms == 0) {
    record.created_at_ms = util::NowMillis();
  }
  TX(t).Mutable().consumer_groups[key] = record;
  return Result::Ok(1);
}

std::optional<model::ConsumerGroupRecord> MemoryRepository::GetConsumerGroup(Transaction& t, uint64_t stream_id,
                                                                             const std::string& group_name) {
  const auto& groups = TX(t).View().consumer_groups;
  const auto  it     = groups.find(GroupKey{stream_id, group_name});
  if (it == groups.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result MemoryRepository::AdvanceConsumerGroup(Transaction& t, uint64_t stream_id, const std::string& group_name,
                                              uint64_t last_delivered_offset) {
  if (!GetConsumerGroup(t, stream_id, group_name).has_value()) {
    return Result::Err(ErrorCode::NotFound);
  }
  auto& group                 = TX(t).Mutable().consumer_groups[GroupKey{stream_id, group_name}];
  group.last_delivered_offset = last_delivered_offset;
  return Result::Ok(1);
}

Result MemoryRepository::InsertPendingEntry(Transaction& t, const model::PendingEntryRecord& r) {
  const PendingKey key{r.stream_id, r.group_name, r.offset};
  if (TX(t).View().pending.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  TX(t).Mutable().pending[key] = r;
  return Result::Ok(1);
}

std::optional<model::PendingEntryRecord> MemoryRepository::GetPendingEntry(Transaction& t, uint64_t stream_id,
                                                                           const std::string& group_name, uint64_t offset) {
  const auto& pending = TX(t).View().pending;
  const auto  it      = pending.find(PendingKey{stream_id, group_name, offset});
  if (it == pending.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::PendingEntryRecord> MemoryRepository::ListPendingEntries(Transaction& t, uint64_t stream_id,
                                                                            const std::string& group_name, uint64_t limit) {
  std::vector<model::PendingEntryRecord> out;
  const auto&                            pending = TX(t).View().pending;
  for (auto it = pending.lower_bound(PendingKey{stream_id, group_name, 0}); it != pending.end() && out.size() < limit; ++it) {
    if (it->second.stream_id != stream_id || it->second.group_name != group_name) {
      break;
    }
    out.push_back(it->second);
  }
  return out;
}

uint64_t MemoryRepository::CountPendingEntries(Transaction& t, uint64_t stream_id, const std::string& group_name) {
  uint64_t count = 0;
  for (const auto& [_, entry] : TX(t).View().pending) {
    if (entry.stream_id == stream_id && entry.group_name == group_name) {
      ++count;
    }
  }
  return count;
}

Result MemoryRepository::ClaimPendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name, uint64_t offset,
                                           const std::string& consumer, uint64_t min_idle_ms, uint64_t now_ms) {
  auto current = GetPendingEntry(t, stream_id, group_name, offset);
  if (!current.has_value() || current->delivered_at_ms + min_idle_ms > now_ms) {
    return Result::Ok(0);
  }

  auto& entry           = TX(t).Mutable().pending[PendingKey{stream_id, group_name, offset}];
  entry.consumer        = consumer;
  entry.delivered_at_ms = now_ms;
  entry.delivery_count += 1;
  return Result::Ok(1);
}

Result MemoryRepository::DeletePendingEntry(Transaction& t, uint64_t stream_id, const std::string& group_name, uint64_t offset) {
  if (!GetPendingEntry(t, stream_id, group_name, offset).has_value()) {
    return Result::Ok(0);
  }
  TX(t).Mutable().pending.erase(PendingKey{stream_id, group_name, offset});
  return Result::Ok(1);
}

// ------------------------------------------------------------------
// Reclaim attempt counters
// ------------------------------------------------------------------

std::optional<model::ReclaimAttemptRecord> MemoryRepository::GetReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset) {
  const auto& counters = TX(t).View().reclaim_attempts;
  const auto  it       = counters.find(EntryKey{stream_id, offset});
  if (it == counters.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result MemoryRepository::IncrementReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset, uint64_t now_ms) {
  auto& record     = TX(t).Mutable().reclaim_attempts[EntryKey{stream_id, offset}];
  record.stream_id = stream_id;
  record.offset    = offset;
  record.attempts += 1;
  record.updated_at_ms = now_ms;
  return Result::Ok(1);
}

Result MemoryRepository::DeleteReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t offset) {
  if (!GetReclaimAttempts(t, stream_id, offset).has_value()) {
    return Result::Ok(0);
  }
  TX(t).Mutable().reclaim_attempts.erase(EntryKey{stream_id, offset});
  return Result::Ok(1);
}

std::vector<model::ReclaimAttemptRecord> MemoryRepository::ListReclaimAttempts(Transaction& t, uint64_t stream_id, uint64_t limit) {
  std::vector<model::ReclaimAttemptRecord> out;
  const auto&                              counters = TX(t).View().reclaim_attempts;
  for (auto it = counters.lower_bound(EntryKey{stream_id, 0}); it != counters.end() && out.size() < limit; ++it) {
    if (it->first.first != stream_id) {
      break;
    }
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Replay ledger
// ------------------------------------------------------------------

Result MemoryRepository::InsertReplayLogIfAbsent(Transaction& t, const model::ReplayLogRecord& r) {
  const StreamMsgKey key{r.original_stream, r.original_msg_id};
  if (TX(t).View().replay_log.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists);
  }
  auto record = r;
  if (record.replayed_at_ms == 0) {
    record.replayed_at_ms = util::NowMillis();
  }
  TX(t).Mutable().replay_log[key] = record;
  return Result::Ok(1);
}

std::optional<model::ReplayLogRecord> MemoryRepository::GetReplayLog(Transaction& t, const std::string& original_stream,
                                                                    const std::string& original_msg_id) {
  const auto& log = TX(t).View().replay_log;
  const auto  it  = log.find(StreamMsgKey{original_stream, original_msg_id});
  if (it == log.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result MemoryRepository::SetReplayLogNewMessageId(Transaction& t, const std::string& original_stream, const std::string& original_msg_id,
                                                  const std::string& new_msg_id) {
  auto current = GetReplayLog(t, original_stream, original_msg_id);
  if (!current.has_value() || current->new_msg_id.has_value()) {
    return Result::Ok(0);
  }
  TX(t).Mutable().replay_log[StreamMsgKey{original_stream, original_msg_id}].new_msg_id = new_msg_id;
  return Result::Ok(1);
}

// ------------------------------------------------------------------
// Dead-letter archive
// ------------------------------------------------------------------

Result MemoryRepository::UpsertDeadLetterArchive(Transaction& t, const model::DeadLetterArchiveRecord& r) {
  auto&              archive  = TX(t).Mutable().archive;
  const auto         archived = r.archived_at_ms == 0 ? util::NowMillis() : r.archived_at_ms;
  const StreamMsgKey key{r.dl_stream, r.dl_msg_id};

  auto it = archive.find(key);
  if (it != archive.end()) {
    it->second.archived_at_ms = archived;
    return Result::Ok(1);
  }
  auto record           = r;
  record.archived_at_ms = archived;
  archive.emplace(key, std::move(record));
  return Result::Ok(1);
}

std::optional<model::DeadLetterArchiveRecord> MemoryRepository::GetDeadLetterArchive(Transaction& t, const std::string& dl_stream,
                                                                                    const std::string& dl_msg_id) {
  const auto& archive = TX(t).View().archive;
  const auto  it      = archive.find(StreamMsgKey{dl_stream, dl_msg_id});
  if (it == archive.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ------------------------------------------------------------------
// Distributed locks
// ------------------------------------------------------------------

Result MemoryRepository::AcquireLock(Transaction& t, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                                     uint64_t expires_at_ms) {
  auto current = GetLock(t, lock_name);
  if (current.has_value() && current->holder_id != holder_id && current->expires_at_ms >= now_ms) {
    return Result::Ok(0);
  }

  auto& lock     = TX(t).Mutable().locks[lock_name];
  lock.lock_name = lock_name;
  if (!current.has_value() || current->holder_id != holder_id) {
    lock.acquired_at_ms = now_ms;
  }
  lock.holder_id     = holder_id;
  lock.expires_at_ms = expires_at_ms;
  return Result::Ok(1);
}

Result MemoryRepository::ExtendLock(Transaction& t, const std::string& lock_name, const std::string& holder_id, uint64_t now_ms,
                                    uint64_t expires_at_ms) {
  auto current = GetLock(t, lock_name);
  if (!current.has_value() || current->holder_id != holder_id || current->expires_at_ms < now_ms) {
    return Result::Ok(0);
  }
  TX(t).Mutable().locks[lock_name].expires_at_ms = expires_at_ms;
  return Result::Ok(1);
}

Result MemoryRepository::ReleaseLock(Transaction& t, const std::string& lock_name, const std::string& holder_id) {
  auto current = GetLock(t, lock_name);
  if (!current.has_value() || current->holder_id != holder_id) {
    return Result::Ok(0);
  }
  TX(t).Mutable().locks.erase(lock_name);
  return Result::Ok(1);
}

Result MemoryRepository::DeleteExpiredLocks(Transaction& t, uint64_t now_ms) {
  std::vector<std::string> expired;
  for (const auto& [name, lock] : TX(t).View().locks) {
    if (lock.expires_at_ms < now_ms) {
      expired.push_back(name);
    }
  }
  if (expired.empty()) {
    return Result::Ok(0);
  }
  auto& locks = TX(t).Mutable().locks;
  for (const auto& name : expired) {
    locks.erase(name);
  }
  return Result::Ok(expired.size());
}

std::optional<model::LockRecord> MemoryRepository::GetLock(Transaction& t, const std::string& lock_name) {
  const auto& locks = TX(t).View().locks;
  const auto  it    = locks.find(lock_name);
  if (it == locks.end()) {
    return std::nullopt;
  }
  return it->second;
}

// ------------------------------------------------------------------
// Outbox
// ------------------------------------------------------------------

Result MemoryRepository::InsertOutbox(Transaction& t, model::OutboxRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_outbox_id++;
  if (r.created_at_ms == 0) {
    r.created_at_ms = util::NowMillis();
  }
  if (r.process_after_ms == 0) {
    r.process_after_ms = r.created_at_ms;
  }
  s.outbox[r.id] = r;
  return Result::Ok(1);
}

std::optional<model::OutboxRecord> MemoryRepository::GetOutbox(Transaction& t, uint64_t id) {
  const auto& outbox = TX(t).View().outbox;
  const auto  it     = outbox.find(id);
  if (it == outbox.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<model::OutboxRecord> MemoryRepository::ClaimOutbox(Transaction& t, const std::string& processor_id, uint64_t batch_size,
                                                               uint64_t now_ms, uint64_t stale_claim_before_ms) {
  std::vector<const model::OutboxRecord*> due;
  for (const auto& [_, record] : TX(t).View().outbox) {
    if (OutboxDue(record, now_ms, stale_claim_before_ms)) {
      due.push_back(&record);
    }
  }
  std::stable_sort(due.begin(), due.end(), [](const auto* a, const auto* b) { return a->created_at_ms < b->created_at_ms; });
  if (due.size() > batch_size) {
    due.resize(batch_size);
  }

  std::vector<uint64_t> ids;
  ids.reserve(due.size());
  for (const auto* record : due) {
    ids.push_back(record->id);
  }

  std::vector<model::OutboxRecord> out;
  if (ids.empty()) {
    return out;
  }
  auto& outbox = TX(t).Mutable().outbox;
  for (auto id : ids) {
    auto& record         = outbox[id];
    record.claimed_by    = processor_id;
    record.claimed_at_ms = now_ms;
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::MarkOutboxProcessed(Transaction& t, uint64_t id, const std::string& processor_id, uint64_t now_ms) {
  auto current = GetOutbox(t, id);
  if (!current.has_value() || current->processed_at_ms.has_value() || current->claimed_by != processor_id) {
    return Result::Ok(0);
  }
  auto& record           = TX(t).Mutable().outbox[id];
  record.processed_at_ms = now_ms;
  record.processed_by    = processor_id;
  record.claimed_by.reset();
  record.claimed_at_ms.reset();
  return Result::Ok(1);
}

Result MemoryRepository::FailOutbox(Transaction& t, uint64_t id, const std::string& processor_id, uint32_t expected_retry_count,
                                    uint64_t process_after_ms, const std::string& error) {
  auto current = GetOutbox(t, id);
  if (!current.has_value() || current->processed_at_ms.has_value() || current->claimed_by != processor_id ||
      current->retry_count != expected_retry_count) {
    return Result::Ok(0);
  }
  auto& record            = TX(t).Mutable().outbox[id];
  record.retry_count      = expected_retry_count + 1;
  record.process_after_ms = process_after_ms;
  record.last_error       = error;
  record.claimed_by.reset();
  record.claimed_at_ms.reset();
  return Result::Ok(1);
}

// ------------------------------------------------------------------
// Retention
// ------------------------------------------------------------------

uint64_t MemoryRepository::CountExpired(Transaction& t, RetentionTable table, uint64_t cutoff_ms) {
  const auto& s     = TX(t).View();
  uint64_t    count = 0;
  switch (table) {
    case RetentionTable::DeadLetterArchive:
      for (const auto& [_, r] : s.archive)
        if (r.archived_at_ms < cutoff_ms) ++count;
      break;
    case RetentionTable::ReplayLog:
      for (const auto& [_, r] : s.replay_log)
        if (r.replayed_at_ms < cutoff_ms) ++count;
      break;
    case RetentionTable::ProcessedOutbox:
      for (const auto& [_, r] : s.outbox)
        if (r.processed_at_ms.has_value() && *r.processed_at_ms < cutoff_ms) ++count;
      break;
  }
  return count;
}

Result MemoryRepository::DeleteExpired(Transaction& t, RetentionTable table, uint64_t cutoff_ms) {
  if (CountExpired(t, table, cutoff_ms) == 0) {
    return Result::Ok(0);
  }

  auto&    s       = TX(t).Mutable();
  uint64_t removed = 0;
  switch (table) {
    case RetentionTable::DeadLetterArchive:
      removed = std::erase_if(s.archive, [&](const auto& kv) { return kv.second.archived_at_ms < cutoff_ms; });
      break;
    case RetentionTable::ReplayLog:
      removed = std::erase_if(s.replay_log, [&](const auto& kv) { return kv.second.replayed_at_ms < cutoff_ms; });
      break;
    case RetentionTable::ProcessedOutbox:
      removed = std::erase_if(s.outbox, [&](const auto& kv) {
        return kv.second.processed_at_ms.has_value() && *kv.second.processed_at_ms < cutoff_ms;
      });
      break;
  }
  return Result::Ok(removed);
}

} // namespace redrive::db::memory
