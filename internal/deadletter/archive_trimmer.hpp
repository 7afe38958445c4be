#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/stream/stream_store.hpp"
#include "internal/util/time.hpp"

namespace redrive::deadletter {

struct ArchiveSummary {
  uint64_t archived = 0;
  uint64_t trimmed  = 0;
  uint64_t errors   = 0;
  bool     completed = true;
};

/*
  Keeps the dead-letter stream at or below a maximum length without losing
  entries: each of the oldest surplus entries is upserted into
  dead_letter_archive first, and only archived entries are deleted.
*/
class ArchiveTrimmer {
 public:
  ArchiveTrimmer(std::shared_ptr<stream::StreamStore> store, std::shared_ptr<db::Repository> repository, std::string dead_letter_stream,
                 std::string archived_by = "stream_trim");

  ArchiveSummary ArchiveAndTrim(uint64_t max_dead_letter_length, const util::Deadline& deadline = {});

 private:
  void Archive(const stream::StreamMessage& entry);

  std::shared_ptr<stream::StreamStore> store_;
  std::shared_ptr<db::Repository>      repository_;
  std::string                          dead_letter_stream_;
  std::string                          archived_by_;
};

} // namespace redrive::deadletter
