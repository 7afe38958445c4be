#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "backoff.hpp"
#include "durable_queue.hpp"

namespace redrive::deadletter {
class DeadLetterPipeline;
}

namespace redrive::queue {

inline constexpr const char* kMaxReclaimsExceeded = "max_reclaims_exceeded";

struct ReclaimOptions {
  uint64_t idle_threshold_ms               = 300000;
  uint64_t max_reclaims_before_dead_letter = 3;
  uint64_t max_reclaim_per_pass            = 20;
  bool     use_backoff                     = true;
  // Pending entries inspected per pass.
  uint64_t scan_limit = 100;
};

struct BackoffSettings {
  uint64_t base_ms = 60000;
  uint64_t max_ms  = 86400000;
};

struct ReclaimSummary {
  uint64_t reclaimed        = 0;
  uint64_t dead_lettered    = 0;
  uint64_t skipped          = 0;
  uint64_t backoff_deferred = 0;
  uint64_t claim_missed     = 0; // another worker claimed it first
  uint64_t errors           = 0;
};

/*
  Periodic pass over the pending-entry list.

  For every pending entry:
    delivery_count >= ceiling    -> dead-letter (backoff ignored)
    idle < required idle         -> backoff_deferred
    otherwise                    -> reclaim candidate

  At most max_reclaim_per_pass candidates are claimed; the rest are
  `skipped` and re-evaluated next pass. Claims are first-claimer-wins,
  so concurrent passes from several workers are safe; losing a claim is
  counted in `claim_missed`, not as an error. The claim uses the same
  idle bound the entry passed (its backoff when enabled).
*/
class ReclaimScheduler {
 public:
  ReclaimScheduler(std::shared_ptr<DurableQueue> queue, std::shared_ptr<deadletter::DeadLetterPipeline> dead_letters,
                   BackoffSettings backoff);

  ReclaimSummary ReclaimStalled(const ReclaimOptions& options);

  // Claims up to `limit` entries idle for at least idle_ms, without dead-lettering.
  std::vector<Delivery> ClaimStalled(uint64_t idle_ms, uint64_t limit);

 private:
  void DeadLetter(const MessageId& id, ReclaimSummary& summary);

  std::shared_ptr<DurableQueue>                    queue_;
  std::shared_ptr<deadletter::DeadLetterPipeline> dead_letters_;
  BackoffSettings                                  backoff_;
};

} // namespace redrive::queue
