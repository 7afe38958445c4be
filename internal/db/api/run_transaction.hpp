#pragma once

#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"

namespace redrive::db {

inline constexpr int kDefaultTransactionAttempts = 16;

namespace detail {
// Short randomized pause between conflicting attempts.
void PauseAfterConflict(int attempt);
}

/*
  Runs `body(tx)` inside a fresh transaction and commits it.

  The body is re-run from scratch when the commit loses a race
  (util::TransactionConflict). Any other exception rolls back and
  propagates. The body must not commit or roll back itself.
*/
template <typename Body>
auto RunTransaction(Repository& repo, Body&& body, int max_attempts = kDefaultTransactionAttempts)
    -> std::invoke_result_t<Body&, Transaction&> {
  using Out = std::invoke_result_t<Body&, Transaction&>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repo.Begin();
      if constexpr (std::is_void_v<Out>) {
        body(*tx);
        tx->Commit();
        return;
      } else {
        Out out = body(*tx);
        tx->Commit();
        return out;
      }
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) {
        throw;
      }
      detail::PauseAfterConflict(attempt);
    }
  }
}

// Converts an unexpected non-OK result into util::StoreUnavailable.
void ThrowIfError(const Result& result, const char* what);

} // namespace redrive::db
