#pragma once

#include <atomic>
#include <memory>

namespace evx::core {

/// Cancellation token tripped by an external interrupt (SIGINT/SIGTERM).
///
/// The flag is a lock-free atomic so request_cancel() may be called from a
/// signal handler. Readers poll it at every suspension point: the libcurl
/// progress callback while a request is in flight, and each slice of an
/// inter-poll or backoff sleep.
class CancelToken {
public:
  CancelToken() = default;

  /// Request cancellation. Async-signal-safe, idempotent.
  void request_cancel() noexcept;

  /// Check if cancellation has been requested.
  [[nodiscard]] bool is_canceled() const noexcept;

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  static_assert(std::atomic<bool>::is_always_lock_free,
                "CancelToken must be usable from a signal handler");
};

} // namespace evx::core
