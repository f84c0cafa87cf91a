#pragma once

#include "core/cancel_token.h"
#include "core/display_sink.h"
#include "core/job_service.h"
#include "core/logger.h"
#include "core/progress_estimator.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace evx::core {

/// Poll cadence, overall deadline and status-fetch retry policy.
struct PollPolicy {
  /// Delay between polls, measured from the end of the previous request.
  std::chrono::milliseconds interval{2000};
  /// Overall deadline for UntilTerminal polling; nullopt waits forever.
  std::optional<std::chrono::milliseconds> max_wait;

  /// Transient status-fetch failures are retried this many times.
  int max_status_retries = 3;
  std::chrono::milliseconds initial_backoff{1000};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{30000};

  /// Granularity at which sleeps check the cancel token.
  std::chrono::milliseconds sleep_slice{50};
};

enum class PollMode {
  UntilTerminal, // keep polling until FINISHED/FAILED/CANCELLED or timeout
  SingleShot     // exactly one observation, no deadline
};

struct PollOutcome {
  Task task;
  ProgressView progress;
  bool terminal = false;
  int polls = 0;
  std::chrono::milliseconds elapsed{0};
};

/// Drives one task to a terminal state through repeated status calls.
///
/// Status interpretation lives in observe() only; poll_until_terminal() and
/// snapshot() are thin wrappers choosing the PollMode, so the looping export
/// and the one-shot status command can never disagree about a status.
///
/// The estimator is owned by the poller and survives between calls for the
/// same task id: two snapshots taken on one poller compute their rate from
/// the two snapshot timestamps.
class TaskPoller {
public:
  TaskPoller(std::shared_ptr<IJobService> service, PollPolicy policy,
             std::shared_ptr<IDisplaySink> display = nullptr,
             std::shared_ptr<ILogger> logger = nullptr);

  /// The state machine:
  ///   PENDING, RUNNING -> keep polling (UntilTerminal) / Ok, non-terminal
  ///   UNKNOWN          -> as above, and stretches the next delay
  ///   FINISHED         -> Ok, terminal
  ///   FAILED/CANCELLED -> Err(TaskFailed) carrying the server detail
  /// Errors: StatusFetchFailed after retries, PollTimeout, Interrupted.
  Result<PollOutcome, TaskError>
  observe(const std::string &task_id, PollMode mode,
          std::shared_ptr<CancelToken> cancel_token = nullptr);

  /// Returns the result location of a FINISHED task, unchanged. Empty when
  /// the service reported FINISHED without one.
  Result<std::string, TaskError>
  poll_until_terminal(const std::string &task_id,
                      std::shared_ptr<CancelToken> cancel_token = nullptr);

  Result<PollOutcome, TaskError>
  snapshot(const std::string &task_id,
           std::shared_ptr<CancelToken> cancel_token = nullptr);

  /// Delay before the next poll after `unknown_streak` consecutive UNKNOWN
  /// observations: interval * multiplier^streak, saturating at
  /// max(max_backoff, interval).
  [[nodiscard]] std::chrono::milliseconds next_delay(int unknown_streak) const;

  [[nodiscard]] const PollPolicy &policy() const { return policy_; }
  [[nodiscard]] const ProgressEstimator &estimator() const { return estimator_; }

private:
  std::shared_ptr<IJobService> service_;
  PollPolicy policy_;
  std::shared_ptr<IDisplaySink> display_;
  std::shared_ptr<ILogger> logger_;

  ProgressEstimator estimator_;
  std::string estimator_task_id_;

  /// Retries stop at `deadline` (start + max_wait) with PollTimeout.
  Result<Task, TaskError>
  fetch_with_retry(const std::string &task_id, TimePoint start,
                   std::optional<TimePoint> deadline,
                   const std::shared_ptr<CancelToken> &cancel_token);

  /// Sleeps in slices; false when canceled before the delay elapsed.
  bool sleep_for(std::chrono::milliseconds delay,
                 const std::shared_ptr<CancelToken> &cancel_token) const;
};

} // namespace evx::core
