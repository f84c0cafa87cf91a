#include "core/task_poller.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <thread>

namespace evx::core {

namespace {

constexpr const char *kComponent = "task_poller";

std::string seconds_text(std::chrono::milliseconds elapsed) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1)
      << static_cast<double>(elapsed.count()) / 1000.0;
  return oss.str();
}

std::chrono::milliseconds since(TimePoint start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start);
}

TaskError interrupted(const std::string &task_id,
                      std::chrono::milliseconds elapsed) {
  auto err = TaskError::Interrupted();
  err.details["task_id"] = task_id;
  err.details["elapsed_s"] = seconds_text(elapsed);
  return err;
}

TaskError task_failed(const Task &task, std::chrono::milliseconds elapsed) {
  const std::string detail = task.failure_detail.value_or("");
  return TaskError(ErrorCategory::TaskFailed, 1, false,
                   std::string("Task ended with status=") +
                       to_string(task.status) + ". Details: " + detail,
                   std::string("terminal failure status ") +
                       to_string(task.status),
                   {{"task_id", task.task_id},
                    {"status", to_string(task.status)},
                    {"detail", detail},
                    {"elapsed_s", seconds_text(elapsed)}});
}

TaskError poll_timeout(const std::string &task_id,
                       std::chrono::milliseconds elapsed) {
  return TaskError(ErrorCategory::PollTimeout, 1, false,
                   "Timed out after " + seconds_text(elapsed) +
                       "s waiting for task " + task_id,
                   "max_wait exceeded",
                   {{"task_id", task_id}, {"elapsed_s", seconds_text(elapsed)}});
}

/// Time left before `deadline`, rounded up so a sleep of this length ends
/// past it.
std::chrono::milliseconds until_deadline(TimePoint deadline) {
  const auto left =
      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return std::max(left, std::chrono::milliseconds(0)) + std::chrono::milliseconds(1);
}

} // namespace

TaskPoller::TaskPoller(std::shared_ptr<IJobService> service, PollPolicy policy,
                       std::shared_ptr<IDisplaySink> display,
                       std::shared_ptr<ILogger> logger)
    : service_(std::move(service)), policy_(std::move(policy)),
      display_(std::move(display)), logger_(std::move(logger)) {}

Result<PollOutcome, TaskError>
TaskPoller::observe(const std::string &task_id, PollMode mode,
                    std::shared_ptr<CancelToken> cancel_token) {
  using R = Result<PollOutcome, TaskError>;

  if (!service_) {
    return R::Err(TaskError::Internal("TaskPoller has no job service"));
  }
  if (estimator_task_id_ != task_id) {
    estimator_.reset();
    estimator_task_id_ = task_id;
  }

  const TimePoint start = Clock::now();
  std::optional<TimePoint> deadline;
  if (mode == PollMode::UntilTerminal && policy_.max_wait) {
    deadline = start + *policy_.max_wait;
  }
  int unknown_streak = 0;
  int polls = 0;

  while (true) {
    if (cancel_token && cancel_token->is_canceled()) {
      return R::Err(interrupted(task_id, since(start)));
    }

    auto fetched = fetch_with_retry(task_id, start, deadline, cancel_token);
    if (fetched.is_err()) {
      auto error = std::move(fetched).error();
      error.details["task_id"] = task_id;
      error.details["elapsed_s"] = seconds_text(since(start));
      return R::Err(std::move(error));
    }
    ++polls;

    Task task = std::move(fetched).value();
    if (task.task_id.empty()) {
      task.task_id = task_id;
    }

    ProgressSample sample;
    sample.at = Clock::now();
    sample.completed = task.completed;
    sample.total = task.known_total();
    sample.status = task.status;
    const ProgressView view = estimator_.add(sample);

    if (display_) {
      display_->render_task(task_id, view,
                            mode == PollMode::UntilTerminal && polls > 1);
    }

    const auto elapsed = since(start);
    if (task.status == TaskStatus::Finished) {
      if (logger_) {
        logger_->info(task_id, kComponent, "task_finished",
                      "polls=" + std::to_string(polls) +
                          " elapsed_s=" + seconds_text(elapsed) +
                          " has_location=" +
                          (task.result_location ? "true" : "false"));
      }
      return R::Ok(PollOutcome{std::move(task), view, true, polls, elapsed});
    }
    if (is_terminal(task.status)) {
      if (logger_) {
        logger_->error(task_id, kComponent, "task_failed",
                       std::string("status=") + to_string(task.status) +
                           " detail=" + task.failure_detail.value_or(""));
      }
      return R::Err(task_failed(task, elapsed));
    }

    if (task.status == TaskStatus::Unknown) {
      ++unknown_streak;
      if (logger_) {
        logger_->warn(task_id, kComponent, "status_unknown",
                      "consecutive_unknown=" + std::to_string(unknown_streak));
      }
    } else {
      unknown_streak = 0;
    }

    if (mode == PollMode::SingleShot) {
      return R::Ok(PollOutcome{std::move(task), view, false, polls, elapsed});
    }

    if (policy_.max_wait && elapsed >= *policy_.max_wait) {
      return R::Err(poll_timeout(task_id, elapsed));
    }

    auto delay = next_delay(unknown_streak);
    if (deadline) {
      delay = std::min(delay, until_deadline(*deadline));
    }
    if (!sleep_for(delay, cancel_token)) {
      return R::Err(interrupted(task_id, since(start)));
    }

    const auto waited = since(start);
    if (policy_.max_wait && waited >= *policy_.max_wait) {
      return R::Err(poll_timeout(task_id, waited));
    }
  }
}

Result<std::string, TaskError>
TaskPoller::poll_until_terminal(const std::string &task_id,
                                std::shared_ptr<CancelToken> cancel_token) {
  using R = Result<std::string, TaskError>;

  auto outcome = observe(task_id, PollMode::UntilTerminal, std::move(cancel_token));
  if (outcome.is_err()) {
    return R::Err(std::move(outcome).error());
  }
  return R::Ok(outcome.value().task.result_location.value_or(""));
}

Result<PollOutcome, TaskError>
TaskPoller::snapshot(const std::string &task_id,
                     std::shared_ptr<CancelToken> cancel_token) {
  return observe(task_id, PollMode::SingleShot, std::move(cancel_token));
}

Result<Task, TaskError>
TaskPoller::fetch_with_retry(const std::string &task_id, TimePoint start,
                             std::optional<TimePoint> deadline,
                             const std::shared_ptr<CancelToken> &cancel_token) {
  using R = Result<Task, TaskError>;

  int retry_count = 0;
  auto backoff = policy_.initial_backoff;

  while (true) {
    auto result = service_->get_status(task_id, cancel_token);
    if (result.is_ok()) {
      return result;
    }

    auto error = std::move(result).error();
    if (error.category == ErrorCategory::Interrupted) {
      return R::Err(std::move(error));
    }

    error.details["retry_count"] = std::to_string(retry_count);
    const bool has_attempts_left = retry_count < policy_.max_status_retries;
    if (!error.retryable || !has_attempts_left) {
      return R::Err(std::move(error));
    }

    if (logger_) {
      logger_->warn(task_id, kComponent, "status_retry_scheduled",
                    "retry_count=" + std::to_string(retry_count + 1) +
                        " max_retries=" +
                        std::to_string(policy_.max_status_retries) +
                        " backoff_ms=" + std::to_string(backoff.count()) +
                        " cause=" + error.internal_message);
    }

    auto wait = backoff;
    if (deadline) {
      const auto now = Clock::now();
      if (now >= *deadline) {
        return R::Err(poll_timeout(task_id, since(start)));
      }
      wait = std::min(wait, until_deadline(*deadline));
    }
    if (!sleep_for(wait, cancel_token)) {
      return R::Err(TaskError::Interrupted());
    }
    if (deadline && Clock::now() >= *deadline) {
      return R::Err(poll_timeout(task_id, since(start)));
    }

    auto next_backoff = std::chrono::duration_cast<std::chrono::milliseconds>(
        backoff * policy_.backoff_multiplier);
    backoff = std::min(next_backoff, policy_.max_backoff);
    ++retry_count;
  }
}

bool TaskPoller::sleep_for(std::chrono::milliseconds delay,
                           const std::shared_ptr<CancelToken> &cancel_token) const {
  const auto sleep_until = Clock::now() + delay;
  const auto slice = std::max(policy_.sleep_slice, std::chrono::milliseconds(1));
  while (Clock::now() < sleep_until) {
    if (cancel_token && cancel_token->is_canceled()) {
      return false;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        sleep_until - Clock::now());
    std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds(0), slice));
  }
  return !(cancel_token && cancel_token->is_canceled());
}

std::chrono::milliseconds TaskPoller::next_delay(int unknown_streak) const {
  if (unknown_streak <= 0 || policy_.interval.count() <= 0) {
    return policy_.interval;
  }
  const auto cap = std::max(policy_.max_backoff, policy_.interval);
  // Stop growing once the factor reaches the cap, before any conversion.
  const double limit = static_cast<double>(cap.count()) /
                       static_cast<double>(policy_.interval.count());
  double factor = 1.0;
  for (int i = 0; i < unknown_streak && factor < limit; ++i) {
    factor *= policy_.backoff_multiplier;
  }
  if (factor >= limit) {
    return cap;
  }
  if (factor <= 1.0) {
    return policy_.interval;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(policy_.interval * factor);
}

} // namespace evx::core
