#pragma once

#include "core/task.h"

#include <chrono>
#include <cstdint>
#include <optional>

namespace evx::core {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::duration<double>;

/// One status observation, captured right after a poll returns.
struct ProgressSample {
  TimePoint at;
  std::optional<std::uint64_t> completed;
  std::optional<std::uint64_t> total;
  TaskStatus status = TaskStatus::Unknown;
};

/// Render-ready summary of the latest sample. Every estimate is optional:
/// nullopt means "unknown" and is shown as an indeterminate indicator.
struct ProgressView {
  TaskStatus status = TaskStatus::Unknown;
  std::optional<std::uint64_t> completed;
  std::optional<std::uint64_t> total;
  std::optional<double> fraction;     // [0, 1]
  std::optional<double> rate;         // units per second, may be <= 0
  std::optional<Seconds> remaining;   // only when rate > 0
  std::optional<double> throughput;   // byte mode only, bytes per second
};

/// Two-sample rate estimator.
///
/// The rate is always computed from the two most recent samples, never from
/// the start of the session: a task that speeds up or slows down gets a
/// current ETA, and a `status` run mid-export does not mistake its own start
/// for the task's start.
class ProgressEstimator {
public:
  /// Count-based mode: one sample per status poll.
  ProgressView add(const ProgressSample &sample);

  /// Byte-based mode: same algorithm over transferred bytes, also fills
  /// ProgressView::throughput.
  ProgressView add_bytes(TimePoint at, std::uint64_t bytes,
                         std::optional<std::uint64_t> total_bytes);

  /// Latest view, nullopt before the first sample.
  [[nodiscard]] const std::optional<ProgressView> &last() const { return last_view_; }

  [[nodiscard]] std::size_t sample_count() const { return sample_count_; }

  void reset();

private:
  std::optional<ProgressSample> previous_;
  std::optional<ProgressView> last_view_;
  std::size_t sample_count_ = 0;
};

} // namespace evx::core
