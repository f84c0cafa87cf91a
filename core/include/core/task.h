#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace evx::core {

// ---- Task Status Enum ----

enum class TaskStatus {
  Pending,   // Accepted by the service, not started yet
  Running,   // Export in progress
  Finished,  // Result available at result_location (terminal)
  Failed,    // Export failed, see failure_detail (terminal)
  Cancelled, // Canceled server-side (terminal)
  Unknown    // Missing or unrecognized status string
};

/// Convert TaskStatus to its canonical upper-case wire name.
const char *to_string(TaskStatus status);

/// Map a wire status string onto TaskStatus. Case-insensitive; both
/// spellings of "canceled" are accepted, unrecognized values map to Unknown.
TaskStatus parse_task_status(std::string_view raw);

/// FINISHED, FAILED and CANCELLED: no further transitions expected.
bool is_terminal(TaskStatus status);

// ---- Task ----

/// Client-side view of one export task. Never mutated locally: every new
/// observation is a fresh Task fetched from the Job Service.
struct Task {
  std::string task_id;
  TaskStatus status = TaskStatus::Unknown;
  std::optional<std::uint64_t> completed;
  std::optional<std::uint64_t> total;         // absent or 0 means unknown
  std::optional<std::string> result_location; // only when Finished
  std::optional<std::string> failure_detail;  // only when Failed/Cancelled

  /// Total when it is known and non-zero.
  [[nodiscard]] std::optional<std::uint64_t> known_total() const {
    if (total && *total > 0) {
      return total;
    }
    return std::nullopt;
  }
};

} // namespace evx::core
