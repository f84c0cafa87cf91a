#include "core/task.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace evx::core {

const char *to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Pending:
    return "PENDING";
  case TaskStatus::Running:
    return "RUNNING";
  case TaskStatus::Finished:
    return "FINISHED";
  case TaskStatus::Failed:
    return "FAILED";
  case TaskStatus::Cancelled:
    return "CANCELLED";
  case TaskStatus::Unknown:
    return "UNKNOWN";
  }
  return "UNKNOWN";
}

TaskStatus parse_task_status(std::string_view raw) {
  std::string upper(raw);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  if (upper == "PENDING" || upper == "QUEUED" || upper == "CREATED") {
    return TaskStatus::Pending;
  }
  if (upper == "RUNNING" || upper == "STARTED" || upper == "IN_PROGRESS") {
    return TaskStatus::Running;
  }
  if (upper == "FINISHED") {
    return TaskStatus::Finished;
  }
  if (upper == "FAILED") {
    return TaskStatus::Failed;
  }
  if (upper == "CANCELED" || upper == "CANCELLED") {
    return TaskStatus::Cancelled;
  }
  return TaskStatus::Unknown;
}

bool is_terminal(TaskStatus status) {
  switch (status) {
  case TaskStatus::Finished:
  case TaskStatus::Failed:
  case TaskStatus::Cancelled:
    return true;
  default:
    return false;
  }
}

} // namespace evx::core
