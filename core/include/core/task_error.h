#pragma once

#include <map>
#include <string>

namespace evx::core {

/// Error categories: enables programmatic branching (and exit-code mapping)
/// without string parsing.
enum class ErrorCategory {
  Config,            // Pre-flight: missing credential, malformed option or key
  Network,           // Transport-level failure before it is attributed to a call
  TriggerFailed,     // Export trigger rejected; never retried
  StatusFetchFailed, // Status call failed (retried by the poller when retryable)
  PollTimeout,       // max_wait exceeded before a terminal state
  TaskFailed,        // Server reported FAILED or CANCELLED
  TaskNotReady,      // Direct download requested for a non-finished task
  KeyRequired,       // Object is SSE-C encrypted but no key was supplied
  InvalidKeyLength,  // Key material does not decode to 32 bytes
  DownloadFailed,    // Transfer or local write failed, partial file kept
  Interrupted,       // User interrupt honored at a suspension point
  Internal           // Programming error / invariant violation
};

/// Structured error type shared by every layer.
struct TaskError {
  ErrorCategory category = ErrorCategory::Internal;
  int code = 0;
  bool retryable = false;
  std::string user_message;     // Printed to the terminal
  std::string internal_message; // Logged only
  std::map<std::string, std::string> details; // task_id, elapsed_s, http_status, body...

  TaskError() = default;

  TaskError(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), user_message(msg),
        internal_message(std::move(msg)) {}

  TaskError(ErrorCategory cat, int c, bool retry, std::string user_msg,
            std::string internal_msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), retryable(retry),
        user_message(std::move(user_msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  /// Look up a detail, empty string when absent.
  [[nodiscard]] std::string detail(const std::string &key) const {
    auto it = details.find(key);
    return it == details.end() ? std::string() : it->second;
  }

  static TaskError Config(std::string msg) {
    return {ErrorCategory::Config, 2, std::move(msg)};
  }
  static TaskError Interrupted(std::string msg = "Interrupted by user") {
    return {ErrorCategory::Interrupted, 130, std::move(msg)};
  }
  static TaskError Internal(std::string msg) {
    return {ErrorCategory::Internal, 1, std::move(msg)};
  }
};

/// Convert ErrorCategory to string for logging.
inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Config:
    return "ConfigError";
  case ErrorCategory::Network:
    return "Network";
  case ErrorCategory::TriggerFailed:
    return "TriggerFailed";
  case ErrorCategory::StatusFetchFailed:
    return "StatusFetchFailed";
  case ErrorCategory::PollTimeout:
    return "PollTimeout";
  case ErrorCategory::TaskFailed:
    return "TaskFailed";
  case ErrorCategory::TaskNotReady:
    return "TaskNotReady";
  case ErrorCategory::KeyRequired:
    return "KeyRequired";
  case ErrorCategory::InvalidKeyLength:
    return "InvalidKeyLength";
  case ErrorCategory::DownloadFailed:
    return "DownloadFailed";
  case ErrorCategory::Interrupted:
    return "Interrupted";
  case ErrorCategory::Internal:
    return "Internal";
  }
  return "Internal";
}

} // namespace evx::core
