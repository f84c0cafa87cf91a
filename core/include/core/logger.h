#pragma once

#include <string>

namespace evx::core {

/// Structured log sink shared by the poller, the streamer and the
/// orchestrator. Output format and level filtering live in infra.
///
/// trace_id: the task id once known, the job id before the trigger.
/// component: "task_poller", "download_streamer", "orchestrator", "config"...
/// event: a snake_case name (e.g. "status_retry_scheduled").
///
/// Messages never carry the API key or raw key material; use mask_secret()
/// when a line has to mention one.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

/// "<unset>" or "<set, N chars>": presence of a secret without its value.
inline std::string mask_secret(const std::string &secret) {
  if (secret.empty()) {
    return "<unset>";
  }
  return "<set, " + std::to_string(secret.size()) + " chars>";
}

} // namespace evx::core
