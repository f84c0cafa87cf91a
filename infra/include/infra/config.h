#pragma once

#include "core/export_config.h"
#include "core/logger.h"
#include "core/result.h"
#include "core/task_error.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evx::infra {

/// getenv-shaped lookup, injectable for tests.
using EnvLookup = std::function<const char *(const char *)>;

/// Lookup over the real process environment.
EnvLookup process_environment();

/// Build the configuration from environment variables. Called exactly once
/// per process; the command line is applied on top of the result.
///
///   API_KEY, API_HOST (default api.sekoia.io)
///   S3_BUCKET, S3_PREFIX, S3_ACCESS_KEY_ID, S3_SECRET_ACCESS_KEY,
///   S3_ENDPOINT_URL, S3_REGION_NAME
///   S3_SSE_C_KEY, S3_SSE_C_KEY_MD5, S3_SSE_C_ALGORITHM
///   EXPORT_FIELDS (comma separated), EXPORT_POLL_INTERVAL_S,
///   EXPORT_MAX_WAIT_S, EXPORT_STATUS_RETRIES
///
/// Malformed numeric values keep the default and log a warning.
evx::core::ExportConfig
load_config(const EnvLookup &env,
            const std::shared_ptr<evx::core::ILogger> &logger = nullptr);

/// Pre-flight checks: credential present, interval > 0, max wait > 0.
evx::core::Result<void, evx::core::TaskError>
validate_config(const evx::core::ExportConfig &config);

/// Parse a positive number of seconds ("2", "0.5"); nullopt when malformed,
/// below one millisecond or above seven days.
std::optional<std::chrono::milliseconds> parse_seconds(const std::string &text);

/// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> split_list(const std::string &csv);

/// https://{api_host}, unless api_host already carries a scheme.
std::string api_base_url(const std::string &api_host);

} // namespace evx::infra
