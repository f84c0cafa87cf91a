#pragma once

#include "core/export_config.h"
#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#ifndef EVX_VERSION
#define EVX_VERSION "0.1.0"
#endif

namespace evx::app {

enum class Command { Export, Status, Download, Help, Version };

/// Parsed command line. Every value option is optional so that only what the
/// user typed overrides the environment.
struct CliOptions {
  Command command = Command::Help;
  std::string target_id; // job id (export) or task id (status, download)

  std::optional<std::string> api_host;
  std::optional<std::chrono::milliseconds> interval;
  std::optional<std::chrono::milliseconds> max_wait;
  std::optional<std::string> output;
  std::optional<std::string> fields;

  std::optional<std::string> s3_bucket;
  std::optional<std::string> s3_prefix;
  std::optional<std::string> s3_access_key;
  std::optional<std::string> s3_secret_key;
  std::optional<std::string> s3_endpoint;
  std::optional<std::string> s3_region;

  std::optional<std::string> sse_c_key;
  std::optional<std::string> sse_c_key_md5;
  std::optional<std::string> sse_c_algorithm;

  bool no_download = false;
  bool no_sse_c = false;
  bool verbose = false;
};

/// Parse argv[1..]. Usage errors come back as ConfigError (exit code 2).
evx::core::Result<CliOptions, evx::core::TaskError>
parse_command_line(const std::vector<std::string> &args);

/// Layer the command line over the environment-derived configuration.
void apply_overrides(const CliOptions &options, evx::core::ExportConfig &config);

/// 0 is success; 2 usage, configuration and key errors; 130 interrupt; 1 the rest.
int exit_code_for(const evx::core::TaskError &error);

/// Multi-line text printed to stderr for a failed flow: the message, then the
/// task id, elapsed time, server detail and manual download URL when known.
std::string format_error(const evx::core::TaskError &error);

std::string usage_text();
std::string version_text();

} // namespace evx::app
