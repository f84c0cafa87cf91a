#include "app/cli.h"

#include "infra/config.h"

#include <cmath>
#include <functional>
#include <map>
#include <sstream>

namespace evx::app {

namespace {

using evx::core::ErrorCategory;
using evx::core::TaskError;

using ValueSetter = std::function<bool(CliOptions &, const std::string &)>;

ValueSetter set_string(std::optional<std::string> CliOptions::*member) {
  return [member](CliOptions &options, const std::string &value) {
    options.*member = value;
    return true;
  };
}

ValueSetter set_seconds(std::optional<std::chrono::milliseconds> CliOptions::*member) {
  return [member](CliOptions &options, const std::string &value) {
    auto parsed = evx::infra::parse_seconds(value);
    if (!parsed) {
      return false;
    }
    options.*member = *parsed;
    return true;
  };
}

const std::map<std::string, ValueSetter> &value_options() {
  static const std::map<std::string, ValueSetter> options = {
      {"--api-host", set_string(&CliOptions::api_host)},
      {"--interval", set_seconds(&CliOptions::interval)},
      {"--max-wait", set_seconds(&CliOptions::max_wait)},
      {"--output", set_string(&CliOptions::output)},
      {"-o", set_string(&CliOptions::output)},
      {"--fields", set_string(&CliOptions::fields)},
      {"--s3-bucket", set_string(&CliOptions::s3_bucket)},
      {"--s3-prefix", set_string(&CliOptions::s3_prefix)},
      {"--s3-access-key", set_string(&CliOptions::s3_access_key)},
      {"--s3-secret-key", set_string(&CliOptions::s3_secret_key)},
      {"--s3-endpoint", set_string(&CliOptions::s3_endpoint)},
      {"--s3-region", set_string(&CliOptions::s3_region)},
      {"--s3-sse-c-key", set_string(&CliOptions::sse_c_key)},
      {"--s3-sse-c-key-md5", set_string(&CliOptions::sse_c_key_md5)},
      {"--s3-sse-c-algorithm", set_string(&CliOptions::sse_c_algorithm)},
  };
  return options;
}

TaskError usage_error(const std::string &message) {
  TaskError error = TaskError::Config(message);
  error.details["usage"] = "true";
  return error;
}

std::optional<Command> parse_command(const std::string &word) {
  if (word == "export") {
    return Command::Export;
  }
  if (word == "status") {
    return Command::Status;
  }
  if (word == "download") {
    return Command::Download;
  }
  return std::nullopt;
}

} // namespace

evx::core::Result<CliOptions, TaskError>
parse_command_line(const std::vector<std::string> &args) {
  using R = evx::core::Result<CliOptions, TaskError>;

  CliOptions options;
  std::optional<Command> command;
  std::vector<std::string> positionals;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.command = Command::Help;
      return R::Ok(std::move(options));
    }
    if (arg == "--version") {
      options.command = Command::Version;
      return R::Ok(std::move(options));
    }
    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
      continue;
    }
    if (arg == "--no-download") {
      options.no_download = true;
      continue;
    }
    if (arg == "--no-sse-c") {
      options.no_sse_c = true;
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      // --name=value or --name value
      std::string name = arg;
      std::optional<std::string> value;
      const auto eq = arg.find('=');
      if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
        name = arg.substr(0, eq);
        value = arg.substr(eq + 1);
      }
      const auto it = value_options().find(name);
      if (it == value_options().end()) {
        return R::Err(usage_error("Unknown option: " + name));
      }
      if (!value) {
        if (i + 1 >= args.size()) {
          return R::Err(usage_error("Option " + name + " requires a value"));
        }
        value = args[++i];
      }
      if (!it->second(options, *value)) {
        return R::Err(usage_error("Invalid value for " + name + ": " + *value +
                                  " (expected a positive number of seconds)"));
      }
      continue;
    }

    if (!command) {
      command = parse_command(arg);
      if (!command) {
        return R::Err(usage_error("Unknown command: " + arg));
      }
      continue;
    }
    positionals.push_back(arg);
  }

  if (!command) {
    return R::Err(usage_error("Missing command (export, status or download)"));
  }
  if (positionals.empty()) {
    return R::Err(usage_error(*command == Command::Export
                                  ? "Missing job id"
                                  : "Missing task id"));
  }
  if (positionals.size() > 1) {
    return R::Err(usage_error("Unexpected argument: " + positionals[1]));
  }

  options.command = *command;
  options.target_id = positionals.front();
  return R::Ok(std::move(options));
}

void apply_overrides(const CliOptions &options, evx::core::ExportConfig &config) {
  const auto assign = [](const std::optional<std::string> &from, std::string &to) {
    if (from) {
      to = *from;
    }
  };

  assign(options.api_host, config.api_host);
  assign(options.s3_bucket, config.s3_bucket);
  assign(options.s3_prefix, config.s3_prefix);
  assign(options.s3_access_key, config.s3_access_key_id);
  assign(options.s3_secret_key, config.s3_secret_access_key);
  assign(options.s3_endpoint, config.s3_endpoint_url);
  assign(options.s3_region, config.s3_region_name);
  assign(options.sse_c_algorithm, config.s3_sse_c_algorithm);

  if (options.interval) {
    config.poll_interval = *options.interval;
  }
  if (options.max_wait) {
    config.max_wait = *options.max_wait;
  }
  if (options.output) {
    config.output_path = *options.output;
  }
  if (options.fields) {
    config.export_fields = evx::infra::split_list(*options.fields);
  }
  if (options.sse_c_key) {
    config.s3_sse_c_key = *options.sse_c_key;
  }
  if (options.sse_c_key_md5) {
    config.s3_sse_c_key_md5 = *options.sse_c_key_md5;
  }

  config.no_download = config.no_download || options.no_download;
  config.no_sse_c = config.no_sse_c || options.no_sse_c;
  config.verbose = config.verbose || options.verbose;
}

int exit_code_for(const TaskError &error) {
  switch (error.category) {
  case ErrorCategory::Config:
  case ErrorCategory::InvalidKeyLength:
    return 2;
  case ErrorCategory::Interrupted:
    return 130;
  default:
    return 1;
  }
}

std::string format_error(const TaskError &error) {
  std::ostringstream oss;
  oss << "Error: " << error.user_message << '\n';

  const std::string task_id = error.detail("task_id");
  if (!task_id.empty() && error.user_message.find(task_id) == std::string::npos) {
    oss << "  Task ID: " << task_id << '\n';
  }
  const std::string elapsed = error.detail("elapsed_s");
  if (!elapsed.empty()) {
    oss << "  Elapsed: " << elapsed << "s\n";
  }
  const std::string retries = error.detail("retry_count");
  if (!retries.empty()) {
    oss << "  Retries: " << retries << '\n';
  }

  switch (error.category) {
  case ErrorCategory::Interrupted:
    if (!task_id.empty()) {
      oss << "  The export continues server-side. Check it later with:\n"
          << "    event-export status " << task_id << '\n';
    }
    break;
  case ErrorCategory::KeyRequired:
    oss << "  Provide the key with --s3-sse-c-key or S3_SSE_C_KEY.\n";
    break;
  case ErrorCategory::DownloadFailed: {
    const std::string destination = error.detail("destination");
    const std::string written = error.detail("bytes_written");
    if (!destination.empty() && !written.empty() && written != "0") {
      oss << "  Partial file kept: " << destination << " (" << written
          << " bytes)\n";
    }
    const std::string location = error.detail("result_location");
    if (!location.empty()) {
      oss << "  You can download the file manually from: " << location << '\n';
    }
    break;
  }
  default:
    break;
  }
  return oss.str();
}

std::string usage_text() {
  return R"(Usage:
  event-export export   <job_id>  [options]   Trigger an export, wait, download
  event-export status   <task_id> [options]   Show the state of an export task
  event-export download <task_id> [options]   Download a finished export

Options:
  --api-host HOST          API host (overrides API_HOST, default api.sekoia.io)
  --interval SECONDS       Polling interval (default 2)
  --max-wait SECONDS       Give up waiting after this long (default: no limit)
  --no-download            Print the download URL instead of downloading
  -o, --output PATH        Output file (default export_YYYYmmdd_HHMMSS.json.gz)
  --fields a,b,c           Export only these fields (overrides EXPORT_FIELDS)
  -v, --verbose            Log requests and state changes to stderr
  -h, --help               Show this help
  --version                Show the version

S3 destination (export):
  --s3-bucket NAME         (overrides S3_BUCKET)
  --s3-prefix PREFIX       (overrides S3_PREFIX)
  --s3-access-key ID       (overrides S3_ACCESS_KEY_ID)
  --s3-secret-key SECRET   (overrides S3_SECRET_ACCESS_KEY)
  --s3-endpoint URL        (overrides S3_ENDPOINT_URL)
  --s3-region REGION       (overrides S3_REGION_NAME)

SSE-C encryption (enabled by default for export):
  --no-sse-c               Disable SSE-C
  --s3-sse-c-key KEY       Base64 256-bit key (overrides S3_SSE_C_KEY,
                           generated for export when absent)
  --s3-sse-c-key-md5 MD5   Base64 MD5 of the key (computed when absent)
  --s3-sse-c-algorithm ALG Algorithm (default AES256)

The API key is read from the API_KEY environment variable.
)";
}

std::string version_text() { return std::string("event-export ") + EVX_VERSION; }

} // namespace evx::app
