#include "infra/config.h"

#include <cmath>
#include <cstdlib>
#include <sstream>

namespace evx::infra {

namespace {

constexpr const char *kComponent = "config";

// Upper bound for any duration setting: 7 days.
constexpr double kMaxSeconds = 7.0 * 24 * 3600;

std::string trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::optional<std::string> env_string(const EnvLookup &env, const char *name) {
  const char *raw = env ? env(name) : nullptr;
  if (!raw || raw[0] == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

void assign_if_set(const EnvLookup &env, const char *name, std::string &target) {
  if (auto value = env_string(env, name)) {
    target = *value;
  }
}

void warn_invalid(const std::shared_ptr<evx::core::ILogger> &logger,
                  const char *name, const std::string &raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", kComponent, "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

} // namespace

EnvLookup process_environment() {
  return [](const char *name) -> const char * { return std::getenv(name); };
}

std::optional<std::chrono::milliseconds> parse_seconds(const std::string &text) {
  const std::string value = trim(text);
  if (value.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double seconds = std::strtod(value.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(seconds) || seconds <= 0.0 ||
      seconds > kMaxSeconds) {
    return std::nullopt;
  }
  const long long millis = std::llround(seconds * 1000.0);
  if (millis <= 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(millis);
}

std::vector<std::string> split_list(const std::string &csv) {
  std::vector<std::string> items;
  std::istringstream stream(csv);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::string api_base_url(const std::string &api_host) {
  std::string host = trim(api_host);
  while (!host.empty() && host.back() == '/') {
    host.pop_back();
  }
  if (host.rfind("http://", 0) == 0 || host.rfind("https://", 0) == 0) {
    return host;
  }
  return "https://" + host;
}

evx::core::ExportConfig load_config(const EnvLookup &env,
                                    const std::shared_ptr<evx::core::ILogger> &logger) {
  evx::core::ExportConfig config;

  assign_if_set(env, "API_KEY", config.api_key);
  assign_if_set(env, "API_HOST", config.api_host);

  assign_if_set(env, "S3_BUCKET", config.s3_bucket);
  assign_if_set(env, "S3_PREFIX", config.s3_prefix);
  assign_if_set(env, "S3_ACCESS_KEY_ID", config.s3_access_key_id);
  assign_if_set(env, "S3_SECRET_ACCESS_KEY", config.s3_secret_access_key);
  assign_if_set(env, "S3_ENDPOINT_URL", config.s3_endpoint_url);
  assign_if_set(env, "S3_REGION_NAME", config.s3_region_name);

  config.s3_sse_c_key = env_string(env, "S3_SSE_C_KEY");
  config.s3_sse_c_key_md5 = env_string(env, "S3_SSE_C_KEY_MD5");
  assign_if_set(env, "S3_SSE_C_ALGORITHM", config.s3_sse_c_algorithm);

  if (auto fields = env_string(env, "EXPORT_FIELDS")) {
    config.export_fields = split_list(*fields);
  }

  if (auto raw = env_string(env, "EXPORT_POLL_INTERVAL_S")) {
    if (auto interval = parse_seconds(*raw)) {
      config.poll_interval = *interval;
    } else {
      warn_invalid(logger, "EXPORT_POLL_INTERVAL_S", *raw,
                   std::to_string(config.poll_interval.count()) + "ms");
    }
  }

  if (auto raw = env_string(env, "EXPORT_MAX_WAIT_S")) {
    if (auto max_wait = parse_seconds(*raw)) {
      config.max_wait = *max_wait;
    } else {
      warn_invalid(logger, "EXPORT_MAX_WAIT_S", *raw, "none");
    }
  }

  if (auto raw = env_string(env, "EXPORT_STATUS_RETRIES")) {
    char *end = nullptr;
    const long value = std::strtol(raw->c_str(), &end, 10);
    if (end && *end == '\0' && value >= 0 && value <= 100) {
      config.max_status_retries = static_cast<int>(value);
    } else {
      warn_invalid(logger, "EXPORT_STATUS_RETRIES", *raw,
                   std::to_string(config.max_status_retries));
    }
  }

  return config;
}

evx::core::Result<void, evx::core::TaskError>
validate_config(const evx::core::ExportConfig &config) {
  using R = evx::core::Result<void, evx::core::TaskError>;

  if (trim(config.api_key).empty()) {
    return R::Err(evx::core::TaskError::Config("API_KEY environment variable not set."));
  }
  if (trim(config.api_host).empty()) {
    return R::Err(evx::core::TaskError::Config("API host is empty."));
  }
  if (config.poll_interval.count() <= 0) {
    return R::Err(evx::core::TaskError::Config("Polling interval must be positive."));
  }
  if (config.max_wait && config.max_wait->count() <= 0) {
    return R::Err(evx::core::TaskError::Config("Max wait must be positive."));
  }
  if (config.max_status_retries < 0) {
    return R::Err(evx::core::TaskError::Config("Status retry count must not be negative."));
  }
  return R::Ok();
}

} // namespace evx::infra
