#include "core/export_orchestrator.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace evx::core {

namespace {

constexpr const char *kComponent = "orchestrator";

std::string banner_rule() { return std::string(80, '='); }

} // namespace

ExportOrchestrator::ExportOrchestrator(ExportConfig config,
                                       std::shared_ptr<IJobService> service,
                                       std::shared_ptr<IDisplaySink> display,
                                       std::shared_ptr<ILogger> logger,
                                       std::shared_ptr<CancelToken> cancel_token)
    : config_(std::move(config)), service_(std::move(service)),
      display_(std::move(display)), logger_(std::move(logger)),
      cancel_token_(std::move(cancel_token)),
      poller_(service_, poll_policy(config_), display_, logger_),
      streamer_(service_, display_, logger_) {}

PollPolicy ExportOrchestrator::poll_policy(const ExportConfig &config) {
  PollPolicy policy;
  policy.interval = config.poll_interval;
  policy.max_wait = config.max_wait;
  policy.max_status_retries = config.max_status_retries;
  return policy;
}

Result<std::optional<EncryptionKey>, TaskError>
ExportOrchestrator::resolve_key(bool allow_generate, bool *generated) const {
  using R = Result<std::optional<EncryptionKey>, TaskError>;

  if (generated) {
    *generated = false;
  }
  if (config_.no_sse_c) {
    return R::Ok(std::nullopt);
  }

  if (config_.s3_sse_c_key && !config_.s3_sse_c_key->empty()) {
    auto key = KeyManager::validate(*config_.s3_sse_c_key,
                                    config_.s3_sse_c_algorithm,
                                    config_.s3_sse_c_key_md5.value_or(""));
    if (key.is_err()) {
      return R::Err(std::move(key).error());
    }
    return R::Ok(std::move(key).value());
  }

  if (!allow_generate) {
    return R::Ok(std::nullopt);
  }
  if (generated) {
    *generated = true;
  }
  return R::Ok(KeyManager::generate(config_.s3_sse_c_algorithm));
}

TriggerRequest
ExportOrchestrator::build_trigger_request(const std::optional<EncryptionKey> &key) const {
  TriggerRequest request;
  request.s3.bucket_name = config_.s3_bucket;
  request.s3.prefix = config_.s3_prefix;
  request.s3.access_key_id = config_.s3_access_key_id;
  request.s3.secret_access_key = config_.s3_secret_access_key;
  request.s3.endpoint_url = config_.s3_endpoint_url;
  request.s3.region_name = config_.s3_region_name;
  request.fields = config_.export_fields;
  if (key) {
    request.sse = SseCustomerKey{key->algorithm, KeyManager::encode(*key),
                                 key->fingerprint};
  }
  return request;
}

std::string ExportOrchestrator::destination_path() const {
  if (config_.output_path && !config_.output_path->empty()) {
    return *config_.output_path;
  }
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream oss;
  oss << "export_" << std::put_time(&local, "%Y%m%d_%H%M%S") << ".json.gz";
  return oss.str();
}

Result<ExportReport, TaskError>
ExportOrchestrator::run_export(const std::string &job_id) {
  using R = Result<ExportReport, TaskError>;

  bool generated = false;
  auto key_result = resolve_key(true, &generated);
  if (key_result.is_err()) {
    return R::Err(std::move(key_result).error());
  }
  const std::optional<EncryptionKey> key = std::move(key_result).value();

  if (display_) {
    display_->message("Using API host: " + config_.api_host);
  }
  announce_s3_destination();
  if (key) {
    announce_key(*key, generated);
  }

  if (logger_) {
    logger_->info(job_id, kComponent, "trigger_requested",
                  std::string("sse_c=") + (key ? "true" : "false") +
                      " fields=" + std::to_string(config_.export_fields.size()));
  }

  auto triggered =
      service_->trigger(job_id, build_trigger_request(key), cancel_token_);
  if (triggered.is_err()) {
    auto error = std::move(triggered).error();
    if (error.category != ErrorCategory::Interrupted) {
      error.category = ErrorCategory::TriggerFailed;
    }
    error.details["job_id"] = job_id;
    if (logger_) {
      logger_->error(job_id, kComponent, "trigger_failed", error.internal_message);
    }
    return R::Err(std::move(error));
  }

  ExportReport report;
  report.task_id = std::move(triggered).value();
  report.key_generated = generated;
  if (display_) {
    display_->message("Export task triggered with UUID: " + report.task_id);
  }
  streamer_.set_trace_id(report.task_id);

  auto location = poller_.poll_until_terminal(report.task_id, cancel_token_);
  if (location.is_err()) {
    return R::Err(std::move(location).error());
  }
  report.result_location = std::move(location).value();

  if (report.result_location.empty()) {
    if (display_) {
      display_->warning("Export finished but no download URL found.");
    }
    return R::Ok(std::move(report));
  }
  if (display_) {
    display_->message("Export ready! Download URL: " + report.result_location);
  }
  if (config_.no_download) {
    return R::Ok(std::move(report));
  }
  return download_into(std::move(report), key);
}

Result<PollOutcome, TaskError>
ExportOrchestrator::run_status(const std::string &task_id) {
  if (display_) {
    display_->message("Using API host: " + config_.api_host);
  }
  auto outcome = poller_.snapshot(task_id, cancel_token_);
  if (outcome.is_ok() && display_) {
    const Task &task = outcome.value().task;
    if (task.status == TaskStatus::Finished) {
      if (task.result_location) {
        display_->message("Export ready! Download URL: " + *task.result_location);
      } else {
        display_->warning("Export finished but no download URL found.");
      }
    }
  }
  return outcome;
}

Result<ExportReport, TaskError>
ExportOrchestrator::run_download(const std::string &task_id) {
  using R = Result<ExportReport, TaskError>;

  auto key_result = resolve_key(false);
  if (key_result.is_err()) {
    return R::Err(std::move(key_result).error());
  }
  const std::optional<EncryptionKey> key = std::move(key_result).value();

  if (display_) {
    display_->message("Using API host: " + config_.api_host);
    if (key) {
      display_->message("SSE-C encryption headers configured for download");
    }
  }

  auto outcome = poller_.snapshot(task_id, cancel_token_);
  if (outcome.is_err()) {
    return R::Err(std::move(outcome).error());
  }
  const Task &task = outcome.value().task;
  if (task.status != TaskStatus::Finished) {
    return R::Err(TaskError(
        ErrorCategory::TaskNotReady, 1, false,
        std::string("Task is not finished yet (status=") +
            to_string(task.status) + "); nothing to download",
        "download requested before FINISHED",
        {{"task_id", task_id}, {"status", to_string(task.status)}}));
  }
  if (!task.result_location || task.result_location->empty()) {
    return R::Err(TaskError(ErrorCategory::DownloadFailed, 1, false,
                            "Export finished but no download URL found.",
                            "FINISHED without download_url",
                            {{"task_id", task_id}}));
  }

  ExportReport report;
  report.task_id = task_id;
  report.result_location = *task.result_location;
  streamer_.set_trace_id(task_id);
  return download_into(std::move(report), key);
}

Result<ExportReport, TaskError>
ExportOrchestrator::download_into(ExportReport report,
                                  const std::optional<EncryptionKey> &key) {
  using R = Result<ExportReport, TaskError>;

  const std::string destination = destination_path();
  if (display_) {
    display_->message("Downloading to: " + destination);
    if (key) {
      display_->message("Using SSE-C encryption headers for download");
    }
  }

  auto written = streamer_.download(report.result_location, destination, key,
                                    cancel_token_);
  if (written.is_err()) {
    auto error = std::move(written).error();
    error.details["task_id"] = report.task_id;
    error.details["result_location"] = report.result_location;
    return R::Err(std::move(error));
  }

  report.destination = destination;
  report.bytes_written = written.value();
  report.downloaded = true;
  if (display_) {
    display_->message("Download complete: " + destination + " (" +
                      std::to_string(report.bytes_written) + " bytes)");
  }
  return R::Ok(std::move(report));
}

void ExportOrchestrator::announce_key(const EncryptionKey &key,
                                      bool generated) const {
  if (!display_) {
    return;
  }
  if (!generated) {
    display_->message("SSE-C encryption enabled");
    return;
  }
  display_->message("");
  display_->message(banner_rule());
  display_->warning("SSE-C ENCRYPTION KEY AUTO-GENERATED");
  display_->message(banner_rule());
  display_->message("Encryption Key: " + KeyManager::encode(key));
  display_->message("");
  display_->warning("IMPORTANT: Save this key securely!");
  display_->message("   You will need it to download this export later.");
  display_->message(
      "   If you lose this key, you will NOT be able to decrypt your data.");
  display_->message(banner_rule());
  display_->message("");
}

void ExportOrchestrator::announce_s3_destination() const {
  if (!display_) {
    return;
  }
  // Credentials are never echoed, only the names of the plain settings.
  std::vector<std::string> shown;
  if (!config_.s3_bucket.empty()) {
    shown.emplace_back("bucket_name");
  }
  if (!config_.s3_prefix.empty()) {
    shown.emplace_back("prefix");
  }
  if (!config_.s3_endpoint_url.empty()) {
    shown.emplace_back("endpoint_url");
  }
  if (!config_.s3_region_name.empty()) {
    shown.emplace_back("region_name");
  }
  if (shown.empty()) {
    return;
  }
  std::string joined;
  for (const auto &name : shown) {
    joined += (joined.empty() ? "" : ", ") + name;
  }
  display_->message("Using custom S3 configuration: " + joined);
}

} // namespace evx::core
