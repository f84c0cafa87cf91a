#include "infra/api_client.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace evx::infra {

using evx::core::ErrorCategory;
using evx::core::Result;
using evx::core::Task;
using evx::core::TaskError;
using json = nlohmann::json;

namespace {

std::string make_request_id() {
  static unsigned long counter = 0;
  std::ostringstream oss;
  oss << "cli-" << std::chrono::steady_clock::now().time_since_epoch().count()
      << "-" << (++counter);
  return oss.str();
}

/// Non-negative integer field; null, missing, negative or non-numeric give
/// nullopt. Fractional counts are truncated.
std::optional<std::uint64_t> count_field(const json &object, const char *name) {
  const auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number_unsigned()) {
    return it->get<std::uint64_t>();
  }
  if (it->is_number_integer()) {
    const auto value = it->get<std::int64_t>();
    return value >= 0 ? std::optional<std::uint64_t>(static_cast<std::uint64_t>(value))
                      : std::nullopt;
  }
  if (it->is_number_float()) {
    // 2^64: anything at or above it has no uint64 representation.
    constexpr double kUint64Limit = 18446744073709551616.0;
    const double value = it->get<double>();
    return std::isfinite(value) && value >= 0.0 && value < kUint64Limit
               ? std::optional<std::uint64_t>(static_cast<std::uint64_t>(value))
               : std::nullopt;
  }
  return std::nullopt;
}

std::string text_field(const json &object, const char *name) {
  const auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  return it->is_string() ? it->get<std::string>() : it->dump();
}

/// Re-attribute a transport error to the operation that issued it, keeping
/// the HTTP details. Cancellation stays Interrupted.
TaskError attribute(TaskError error, ErrorCategory category,
                    const std::string &prefix) {
  if (error.category == ErrorCategory::Interrupted) {
    return error;
  }
  error.category = category;
  const std::string status = error.detail("http_status");
  const std::string body = error.detail("body");
  if (!status.empty()) {
    error.user_message = prefix + ": " + status + (body.empty() ? "" : " " + body);
  } else {
    error.user_message = prefix + ": " + error.user_message;
  }
  return error;
}

} // namespace

Result<Task, TaskError> parse_task_json(const std::string &body,
                                        const std::string &task_id) {
  using R = Result<Task, TaskError>;

  json document = json::parse(body, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return R::Err(TaskError(ErrorCategory::StatusFetchFailed,
                            static_cast<int>(HttpErrorCode::PARSE_ERROR), true,
                            "Failed to get export status: malformed response",
                            "status body is not a JSON object",
                            {{"body", body.substr(0, 512)}}));
  }

  Task task;
  task.task_id = task_id;
  task.status = evx::core::parse_task_status(text_field(document, "status"));
  task.completed = count_field(document, "progress");
  task.total = count_field(document, "total");
  if (task.completed && task.total && *task.total > 0 && *task.completed > *task.total) {
    task.completed = task.total;
  }

  json attributes = json::object();
  const auto attr_it = document.find("attributes");
  if (attr_it != document.end() && attr_it->is_object()) {
    attributes = *attr_it;
  }

  if (task.status == evx::core::TaskStatus::Finished) {
    const std::string url = text_field(attributes, "download_url");
    if (!url.empty()) {
      task.result_location = url;
    }
  }

  if (task.status == evx::core::TaskStatus::Failed ||
      task.status == evx::core::TaskStatus::Cancelled) {
    std::string detail = text_field(document, "message");
    if (detail.empty()) {
      detail = text_field(attributes, "error");
    }
    if (detail.empty()) {
      detail = body;
    }
    task.failure_detail = detail;
  }

  return R::Ok(std::move(task));
}

std::string build_trigger_body(const evx::core::TriggerRequest &request) {
  json s3 = json::object();
  auto put = [&s3](const char *name, const std::string &value) {
    if (!value.empty()) {
      s3[name] = value;
    }
  };
  put("bucket_name", request.s3.bucket_name);
  put("prefix", request.s3.prefix);
  put("access_key_id", request.s3.access_key_id);
  put("secret_access_key", request.s3.secret_access_key);
  put("endpoint_url", request.s3.endpoint_url);
  put("region_name", request.s3.region_name);
  if (request.sse) {
    put("sse_customer_key", request.sse->key);
    put("sse_customer_algorithm", request.sse->algorithm);
    put("sse_customer_key_md5", request.sse->key_md5);
  }

  json body = json::object();
  if (!s3.empty()) {
    body["s3"] = std::move(s3);
  }
  if (!request.fields.empty()) {
    body["fields"] = request.fields;
  }
  return body.empty() ? std::string() : body.dump();
}

HttpJobService::HttpJobService(std::shared_ptr<IHttpClient> http_client,
                               std::string base_url, std::string api_key,
                               HttpTimeouts timeouts)
    : http_client_(std::move(http_client)), base_url_(std::move(base_url)),
      api_key_(std::move(api_key)), timeouts_(timeouts) {}

Result<void, TaskError> HttpJobService::ensure_http_client() const {
  if (!http_client_) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("HTTP client is null"));
  }
  return Result<void, TaskError>::Ok();
}

std::string HttpJobService::join_url(const std::string &path) const {
  if (base_url_.empty()) {
    return path;
  }
  if (!path.empty() && path.front() == '/') {
    return base_url_ + path;
  }
  return base_url_ + "/" + path;
}

HttpRequest HttpJobService::make_api_request(HttpMethod method,
                                             const std::string &path) const {
  HttpRequest request;
  request.method = method;
  request.url = join_url(path);
  request.request_id = make_request_id();
  request.headers["Authorization"] = "Bearer " + api_key_;
  request.headers["Accept"] = "application/json";
  request.connect_timeout = timeouts_.connect;
  request.timeout = timeouts_.connect + timeouts_.api_read;
  request.read_timeout = timeouts_.api_read;
  return request;
}

Result<std::string, TaskError>
HttpJobService::trigger(const std::string &job_id,
                        const evx::core::TriggerRequest &trigger_request,
                        std::shared_ptr<evx::core::CancelToken> cancel_token) {
  using R = Result<std::string, TaskError>;

  auto ready = ensure_http_client();
  if (ready.is_err()) {
    return R::Err(ready.error());
  }

  HttpRequest request = make_api_request(
      HttpMethod::POST, "/v1/sic/conf/events/search/jobs/" + job_id + "/export");
  request.body = build_trigger_body(trigger_request);
  if (!request.body.empty()) {
    request.headers["Content-Type"] = "application/json";
  }

  auto result = http_client_->execute(request, std::move(cancel_token));
  if (result.is_err()) {
    return R::Err(attribute(std::move(result).error(), ErrorCategory::TriggerFailed,
                            "Failed to trigger export"));
  }

  const HttpResponse &response = result.value();
  if (response.status_code != 200 && response.status_code != 201 &&
      response.status_code != 202) {
    return R::Err(TaskError(
        ErrorCategory::TriggerFailed, response.status_code, false,
        "Failed to trigger export: " + std::to_string(response.status_code) +
            " " + response.body,
        "unexpected trigger status",
        {{"http_status", std::to_string(response.status_code)},
         {"body", response.body}}));
  }

  json document = json::parse(response.body, nullptr, false);
  std::string task_id;
  if (!document.is_discarded() && document.is_object()) {
    task_id = text_field(document, "task_uuid");
  }
  if (task_id.empty()) {
    return R::Err(TaskError(ErrorCategory::TriggerFailed,
                            static_cast<int>(HttpErrorCode::PARSE_ERROR), false,
                            "No task UUID returned from export trigger.",
                            "trigger response without task_uuid",
                            {{"http_status", std::to_string(response.status_code)},
                             {"body", response.body}}));
  }
  return R::Ok(std::move(task_id));
}

Result<Task, TaskError>
HttpJobService::get_status(const std::string &task_id,
                           std::shared_ptr<evx::core::CancelToken> cancel_token) {
  using R = Result<Task, TaskError>;

  auto ready = ensure_http_client();
  if (ready.is_err()) {
    return R::Err(ready.error());
  }

  HttpRequest request =
      make_api_request(HttpMethod::GET, "/v1/tasks/" + task_id);
  auto result = http_client_->execute(request, std::move(cancel_token));
  if (result.is_err()) {
    return R::Err(attribute(std::move(result).error(),
                            ErrorCategory::StatusFetchFailed,
                            "Failed to get export status"));
  }
  if (result.value().status_code != 200) {
    const auto &response = result.value();
    return R::Err(TaskError(
        ErrorCategory::StatusFetchFailed, response.status_code, false,
        "Failed to get export status: " + std::to_string(response.status_code) +
            " " + response.body,
        "unexpected status code",
        {{"http_status", std::to_string(response.status_code)},
         {"body", response.body}}));
  }
  return parse_task_json(result.value().body, task_id);
}

Result<evx::core::FetchSummary, TaskError>
HttpJobService::fetch(const std::string &location,
                      const std::map<std::string, std::string> &headers,
                      const evx::core::FetchHandlers &handlers,
                      std::shared_ptr<evx::core::CancelToken> cancel_token) {
  using R = Result<evx::core::FetchSummary, TaskError>;

  auto ready = ensure_http_client();
  if (ready.is_err()) {
    return R::Err(ready.error());
  }

  evx::core::FetchSummary summary;

  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = location;
  request.request_id = make_request_id();
  request.headers = headers;
  request.connect_timeout = timeouts_.connect;
  request.timeout = std::chrono::milliseconds(0);
  request.read_timeout = timeouts_.download_read;

  request.on_head = [&](const HttpResponse &head) {
    evx::core::FetchHead fetch_head;
    fetch_head.status_code = head.status_code;
    fetch_head.headers = head.headers;
    const auto it = head.headers.find("content-length");
    if (it != head.headers.end()) {
      char *end = nullptr;
      const unsigned long long length = std::strtoull(it->second.c_str(), &end, 10);
      if (end && *end == '\0' && !it->second.empty()) {
        fetch_head.content_length = length;
      }
    }
    summary.status_code = head.status_code;
    return handlers.on_head ? handlers.on_head(fetch_head) : true;
  };
  request.on_chunk = [&](const char *data, std::size_t size) {
    summary.bytes_received += size;
    return handlers.on_chunk ? handlers.on_chunk(data, size) : true;
  };

  auto result = http_client_->execute(request, std::move(cancel_token));
  if (result.is_err()) {
    return R::Err(attribute(std::move(result).error(),
                            ErrorCategory::DownloadFailed,
                            "Failed to download file"));
  }
  summary.status_code = result.value().status_code;
  return R::Ok(summary);
}

} // namespace evx::infra
