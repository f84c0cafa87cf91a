#include "core/download_streamer.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <ios>

namespace evx::core {

namespace {

constexpr const char *kComponent = "download_streamer";

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/// S3 answers a GET on an SSE-C object without key headers with a 400
/// InvalidRequest ("The object was stored using a form of Server Side
/// Encryption..."); some gateways use 403.
bool body_demands_customer_key(int http_status, const std::string &body) {
  if (http_status != 400 && http_status != 403) {
    return false;
  }
  const std::string text = to_lower(body);
  return text.find("server side encryption") != std::string::npos ||
         text.find("server-side encryption") != std::string::npos ||
         text.find("sse-c") != std::string::npos ||
         text.find("customer-provided") != std::string::npos ||
         text.find("customer key") != std::string::npos;
}

TaskError key_required(const std::string &destination) {
  return TaskError(ErrorCategory::KeyRequired, 2, false,
                   "The export is encrypted (SSE-C) but no key was supplied. "
                   "Provide the key used at export time with --s3-sse-c-key "
                   "or S3_SSE_C_KEY",
                   "server requires SSE-C key headers",
                   {{"destination", destination}, {"bytes_written", "0"}});
}

TaskError download_failed(std::string user_msg, std::string internal_msg) {
  return TaskError(ErrorCategory::DownloadFailed, 1, false, std::move(user_msg),
                   std::move(internal_msg));
}

} // namespace

DownloadStreamer::DownloadStreamer(std::shared_ptr<IJobService> service,
                                   std::shared_ptr<IDisplaySink> display,
                                   std::shared_ptr<ILogger> logger,
                                   DownloadPolicy policy)
    : service_(std::move(service)), display_(std::move(display)),
      logger_(std::move(logger)), policy_(policy) {}

void DownloadStreamer::on_progress(ProgressCallback cb) {
  progress_cb_ = std::move(cb);
}

std::map<std::string, std::string>
DownloadStreamer::encryption_headers(const EncryptionKey &key) {
  return {
      {kSseAlgorithmHeader, key.algorithm},
      {kSseKeyHeader, KeyManager::encode(key)},
      {kSseKeyMd5Header, key.fingerprint},
  };
}

Result<std::uint64_t, TaskError>
DownloadStreamer::download(const std::string &result_location,
                           const std::string &destination,
                           const std::optional<EncryptionKey> &key,
                           std::shared_ptr<CancelToken> cancel_token) {
  using R = Result<std::uint64_t, TaskError>;

  if (!service_) {
    return R::Err(TaskError::Internal("DownloadStreamer has no job service"));
  }
  if (result_location.empty()) {
    return R::Err(download_failed("No download location available",
                                  "empty result_location"));
  }

  const auto headers =
      key ? encryption_headers(*key) : std::map<std::string, std::string>{};

  TransferProgress progress;
  progress.started_at = Clock::now();
  ProgressEstimator estimator;
  std::optional<TimePoint> last_render;
  std::optional<TaskError> local_error;
  std::ofstream out;

  if (logger_) {
    logger_->info(trace_id_, kComponent, "download_started",
                  "destination=" + destination +
                      " sse_c=" + (key ? "true" : "false"));
  }

  FetchHandlers handlers;
  handlers.on_head = [&](const FetchHead &head) {
    if (!key && head.headers.count(kSseAlgorithmHeader) > 0) {
      local_error = key_required(destination);
      return false;
    }
    progress.total_bytes = head.content_length;
    return true;
  };
  handlers.on_chunk = [&](const char *data, std::size_t size) {
    if (!out.is_open()) {
      out.open(destination, std::ios::binary | std::ios::trunc);
      if (!out) {
        local_error = download_failed("Cannot open " + destination + " for writing",
                                      "ofstream open failed");
        return false;
      }
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
      local_error = download_failed("Failed writing to " + destination,
                                    "ofstream write failed");
      return false;
    }
    progress.bytes_written += size;

    const TimePoint now = Clock::now();
    if (!last_render || now - *last_render >= policy_.render_interval) {
      const auto view =
          estimator.add_bytes(now, progress.bytes_written, progress.total_bytes);
      progress.rate = view.throughput;
      if (display_) {
        display_->render_transfer(view, last_render.has_value());
      }
      last_render = now;
    }

    if (progress_cb_) {
      progress_cb_(progress);
    }
    return true;
  };

  auto fetched = service_->fetch(result_location, headers, handlers, cancel_token);

  auto fail = [&](TaskError error) {
    error.details["destination"] = destination;
    error.details["bytes_written"] = std::to_string(progress.bytes_written);
    if (logger_) {
      logger_->error(trace_id_, kComponent, "download_failed",
                     std::string(to_string(error.category)) + ": " +
                         error.internal_message +
                         " bytes_written=" +
                         std::to_string(progress.bytes_written));
    }
    return R::Err(std::move(error));
  };

  if (local_error) {
    return fail(std::move(*local_error));
  }
  if (fetched.is_err()) {
    auto error = std::move(fetched).error();
    if (error.category == ErrorCategory::Interrupted) {
      return fail(std::move(error));
    }
    int http_status = 0;
    try {
      http_status = std::stoi(error.detail("http_status"));
    } catch (const std::exception &) {
      http_status = 0;
    }
    if (!key && progress.bytes_written == 0 &&
        (body_demands_customer_key(http_status, error.detail("body")) ||
         !error.detail(std::string("header.") + kSseAlgorithmHeader).empty())) {
      return fail(key_required(destination));
    }
    error.category = ErrorCategory::DownloadFailed;
    if (error.user_message.empty()) {
      error.user_message = "Failed to download file";
    }
    return fail(std::move(error));
  }

  if (!out.is_open()) {
    // Zero-byte export: still produce the (empty) destination file.
    out.open(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
      return fail(download_failed("Cannot open " + destination + " for writing",
                                  "ofstream open failed"));
    }
  }
  out.close();
  if (out.fail()) {
    return fail(download_failed("Failed to flush " + destination,
                                "ofstream close failed"));
  }

  const auto final_view =
      estimator.add_bytes(Clock::now(), progress.bytes_written, progress.total_bytes);
  if (display_) {
    display_->render_transfer(final_view, last_render.has_value());
  }

  if (logger_) {
    logger_->info(trace_id_, kComponent, "download_complete",
                  "destination=" + destination +
                      " bytes=" + std::to_string(progress.bytes_written));
  }
  return R::Ok(progress.bytes_written);
}

} // namespace evx::core
