#pragma once

#include "core/cancel_token.h"
#include "core/display_sink.h"
#include "core/job_service.h"
#include "core/key_manager.h"
#include "core/logger.h"
#include "core/progress_estimator.h"
#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace evx::core {

/// Header names of SSE-C retrieval.
inline constexpr const char *kSseAlgorithmHeader =
    "x-amz-server-side-encryption-customer-algorithm";
inline constexpr const char *kSseKeyHeader =
    "x-amz-server-side-encryption-customer-key";
inline constexpr const char *kSseKeyMd5Header =
    "x-amz-server-side-encryption-customer-key-MD5";

/// Accumulator owned by one download() call.
struct TransferProgress {
  std::uint64_t bytes_written = 0;
  std::optional<std::uint64_t> total_bytes;
  TimePoint started_at{};
  std::optional<double> rate; // bytes per second, last window
};

struct DownloadPolicy {
  /// Minimum spacing between display refreshes (and estimator samples).
  std::chrono::milliseconds render_interval{250};
};

/// Streams a finished export to disk with bounded memory.
class DownloadStreamer {
public:
  DownloadStreamer(std::shared_ptr<IJobService> service,
                   std::shared_ptr<IDisplaySink> display = nullptr,
                   std::shared_ptr<ILogger> logger = nullptr,
                   DownloadPolicy policy = {});

  /// Invoked after every chunk written to disk.
  using ProgressCallback = std::function<void(const TransferProgress &)>;
  void on_progress(ProgressCallback cb);

  /// Correlation id for log lines (the task id when known).
  void set_trace_id(std::string trace_id) { trace_id_ = std::move(trace_id); }

  /// The three SSE-C headers, all derived from the same key instance.
  static std::map<std::string, std::string>
  encryption_headers(const EncryptionKey &key);

  /// Downloads result_location into destination and returns bytes written.
  ///
  /// The destination is opened right before the first write, so a refused
  /// request (KeyRequired, HTTP error) leaves no file behind; a transfer that
  /// fails mid-stream keeps the partial file. Errors: KeyRequired,
  /// DownloadFailed, Interrupted.
  Result<std::uint64_t, TaskError>
  download(const std::string &result_location, const std::string &destination,
           const std::optional<EncryptionKey> &key,
           std::shared_ptr<CancelToken> cancel_token = nullptr);

private:
  std::shared_ptr<IJobService> service_;
  std::shared_ptr<IDisplaySink> display_;
  std::shared_ptr<ILogger> logger_;
  DownloadPolicy policy_;
  ProgressCallback progress_cb_;
  std::string trace_id_ = "download";
};

} // namespace evx::core
