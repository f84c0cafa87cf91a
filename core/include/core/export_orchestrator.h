#pragma once

#include "core/cancel_token.h"
#include "core/display_sink.h"
#include "core/download_streamer.h"
#include "core/export_config.h"
#include "core/job_service.h"
#include "core/key_manager.h"
#include "core/logger.h"
#include "core/result.h"
#include "core/task_error.h"
#include "core/task_poller.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace evx::core {

/// What a flow achieved, for the final summary printed by the CLI.
struct ExportReport {
  std::string task_id;
  std::string result_location;
  std::optional<std::string> destination;
  std::uint64_t bytes_written = 0;
  bool downloaded = false;
  bool key_generated = false;
};

/// ExportOrchestrator: the three user-facing flows.
///
///   export   : resolve/generate key -> trigger -> poll -> download
///   status   : one snapshot, rendered once, never downloads
///   download : one snapshot for the location -> download with the caller's
///              key (never generates one)
///
/// Does NOT retry anything itself: StatusFetchFailed retries live in the
/// poller, every other error is returned to the caller as-is.
class ExportOrchestrator {
public:
  ExportOrchestrator(ExportConfig config, std::shared_ptr<IJobService> service,
                     std::shared_ptr<IDisplaySink> display,
                     std::shared_ptr<ILogger> logger,
                     std::shared_ptr<CancelToken> cancel_token = nullptr);

  Result<ExportReport, TaskError> run_export(const std::string &job_id);
  Result<PollOutcome, TaskError> run_status(const std::string &task_id);
  Result<ExportReport, TaskError> run_download(const std::string &task_id);

  /// Key resolution shared by every flow. Disabled SSE-C yields nullopt; a
  /// configured key is validated; otherwise a key is generated only when
  /// allow_generate is set (export flow).
  Result<std::optional<EncryptionKey>, TaskError>
  resolve_key(bool allow_generate, bool *generated = nullptr) const;

  TriggerRequest build_trigger_request(const std::optional<EncryptionKey> &key) const;

  /// output_path, or export_YYYYmmdd_HHMMSS.json.gz in the working directory.
  std::string destination_path() const;

  static PollPolicy poll_policy(const ExportConfig &config);

private:
  ExportConfig config_;
  std::shared_ptr<IJobService> service_;
  std::shared_ptr<IDisplaySink> display_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<CancelToken> cancel_token_;
  TaskPoller poller_;
  DownloadStreamer streamer_;

  Result<ExportReport, TaskError> download_into(ExportReport report,
                                                const std::optional<EncryptionKey> &key);
  void announce_key(const EncryptionKey &key, bool generated) const;
  void announce_s3_destination() const;
};

} // namespace evx::core
