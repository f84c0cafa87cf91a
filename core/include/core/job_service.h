#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace evx::core {

/// Custom S3 destination forwarded in the trigger body. Empty fields are
/// omitted from the request.
struct S3Destination {
  std::string bucket_name;
  std::string prefix;
  std::string access_key_id;
  std::string secret_access_key;
  std::string endpoint_url;
  std::string region_name;

  [[nodiscard]] bool empty() const {
    return bucket_name.empty() && prefix.empty() && access_key_id.empty() &&
           secret_access_key.empty() && endpoint_url.empty() &&
           region_name.empty();
  }
};

/// SSE-C fields of the trigger body, already encoded for transport.
struct SseCustomerKey {
  std::string algorithm;
  std::string key;     // base64 raw key
  std::string key_md5; // base64 fingerprint
};

struct TriggerRequest {
  S3Destination s3;
  std::optional<SseCustomerKey> sse;
  std::vector<std::string> fields;
};

/// Response head of a streaming fetch, delivered before the first chunk.
struct FetchHead {
  int status_code = 0;
  std::map<std::string, std::string> headers; // lower-case names
  std::optional<std::uint64_t> content_length;
};

/// Streaming callbacks. Returning false from either aborts the transfer;
/// fetch() then fails with DownloadFailed unless the cancel token was set.
struct FetchHandlers {
  std::function<bool(const FetchHead &)> on_head;
  std::function<bool(const char *data, std::size_t size)> on_chunk;
};

struct FetchSummary {
  int status_code = 0;
  std::uint64_t bytes_received = 0;
};

/// Remote export API.
///
/// Error contract:
///   trigger    -> TriggerFailed (details: http_status, body) or Interrupted
///   get_status -> StatusFetchFailed (retryable flag set for transient
///                 failures) or Interrupted
///   fetch      -> DownloadFailed (details: http_status, body for non-2xx),
///                 or Interrupted
class IJobService {
public:
  virtual ~IJobService() = default;

  virtual Result<std::string, TaskError>
  trigger(const std::string &job_id, const TriggerRequest &request,
          std::shared_ptr<CancelToken> cancel_token) = 0;

  virtual Result<Task, TaskError>
  get_status(const std::string &task_id,
             std::shared_ptr<CancelToken> cancel_token) = 0;

  /// Streaming GET of a pre-signed location. Only the given headers are
  /// sent: no Authorization header is ever added to this call.
  virtual Result<FetchSummary, TaskError>
  fetch(const std::string &location,
        const std::map<std::string, std::string> &headers,
        const FetchHandlers &handlers,
        std::shared_ptr<CancelToken> cancel_token) = 0;
};

} // namespace evx::core
