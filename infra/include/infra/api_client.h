#pragma once

#include "core/job_service.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"
#include "infra/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace evx::infra {

struct HttpTimeouts {
  std::chrono::milliseconds connect{5000};
  std::chrono::milliseconds api_read{30000};
  std::chrono::milliseconds download_read{60000};
};

/// Parse the JSON body of GET /v1/tasks/{id} into a Task.
/// Fails with StatusFetchFailed (retryable) when the body is not a JSON
/// object.
evx::core::Result<evx::core::Task, evx::core::TaskError>
parse_task_json(const std::string &body, const std::string &task_id);

/// Serialize a trigger request; empty string when there is nothing to send
/// (the trigger is then posted without a body).
std::string build_trigger_body(const evx::core::TriggerRequest &request);

/// HttpJobService: the export API over an IHttpClient.
///
///   trigger    POST {base}/v1/sic/conf/events/search/jobs/{job_id}/export
///   get_status GET  {base}/v1/tasks/{task_id}
///   fetch      GET  {pre-signed location}
///
/// The bearer token is attached to the two API calls only; a pre-signed
/// location carries its own credentials in the query string and rejects a
/// competing Authorization header.
class HttpJobService final : public evx::core::IJobService {
public:
  HttpJobService(std::shared_ptr<IHttpClient> http_client, std::string base_url,
                 std::string api_key, HttpTimeouts timeouts = {});

  evx::core::Result<std::string, evx::core::TaskError>
  trigger(const std::string &job_id, const evx::core::TriggerRequest &request,
          std::shared_ptr<evx::core::CancelToken> cancel_token) override;

  evx::core::Result<evx::core::Task, evx::core::TaskError>
  get_status(const std::string &task_id,
             std::shared_ptr<evx::core::CancelToken> cancel_token) override;

  evx::core::Result<evx::core::FetchSummary, evx::core::TaskError>
  fetch(const std::string &location,
        const std::map<std::string, std::string> &headers,
        const evx::core::FetchHandlers &handlers,
        std::shared_ptr<evx::core::CancelToken> cancel_token) override;

private:
  std::shared_ptr<IHttpClient> http_client_;
  std::string base_url_;
  std::string api_key_;
  HttpTimeouts timeouts_;

  evx::core::Result<void, evx::core::TaskError> ensure_http_client() const;
  std::string join_url(const std::string &path) const;
  HttpRequest make_api_request(HttpMethod method, const std::string &path) const;
};

} // namespace evx::infra
