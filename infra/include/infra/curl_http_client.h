#pragma once

#include "infra/http_client.h"
#include <memory>
#include <mutex>

// Forward declaration (keeps curl.h out of public headers)
typedef void CURL;

namespace evx::infra {

/// libcurl-backed HTTP client.
/// Supports: connect/total/read timeouts, cancellation through the cancel
/// token (checked from the transfer progress callback), response header
/// capture, streamed 2xx bodies and error classification.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    // A CURL easy handle cannot be shared between two owners
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    evx::core::Result<HttpResponse, evx::core::TaskError> execute(
        const HttpRequest& request,
        std::shared_ptr<evx::core::CancelToken> cancel_token = nullptr
    ) override;

private:
    CURL* curl_;  // reused between requests (keeps connections alive)
    std::mutex curl_mutex_;
};

} // namespace evx::infra
