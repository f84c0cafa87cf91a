#pragma once
#include "core/cancel_token.h"
#include "core/result.h"
#include "core/task_error.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace evx::infra {

// HTTP method
enum class HttpMethod {
    GET,
    POST
};

// HTTP response (head + buffered body)
struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // lower-case names
    std::string body;            // empty when the body was streamed
    std::string request_id;      // x-request-id from the server, if any
    std::chrono::milliseconds elapsed_ms{0};
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string request_id;  // client-side id of this call
    std::chrono::milliseconds connect_timeout{5000};
    // Total deadline; zero disables it (long downloads use read_timeout only).
    std::chrono::milliseconds timeout{30000};
    // Abort when no byte arrives for this long; zero disables it.
    std::chrono::milliseconds read_timeout{0};

    // Streaming: when on_chunk is set, 2xx bodies are delivered chunk by chunk
    // instead of being buffered. on_head fires once before the first chunk.
    // Returning false from either aborts the transfer (WRITE_ABORTED).
    std::function<bool(const HttpResponse& head)> on_head;
    std::function<bool(const char* data, std::size_t size)> on_chunk;
};

// HTTP error classification (carried in TaskError::details["http_error_code"])
enum class HttpErrorCode {
    NETWORK_ERROR = 1001,    // unreachable, DNS failure, connection refused/reset
    TIMEOUT = 1002,          // connect/read/total timeout
    CANCELED = 1003,         // cancel token tripped
    SERVER_ERROR = 1004,     // 5xx
    CLIENT_ERROR = 1005,     // 4xx other than 429
    RATE_LIMIT = 1006,       // 429
    PARSE_ERROR = 1007,      // malformed response body
    WRITE_ABORTED = 1008,    // streaming callback refused a chunk
    UNKNOWN = 1999
};

// Build a TaskError for a transport failure. Canceled maps to Interrupted,
// everything else to Network until the caller attributes it to an operation.
evx::core::TaskError make_http_error(
    HttpErrorCode code,
    const std::string& user_message,
    const std::string& internal_message,
    bool retryable = false
);

// Read the HttpErrorCode stored in TaskError::details, UNKNOWN when absent.
HttpErrorCode http_error_code(const evx::core::TaskError& error);

// Pure-virtual HTTP transport.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Synchronous call. Non-2xx statuses come back as Err with details
    // "http_status", "body" and "header.<name>" for every response header.
    virtual evx::core::Result<HttpResponse, evx::core::TaskError> execute(
        const HttpRequest& request,
        std::shared_ptr<evx::core::CancelToken> cancel_token = nullptr
    ) = 0;
};

} // namespace evx::infra
