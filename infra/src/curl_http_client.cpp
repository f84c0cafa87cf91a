#include "infra/curl_http_client.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>

namespace evx::infra {

namespace {
    // One-time global libcurl initialization
    struct CurlGlobalInit {
        CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
        ~CurlGlobalInit() { curl_global_cleanup(); }
    };
    static CurlGlobalInit g_curl_init;

    // Error bodies are kept for diagnostics only
    constexpr size_t kMaxErrorBody = 64 * 1024;

    struct TransferState {
        const HttpRequest* request = nullptr;
        CURL* curl = nullptr;
        HttpResponse head;
        std::string buffer;
        bool head_delivered = false;
        bool aborted_by_callback = false;
    };

    std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string& value) {
        const auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

    bool is_success(long http_code) { return http_code >= 200 && http_code < 300; }

    // Header callback: collect response headers (reset on every status line,
    // so only the final response of a redirect chain is kept)
    size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t total_size = size * nitems;
        const std::string line(ptr, total_size);

        if (line.rfind("HTTP/", 0) == 0) {
            state->head.headers.clear();
            return total_size;
        }
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            state->head.headers[to_lower(trim(line.substr(0, colon)))] =
                trim(line.substr(colon + 1));
        }
        return total_size;
    }

    // Write callback: stream 2xx bodies when requested, buffer otherwise
    size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* state = static_cast<TransferState*>(userdata);
        const size_t total_size = size * nmemb;

        long http_code = 0;
        curl_easy_getinfo(state->curl, CURLINFO_RESPONSE_CODE, &http_code);
        const HttpRequest& request = *state->request;

        if (request.on_chunk && is_success(http_code)) {
            if (!state->head_delivered) {
                state->head_delivered = true;
                state->head.status_code = static_cast<int>(http_code);
                if (request.on_head && !request.on_head(state->head)) {
                    state->aborted_by_callback = true;
                    return 0;  // CURLE_WRITE_ERROR
                }
            }
            if (!request.on_chunk(ptr, total_size)) {
                state->aborted_by_callback = true;
                return 0;
            }
            return total_size;
        }

        if (is_success(http_code) || state->buffer.size() < kMaxErrorBody) {
            state->buffer.append(ptr, total_size);
        }
        return total_size;
    }

    // Progress callback: cancellation support
    int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                          curl_off_t ultotal, curl_off_t ulnow) {
        (void)dltotal; (void)dlnow; (void)ultotal; (void)ulnow;

        auto* cancel_token = static_cast<evx::core::CancelToken*>(clientp);
        if (cancel_token && cancel_token->is_canceled()) {
            return 1;  // non-zero aborts the transfer
        }
        return 0;
    }

    HttpErrorCode classify_curl_error(CURLcode curl_code, bool aborted_by_callback) {
        switch (curl_code) {
            case CURLE_OK:
                return HttpErrorCode::UNKNOWN;

            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_PARTIAL_FILE:
            case CURLE_GOT_NOTHING:
            case CURLE_SSL_CONNECT_ERROR:
                return HttpErrorCode::NETWORK_ERROR;

            case CURLE_OPERATION_TIMEDOUT:
                return HttpErrorCode::TIMEOUT;

            case CURLE_ABORTED_BY_CALLBACK:
                return HttpErrorCode::CANCELED;

            case CURLE_WRITE_ERROR:
                return aborted_by_callback ? HttpErrorCode::WRITE_ABORTED
                                           : HttpErrorCode::UNKNOWN;

            default:
                return HttpErrorCode::UNKNOWN;
        }
    }
}

CurlHttpClient::CurlHttpClient() {
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

evx::core::Result<HttpResponse, evx::core::TaskError> CurlHttpClient::execute(
    const HttpRequest& request,
    std::shared_ptr<evx::core::CancelToken> cancel_token
) {
    using Result = evx::core::Result<HttpResponse, evx::core::TaskError>;
    std::lock_guard<std::mutex> lock(curl_mutex_);

    if (cancel_token && cancel_token->is_canceled()) {
        return Result::Err(make_http_error(HttpErrorCode::CANCELED, "Request was canceled.",
                                           "Cancellation requested before HTTP call"));
    }

    // Clear state left by the previous request
    curl_easy_reset(curl_);

    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);

    // Timeouts
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    if (request.read_timeout.count() > 0) {
        // "Read timeout": fewer than 1 byte/s for read_timeout aborts
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME,
                         static_cast<long>(std::max<long long>(1, request.read_timeout.count() / 1000)));
    }

    // Method
    if (request.method == HttpMethod::POST) {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }

    // Request headers
    struct curl_slist* headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        headers = curl_slist_append(headers, header.c_str());
    }
    if (request.method == HttpMethod::POST && request.body.empty()) {
        // No body: do not let curl add a form Content-Type
        headers = curl_slist_append(headers, "Content-Type:");
    }
    if (headers) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    }

    TransferState state;
    state.request = &request;
    state.curl = curl_;
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &state);

    // Cancellation through the progress callback
    if (cancel_token) {
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &progress_callback);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, cancel_token.get());
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    }

    auto start_time = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl_);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (headers) {
        curl_slist_free_all(headers);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) {
        HttpErrorCode error_code = classify_curl_error(res, state.aborted_by_callback);
        std::string curl_error_msg = curl_easy_strerror(res);

        std::string user_message;
        switch (error_code) {
            case HttpErrorCode::NETWORK_ERROR:
                user_message = "Network error occurred. Please check your connection.";
                break;
            case HttpErrorCode::TIMEOUT:
                user_message = "Request timed out.";
                break;
            case HttpErrorCode::CANCELED:
                user_message = "Request was canceled.";
                break;
            case HttpErrorCode::WRITE_ABORTED:
                user_message = "Transfer aborted by the receiver.";
                break;
            default:
                user_message = "Unknown transfer error: " + curl_error_msg;
                break;
        }

        std::string internal_message = "CURL error: " + curl_error_msg +
                                       " (code: " + std::to_string(res) + ")";
        const bool retryable = error_code == HttpErrorCode::NETWORK_ERROR ||
                               error_code == HttpErrorCode::TIMEOUT;
        auto error = make_http_error(error_code, user_message, internal_message, retryable);
        if (http_code > 0) {
            error.details["http_status"] = std::to_string(http_code);
        }
        return Result::Err(std::move(error));
    }

    const auto request_id_it = state.head.headers.find("x-request-id");
    const std::string server_request_id =
        request_id_it != state.head.headers.end() ? request_id_it->second : request.request_id;

    if (!is_success(http_code)) {
        HttpErrorCode error_code = HttpErrorCode::CLIENT_ERROR;
        std::string user_message = "Request rejected: HTTP " + std::to_string(http_code);
        bool retryable = false;
        if (http_code >= 500) {
            error_code = HttpErrorCode::SERVER_ERROR;
            user_message = "Server error: HTTP " + std::to_string(http_code);
            retryable = true;
        } else if (http_code == 429) {
            error_code = HttpErrorCode::RATE_LIMIT;
            user_message = "Too many requests: HTTP 429";
            retryable = true;
        } else if (http_code < 400) {
            error_code = HttpErrorCode::UNKNOWN;
            user_message = "Unexpected HTTP status " + std::to_string(http_code);
        }

        auto error = make_http_error(error_code, user_message,
                                     "HTTP " + std::to_string(http_code) + " response",
                                     retryable);
        error.details["http_status"] = std::to_string(http_code);
        error.details["body"] = state.buffer;
        error.details["request_id"] = server_request_id;
        for (const auto& [name, value] : state.head.headers) {
            error.details["header." + name] = value;
        }
        return Result::Err(std::move(error));
    }

    // Empty streamed body: the write callback never ran, announce the head now
    if (request.on_chunk && !state.head_delivered) {
        state.head.status_code = static_cast<int>(http_code);
        if (request.on_head && !request.on_head(state.head)) {
            return Result::Err(make_http_error(HttpErrorCode::WRITE_ABORTED,
                                               "Transfer aborted by the receiver.",
                                               "on_head refused an empty response"));
        }
    }

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.headers = std::move(state.head.headers);
    response.body = std::move(state.buffer);
    response.request_id = server_request_id;
    response.elapsed_ms = elapsed_ms;

    return Result::Ok(std::move(response));
}

} // namespace evx::infra
