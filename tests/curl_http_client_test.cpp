#include <gtest/gtest.h>

#include "core/cancel_token.h"
#include "infra/curl_http_client.h"
#include "infra/http_client.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

using namespace evx::infra;
using namespace evx::core;
using namespace std::chrono_literals;

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string reason_phrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 429:
            return "Too Many Requests";
        case 500:
            return "Internal Server Error";
        default:
            return "Status";
    }
}

// Minimal loopback HTTP/1.1 server, one connection at a time.
class LocalHttpServer {
public:
    LocalHttpServer() { start(); }
    ~LocalHttpServer() { stop(); }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    bool ready() const { return start_error_.empty(); }
    const std::string& start_error() const { return start_error_; }

    // Raw head (request line + headers) of the last request received.
    std::string last_request_head() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_head_;
    }

private:
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread worker_;
    std::string start_error_;
    mutable std::mutex mutex_;
    std::string last_request_head_;

    void start() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            start_error_ = std::string("socket() failed: ") + std::strerror(errno);
            return;
        }

        int enable = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(0);

        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            start_error_ = std::string("bind() failed: ") + std::strerror(errno);
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }

        socklen_t addr_len = sizeof(addr);
        if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
            start_error_ = std::string("getsockname() failed: ") + std::strerror(errno);
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);

        if (::listen(listen_fd_, 16) < 0) {
            start_error_ = std::string("listen() failed: ") + std::strerror(errno);
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }

        worker_ = std::thread([this] { run_loop(); });
    }

    void stop() {
        stop_.store(true);
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
            ::close(listen_fd_);
            listen_fd_ = -1;
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    static bool send_all(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            int flags = 0;
#ifdef MSG_NOSIGNAL
            flags = MSG_NOSIGNAL;
#endif
            const ssize_t n =
                ::send(fd, data.data() + sent, data.size() - sent, flags);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    void send_response(int client_fd,
                       int status,
                       const std::string& body,
                       const std::string& extra_headers = "") {
        std::ostringstream response;
        response << "HTTP/1.1 " << status << ' ' << reason_phrase(status) << "\r\n";
        response << "Content-Type: application/json\r\n";
        response << "Content-Length: " << body.size() << "\r\n";
        response << "X-Request-ID: local-req\r\n";
        response << extra_headers;
        response << "Connection: close\r\n\r\n";
        response << body;
        (void)send_all(client_fd, response.str());
    }

    // size bytes, sent in 16 KiB writes
    void send_stream(int client_fd, size_t size) {
        std::ostringstream headers;
        headers << "HTTP/1.1 200 OK\r\n";
        headers << "Content-Type: application/gzip\r\n";
        headers << "Content-Length: " << size << "\r\n";
        headers << "Connection: close\r\n\r\n";
        if (!send_all(client_fd, headers.str())) {
            return;
        }

        const std::string chunk(16 * 1024, 'z');
        size_t sent = 0;
        while (sent < size) {
            const size_t n = std::min(chunk.size(), size - sent);
            if (!send_all(client_fd, chunk.substr(0, n))) {
                return;
            }
            sent += n;
        }
    }

    void send_slow_stream(int client_fd) {
        constexpr size_t kChunkSize = 1024;
        constexpr int kChunkCount = 120;
        const std::string chunk(kChunkSize, 'a');

        std::ostringstream headers;
        headers << "HTTP/1.1 200 OK\r\n";
        headers << "Content-Type: application/octet-stream\r\n";
        headers << "Content-Length: " << (kChunkSize * kChunkCount) << "\r\n";
        headers << "Connection: close\r\n\r\n";

        if (!send_all(client_fd, headers.str())) {
            return;
        }

        for (int i = 0; i < kChunkCount && !stop_.load(); ++i) {
            if (!send_all(client_fd, chunk)) {
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    }

    // Announces 4 KiB, then goes silent until the client gives up
    void send_stalled_stream(int client_fd) {
        std::ostringstream headers;
        headers << "HTTP/1.1 200 OK\r\n";
        headers << "Content-Length: 4096\r\n";
        headers << "Connection: close\r\n\r\n";
        if (!send_all(client_fd, headers.str())) {
            return;
        }
        for (int i = 0; i < 200 && !stop_.load(); ++i) {
            std::this_thread::sleep_for(50ms);
        }
    }

    void handle_client(int client_fd) {
        std::string raw_request;
        char buffer[4096];
        while (raw_request.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            raw_request.append(buffer, static_cast<size_t>(n));
        }

        const size_t header_end = raw_request.find("\r\n\r\n");
        std::string headers = raw_request.substr(0, header_end + 4);
        std::string body = raw_request.substr(header_end + 4);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_request_head_ = headers;
        }

        std::istringstream request_stream(headers);
        std::string request_line;
        std::getline(request_stream, request_line);
        if (!request_line.empty() && request_line.back() == '\r') {
            request_line.pop_back();
        }

        std::string method;
        std::string path;
        std::string version;
        {
            std::istringstream line_stream(request_line);
            line_stream >> method >> path >> version;
        }

        size_t content_length = 0;
        const std::string content_length_tag = "Content-Length:";
        const size_t content_length_pos = headers.find(content_length_tag);
        if (content_length_pos != std::string::npos) {
            size_t value_start = content_length_pos + content_length_tag.size();
            while (value_start < headers.size() && headers[value_start] == ' ') {
                ++value_start;
            }
            size_t value_end = headers.find("\r\n", value_start);
            const std::string value = headers.substr(value_start, value_end - value_start);
            content_length = static_cast<size_t>(std::stoul(value));
        }

        while (body.size() < content_length) {
            const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            body.append(buffer, static_cast<size_t>(n));
        }

        if (method == "GET" && path == "/v1/tasks/t1") {
            send_response(client_fd, 200, R"({"status":"RUNNING","progress":3,"total":10})");
            return;
        }

        if (method == "POST" && path == "/post") {
            send_response(client_fd, 202, body.empty() ? R"({"empty":true})" : body);
            return;
        }

        if (starts_with(path, "/delay/")) {
            const int delay_ms = std::atoi(path.c_str() + std::strlen("/delay/"));
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            send_response(client_fd, 200, R"({"delayed":true})");
            return;
        }

        if (starts_with(path, "/stream/")) {
            send_stream(client_fd, std::strtoul(path.c_str() + std::strlen("/stream/"), nullptr, 10));
            return;
        }

        if (path == "/empty") {
            send_response(client_fd, 200, "");
            return;
        }

        if (path == "/slow-stream") {
            send_slow_stream(client_fd);
            return;
        }

        if (path == "/stall") {
            send_stalled_stream(client_fd);
            return;
        }

        if (path == "/sse-required") {
            send_response(client_fd, 400,
                          "<Error><Code>InvalidRequest</Code><Message>The object was stored "
                          "using a form of Server Side Encryption.</Message></Error>",
                          "x-amz-server-side-encryption-customer-algorithm: AES256\r\n");
            return;
        }

        if (starts_with(path, "/status/")) {
            int status_code = std::atoi(path.c_str() + std::strlen("/status/"));
            if (status_code < 100) {
                status_code = 500;
            }
            send_response(client_fd, status_code, R"({"status":"custom"})");
            return;
        }

        send_response(client_fd, 404, R"({"error":"not found"})");
    }

    void run_loop() {
        while (!stop_.load()) {
            sockaddr_in client_addr{};
            socklen_t client_addr_len = sizeof(client_addr);
            const int client_fd =
                ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
            if (client_fd < 0) {
                if (stop_.load()) {
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                std::this_thread::sleep_for(5ms);
                continue;
            }

            handle_client(client_fd);
            ::close(client_fd);
        }
    }
};

class CurlHttpClientTest : public ::testing::Test {
protected:
    LocalHttpServer server_;

    void SetUp() override {
        if (!server_.ready()) {
            GTEST_SKIP() << "Loopback fixture unavailable: " << server_.start_error();
        }
    }

    HttpRequest make_request(const std::string& path, HttpMethod method = HttpMethod::GET) {
        HttpRequest request;
        request.method = method;
        request.url = server_.base_url() + path;
        request.request_id = "req-" + path;
        request.timeout = 3s;
        return request;
    }
};

TEST_F(CurlHttpClientTest, SimpleGetRequest) {
    CurlHttpClient client;

    HttpRequest request = make_request("/v1/tasks/t1");
    request.headers["Authorization"] = "Bearer token-1";

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_NE(result.value().body.find("RUNNING"), std::string::npos);
    EXPECT_EQ(result.value().request_id, "local-req");
    EXPECT_EQ(result.value().headers.at("content-type"), "application/json");
    EXPECT_NE(server_.last_request_head().find("Authorization: Bearer token-1"),
              std::string::npos);
}

TEST_F(CurlHttpClientTest, PostRequest) {
    CurlHttpClient client;

    HttpRequest request = make_request("/post", HttpMethod::POST);
    request.body = R"({"fields":["message"]})";
    request.headers["Content-Type"] = "application/json";

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 202);
    EXPECT_EQ(result.value().body, R"({"fields":["message"]})");
}

TEST_F(CurlHttpClientTest, PostWithoutBodySendsNoFormContentType) {
    CurlHttpClient client;

    auto result = client.execute(make_request("/post", HttpMethod::POST));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(server_.last_request_head().find("application/x-www-form-urlencoded"),
              std::string::npos);
}

TEST_F(CurlHttpClientTest, StreamsSuccessfulBody) {
    CurlHttpClient client;
    constexpr size_t kSize = 1024 * 1024 + 123;

    HttpRequest request = make_request("/stream/" + std::to_string(kSize));
    request.headers["x-amz-server-side-encryption-customer-algorithm"] = "AES256";
    std::string announced_length;
    size_t received = 0;
    int chunks = 0;
    request.on_head = [&](const HttpResponse& head) {
        announced_length = head.headers.count("content-length") ? head.headers.at("content-length") : "";
        return true;
    };
    request.on_chunk = [&](const char*, size_t size) {
        received += size;
        ++chunks;
        return true;
    };

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(received, kSize);
    EXPECT_GT(chunks, 1);
    EXPECT_EQ(announced_length, std::to_string(kSize));
    EXPECT_TRUE(result.value().body.empty());
    EXPECT_NE(server_.last_request_head().find("x-amz-server-side-encryption-customer-algorithm: AES256"),
              std::string::npos);
    EXPECT_EQ(server_.last_request_head().find("Authorization"), std::string::npos);
}

TEST_F(CurlHttpClientTest, EmptyStreamedBodyStillAnnouncesHead) {
    CurlHttpClient client;

    HttpRequest request = make_request("/empty");
    bool head_seen = false;
    request.on_head = [&](const HttpResponse& head) {
        head_seen = head.status_code == 200;
        return true;
    };
    request.on_chunk = [](const char*, size_t) { return true; };

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_TRUE(head_seen);
}

TEST_F(CurlHttpClientTest, ReceiverCanAbortStream) {
    CurlHttpClient client;

    HttpRequest request = make_request("/stream/65536");
    request.on_chunk = [](const char*, size_t) { return false; };

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::WRITE_ABORTED);
    EXPECT_FALSE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, ErrorResponseIsNotStreamed) {
    CurlHttpClient client;

    HttpRequest request = make_request("/sse-required");
    int chunks = 0;
    request.on_chunk = [&](const char*, size_t) {
        ++chunks;
        return true;
    };

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(chunks, 0);
    EXPECT_EQ(result.error().detail("http_status"), "400");
    EXPECT_NE(result.error().detail("body").find("Server Side Encryption"), std::string::npos);
    EXPECT_EQ(result.error().detail("header.x-amz-server-side-encryption-customer-algorithm"),
              "AES256");
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::CLIENT_ERROR);
    EXPECT_FALSE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, Timeout) {
    CurlHttpClient client;

    HttpRequest request = make_request("/delay/1200");
    request.timeout = 200ms;

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Network);
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::TIMEOUT);
    EXPECT_TRUE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, StalledStreamHitsReadTimeout) {
    CurlHttpClient client;

    HttpRequest request = make_request("/stall");
    request.timeout = 0ms;
    request.read_timeout = 1s;
    size_t received = 0;
    request.on_chunk = [&](const char*, size_t size) {
        received += size;
        return true;
    };

    const auto start = std::chrono::steady_clock::now();
    auto result = client.execute(request);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::TIMEOUT);
    EXPECT_EQ(received, 0u);
    EXPECT_LT(elapsed, 8s);
}

TEST_F(CurlHttpClientTest, CancelRequest) {
    CurlHttpClient client;
    auto cancel_token = CancelToken::create();

    HttpRequest request = make_request("/slow-stream");
    request.timeout = 30s;

    std::thread canceler([cancel_token]() {
        std::this_thread::sleep_for(200ms);
        cancel_token->request_cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = client.execute(request, cancel_token);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    canceler.join();

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Interrupted);
    EXPECT_LT(elapsed.count(), 2000);
}

TEST_F(CurlHttpClientTest, CanceledBeforeStartMakesNoRequest) {
    CurlHttpClient client;
    auto cancel_token = CancelToken::create();
    cancel_token->request_cancel();

    auto result = client.execute(make_request("/v1/tasks/t1"), cancel_token);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Interrupted);
    EXPECT_TRUE(server_.last_request_head().empty());
}

TEST_F(CurlHttpClientTest, NotFoundError) {
    CurlHttpClient client;

    auto result = client.execute(make_request("/status/404"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::CLIENT_ERROR);
    EXPECT_EQ(result.error().detail("http_status"), "404");
    EXPECT_FALSE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, ServerErrorIsRetryable) {
    CurlHttpClient client;

    auto result = client.execute(make_request("/status/500"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::SERVER_ERROR);
    EXPECT_EQ(result.error().detail("request_id"), "local-req");
    EXPECT_TRUE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, RateLimitIsRetryable) {
    CurlHttpClient client;

    auto result = client.execute(make_request("/status/429"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(http_error_code(result.error()), HttpErrorCode::RATE_LIMIT);
    EXPECT_TRUE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, HandleIsReusedAcrossRequests) {
    CurlHttpClient client;

    ASSERT_TRUE(client.execute(make_request("/status/500")).is_err());
    auto result = client.execute(make_request("/v1/tasks/t1"));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 200);
}

TEST(CurlHttpClientNetworkTest, ConnectionRefusedIsRetryableNetworkError) {
    CurlHttpClient client;

    HttpRequest request;
    request.url = "http://127.0.0.1:1/unreachable";
    request.connect_timeout = 500ms;
    request.timeout = 1s;

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().category, ErrorCategory::Network);
    EXPECT_TRUE(result.error().retryable);
}

}  // namespace
