#pragma once

#include "errors.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace thincore {
namespace artifacts {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds duration{0};
};

/**
 * Non-retryable HTTP failure (4xx other than 408/429)
 */
class HttpClientError : public ThinCoreError {
public:
    HttpClientError(const std::string& message, int status_code = 0)
        : ThinCoreError(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

/**
 * Retry schedule for transient failures
 */
struct RetryPolicy {
    std::vector<int> delays_ms = {1000, 2000, 4000};   ///< One entry per retry

    size_t max_attempts() const { return delays_ms.size() + 1; }
};

/**
 * HTTP client with retry logic and timeout support
 *
 * Features:
 * - Exponential backoff retry (1s, 2s, 4s by default)
 * - Configurable timeout (default 30s)
 * - Binary-safe request and response bodies
 * - Request/response logging in debug mode, Authorization header redacted
 * - Thread-safe (requests are serialized on one libcurl handle)
 *
 * Connection failures, timeouts, 408, 429 and 5xx are retried and surface
 * as TransientIOError once the schedule is exhausted. Other 4xx responses
 * throw HttpClientError immediately.
 */
class HttpClient {
public:
    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "http://artifacts:9000")
     * @param timeout_ms Timeout in milliseconds (default: 30000)
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000);

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    HttpResponse head(const std::string& path,
                      const std::map<std::string, std::string>& headers = {});

    HttpResponse put(const std::string& path,
                     const std::string& body,
                     const std::map<std::string, std::string>& headers = {});

    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    void set_debug(bool debug) { debug_ = debug; }
    void set_retry_policy(const RetryPolicy& policy) { retry_policy_ = policy; }

    const std::string& base_url() const { return base_url_; }

    /// Retry classification for a status code
    static bool should_retry(int status_code);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    int timeout_ms_;
    bool debug_;
    RetryPolicy retry_policy_;
    std::mutex mutex_;

    HttpResponse execute_with_retry(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );
    HttpResponse perform_once(
        const std::string& method,
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );
};

} // namespace artifacts
} // namespace thincore
