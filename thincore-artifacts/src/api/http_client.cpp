#include "api/http_client.hpp"
#include <curl/curl.h>
#include <iostream>
#include <sstream>
#include <thread>

namespace thincore {
namespace artifacts {

namespace {

// Transport-level failure (connect refused, DNS, timeout); always retryable
class TransportError : public ThinCoreError {
public:
    explicit TransportError(const std::string& message) : ThinCoreError(message) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);

    // "Name: Value\r\n"
    size_t colon_pos = header.find(':');
    if (colon_pos != std::string::npos) {
        std::string name = header.substr(0, colon_pos);
        std::string value = header.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        (*headers)[name] = value;
    }

    return total_size;
}

} // namespace

struct HttpClient::Impl {
    CURL* curl;

    Impl() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl = curl_easy_init();
        if (!curl) {
            throw TransientIOError("Failed to initialize CURL");
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
        curl_global_cleanup();
    }
};

HttpClient::HttpClient(const std::string& base_url, int timeout_ms)
    : impl_(std::make_unique<Impl>())
    , base_url_(base_url)
    , timeout_ms_(timeout_ms)
    , debug_(false)
{
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

HttpClient::~HttpClient() = default;

bool HttpClient::should_retry(int status_code) {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    // Don't retry on: auth (401), forbidden (403), not found (404)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

HttpResponse HttpClient::perform_once(
    const std::string& method,
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    auto start = std::chrono::steady_clock::now();

    curl_easy_reset(impl_->curl);
    curl_easy_setopt(impl_->curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(impl_->curl, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST" || method == "PUT") {
        if (method == "PUT") {
            curl_easy_setopt(impl_->curl, CURLOPT_CUSTOMREQUEST, "PUT");
        } else {
            curl_easy_setopt(impl_->curl, CURLOPT_POST, 1L);
        }
        curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    } else if (method == "HEAD") {
        curl_easy_setopt(impl_->curl, CURLOPT_NOBODY, 1L);
    }

    struct curl_slist* curl_headers = nullptr;
    for (const auto& [key, value] : headers) {
        if (debug_) {
            if (key == "Authorization") {
                std::cerr << "[HttpClient] Header: " << key << ": [REDACTED]" << std::endl;
            } else {
                std::cerr << "[HttpClient] Header: " << key << ": " << value << std::endl;
            }
        }
        std::string header_line = key + ": " + value;
        curl_headers = curl_slist_append(curl_headers, header_line.c_str());
    }
    if (curl_headers) {
        curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, curl_headers);
    }

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(impl_->curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_HEADERDATA, &response_headers);

    if (debug_) {
        std::cerr << "[HttpClient] " << method << " " << url
                  << " (" << body.size() << " bytes)" << std::endl;
    }

    CURLcode res = curl_easy_perform(impl_->curl);

    if (curl_headers) {
        curl_slist_free_all(curl_headers);
    }

    if (res != CURLE_OK) {
        throw TransportError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    long status_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &status_code);

    auto end = std::chrono::steady_clock::now();

    HttpResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);
    response.duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    if (debug_) {
        std::cerr << "[HttpClient] Status: " << status_code
                  << " (" << response.duration.count() << "ms)" << std::endl;
    }

    return response;
}

HttpResponse HttpClient::execute_with_retry(
    const std::string& method,
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string url = base_url_ + path;
    std::string last_error = "no attempt made";

    for (size_t attempt = 0; attempt < retry_policy_.max_attempts(); ++attempt) {
        if (attempt > 0) {
            int delay_ms = retry_policy_.delays_ms[attempt - 1];
            if (debug_) {
                std::cerr << "[HttpClient] " << last_error
                          << " - retrying in " << delay_ms << "ms..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }

        HttpResponse response;
        try {
            response = perform_once(method, url, body, headers);
        } catch (const TransportError& e) {
            last_error = e.what();
            continue;
        }

        if (should_retry(response.status_code)) {
            std::ostringstream oss;
            oss << "HTTP " << response.status_code << " from " << method << " " << url;
            last_error = oss.str();
            continue;
        }

        if (response.status_code >= 400) {
            std::ostringstream oss;
            if (response.status_code == 401) {
                oss << "Authentication failed for " << url;
            } else if (response.status_code == 403) {
                oss << "Access denied for " << url;
            } else if (response.status_code == 404) {
                oss << "Resource not found: " << url;
            } else {
                oss << "HTTP " << response.status_code << ": " << response.body;
            }
            throw HttpClientError(oss.str(), response.status_code);
        }

        return response;
    }

    throw TransientIOError(last_error + " (gave up after " +
                           std::to_string(retry_policy_.max_attempts()) + " attempts)");
}

HttpResponse HttpClient::get(
    const std::string& path,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("GET", path, "", headers);
}

HttpResponse HttpClient::head(
    const std::string& path,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("HEAD", path, "", headers);
}

HttpResponse HttpClient::put(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("PUT", path, body, headers);
}

HttpResponse HttpClient::post(
    const std::string& path,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
{
    return execute_with_retry("POST", path, body, headers);
}

} // namespace artifacts
} // namespace thincore
