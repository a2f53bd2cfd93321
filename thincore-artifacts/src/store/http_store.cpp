#include "store/http_store.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace thincore {
namespace artifacts {

namespace {

const std::string CONTENT_TYPE_HEADER = "X-Content-Type";

int64_t parse_int_header(const std::map<std::string, std::string>& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(),
                       [](char a, char b) { return std::tolower(a) == std::tolower(b); })) {
            try {
                return std::stoll(value);
            } catch (const std::exception&) {
                return -1;
            }
        }
    }
    return -1;
}

} // namespace

HttpArtifactStore::HttpArtifactStore(const std::string& base_url, int timeout_ms)
    : client_(std::make_unique<HttpClient>(base_url, timeout_ms))
{
}

std::string HttpArtifactStore::put(const Bytes& bytes, const std::string& content_type) {
    std::string expected = sha256_hex(bytes);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.puts++;
    }

    if (exists(expected)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.deduplicated++;
        return expected;
    }

    std::map<std::string, std::string> headers = {
        {"Content-Type", "application/octet-stream"}
    };
    if (!content_type.empty()) {
        headers[CONTENT_TYPE_HEADER] = content_type;
    }

    HttpResponse response = client_->put("/artifacts", bytes, headers);

    std::string reported;
    try {
        json j = json::parse(response.body);
        reported = j.at("hash").get<std::string>();
    } catch (const json::exception& e) {
        throw IntegrityError("Artifact service returned an unreadable PUT response: " + std::string(e.what()));
    }

    if (normalize_digest(reported) != expected) {
        throw IntegrityError("Artifact service reported hash " + reported + " for content hashing to " + expected);
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.writes++;
    return expected;
}

Bytes HttpArtifactStore::get(const std::string& hash) {
    std::string key = normalize_digest(hash);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.gets++;
    }

    HttpResponse response;
    try {
        response = client_->get("/artifacts/" + key);
    } catch (const HttpClientError& e) {
        if (e.status_code() == 404) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.misses++;
            throw NotFoundError(key);
        }
        throw;
    }

    if (sha256_hex(response.body) != key) {
        throw IntegrityError("Downloaded bytes for " + key + " do not match their hash");
    }
    return std::move(response.body);
}

bool HttpArtifactStore::exists(const std::string& hash) {
    std::string key = normalize_digest(hash);
    try {
        client_->head("/artifacts/" + key);
        return true;
    } catch (const HttpClientError& e) {
        if (e.status_code() == 404) {
            return false;
        }
        throw;
    }
}

std::optional<ArtifactInfo> HttpArtifactStore::info(const std::string& hash) {
    std::string key = normalize_digest(hash);

    HttpResponse response;
    try {
        response = client_->head("/artifacts/" + key);
    } catch (const HttpClientError& e) {
        if (e.status_code() == 404) {
            return std::nullopt;
        }
        throw;
    }

    ArtifactInfo artifact_info;
    artifact_info.hash = key;
    int64_t length = parse_int_header(response.headers, "Content-Length");
    artifact_info.size = length < 0 ? 0 : static_cast<size_t>(length);
    auto it = response.headers.find(CONTENT_TYPE_HEADER);
    if (it != response.headers.end()) {
        artifact_info.content_type = it->second;
    }
    return artifact_info;
}

std::string HttpArtifactStore::describe() const {
    return client_->base_url();
}

StoreStats HttpArtifactStore::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace artifacts
} // namespace thincore
