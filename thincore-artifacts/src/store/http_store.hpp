#pragma once

#include "store/artifact_store.hpp"
#include "api/http_client.hpp"
#include <memory>
#include <mutex>

namespace thincore {
namespace artifacts {

/**
 * Client for a remote artifact service
 *
 * API:
 *   PUT  /artifacts          body: raw bytes  -> {"hash": "<hex>"}
 *   GET  /artifacts/{hash}                    -> raw bytes, or 404
 *   HEAD /artifacts/{hash}                    -> 200, or 404
 *
 * The service's reported hash and every downloaded payload are checked
 * against a locally computed SHA-256; any disagreement is an IntegrityError.
 */
class HttpArtifactStore : public ArtifactStore {
public:
    /**
     * Constructor
     * @param base_url Service URL (e.g., "http://artifacts:9000")
     * @param timeout_ms Per-request timeout
     */
    explicit HttpArtifactStore(const std::string& base_url, int timeout_ms = 30000);

    std::string put(const Bytes& bytes, const std::string& content_type = "") override;
    Bytes get(const std::string& hash) override;
    bool exists(const std::string& hash) override;
    std::optional<ArtifactInfo> info(const std::string& hash) override;
    std::string describe() const override;
    StoreStats get_stats() const override;

    void set_retry_policy(const RetryPolicy& policy) { client_->set_retry_policy(policy); }
    void set_debug(bool debug) { client_->set_debug(debug); }

private:
    std::unique_ptr<HttpClient> client_;
    mutable std::mutex stats_mutex_;
    StoreStats stats_;
};

} // namespace artifacts
} // namespace thincore
