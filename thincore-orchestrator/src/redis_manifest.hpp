/**
 * @file redis_manifest.hpp
 * @brief Manifest stored in Redis
 *
 * Layout:
 *   <prefix>:manifest:<run_id>         list of JSON lines, append order
 *   <prefix>:manifest-index:<run_id>   hash task_key -> first done line
 */

#ifndef THINCORE_REDIS_MANIFEST_HPP
#define THINCORE_REDIS_MANIFEST_HPP

#include "manifest.hpp"
#include <memory>

namespace sw { namespace redis { class Redis; } }

namespace thincore {

class RedisManifestLog : public ManifestLog {
public:
    RedisManifestLog(std::shared_ptr<sw::redis::Redis> redis, const std::string& key_prefix = "thincore");

    void append(const std::string& run_id, const ManifestEntry& entry) override;
    std::vector<ManifestEntry> replay(const std::string& run_id) override;
    std::optional<ManifestEntry> find_done(const std::string& run_id, const std::string& task_key) override;
    std::string describe() const override { return "redis (prefix " + key_prefix_ + ")"; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string key_prefix_;
};

} // namespace thincore

#endif // THINCORE_REDIS_MANIFEST_HPP
