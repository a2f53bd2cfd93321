#pragma once

#include "store/artifact_store.hpp"
#include <map>
#include <mutex>

namespace thincore {
namespace artifacts {

/**
 * In-process artifact store.
 *
 * Used by local mode and tests. Content lives as long as the store object.
 */
class MemoryArtifactStore : public ArtifactStore {
public:
    MemoryArtifactStore() = default;

    std::string put(const Bytes& bytes, const std::string& content_type = "") override;
    Bytes get(const std::string& hash) override;
    bool exists(const std::string& hash) override;
    std::optional<ArtifactInfo> info(const std::string& hash) override;
    std::string describe() const override { return "memory"; }
    StoreStats get_stats() const override;

    /// Number of distinct artifacts held
    size_t size() const;

    /// Drop an artifact. Simulates external data loss in tests.
    bool erase(const std::string& hash);

    /// Overwrite stored bytes without rehashing. Simulates corruption in tests.
    void corrupt(const std::string& hash, const Bytes& bytes);

private:
    struct Entry {
        ArtifactInfo info;
        Bytes bytes;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    StoreStats stats_;
};

} // namespace artifacts
} // namespace thincore
