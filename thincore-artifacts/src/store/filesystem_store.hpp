#pragma once

#include "store/artifact_store.hpp"
#include <filesystem>
#include <mutex>

namespace thincore {
namespace artifacts {

/**
 * Artifact store on a local or shared filesystem
 *
 * Layout:
 *   <root>/<first two hex chars>/<hash>.blob   header + raw bytes
 *   <root>/<first two hex chars>/<hash>.meta   JSON metadata (content type, size, created_at)
 *
 * Features:
 * - Writes land in a temp file and are published with an atomic rename, so
 *   concurrent writers of the same content are safe and readers never see a
 *   partial blob
 * - Every read re-hashes the payload and rejects mismatches
 * - Blob header (magic, format version, payload length) detects truncation
 */
class FilesystemArtifactStore : public ArtifactStore {
public:
    /**
     * Constructor
     * @param root Store directory, created if missing
     * @throws TransientIOError if the directory cannot be created
     */
    explicit FilesystemArtifactStore(const std::filesystem::path& root);

    std::string put(const Bytes& bytes, const std::string& content_type = "") override;
    Bytes get(const std::string& hash) override;
    bool exists(const std::string& hash) override;
    std::optional<ArtifactInfo> info(const std::string& hash) override;
    std::string describe() const override { return "file://" + root_.string(); }
    StoreStats get_stats() const override;

    const std::filesystem::path& root() const { return root_; }

    /// Path of the blob file for a hash (exposed for tests and tooling)
    std::filesystem::path blob_path(const std::string& hash) const;

private:
    std::filesystem::path root_;
    mutable std::mutex stats_mutex_;
    StoreStats stats_;

    std::filesystem::path meta_path(const std::string& hash) const;
    void write_blob(const std::string& hash, const Bytes& bytes);
    void write_meta(const std::string& hash, const ArtifactInfo& info);
    Bytes read_blob(const std::string& hash) const;
    std::filesystem::path temp_path_for(const std::filesystem::path& target) const;
};

} // namespace artifacts
} // namespace thincore
