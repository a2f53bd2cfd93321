/**
 * @file file_manifest.hpp
 * @brief Manifest stored as JSON lines under the state directory
 */

#ifndef THINCORE_FILE_MANIFEST_HPP
#define THINCORE_FILE_MANIFEST_HPP

#include "manifest.hpp"
#include <filesystem>

namespace thincore {

/**
 * @brief Manifest file per run: <state_dir>/<run_id>.manifest.jsonl
 *
 * Each append is one write(2) of a complete line on an O_APPEND descriptor
 * under an exclusive flock, followed by fsync, so concurrent writers in
 * several processes never interleave and acknowledged entries survive a crash.
 */
class FileManifestLog : public ManifestLog {
public:
    /**
     * @param state_dir Directory for manifest files, created if missing
     * @throws TransientIOError if the directory cannot be created
     */
    explicit FileManifestLog(const std::filesystem::path& state_dir);

    void append(const std::string& run_id, const ManifestEntry& entry) override;
    std::vector<ManifestEntry> replay(const std::string& run_id) override;
    std::optional<ManifestEntry> find_done(const std::string& run_id, const std::string& task_key) override;
    std::string describe() const override { return "file://" + state_dir_.string(); }

    std::filesystem::path path_for(const std::string& run_id) const;

private:
    std::filesystem::path state_dir_;
    std::mutex mutex_;
};

} // namespace thincore

#endif // THINCORE_FILE_MANIFEST_HPP
