/**
 * @file manifest.hpp
 * @brief Append-only record of task resolutions per run
 *
 * The manifest is the single source of truth for resume: for every task key
 * ever resolved in a run it records the output artifact (or a failure marker)
 * and the cost charged. Entries are JSON lines:
 *
 *   {"task_key":"<hex>","resolution":"<hex>"|"failed","cost_charged":<units>,
 *    "task_type":"llm","recorded_at":<epoch ms>}
 */

#ifndef THINCORE_MANIFEST_HPP
#define THINCORE_MANIFEST_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace thincore {

/// Resolution value marking a terminal failure
constexpr const char* RESOLUTION_FAILED = "failed";

/**
 * @brief One manifest line
 */
struct ManifestEntry {
    std::string task_key;
    std::string resolution;          ///< Artifact hash, or "failed"
    int64_t cost_charged;            ///< Cost units
    std::string task_type;
    int64_t recorded_at_ms;          ///< Unix epoch milliseconds

    ManifestEntry() : cost_charged(0), recorded_at_ms(0) {}

    bool is_failed() const { return resolution == RESOLUTION_FAILED; }

    static ManifestEntry done(const std::string& key, const std::string& artifact_hash,
                              int64_t cost, const std::string& type);
    static ManifestEntry failed(const std::string& key, const std::string& type);
};

/**
 * @brief Serialize to one JSON line (no trailing newline)
 */
std::string encode_manifest_entry(const ManifestEntry& entry);

/**
 * @brief Parse one JSON line
 * @throws IntegrityError if the line is not a valid entry
 */
ManifestEntry decode_manifest_entry(const std::string& line);

/**
 * @brief Fold a replayed log into one resolution per task key
 *
 * A done resolution is never replaced by a later failure, and among several
 * done entries for the same key the first one wins.
 */
std::map<std::string, ManifestEntry> fold_manifest(const std::vector<ManifestEntry>& entries);

/**
 * @brief Sum of cost charged over all entries
 */
int64_t total_cost(const std::vector<ManifestEntry>& entries);

/**
 * @brief Manifest storage interface
 *
 * append must be atomic with respect to concurrent writers: entries are never
 * interleaved or lost. Backend failures surface as TransientIOError; entries
 * that cannot be decoded surface as IntegrityError.
 */
class ManifestLog {
public:
    virtual ~ManifestLog() = default;

    virtual void append(const std::string& run_id, const ManifestEntry& entry) = 0;

    /**
     * @brief All entries of a run in append order
     */
    virtual std::vector<ManifestEntry> replay(const std::string& run_id) = 0;

    /**
     * @brief First done entry for a task key, if any
     */
    virtual std::optional<ManifestEntry> find_done(const std::string& run_id, const std::string& task_key) = 0;

    virtual std::string describe() const = 0;
};

/**
 * @brief Manifest held in memory (tests)
 */
class MemoryManifestLog : public ManifestLog {
public:
    void append(const std::string& run_id, const ManifestEntry& entry) override;
    std::vector<ManifestEntry> replay(const std::string& run_id) override;
    std::optional<ManifestEntry> find_done(const std::string& run_id, const std::string& task_key) override;
    std::string describe() const override { return "memory"; }

    /// Append a raw line, bypassing encoding. Simulates a corrupted log in tests.
    void append_raw(const std::string& run_id, const std::string& line);

private:
    std::mutex mutex_;
    std::map<std::string, std::vector<std::string>> lines_;
};

} // namespace thincore

#endif // THINCORE_MANIFEST_HPP
