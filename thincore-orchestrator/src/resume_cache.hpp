/**
 * @file resume_cache.hpp
 * @brief Decides whether a task needs to run at all
 *
 * The manifest of a run is replayed into memory once, before any dispatch.
 * After that resolve() answers from memory, checking only that a recorded
 * artifact is still retrievable from the store.
 */

#ifndef THINCORE_RESUME_CACHE_HPP
#define THINCORE_RESUME_CACHE_HPP

#include "logger.hpp"
#include "manifest.hpp"
#include "store/artifact_store.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace thincore {

/**
 * @brief Outcome of a cache lookup
 */
enum class ResolveState {
    RESOLVED,   ///< Output artifact available; skip the task
    PENDING,    ///< Dispatched in this session, awaiting completion
    ABSENT      ///< Must be dispatched
};

struct Resolution {
    ResolveState state;
    std::string artifact_hash;       ///< Set when RESOLVED
    bool from_prior_run;             ///< Found in a consulted prior run, not this run's manifest

    Resolution() : state(ResolveState::ABSENT), from_prior_run(false) {}

    bool is_resolved() const { return state == ResolveState::RESOLVED; }
    bool is_pending() const { return state == ResolveState::PENDING; }
    bool is_absent() const { return state == ResolveState::ABSENT; }
};

/**
 * @brief Cache statistics
 */
struct CacheStats {
    size_t hits = 0;
    size_t prior_run_hits = 0;
    size_t misses = 0;
    size_t lost_artifacts = 0;       ///< Recorded artifact no longer in the store
};

/**
 * @brief Resume/cache manager for one run
 *
 * Usage Example:
 *   @code
 *   ResumeCacheManager cache(manifest, store);
 *   cache.load("exp-1");
 *   auto resolution = cache.resolve(task_key);
 *   if (resolution.is_absent()) {
 *       router.enqueue(envelope);
 *       cache.mark_pending(task_key);
 *   }
 *   @endcode
 *
 * Not thread-safe; owned by the planner.
 */
class ResumeCacheManager {
public:
    ResumeCacheManager(
        std::shared_ptr<ManifestLog> manifest,
        std::shared_ptr<artifacts::ArtifactStore> store,
        Logger* logger = nullptr
    );

    /**
     * @brief Replay the manifest of a run into memory
     *
     * @throws IntegrityError if an entry cannot be decoded
     * @throws TransientIOError if the manifest backend is unavailable
     */
    void load(const std::string& run_id);

    /**
     * @brief Also accept done resolutions recorded by earlier runs
     *
     * Earlier runs are consulted only when this run has no done entry.
     */
    void also_consult(const std::vector<std::string>& prior_run_ids);

    /**
     * @brief Look up a task key
     *
     * Returns ABSENT rather than throwing when the recorded artifact is gone.
     */
    Resolution resolve(const std::string& task_key);

    /**
     * @brief Note that a task has been dispatched in this session
     */
    void mark_pending(const std::string& task_key);

    /**
     * @brief Forget a dispatch that ended without a resolution (cancelled, halted)
     */
    void clear_pending(const std::string& task_key);

    /**
     * @brief Apply an entry that was appended to the manifest during this session
     */
    void record(const ManifestEntry& entry);

    /**
     * @brief Failure recorded for a key in this run, if it has no done entry
     */
    std::optional<ManifestEntry> recorded_failure(const std::string& task_key) const;

    /**
     * @brief Sum of cost charged across this run's replayed and recorded entries
     */
    int64_t recorded_cost() const { return recorded_cost_; }

    size_t entry_count() const { return entries_.size(); }
    const std::string& run_id() const { return run_id_; }
    const CacheStats& get_stats() const { return stats_; }

private:
    std::shared_ptr<ManifestLog> manifest_;
    std::shared_ptr<artifacts::ArtifactStore> store_;
    Logger* logger_;

    std::string run_id_;
    std::map<std::string, ManifestEntry> entries_;      ///< This run, folded
    std::map<std::string, ManifestEntry> prior_done_;   ///< Consulted runs, done only
    std::set<std::string> pending_;
    int64_t recorded_cost_;
    CacheStats stats_;

    bool artifact_available(const std::string& task_key, const std::string& artifact_hash);
};

} // namespace thincore

#endif // THINCORE_RESUME_CACHE_HPP
