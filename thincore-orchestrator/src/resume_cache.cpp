/**
 * @file resume_cache.cpp
 * @brief Resume/cache manager implementation
 */

#include "resume_cache.hpp"
#include "errors.hpp"

namespace thincore {

ResumeCacheManager::ResumeCacheManager(
    std::shared_ptr<ManifestLog> manifest,
    std::shared_ptr<artifacts::ArtifactStore> store,
    Logger* logger
)
    : manifest_(std::move(manifest))
    , store_(std::move(store))
    , logger_(logger ? logger : &Logger::get_instance())
    , recorded_cost_(0)
{
    if (!manifest_ || !store_) {
        throw ConfigurationError("ResumeCacheManager requires a manifest and an artifact store");
    }
}

void ResumeCacheManager::load(const std::string& run_id) {
    std::vector<ManifestEntry> replayed = manifest_->replay(run_id);

    run_id_ = run_id;
    entries_ = fold_manifest(replayed);
    recorded_cost_ = total_cost(replayed);
    pending_.clear();
    stats_ = CacheStats();

    LogContext ctx(run_id);
    ctx.phase = "load";
    logger_->log_info(ctx, "Manifest replayed", {
        {"entries", std::to_string(replayed.size())},
        {"task_keys", std::to_string(entries_.size())},
        {"cost_units", std::to_string(recorded_cost_)}
    });
}

void ResumeCacheManager::also_consult(const std::vector<std::string>& prior_run_ids) {
    for (const auto& prior : prior_run_ids) {
        if (prior == run_id_) {
            continue;
        }
        for (const auto& [key, entry] : fold_manifest(manifest_->replay(prior))) {
            if (!entry.is_failed()) {
                prior_done_.emplace(key, entry);
            }
        }
    }
}

bool ResumeCacheManager::artifact_available(const std::string& task_key, const std::string& artifact_hash) {
    if (store_->exists(artifact_hash)) {
        return true;
    }

    stats_.lost_artifacts++;
    LogContext ctx(run_id_);
    ctx.task_key = task_key;
    ctx.phase = "resolve";
    logger_->log_warning(ctx, "Recorded artifact " + artifact_hash + " is missing from the store; recomputing");
    return false;
}

Resolution ResumeCacheManager::resolve(const std::string& task_key) {
    Resolution resolution;

    if (pending_.count(task_key)) {
        resolution.state = ResolveState::PENDING;
        return resolution;
    }

    auto it = entries_.find(task_key);
    if (it != entries_.end() && !it->second.is_failed()) {
        if (artifact_available(task_key, it->second.resolution)) {
            stats_.hits++;
            resolution.state = ResolveState::RESOLVED;
            resolution.artifact_hash = it->second.resolution;
            return resolution;
        }
        // Let the recomputed result replace the lost one when it is recorded
        entries_.erase(it);
    } else {
        auto prior = prior_done_.find(task_key);
        if (prior != prior_done_.end() && artifact_available(task_key, prior->second.resolution)) {
            stats_.prior_run_hits++;
            resolution.state = ResolveState::RESOLVED;
            resolution.artifact_hash = prior->second.resolution;
            resolution.from_prior_run = true;
            return resolution;
        }
    }

    stats_.misses++;
    resolution.state = ResolveState::ABSENT;
    return resolution;
}

void ResumeCacheManager::mark_pending(const std::string& task_key) {
    pending_.insert(task_key);
}

void ResumeCacheManager::clear_pending(const std::string& task_key) {
    pending_.erase(task_key);
}

void ResumeCacheManager::record(const ManifestEntry& entry) {
    pending_.erase(entry.task_key);
    recorded_cost_ += entry.cost_charged;

    auto it = entries_.find(entry.task_key);
    if (it == entries_.end()) {
        entries_.emplace(entry.task_key, entry);
    } else if (it->second.is_failed() && !entry.is_failed()) {
        it->second = entry;
    }
}

std::optional<ManifestEntry> ResumeCacheManager::recorded_failure(const std::string& task_key) const {
    auto it = entries_.find(task_key);
    if (it != entries_.end() && it->second.is_failed()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace thincore
