/**
 * @file manifest.cpp
 * @brief Manifest entry encoding and the in-memory log
 */

#include "manifest.hpp"
#include "errors.hpp"
#include "hash/content_hash.hpp"
#include <nlohmann/json.hpp>
#include <chrono>

using json = nlohmann::json;

namespace thincore {

namespace {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

ManifestEntry ManifestEntry::done(
    const std::string& key,
    const std::string& artifact_hash,
    int64_t cost,
    const std::string& type
) {
    ManifestEntry entry;
    entry.task_key = key;
    entry.resolution = artifact_hash;
    entry.cost_charged = cost;
    entry.task_type = type;
    entry.recorded_at_ms = now_epoch_ms();
    return entry;
}

ManifestEntry ManifestEntry::failed(const std::string& key, const std::string& type) {
    ManifestEntry entry;
    entry.task_key = key;
    entry.resolution = RESOLUTION_FAILED;
    entry.cost_charged = 0;
    entry.task_type = type;
    entry.recorded_at_ms = now_epoch_ms();
    return entry;
}

std::string encode_manifest_entry(const ManifestEntry& entry) {
    json j;
    j["task_key"] = entry.task_key;
    j["resolution"] = entry.resolution;
    j["cost_charged"] = entry.cost_charged;
    j["task_type"] = entry.task_type;
    j["recorded_at"] = entry.recorded_at_ms;
    return j.dump();
}

ManifestEntry decode_manifest_entry(const std::string& line) {
    ManifestEntry entry;
    try {
        json j = json::parse(line);
        entry.task_key = j.at("task_key").get<std::string>();
        entry.resolution = j.at("resolution").get<std::string>();
        entry.cost_charged = j.at("cost_charged").get<int64_t>();
        entry.task_type = j.value("task_type", std::string());
        entry.recorded_at_ms = j.value("recorded_at", static_cast<int64_t>(0));
    } catch (const json::exception& e) {
        throw IntegrityError("Corrupt manifest entry: " + std::string(e.what()));
    }

    if (!artifacts::is_valid_digest(entry.task_key)) {
        throw IntegrityError("Manifest entry has malformed task key '" + entry.task_key + "'");
    }
    if (!entry.is_failed() && !artifacts::is_valid_digest(entry.resolution)) {
        throw IntegrityError("Manifest entry for " + entry.task_key +
                             " has malformed resolution '" + entry.resolution + "'");
    }
    if (entry.cost_charged < 0) {
        throw IntegrityError("Manifest entry for " + entry.task_key + " has negative cost");
    }
    return entry;
}

std::map<std::string, ManifestEntry> fold_manifest(const std::vector<ManifestEntry>& entries) {
    std::map<std::string, ManifestEntry> resolved;
    for (const auto& entry : entries) {
        auto it = resolved.find(entry.task_key);
        if (it == resolved.end()) {
            resolved.emplace(entry.task_key, entry);
        } else if (it->second.is_failed() && !entry.is_failed()) {
            // A later success (e.g. a resumed retry) supersedes a failure
            it->second = entry;
        }
    }
    return resolved;
}

int64_t total_cost(const std::vector<ManifestEntry>& entries) {
    int64_t total = 0;
    for (const auto& entry : entries) {
        total += entry.cost_charged;
    }
    return total;
}

void MemoryManifestLog::append(const std::string& run_id, const ManifestEntry& entry) {
    std::string line = encode_manifest_entry(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    lines_[run_id].push_back(std::move(line));
}

void MemoryManifestLog::append_raw(const std::string& run_id, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_[run_id].push_back(line);
}

std::vector<ManifestEntry> MemoryManifestLog::replay(const std::string& run_id) {
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = lines_.find(run_id);
        if (it != lines_.end()) {
            lines = it->second;
        }
    }

    std::vector<ManifestEntry> entries;
    entries.reserve(lines.size());
    for (const auto& line : lines) {
        entries.push_back(decode_manifest_entry(line));
    }
    return entries;
}

std::optional<ManifestEntry> MemoryManifestLog::find_done(const std::string& run_id, const std::string& task_key) {
    for (const auto& entry : replay(run_id)) {
        if (entry.task_key == task_key && !entry.is_failed()) {
            return entry;
        }
    }
    return std::nullopt;
}

} // namespace thincore
