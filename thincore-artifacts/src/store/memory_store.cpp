#include "store/memory_store.hpp"
#include "errors.hpp"

namespace thincore {
namespace artifacts {

std::string MemoryArtifactStore::put(const Bytes& bytes, const std::string& content_type) {
    std::string hash = sha256_hex(bytes);

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.puts++;

    if (entries_.find(hash) != entries_.end()) {
        stats_.deduplicated++;
        return hash;
    }

    Entry entry;
    entry.info.hash = hash;
    entry.info.size = bytes.size();
    entry.info.content_type = content_type;
    entry.info.created_at = std::chrono::system_clock::now();
    entry.bytes = bytes;
    entries_.emplace(hash, std::move(entry));
    stats_.writes++;

    return hash;
}

Bytes MemoryArtifactStore::get(const std::string& hash) {
    std::string key = normalize_digest(hash);

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.gets++;

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        stats_.misses++;
        throw NotFoundError(key);
    }

    if (sha256_hex(it->second.bytes) != key) {
        throw IntegrityError("Stored bytes for " + key + " no longer match their hash");
    }
    return it->second.bytes;
}

bool MemoryArtifactStore::exists(const std::string& hash) {
    std::string key = normalize_digest(hash);
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

std::optional<ArtifactInfo> MemoryArtifactStore::info(const std::string& hash) {
    std::string key = normalize_digest(hash);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

StoreStats MemoryArtifactStore::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t MemoryArtifactStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool MemoryArtifactStore::erase(const std::string& hash) {
    std::string key = normalize_digest(hash);
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.erase(key) > 0;
}

void MemoryArtifactStore::corrupt(const std::string& hash, const Bytes& bytes) {
    std::string key = normalize_digest(hash);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.bytes = bytes;
    }
}

} // namespace artifacts
} // namespace thincore
