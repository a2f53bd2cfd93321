#include "store/filesystem_store.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <fstream>
#include <sstream>
#include <unistd.h>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace thincore {
namespace artifacts {

namespace {

constexpr uint8_t BLOB_MAGIC = 0x54;    // 'T'
constexpr uint8_t BLOB_VERSION = 1;
constexpr size_t BLOB_HEADER_SIZE = 1 + 1 + sizeof(uint64_t);

std::atomic<uint64_t> temp_counter{0};

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

FilesystemArtifactStore::FilesystemArtifactStore(const fs::path& root)
    : root_(root)
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw TransientIOError("Cannot create artifact directory " + root_.string() + ": " + ec.message());
    }
}

fs::path FilesystemArtifactStore::blob_path(const std::string& hash) const {
    return root_ / hash.substr(0, 2) / (hash + ".blob");
}

fs::path FilesystemArtifactStore::meta_path(const std::string& hash) const {
    return root_ / hash.substr(0, 2) / (hash + ".meta");
}

fs::path FilesystemArtifactStore::temp_path_for(const fs::path& target) const {
    std::ostringstream name;
    name << target.filename().string() << ".tmp." << ::getpid() << "." << temp_counter.fetch_add(1);
    return target.parent_path() / name.str();
}

std::string FilesystemArtifactStore::put(const Bytes& bytes, const std::string& content_type) {
    std::string hash = sha256_hex(bytes);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.puts++;
    }

    if (exists(hash)) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.deduplicated++;
        return hash;
    }

    std::error_code ec;
    fs::create_directories(blob_path(hash).parent_path(), ec);
    if (ec) {
        throw TransientIOError("Cannot create shard directory for " + hash + ": " + ec.message());
    }

    ArtifactInfo artifact_info;
    artifact_info.hash = hash;
    artifact_info.size = bytes.size();
    artifact_info.content_type = content_type;
    artifact_info.created_at = std::chrono::system_clock::now();

    // Metadata first: a blob is only visible once complete, and its sidecar is
    // already in place by then.
    write_meta(hash, artifact_info);
    write_blob(hash, bytes);

    // Read back what was published. Another writer may have won the rename,
    // which is fine as long as the content is identical.
    Bytes stored = read_blob(hash);
    if (sha256_hex(stored) != hash) {
        throw IntegrityError("Hash mismatch after writing " + hash);
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.writes++;
    return hash;
}

void FilesystemArtifactStore::write_blob(const std::string& hash, const Bytes& bytes) {
    fs::path target = blob_path(hash);
    fs::path temp = temp_path_for(target);

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw TransientIOError("Cannot open " + temp.string() + " for writing");
        }

        uint8_t magic = BLOB_MAGIC;
        file.write(reinterpret_cast<const char*>(&magic), sizeof(magic));

        uint8_t version = BLOB_VERSION;
        file.write(reinterpret_cast<const char*>(&version), sizeof(version));

        uint64_t data_len = bytes.size();
        file.write(reinterpret_cast<const char*>(&data_len), sizeof(data_len));

        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file.good()) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            throw TransientIOError("Short write for artifact " + hash);
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw TransientIOError("Cannot publish artifact " + hash + ": " + ec.message());
    }
}

void FilesystemArtifactStore::write_meta(const std::string& hash, const ArtifactInfo& artifact_info) {
    fs::path target = meta_path(hash);
    fs::path temp = temp_path_for(target);

    json j;
    j["hash"] = artifact_info.hash;
    j["size"] = artifact_info.size;
    j["content_type"] = artifact_info.content_type;
    j["created_at_ms"] = to_epoch_ms(artifact_info.created_at);

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            throw TransientIOError("Cannot open " + temp.string() + " for writing");
        }
        file << j.dump();
        if (!file.good()) {
            throw TransientIOError("Short write for metadata of " + hash);
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw TransientIOError("Cannot publish metadata for " + hash + ": " + ec.message());
    }
}

Bytes FilesystemArtifactStore::read_blob(const std::string& hash) const {
    fs::path path = blob_path(hash);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        if (!fs::exists(path)) {
            throw NotFoundError(hash);
        }
        throw TransientIOError("Cannot open " + path.string());
    }

    uint8_t magic = 0;
    file.read(reinterpret_cast<char*>(&magic), sizeof(magic));
    if (!file || magic != BLOB_MAGIC) {
        throw IntegrityError("Bad blob header for " + hash);
    }

    uint8_t version = 0;
    file.read(reinterpret_cast<char*>(&version), sizeof(version));
    if (!file || version != BLOB_VERSION) {
        throw IntegrityError("Unsupported blob version " + std::to_string(version) + " for " + hash);
    }

    uint64_t data_len = 0;
    file.read(reinterpret_cast<char*>(&data_len), sizeof(data_len));
    if (!file) {
        throw IntegrityError("Truncated blob header for " + hash);
    }

    std::error_code ec;
    auto file_size = fs::file_size(path, ec);
    if (ec || file_size != BLOB_HEADER_SIZE + data_len) {
        throw IntegrityError("Blob length mismatch for " + hash);
    }

    Bytes bytes(static_cast<size_t>(data_len), '\0');
    file.read(&bytes[0], static_cast<std::streamsize>(data_len));
    if (static_cast<uint64_t>(file.gcount()) != data_len) {
        throw IntegrityError("Truncated blob payload for " + hash);
    }
    return bytes;
}

Bytes FilesystemArtifactStore::get(const std::string& hash) {
    std::string key = normalize_digest(hash);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.gets++;
    }

    Bytes bytes;
    try {
        bytes = read_blob(key);
    } catch (const NotFoundError&) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.misses++;
        throw;
    }

    if (sha256_hex(bytes) != key) {
        throw IntegrityError("Stored bytes for " + key + " no longer match their hash");
    }
    return bytes;
}

bool FilesystemArtifactStore::exists(const std::string& hash) {
    std::string key = normalize_digest(hash);
    std::error_code ec;
    bool present = fs::exists(blob_path(key), ec);
    if (ec) {
        throw TransientIOError("Cannot stat artifact " + key + ": " + ec.message());
    }
    return present;
}

std::optional<ArtifactInfo> FilesystemArtifactStore::info(const std::string& hash) {
    std::string key = normalize_digest(hash);
    if (!exists(key)) {
        return std::nullopt;
    }

    ArtifactInfo artifact_info;
    artifact_info.hash = key;

    std::ifstream file(meta_path(key));
    if (file.is_open()) {
        try {
            json j = json::parse(file);
            artifact_info.size = j.value("size", static_cast<size_t>(0));
            artifact_info.content_type = j.value("content_type", std::string());
            artifact_info.created_at = from_epoch_ms(j.value("created_at_ms", static_cast<int64_t>(0)));
            return artifact_info;
        } catch (const json::exception&) {
            // Metadata is advisory; fall back to the blob itself
        }
    }

    std::error_code ec;
    auto file_size = fs::file_size(blob_path(key), ec);
    artifact_info.size = (ec || file_size < BLOB_HEADER_SIZE) ? 0 : file_size - BLOB_HEADER_SIZE;
    return artifact_info;
}

StoreStats FilesystemArtifactStore::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace artifacts
} // namespace thincore
