#pragma once

#include "hash/content_hash.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace thincore {
namespace artifacts {

/**
 * Attributes of a stored artifact. The hash is the identity; there is no
 * separate ID space.
 */
struct ArtifactInfo {
    std::string hash;                                  ///< SHA-256 hex digest
    size_t size = 0;                                   ///< Byte length
    std::string content_type;                          ///< Advisory only, never used for parsing
    std::chrono::system_clock::time_point created_at;  ///< First time the bytes were stored
};

/**
 * Store statistics
 */
struct StoreStats {
    size_t puts = 0;              ///< put() calls
    size_t writes = 0;            ///< puts that actually wrote new bytes
    size_t deduplicated = 0;      ///< puts satisfied by an existing artifact
    size_t gets = 0;
    size_t misses = 0;
};

/**
 * Content-addressed blob storage.
 *
 * Contract:
 * - put(bytes) returns the SHA-256 of the bytes; storing identical bytes again
 *   returns the same hash and performs no second write
 * - get(hash) returns exactly the stored bytes or throws NotFoundError
 * - Content is never transformed, parsed or re-encoded
 *
 * Failure modes:
 * - Backend unavailable: TransientIOError (after the backend's own retries)
 * - Stored bytes do not match their hash: IntegrityError
 *
 * Implementations must be safe to call from several threads.
 */
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    /**
     * Store bytes and return their hash
     * @param bytes Raw content
     * @param content_type Optional advisory hint recorded with the artifact
     */
    virtual std::string put(const Bytes& bytes, const std::string& content_type = "") = 0;

    /**
     * Fetch bytes by hash
     * @throws NotFoundError if absent
     * @throws IntegrityError if the stored bytes hash differently
     */
    virtual Bytes get(const std::string& hash) = 0;

    /**
     * Check whether an artifact is retrievable
     */
    virtual bool exists(const std::string& hash) = 0;

    /**
     * Metadata lookup, std::nullopt if absent
     */
    virtual std::optional<ArtifactInfo> info(const std::string& hash) = 0;

    /**
     * Short description for logs ("memory", "file:///var/thincore", ...)
     */
    virtual std::string describe() const = 0;

    virtual StoreStats get_stats() const = 0;
};

} // namespace artifacts
} // namespace thincore
