#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace thincore {
namespace artifacts {

/**
 * Raw byte payload stored and exchanged by the core.
 *
 * std::string is used as the byte container: it is binary safe and is what
 * libcurl and the Redis client hand back.
 */
using Bytes = std::string;

/// Length of a SHA-256 digest in lowercase hex
constexpr std::size_t DIGEST_HEX_LENGTH = 64;

/// Optional prefix accepted on digests coming from outside ("sha256:<hex>")
constexpr const char* DIGEST_PREFIX = "sha256:";

/**
 * SHA-256 over raw bytes, returned as 64 lowercase hex characters
 */
std::string sha256_hex(const void* data, std::size_t size);

inline std::string sha256_hex(const Bytes& bytes) {
    return sha256_hex(bytes.data(), bytes.size());
}

/**
 * Incremental SHA-256, used where the digest covers several fields
 */
class Sha256Builder {
public:
    Sha256Builder();
    ~Sha256Builder();

    Sha256Builder(const Sha256Builder&) = delete;
    Sha256Builder& operator=(const Sha256Builder&) = delete;

    Sha256Builder& update(const void* data, std::size_t size);
    Sha256Builder& update(const std::string& bytes);

    /// Appends an 8-byte big-endian length followed by the bytes
    Sha256Builder& update_framed(const std::string& bytes);

    /// Finishes the digest. The builder cannot be updated afterwards.
    std::string hex_digest();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finished_;
};

/**
 * True if value is exactly 64 lowercase hex characters
 */
bool is_valid_digest(const std::string& value);

/**
 * Strips an optional "sha256:" prefix and lower-cases the digest.
 *
 * @throws IntegrityError if the result is not a valid digest
 */
std::string normalize_digest(const std::string& value);

/**
 * Hex encoding helpers for opaque blobs carried inside JSON
 */
std::string to_hex(const Bytes& bytes);
Bytes from_hex(const std::string& hex);

} // namespace artifacts
} // namespace thincore
