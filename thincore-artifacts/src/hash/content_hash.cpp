#include "hash/content_hash.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace thincore {
namespace artifacts {

namespace {

const char HEX_CHARS[] = "0123456789abcdef";

std::string encode_hex(const unsigned char* data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(HEX_CHARS[(data[i] >> 4) & 0x0F]);
        out.push_back(HEX_CHARS[data[i] & 0x0F]);
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

struct Sha256Builder::Impl {
    EVP_MD_CTX* ctx;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
            throw IntegrityError("Failed to initialize SHA-256 context");
        }
    }

    ~Impl() {
        EVP_MD_CTX_free(ctx);
    }
};

Sha256Builder::Sha256Builder()
    : impl_(std::make_unique<Impl>())
    , finished_(false)
{
}

Sha256Builder::~Sha256Builder() = default;

Sha256Builder& Sha256Builder::update(const void* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Sha256Builder::update called after hex_digest");
    }
    if (size > 0 && EVP_DigestUpdate(impl_->ctx, data, size) != 1) {
        throw IntegrityError("SHA-256 update failed");
    }
    return *this;
}

Sha256Builder& Sha256Builder::update(const std::string& bytes) {
    return update(bytes.data(), bytes.size());
}

Sha256Builder& Sha256Builder::update_framed(const std::string& bytes) {
    unsigned char length_prefix[8];
    uint64_t length = bytes.size();
    for (int i = 7; i >= 0; --i) {
        length_prefix[i] = static_cast<unsigned char>(length & 0xFF);
        length >>= 8;
    }
    update(length_prefix, sizeof(length_prefix));
    return update(bytes);
}

std::string Sha256Builder::hex_digest() {
    if (finished_) {
        throw std::logic_error("Sha256Builder::hex_digest called twice");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, digest, &digest_len) != 1) {
        throw IntegrityError("SHA-256 finalization failed");
    }
    finished_ = true;
    return encode_hex(digest, digest_len);
}

std::string sha256_hex(const void* data, std::size_t size) {
    Sha256Builder builder;
    builder.update(data, size);
    return builder.hex_digest();
}

bool is_valid_digest(const std::string& value) {
    if (value.size() != DIGEST_HEX_LENGTH) {
        return false;
    }
    return std::all_of(value.begin(), value.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::string normalize_digest(const std::string& value) {
    std::string digest = value;
    const std::string prefix = DIGEST_PREFIX;
    if (digest.compare(0, prefix.size(), prefix) == 0) {
        digest = digest.substr(prefix.size());
    }
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (!is_valid_digest(digest)) {
        throw IntegrityError("Malformed digest: '" + value + "'");
    }
    return digest;
}

std::string to_hex(const Bytes& bytes) {
    return encode_hex(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

Bytes from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw IntegrityError("Hex string has odd length");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw IntegrityError("Invalid hex character in '" + hex.substr(i, 2) + "'");
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

} // namespace artifacts
} // namespace thincore
