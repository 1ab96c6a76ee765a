#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <stdexcept>

namespace tourney {

namespace {

constexpr std::string_view MATCH_DOMAIN = "match";
constexpr std::string_view TOURNAMENT_DOMAIN = "tournament";

EVP_MD_CTX* as_ctx(void* ctx) {
    return static_cast<EVP_MD_CTX*>(ctx);
}

}  // namespace

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

SHA3Hasher::SHA3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA3-256");
        EVP_MD_CTX_free(as_ctx(ctx_));
        throw std::runtime_error("Failed to initialize SHA3-256");
    }
}

SHA3Hasher::~SHA3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(as_ctx(ctx_));
    }
}

SHA3Hasher::SHA3Hasher(SHA3Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(as_ctx(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(std::string_view text) {
    update(text.data(), text.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(as_ctx(ctx_), data, len) != 1) {
        log::crypto.error("SHA3-256 update failed");
        throw std::runtime_error("SHA3-256 update failed");
    }
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(as_ctx(ctx_), result.data(), &len) != 1) {
        log::crypto.error("SHA3-256 finalize failed");
        throw std::runtime_error("SHA3-256 finalize failed");
    }
    return result;
}

hash_t sha3_256(std::span<const std::uint8_t> data) {
    return sha3_256(data.data(), data.size());
}

hash_t sha3_256(const void* data, std::size_t len) {
    SHA3Hasher hasher;
    hasher.update(data, len);
    return hasher.finalize();
}

// ============================================================================
// Identifier Derivation
// ============================================================================

match_id_t derive_match_id(std::string_view label) {
    SHA3Hasher hasher;
    hasher.update(MATCH_DOMAIN);
    hasher.update(label);
    hash_t digest = hasher.finalize();
    return decode_u32(digest.data());
}

Address derive_tournament_id(const Address& creator, std::uint64_t nonce) {
    std::array<std::uint8_t, 8> nonce_bytes;
    encode_u64(nonce_bytes.data(), nonce);

    SHA3Hasher hasher;
    hasher.update(TOURNAMENT_DOMAIN);
    hasher.update(creator.bytes);
    hasher.update(nonce_bytes);

    Address id;
    id.bytes = hasher.finalize();
    return id;
}

}  // namespace tourney
