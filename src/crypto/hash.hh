#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>

namespace tourney {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

private:
    void* ctx_;
};

[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// ============================================================================
// Identifier Derivation
// ============================================================================

// 32-bit match identifier: first four bytes (LE) of SHA3("match" || label).
// Hosts label matches however they like ("round-1/table-3"); the tournament
// only ever sees the hash.
[[nodiscard]] match_id_t derive_match_id(std::string_view label);

// Deterministic tournament identity: SHA3("tournament" || creator || nonce_le)
[[nodiscard]] Address derive_tournament_id(const Address& creator, std::uint64_t nonce);

}  // namespace tourney
