#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>
#include <functional>

namespace tourney {

// ============================================================================
// Size Constants
// ============================================================================

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Identities are 32-byte public keys / derived addresses
inline constexpr std::size_t ADDRESS_SIZE = HASH_SIZE;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;

// Basis points: 10000 == 100%
using bps_t = std::uint16_t;

// Smallest indivisible unit of value held by a vault
using amount_t = std::uint64_t;

// Accumulator width for pool arithmetic
using wide_amount_t = unsigned __int128;

using match_id_t = std::uint32_t;
using player_count_t = std::uint8_t;
using unix_time_t = std::int64_t;

// ============================================================================
// Address (player, authority, tournament and vault identities)
// ============================================================================

struct Address {
    std::array<std::uint8_t, ADDRESS_SIZE> bytes{};

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    // Fill every byte with one value (test fixtures, well-known ids)
    [[nodiscard]] static Address filled(std::uint8_t value) {
        Address addr;
        addr.bytes.fill(value);
        return addr;
    }

    // The default (all-zero) identity is never a valid player
    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] auto begin() const { return bytes.begin(); }
    [[nodiscard]] auto end() const { return bytes.end(); }

    auto operator<=>(const Address&) const = default;
};

// ============================================================================
// Time Utilities
// ============================================================================

[[nodiscard]] inline unix_time_t unix_now() {
    return static_cast<unix_time_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    for (std::size_t i = 0; i < 4; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (i * 8));
    }
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (i * 8));
    }
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           static_cast<std::uint16_t>(static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    std::uint32_t val = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        val |= static_cast<std::uint32_t>(src[i]) << (i * 8);
    }
    return val;
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (i * 8);
    }
    return val;
}

// Append helpers for variable-length encodings
void append_u8(std::vector<std::uint8_t>& out, std::uint8_t val);
void append_u16(std::vector<std::uint8_t>& out, std::uint16_t val);
void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val);
void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val);
void append_address(std::vector<std::uint8_t>& out, const Address& addr);

// Bounds-checked sequential reader over an encoded buffer
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data)
        : data_(data) {}

    [[nodiscard]] std::optional<std::uint8_t> read_u8();
    [[nodiscard]] std::optional<std::uint16_t> read_u16();
    [[nodiscard]] std::optional<std::uint32_t> read_u32();
    [[nodiscard]] std::optional<std::uint64_t> read_u64();
    [[nodiscard]] std::optional<Address> read_address();

    [[nodiscard]] std::size_t remaining() const { return data_.size() - offset_; }

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;

    [[nodiscard]] bool has(std::size_t n) const { return remaining() >= n; }
};

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// Decimal rendering of a 128-bit accumulator (for logs and events)
[[nodiscard]] std::string wide_to_string(wide_amount_t value);

}  // namespace tourney

// ============================================================================
// Hash specialization for Address (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<tourney::Address> {
    std::size_t operator()(const tourney::Address& addr) const noexcept {
        // FNV-1a
        constexpr std::size_t FNV_OFFSET = 14695981039346656037ULL;
        constexpr std::size_t FNV_PRIME = 1099511628211ULL;
        std::size_t h = FNV_OFFSET;
        for (auto b : addr.bytes) {
            h ^= b;
            h *= FNV_PRIME;
        }
        return h;
    }
};

}  // namespace std
