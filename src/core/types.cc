#include "types.hh"
#include <algorithm>

namespace tourney {

// ============================================================================
// Append Helpers
// ============================================================================

void append_u8(std::vector<std::uint8_t>& out, std::uint8_t val) {
    out.push_back(val);
}

void append_u16(std::vector<std::uint8_t>& out, std::uint16_t val) {
    std::array<std::uint8_t, 2> buf;
    encode_u16(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_address(std::vector<std::uint8_t>& out, const Address& addr) {
    out.insert(out.end(), addr.bytes.begin(), addr.bytes.end());
}

// ============================================================================
// ByteReader Implementation
// ============================================================================

std::optional<std::uint8_t> ByteReader::read_u8() {
    if (!has(1)) {
        return std::nullopt;
    }
    return data_[offset_++];
}

std::optional<std::uint16_t> ByteReader::read_u16() {
    if (!has(2)) {
        return std::nullopt;
    }
    auto val = decode_u16(data_.data() + offset_);
    offset_ += 2;
    return val;
}

std::optional<std::uint32_t> ByteReader::read_u32() {
    if (!has(4)) {
        return std::nullopt;
    }
    auto val = decode_u32(data_.data() + offset_);
    offset_ += 4;
    return val;
}

std::optional<std::uint64_t> ByteReader::read_u64() {
    if (!has(8)) {
        return std::nullopt;
    }
    auto val = decode_u64(data_.data() + offset_);
    offset_ += 8;
    return val;
}

std::optional<Address> ByteReader::read_address() {
    if (!has(ADDRESS_SIZE)) {
        return std::nullopt;
    }
    Address addr;
    std::copy_n(data_.data() + offset_, ADDRESS_SIZE, addr.bytes.begin());
    offset_ += ADDRESS_SIZE;
    return addr;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

namespace {

std::optional<std::uint8_t> hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

}  // namespace

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto high = hex_nibble(hex[i]);
        auto low = hex_nibble(hex[i + 1]);
        if (!high || !low) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((*high << 4) | *low));
    }

    return result;
}

std::string wide_to_string(wide_amount_t value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::to_hex() const {
    return "0x" + bytes_to_hex(bytes);
}

std::optional<Address> Address::from_hex(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != ADDRESS_SIZE) {
        return std::nullopt;
    }
    Address addr;
    std::copy(bytes_opt->begin(), bytes_opt->end(), addr.bytes.begin());
    return addr;
}

}  // namespace tourney
