// CROWDFUND - Core Types Header
// Copyright (c) 2024 CROWDFUND Developers
// MIT License
//
// Value types shared by every crowdfund module: amounts, timestamps and the
// fixed-size byte strings used for digests and participant addresses.

#ifndef CROWDFUND_CORE_TYPES_H
#define CROWDFUND_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace crowdfund {

using Byte = uint8_t;

/// Quantity in the smallest unit of a denomination. 128 bits hold about
/// 1.7e20 whole 18-decimal tokens. Never negative in stored state; checked
/// helpers in arith.h guard every sum and product.
using Amount = __int128;

/// Unix epoch seconds
using Timestamp = int64_t;

constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

/// 10^18 base units, one whole token at 18 decimals
constexpr Amount UNIT = 1000000000000000000LL;

constexpr Timestamp SECONDS_PER_DAY = 24 * 60 * 60;

// ============================================================================
// BaseHash
// ============================================================================

/// BITS/8 raw bytes compared and ordered byte by byte. All zero is "null".
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept { bytes_.fill(0); }

    /// Copies min(len, SIZE) bytes and zero-fills the rest
    BaseHash(const Byte* src, size_t len) noexcept {
        bytes_.fill(0);
        if (src != nullptr) {
            std::memcpy(bytes_.data(), src, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
    }
    void SetNull() noexcept { bytes_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }
    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }

    Byte& operator[](size_t i) { return bytes_[i]; }
    const Byte& operator[](size_t i) const { return bytes_[i]; }

    bool operator==(const BaseHash& o) const noexcept { return bytes_ == o.bytes_; }
    bool operator!=(const BaseHash& o) const noexcept { return bytes_ != o.bytes_; }
    bool operator<(const BaseHash& o) const noexcept { return bytes_ < o.bytes_; }

    /// Lowercase hex, first byte first
    std::string ToHex() const;

    /// Exactly SIZE*2 hex digits; throws std::invalid_argument otherwise
    static BaseHash FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> bytes_;
};

using Hash256 = BaseHash<256>;
using Hash160 = BaseHash<160>;

// ============================================================================
// Address
// ============================================================================

/**
 * Stable identifier of a participant: contributor, recipient, fee
 * collector or token contract. The null address stands for "none".
 */
class Address : public Hash160 {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;
    explicit Address(const Hash160& h) : Hash160(h) {}

    /// "0x" followed by 40 lowercase hex digits
    std::string ToString() const { return "0x" + ToHex(); }

    /// Accepts 40 hex digits with or without "0x". `out` is untouched on failure.
    static bool TryParse(const std::string& str, Address& out);
};

inline const Address& NullAddress() {
    static const Address none;
    return none;
}

} // namespace crowdfund

#endif // CROWDFUND_CORE_TYPES_H
