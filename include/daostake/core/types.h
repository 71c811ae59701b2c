// DAOSTAKE - Core Types Header
// Copyright (c) 2024 DAOSTAKE Developers
// MIT License
//
// This file defines fundamental types used throughout DAOSTAKE.

#ifndef DAOSTAKE_CORE_TYPES_H
#define DAOSTAKE_CORE_TYPES_H

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace daostake {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units. Overflow and negative results throw.
using Amount = boost::multiprecision::checked_uint256_t;

/// Block height as reported by the host chain
using BlockNumber = uint64_t;

/// Index of a pool in the engine's append-only pool list
using PoolId = uint32_t;

/// Decimals used by the reward token and the staked assets
constexpr int TOKEN_DECIMALS = 18;

/// 10^decimals as an Amount
Amount PowerOfTen(int decimals);

/// One whole token (10^18 base units)
inline Amount Coin() {
    return PowerOfTen(TOKEN_DECIMALS);
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-width identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to hex string (storage byte order)
    std::string ToHex() const;

    /// Parse from hex string, nullopt on bad length or characters
    static std::optional<BaseHash> FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    explicit Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static std::optional<Hash160> FromHex(const std::string& hex) {
        auto base = BaseHash<160>::FromHex(hex);
        if (!base) {
            return std::nullopt;
        }
        return Hash160(*base);
    }
};

/// Account or contract identity on the host chain
using Address = Hash160;

// ============================================================================
// Amount Formatting
// ============================================================================

/// Format an amount as a decimal string (e.g., "12.5")
std::string FormatAmount(const Amount& amount, int decimals = TOKEN_DECIMALS);

/// Parse a decimal string into base units. Rejects signs, garbage,
/// excess fractional digits and values that do not fit.
std::optional<Amount> ParseAmount(const std::string& str, int decimals = TOKEN_DECIMALS);

/// Integer-only decimal string of the raw base units
inline std::string AmountToString(const Amount& amount) {
    return amount.str();
}

} // namespace daostake

#endif // DAOSTAKE_CORE_TYPES_H
