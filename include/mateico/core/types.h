// MATEICO - Core Types Header
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// This file defines fundamental types used throughout MATEICO.

#ifndef MATEICO_CORE_TYPES_H
#define MATEICO_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace mateico {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in base units (10^-18 of a token)
using Amount = unsigned __int128;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Duration = int64_t;

/// Constants
constexpr Amount COIN = 1000000000000000000ULL;  // 1 token = 10^18 base units
constexpr int COIN_DECIMALS = 18;

/// Largest representable amount; used as the "unlimited" allowance
constexpr Amount MAX_AMOUNT = ~static_cast<Amount>(0);

/// Reward rates are expressed per mille of principal
constexpr uint64_t RATE_DENOMINATOR = 1000;

/// Seconds per day
constexpr Duration DAY = 24 * 60 * 60;

/// Seconds per week
constexpr Duration WEEK = 7 * DAY;

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic hash template
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
            std::memcpy(data_.data(), data, std::min(len, SIZE));
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

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators
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

    /// Create from hex string; accepts an optional "0x" prefix
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Caller identity
using Address = Hash160;

/// Stable pool identity
using PoolHash = Hash256;

// ============================================================================
// Hex Helpers
// ============================================================================

/// Convert bytes to lowercase hex string
std::string BytesToHex(const Byte* data, size_t len);

/// Convert hex string to bytes; throws std::invalid_argument on bad input
std::vector<Byte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (an optional "0x" prefix is allowed)
bool IsValidHex(const std::string& str);

} // namespace mateico

#endif // MATEICO_CORE_TYPES_H
