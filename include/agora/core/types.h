// AGORA - Core Types Header
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// This file defines fundamental types used throughout AGORA.

#ifndef AGORA_CORE_TYPES_H
#define AGORA_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace agora {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest units. Unsigned, no implicit precision loss.
using Amount = uint64_t;

/// Timestamp (milliseconds since the Unix epoch)
using Timestamp = uint64_t;

/// Duration in milliseconds
using Duration = uint64_t;

/// Fixed-point fraction scaled by QUORUM_RATE_SCALE
using FixedPoint = uint64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = UINT64_MAX;

/// Add two amounts, returning false on overflow
inline bool CheckedAdd(Amount a, Amount b, Amount& out) {
    if (a > MAX_AMOUNT - b) return false;
    out = a + b;
    return true;
}

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
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
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

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    explicit Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    explicit Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

// ============================================================================
// Type-safe Identifiers
// ============================================================================

/// Account address of a token holder
using Address = Hash160;

/// Identity of one DAO instance (one per governance token type)
class DaoId : public Hash256 {
public:
    DaoId() = default;
    explicit DaoId(const Hash256& h) : Hash256(h) {}
};

/// Proposal identifier
class ProposalId : public Hash256 {
public:
    ProposalId() = default;
    explicit ProposalId(const Hash256& h) : Hash256(h) {}
};

/// Vote receipt identifier
class ReceiptId : public Hash256 {
public:
    ReceiptId() = default;
    explicit ReceiptId(const Hash256& h) : Hash256(h) {}
};

} // namespace agora

#endif // AGORA_CORE_TYPES_H
