// AGORA - SHA256 Hash Function
// Copyright (c) 2024 AGORA Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP digest interface.
// Used to derive DAO, proposal and receipt identifiers.

#ifndef AGORA_CRYPTO_SHA256_H
#define AGORA_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <agora/core/types.h>

// Forward declaration so callers don't need OpenSSL headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace agora {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Write a string's bytes
    SHA256& Write(const std::string& str);

    /// Write a 64-bit integer (little-endian)
    SHA256& WriteU64(uint64_t value);

    /// Finalize the hash and write to output
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a string
inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace agora

#endif // AGORA_CRYPTO_SHA256_H
