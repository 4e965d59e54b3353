// AGORA - SHA256 Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/crypto/sha256.h>
#include <agora/core/serialize.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace agora {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() {
    EVP_MD_CTX_free(ctx_);
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

SHA256& SHA256::Write(const std::string& str) {
    return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
}

SHA256& SHA256::WriteU64(uint64_t value) {
    value = detail::htole64(value);
    return Write(reinterpret_cast<const Byte*>(&value), sizeof(value));
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);

    std::array<Byte, SHA256::OUTPUT_SIZE> result;
    hasher.Finalize(result.data());
    return Hash256(result);
}

} // namespace agora
