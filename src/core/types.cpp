// AGORA - Core Types Implementation
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <agora/core/types.h>

namespace agora {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    inline int HexCharToNibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(HEX_CHARS[data_[i] >> 4]);
        result.push_back(HEX_CHARS[data_[i] & 0x0F]);
    }
    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        int high = HexCharToNibble(hex[i * 2]);
        int low = HexCharToNibble(hex[i * 2 + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }
    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

} // namespace agora
