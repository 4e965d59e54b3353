// AGORA - Core Types Tests
// Copyright (c) 2024 AGORA Developers
// MIT License

#include <gtest/gtest.h>
#include <agora/core/types.h>

#include <array>
#include <map>
#include <type_traits>

namespace agora {
namespace test {

// ============================================================================
// Hash256 Tests
// ============================================================================

TEST(Hash256Test, DefaultConstructorCreatesZeroHash) {
    Hash256 h;
    EXPECT_TRUE(h.IsNull());
    for (size_t i = 0; i < Hash256::SIZE; ++i) {
        EXPECT_EQ(h[i], 0);
    }
}

TEST(Hash256Test, SizeIs32Bytes) {
    EXPECT_EQ(Hash256::SIZE, 32u);
    EXPECT_EQ(Hash160::SIZE, 20u);
}

TEST(Hash256Test, ConstructFromBytes) {
    std::array<Byte, 32> data;
    for (size_t i = 0; i < 32; ++i) {
        data[i] = static_cast<Byte>(i);
    }
    Hash256 h(data);
    EXPECT_FALSE(h.IsNull());
    EXPECT_EQ(h[0], 0);
    EXPECT_EQ(h[31], 31);

    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

TEST(Hash256Test, ShortRawInputIsZeroPadded) {
    const Byte raw[3] = {0xaa, 0xbb, 0xcc};
    Hash160 h(raw, sizeof(raw));
    EXPECT_EQ(h[0], 0xaa);
    EXPECT_EQ(h[2], 0xcc);
    EXPECT_EQ(h[3], 0);
    EXPECT_EQ(h[19], 0);
}

TEST(Hash256Test, HexRoundTrip) {
    std::string hex = "00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";
    Hash256 h = Hash256::FromHex(hex);
    EXPECT_EQ(h[1], 0x11);
    EXPECT_EQ(h.ToHex(), hex);
}

TEST(Hash256Test, FromHexRejectsBadInput) {
    EXPECT_THROW(Hash256::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Hash160::FromHex(std::string(40, 'z')), std::invalid_argument);
}

TEST(Hash256Test, OrderingIsBytewise) {
    std::array<Byte, 32> a{}, b{};
    a[0] = 1;
    b[0] = 2;
    EXPECT_LT(Hash256(a), Hash256(b));
    EXPECT_NE(Hash256(a), Hash256(b));
}

// ============================================================================
// Identifiers
// ============================================================================

TEST(IdentifierTest, TagsDoNotConvertImplicitly) {
    EXPECT_FALSE((std::is_convertible<DaoId, ProposalId>::value));
    EXPECT_FALSE((std::is_convertible<ProposalId, ReceiptId>::value));
    EXPECT_FALSE((std::is_convertible<Hash256, DaoId>::value));
    EXPECT_TRUE((std::is_constructible<DaoId, Hash256>::value));
}

TEST(IdentifierTest, UsableAsMapKey) {
    std::array<Byte, 32> raw{};
    raw[5] = 7;
    std::map<ProposalId, int> m;
    m[ProposalId(Hash256(raw))] = 1;
    m[ProposalId()] = 2;
    EXPECT_EQ(m.size(), 2u);
    EXPECT_EQ(m.begin()->second, 2);
}

// ============================================================================
// Amount Arithmetic
// ============================================================================

TEST(AmountTest, CheckedAdd) {
    Amount out = 0;
    EXPECT_TRUE(CheckedAdd(1, 2, out));
    EXPECT_EQ(out, 3u);

    EXPECT_TRUE(CheckedAdd(MAX_AMOUNT - 1, 1, out));
    EXPECT_EQ(out, MAX_AMOUNT);

    out = 42;
    EXPECT_FALSE(CheckedAdd(MAX_AMOUNT, 1, out));
    EXPECT_EQ(out, 42u);
}

} // namespace test
} // namespace agora
