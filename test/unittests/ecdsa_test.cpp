// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <test/utils/utils.hpp>
#include <warden/ecdsa.hpp>

using namespace warden;
using namespace warden::test;
using namespace intx::literals;

namespace
{
// keccak256("warden") signed with the private key 1 and the nonce k = 7.
constexpr auto MSG = 0xe3e230c3643b3d50a192dbf9855946231a663dadc7927b49ab41d6092db89e76_bytes32;
constexpr auto R = 0x5cbdf0646e5db4eaa398f365f2ea7a0e3d419b7e0330e39ce92bddedcac4f9bc_u256;
constexpr auto S = 0x76f24de11e15d9762e73f90da3776498f8b7a7482a79cd9fb9b97dddccb3baac_u256;
constexpr auto ADDR1 = 0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address;
constexpr auto ADDR2 = 0x2b5ad5c4795c026514f8317c7a215e218dccd6cf_address;
}  // namespace

TEST(ecdsa, to_address)
{
    EXPECT_EQ(ecdsa::to_address(1), ADDR1);
    EXPECT_EQ(ecdsa::to_address(2), ADDR2);
    EXPECT_THROW((void)ecdsa::to_address(0), std::invalid_argument);
    EXPECT_THROW((void)ecdsa::to_address(ecdsa::SECP256K1N), std::invalid_argument);
}

TEST(ecdsa, ecrecover_known_signature)
{
    EXPECT_EQ(ecdsa::ecrecover(MSG, R, S, false), ADDR1);

    const auto sig = ecdsa::serialize({R, S, false});
    ASSERT_EQ(sig.size(), ecdsa::SIGNATURE_SIZE);
    EXPECT_EQ(sig[64], 27);
    EXPECT_EQ(ecdsa::recover_signer(MSG, sig), ADDR1);
}

TEST(ecdsa, malleable_signature)
{
    // The (r, n - s) signature with the flipped parity recovers the same key.
    const auto high_s = ecdsa::SECP256K1N - S;
    EXPECT_EQ(ecdsa::ecrecover(MSG, R, high_s, true), ADDR1);
    EXPECT_EQ(ecdsa::recover_signer(MSG, ecdsa::serialize({R, high_s, true})), std::nullopt);
}

TEST(ecdsa, ecrecover_invalid)
{
    EXPECT_EQ(ecdsa::ecrecover(MSG, 0, S, false), std::nullopt);
    EXPECT_EQ(ecdsa::ecrecover(MSG, R, 0, false), std::nullopt);
    EXPECT_EQ(ecdsa::ecrecover(MSG, ecdsa::SECP256K1N, S, false), std::nullopt);
    EXPECT_EQ(ecdsa::ecrecover(MSG, R, ecdsa::SECP256K1N, false), std::nullopt);
    // The wrong parity recovers some other key.
    EXPECT_NE(ecdsa::ecrecover(MSG, R, S, true), ADDR1);
}

TEST(ecdsa, parse_signature)
{
    auto sig = ecdsa::serialize({R, S, true});
    EXPECT_EQ(sig[64], 28);

    auto parsed = ecdsa::parse_signature(sig);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->r, R);
    EXPECT_EQ(parsed->s, S);
    EXPECT_TRUE(parsed->y_parity);

    sig[64] = 0;
    parsed = ecdsa::parse_signature(sig);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->y_parity);

    sig[64] = 29;
    EXPECT_FALSE(ecdsa::parse_signature(sig).has_value());
    EXPECT_FALSE(ecdsa::parse_signature(bytes_view{sig}.substr(1)).has_value());
    EXPECT_EQ(ecdsa::recover_signer(MSG, {}), std::nullopt);
}

TEST(ecdsa, sign_and_recover)
{
    for (const auto key : {1_u256, 2_u256, 0xc0ffee_u256})
    {
        const auto sig = ecdsa::sign(MSG, key);
        EXPECT_LE(sig.s, ecdsa::SECP256K1N_OVER_2);
        EXPECT_EQ(ecdsa::recover_signer(MSG, ecdsa::serialize(sig)), ecdsa::to_address(key));
    }
}

TEST(ecdsa, eth_signed_message_hash)
{
    EXPECT_EQ(ecdsa::to_eth_signed_message_hash({}),
        0x5e4106618209740b9f773a94c5667b9659a7a4e2691c7c8a78336e9889a6be07_bytes32);
}
