// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <test/utils/utils.hpp>
#include <warden/ecdsa.hpp>
#include <warden/predicate.hpp>
#include <warden/session_signature.hpp>

using namespace warden;
using namespace warden::test;
using namespace testing;

namespace
{
constexpr auto Operator = 0x7e5f4552091a69125d5dfcb7b8c2659029395bdf_address;

Session transfer_session(intx::uint256 times_limit = 0)
{
    return {
        .to = 0x7070_address,
        .selector = 0xa9059cbb,
        .allowed_arguments = predicate::encode_allowed({predicate::any()}),
        .times_limit = times_limit,
    };
}

SessionSignature single_call()
{
    return {
        .op = Operator,
        .calls = {{
            .proof = {0x01_bytes32, 0x02_bytes32},
            .session = transfer_session(),
            .actual_arguments = predicate::encode_arguments(0, {}),
        }},
        .operator_signature = bytes(65, 0x5a),
    };
}

Permit permit()
{
    return {
        .signature = "0000000000000000000000000000000000000e1e"_hex + bytes(65, 0x77),
        .permission = {.session_root = 0x2007_bytes32, .valid_until = 50, .gas_remaining = 9},
        .spending_limits = {{.token = 0x7070_address, .allowance = 100}},
    };
}

uint64_t head_size(bytes_view payload)
{
    return static_cast<uint64_t>(intx::be::unsafe::load<intx::uint256>(payload.data()));
}
}  // namespace

TEST(session_signature, single_call)
{
    const auto sig = single_call();
    const auto payload = encode_session_signature(sig);
    EXPECT_EQ(head_size(payload), 160);

    const auto decoded = decode_session_signature(payload, false);
    EXPECT_FALSE(decoded.is_batch);
    EXPECT_EQ(decoded.op, Operator);
    ASSERT_EQ(decoded.calls.size(), 1);
    EXPECT_THAT(decoded.calls[0].proof, ElementsAre(0x01_bytes32, 0x02_bytes32));
    EXPECT_EQ(decoded.calls[0].session, transfer_session());
    EXPECT_EQ(decoded.calls[0].actual_arguments, sig.calls[0].actual_arguments);
    EXPECT_EQ(decoded.operator_signature, sig.operator_signature);
    EXPECT_FALSE(decoded.permit.has_value());
}

TEST(session_signature, batch)
{
    auto sig = single_call();
    sig.is_batch = true;
    sig.calls.push_back({.proof = {}, .session = transfer_session(2), .actual_arguments = "c0"_hex});

    const auto payload = encode_session_signature(sig);
    EXPECT_EQ(head_size(payload), 160);

    const auto decoded = decode_session_signature(payload, true);
    EXPECT_TRUE(decoded.is_batch);
    ASSERT_EQ(decoded.calls.size(), 2);
    EXPECT_EQ(decoded.calls[0].session, transfer_session());
    EXPECT_THAT(decoded.calls[1].proof, IsEmpty());
    EXPECT_EQ(decoded.calls[1].session, transfer_session(2));
    EXPECT_EQ(decoded.calls[1].actual_arguments, "c0"_hex);
}

TEST(session_signature, with_permit)
{
    auto sig = single_call();
    sig.permit = permit();

    const auto payload = encode_session_signature(sig);
    EXPECT_EQ(head_size(payload), 416);

    const auto decoded = decode_session_signature(payload, false);
    ASSERT_TRUE(decoded.permit.has_value());
    EXPECT_EQ(decoded.permit->signature, sig.permit->signature);
    EXPECT_EQ(decoded.permit->permission, sig.permit->permission);
    ASSERT_EQ(decoded.permit->spending_limits.size(), 1);
    EXPECT_EQ(decoded.permit->spending_limits[0].token, 0x7070_address);
    EXPECT_EQ(decoded.permit->spending_limits[0].allowance, 100);
    EXPECT_EQ(decoded.calls[0].session, transfer_session());
}

TEST(session_signature, single_call_count)
{
    auto sig = single_call();
    sig.calls.clear();
    EXPECT_THROW((void)encode_session_signature(sig), std::invalid_argument);
}

TEST(session_signature, malformed)
{
    EXPECT_VALIDATION_ERROR((void)decode_session_signature({}, false), MALFORMED_SIGNATURE);
    EXPECT_VALIDATION_ERROR(
        (void)decode_session_signature(word(0x60) + word(0), false), MALFORMED_SIGNATURE);

    const auto payload = encode_session_signature(single_call());
    EXPECT_VALIDATION_ERROR(
        (void)decode_session_signature(bytes_view{payload}.substr(0, payload.size() - 32), false),
        MALFORMED_SIGNATURE);

    // The permission budget above 128 bits.
    auto sig = single_call();
    sig.permit = permit();
    sig.permit->permission.gas_remaining = MAX_UINT128 + 1;
    EXPECT_VALIDATION_ERROR(
        (void)decode_session_signature(encode_session_signature(sig), false), MALFORMED_SIGNATURE);
}

TEST(session_signature, batch_length_mismatch)
{
    const bytes proofs[]{abi::encode_word_array({})};
    const auto payload = abi::AbiEncoder{}
                             .add_dynamic(abi::encode_dynamic_array(proofs))
                             .add_address(Operator)
                             .add_dynamic(abi::encode_dynamic_array({}))
                             .add_dynamic(abi::encode_dynamic_array({}))
                             .add_bytes({})
                             .encode_final();
    EXPECT_VALIDATION_ERROR((void)decode_session_signature(payload, true), INVALID_BATCH_LENGTH);
}

TEST(session_signature, operator_message_hash)
{
    const auto op_hash = 0xaa_bytes32;
    EXPECT_NE(operator_message_hash(op_hash, 0x5e55_address),
        operator_message_hash(op_hash, 0x5e56_address));
    EXPECT_EQ(operator_message_hash(op_hash, 0x5e55_address),
        ecdsa::to_eth_signed_message_hash(keccak256(
            abi::AbiEncoder{}.add_word(op_hash).add_address(0x5e55_address).encode_final())));
}

TEST(session_signature, permit_hash)
{
    const auto p = permit();
    const auto h = permit_hash(0x3a11e7_address, Operator, p.permission, p.spending_limits, 1, 0);
    EXPECT_NE(h, permit_hash(0x3a11e7_address, Operator, p.permission, p.spending_limits, 1, 1));
    EXPECT_NE(h, permit_hash(0x3a11e7_address, Operator, p.permission, p.spending_limits, 5, 0));
    EXPECT_NE(h, permit_hash(0x3a11e7_address, Operator, p.permission, {}, 1, 0));
    EXPECT_NE(h, permit_hash(0x3a11e8_address, Operator, p.permission, p.spending_limits, 1, 0));
}
