// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include <gmock/gmock.h>
#include <test/utils/utils.hpp>
#include <warden/user_operation.hpp>

using namespace warden;
using namespace warden::test;
using namespace testing;

namespace
{
constexpr auto EntryPoint = 0x5ff137d4b0fdcd49dca30c7cf57e578a026d2789_address;
constexpr auto Token = 0x7070_address;
}  // namespace

TEST(user_operation, hash)
{
    const UserOperation op{.sender = 0x3a11e7_address};
    EXPECT_EQ(user_op_hash(op, EntryPoint, 1),
        0x2c83fde26e2fa7c4a861220f4daa4d0d852aa66856586627f2527a2c99cdd980_bytes32);

    // The signature is not covered by the hash.
    auto signed_op = op;
    signed_op.signature = "0102"_hex;
    EXPECT_EQ(user_op_hash(signed_op, EntryPoint, 1), user_op_hash(op, EntryPoint, 1));

    EXPECT_NE(user_op_hash(op, EntryPoint, 5), user_op_hash(op, EntryPoint, 1));
    auto other_nonce = op;
    other_nonce.nonce = 1;
    EXPECT_NE(user_op_hash(other_nonce, EntryPoint, 1), user_op_hash(op, EntryPoint, 1));
}

TEST(user_operation, paymaster_of)
{
    UserOperation op;
    EXPECT_EQ(paymaster_of(op), address{});

    op.paymaster_and_data = "fa11"_hex;
    EXPECT_EQ(paymaster_of(op), address{});

    op.paymaster_and_data = bytes(19, 0) + "fa11"_hex + "deadbeef"_hex;
    EXPECT_EQ(paymaster_of(op), 0xfa_address);
}

TEST(user_operation, max_gas_fee)
{
    UserOperation op{
        .call_gas_limit = 1000,
        .verification_gas_limit = 1000,
        .pre_verification_gas = 500,
        .max_fee_per_gas = 2,
    };
    EXPECT_EQ(max_gas_fee(op), 5000);

    // The verification gas is counted 3 times with a paymaster.
    op.paymaster_and_data = bytes(20, 0xfa);
    EXPECT_EQ(max_gas_fee(op), 9000);

    op.max_fee_per_gas = 0;
    EXPECT_EQ(max_gas_fee(op), 0);
}

TEST(user_operation, max_gas_fee_overflow)
{
    const auto max = ~intx::uint256{0};

    UserOperation op{.call_gas_limit = max, .verification_gas_limit = 1, .max_fee_per_gas = 1};
    EXPECT_EQ(max_gas_fee(op), std::nullopt);

    op = {.call_gas_limit = 2, .max_fee_per_gas = max};
    EXPECT_EQ(max_gas_fee(op), std::nullopt);

    op = {.verification_gas_limit = max / 2, .paymaster_and_data = bytes(20, 0xfa)};
    EXPECT_EQ(max_gas_fee(op), std::nullopt);

    op = {.call_gas_limit = 1, .max_fee_per_gas = max};
    EXPECT_EQ(max_gas_fee(op), max);
}

TEST(user_operation, normal_execute)
{
    const Call call{.to = Token, .value = 5, .data = "a9059cbb"_hex};
    const auto data = encode_normal_execute(call);
    EXPECT_EQ(hex(bytes_view{data}.substr(0, 4)), "e351c75d");

    const auto op = decode_wallet_operation(data);
    EXPECT_FALSE(op.is_batch);
    ASSERT_EQ(op.calls.size(), 1);
    EXPECT_EQ(op.calls[0].to, Token);
    EXPECT_EQ(op.calls[0].value, 5);
    EXPECT_EQ(op.calls[0].data, "a9059cbb"_hex);
    EXPECT_EQ(op.calls[0].operation, 0);
}

TEST(user_operation, batch_normal_execute)
{
    const Call calls[]{
        {.to = Token, .data = "a9059cbb"_hex},
        {.to = 0xa11ce_address, .value = 1},
        {.to = Token, .data = "095ea7b3"_hex, .operation = 1},
    };
    const auto data = encode_batch_normal_execute(calls);
    EXPECT_EQ(hex(bytes_view{data}.substr(0, 4)), "520237d1");

    const auto op = decode_wallet_operation(data);
    EXPECT_TRUE(op.is_batch);
    ASSERT_EQ(op.calls.size(), 3);
    EXPECT_EQ(op.calls[1].to, 0xa11ce_address);
    EXPECT_EQ(op.calls[1].value, 1);
    EXPECT_THAT(op.calls[1].data, IsEmpty());
    EXPECT_EQ(op.calls[2].data, "095ea7b3"_hex);
    EXPECT_EQ(op.calls[2].operation, 1);

    const auto empty = decode_wallet_operation(encode_batch_normal_execute({}));
    EXPECT_TRUE(empty.is_batch);
    EXPECT_THAT(empty.calls, IsEmpty());
}

TEST(user_operation, batch_length_mismatch)
{
    // batchNormalExecute([Token], [], [], []).
    const bytes32 targets[]{to_bytes32(Token)};
    const auto data = abi::selector_bytes(BATCH_NORMAL_EXECUTE_SELECTOR) +
                      abi::AbiEncoder{}
                          .add_dynamic(abi::encode_word_array(targets))
                          .add_dynamic(abi::encode_word_array({}))
                          .add_dynamic(abi::encode_dynamic_array({}))
                          .add_dynamic(abi::encode_word_array({}))
                          .encode_final();
    EXPECT_VALIDATION_ERROR((void)decode_wallet_operation(data), INVALID_BATCH_LENGTH);
}

TEST(user_operation, invalid_wallet_operation)
{
    EXPECT_VALIDATION_ERROR((void)decode_wallet_operation({}), INVALID_WALLET_OPERATION);
    EXPECT_VALIDATION_ERROR(
        (void)decode_wallet_operation("a9059cbb"_hex + word(1) + word(2)), INVALID_WALLET_OPERATION);

    const auto truncated = encode_normal_execute({.to = Token, .data = "cafe"_hex});
    EXPECT_VALIDATION_ERROR(
        (void)decode_wallet_operation(bytes_view{truncated}.substr(0, 4 + 64)), MALFORMED_CALLDATA);
}
