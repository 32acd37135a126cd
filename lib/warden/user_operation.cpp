// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "user_operation.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include <algorithm>

namespace warden
{
hash256 user_op_hash(const UserOperation& op, const address& entry_point, uint64_t chain_id)
{
    const auto packed = abi::AbiEncoder{}
                            .add_address(op.sender)
                            .add_uint(op.nonce)
                            .add_word(keccak256(op.init_code))
                            .add_word(keccak256(op.call_data))
                            .add_uint(op.call_gas_limit)
                            .add_uint(op.verification_gas_limit)
                            .add_uint(op.pre_verification_gas)
                            .add_uint(op.max_fee_per_gas)
                            .add_uint(op.max_priority_fee_per_gas)
                            .add_word(keccak256(op.paymaster_and_data))
                            .encode_final();

    return keccak256(abi::AbiEncoder{}
                         .add_word(keccak256(packed))
                         .add_address(entry_point)
                         .add_uint(chain_id)
                         .encode_final());
}

address paymaster_of(const UserOperation& op) noexcept
{
    address paymaster;
    if (op.paymaster_and_data.size() >= sizeof(paymaster))
        std::copy_n(op.paymaster_and_data.data(), sizeof(paymaster), paymaster.bytes);
    return paymaster;
}

std::optional<intx::uint256> max_gas_fee(const UserOperation& op) noexcept
{
    static constexpr auto max_uint256 = ~intx::uint256{0};

    const intx::uint256 multiplier = op.paymaster_and_data.empty() ? 1 : 3;
    if (op.verification_gas_limit > max_uint256 / multiplier)
        return std::nullopt;

    auto gas = op.verification_gas_limit * multiplier;
    if (op.call_gas_limit > max_uint256 - gas)
        return std::nullopt;
    gas += op.call_gas_limit;
    if (op.pre_verification_gas > max_uint256 - gas)
        return std::nullopt;
    gas += op.pre_verification_gas;

    if (gas != 0 && op.max_fee_per_gas > max_uint256 / gas)
        return std::nullopt;
    return gas * op.max_fee_per_gas;
}

bytes encode_normal_execute(const Call& call)
{
    return abi::selector_bytes(NORMAL_EXECUTE_SELECTOR) + abi::AbiEncoder{}
                                                              .add_address(call.to)
                                                              .add_uint(call.value)
                                                              .add_bytes(call.data)
                                                              .add_uint(call.operation)
                                                              .encode_final();
}

bytes encode_batch_normal_execute(std::span<const Call> calls)
{
    std::vector<bytes32> targets;
    std::vector<bytes32> values;
    std::vector<bytes> datas;
    std::vector<bytes32> operations;
    for (const auto& c : calls)
    {
        targets.emplace_back(to_bytes32(c.to));
        values.emplace_back(to_bytes32(c.value));
        datas.emplace_back(abi::encode_bytes(c.data));
        operations.emplace_back(to_bytes32(intx::uint256{c.operation}));
    }

    return abi::selector_bytes(BATCH_NORMAL_EXECUTE_SELECTOR) +
           abi::AbiEncoder{}
               .add_dynamic(abi::encode_word_array(targets))
               .add_dynamic(abi::encode_word_array(values))
               .add_dynamic(abi::encode_dynamic_array(datas))
               .add_dynamic(abi::encode_word_array(operations))
               .encode_final();
}

namespace
{
Call decode_single(abi::AbiDecoder& args)
{
    Call call;
    call.to = args.addr();
    call.value = args.uint();
    call.data = args.dynamic_bytes();
    call.operation = args.uint_n<uint8_t>();
    return call;
}

std::vector<Call> decode_batch(abi::AbiDecoder& args)
{
    auto [num_targets, targets] = args.array();
    auto [num_values, values] = args.array();
    auto [num_datas, datas] = args.array();
    auto [num_operations, operations] = args.array();
    if (num_targets != num_values || num_targets != num_datas || num_targets != num_operations)
        throw ValidationError{INVALID_BATCH_LENGTH};

    std::vector<Call> calls(num_targets);
    for (auto& call : calls)
    {
        call.to = targets.addr();
        call.value = values.uint();
        call.data = datas.dynamic_bytes();
        call.operation = operations.uint_n<uint8_t>();
    }
    return calls;
}
}  // namespace

WalletOperation decode_wallet_operation(bytes_view call_data)
{
    const auto selector = abi::load_selector(call_data);
    if (selector != NORMAL_EXECUTE_SELECTOR && selector != BATCH_NORMAL_EXECUTE_SELECTOR)
        throw ValidationError{INVALID_WALLET_OPERATION};

    try
    {
        abi::AbiDecoder args{call_data.substr(4)};
        if (selector == NORMAL_EXECUTE_SELECTOR)
            return {false, {decode_single(args)}};
        return {true, decode_batch(args)};
    }
    catch (const abi::DecodingError&)
    {
        throw ValidationError{MALFORMED_CALLDATA};
    }
}

}  // namespace warden
