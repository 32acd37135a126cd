// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <optional>
#include <span>
#include <vector>

namespace warden
{
/// The ERC-4337 (EntryPoint v0.6) user operation.
struct UserOperation
{
    address sender;
    intx::uint256 nonce;
    bytes init_code;
    bytes call_data;
    intx::uint256 call_gas_limit;
    intx::uint256 verification_gas_limit;
    intx::uint256 pre_verification_gas;
    intx::uint256 max_fee_per_gas;
    intx::uint256 max_priority_fee_per_gas;

    /// The paymaster address followed by the paymaster specific data. Empty without paymaster.
    bytes paymaster_and_data;

    /// The validator address followed by the validator specific signature payload.
    bytes signature;
};

/// Computes the user operation hash as the EntryPoint does:
/// keccak256(abi.encode(keccak256(pack(op)), entry_point, chain_id)).
[[nodiscard]] hash256 user_op_hash(
    const UserOperation& op, const address& entry_point, uint64_t chain_id);

/// Returns the paymaster address: the first 20 bytes of paymaster_and_data
/// or the zero address when no paymaster is used.
[[nodiscard]] address paymaster_of(const UserOperation& op) noexcept;

/// Computes the worst-case fee the operation may charge:
/// (call_gas + verification_gas * m + pre_verification_gas) * max_fee_per_gas
/// where the multiplier m is 3 with a paymaster (postOp may be called twice) and 1 otherwise.
///
/// @return The fee or std::nullopt if it does not fit 256 bits.
[[nodiscard]] std::optional<intx::uint256> max_gas_fee(const UserOperation& op) noexcept;

/// The wallet entry point selectors a session key may authorize.
inline constexpr uint32_t NORMAL_EXECUTE_SELECTOR = 0xe351c75d;
inline constexpr uint32_t BATCH_NORMAL_EXECUTE_SELECTOR = 0x520237d1;

/// The single call executed by the wallet.
struct Call
{
    address to;
    intx::uint256 value;
    bytes data;

    /// 0 - call, 1 - delegatecall.
    uint8_t operation = 0;
};

/// Encodes normalExecute(address,uint256,bytes,uint8).
[[nodiscard]] bytes encode_normal_execute(const Call& call);

/// Encodes batchNormalExecute(address[],uint256[],bytes[],uint8[]).
[[nodiscard]] bytes encode_batch_normal_execute(std::span<const Call> calls);

/// The calls decoded from the wallet calldata.
struct WalletOperation
{
    bool is_batch = false;
    std::vector<Call> calls;
};

/// Decodes the wallet calldata of normalExecute or batchNormalExecute.
///
/// @throws ValidationError  INVALID_WALLET_OPERATION for other selectors,
///                          INVALID_BATCH_LENGTH if the batch arrays differ in length,
///                          MALFORMED_CALLDATA for undecodable arguments.
[[nodiscard]] WalletOperation decode_wallet_operation(bytes_view call_data);

}  // namespace warden
