// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "abi.hpp"
#include "hash_utils.hpp"
#include <intx/intx.hpp>

namespace warden
{
/// The permission of an operator to act on behalf of a wallet.
struct OperatorPermission
{
    /// The root of the operator's session Merkle tree.
    hash256 session_root;

    /// The pinned paymaster. Zero means any.
    address paymaster;

    /// The validity window (uint48 timestamps). Zero valid_until means no expiry.
    uint64_t valid_until = 0;
    uint64_t valid_after = 0;

    /// The remaining fee budget in wei. MAX_UINT128 is unlimited.
    intx::uint256 gas_remaining;

    /// The remaining number of operations. MAX_UINT128 is unlimited.
    intx::uint256 times_remaining;

    friend bool operator==(const OperatorPermission&, const OperatorPermission&) = default;
};

/// ABI-encodes the permission as the static tuple
/// (bytes32, address, uint48, uint48, uint128, uint128).
[[nodiscard]] bytes abi_encode(const OperatorPermission& permission);

/// Decodes the permission from the decoder positioned at the (inline) tuple.
[[nodiscard]] OperatorPermission decode_operator_permission(abi::AbiDecoder& fields);

}  // namespace warden
