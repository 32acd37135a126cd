// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include "permission.hpp"
#include "session.hpp"
#include "spending.hpp"
#include <optional>
#include <span>
#include <vector>

namespace warden
{
/// The session authorizing one call of the wallet operation.
struct SessionCall
{
    /// The Merkle proof of the session under the operator's session root.
    std::vector<bytes32> proof;

    Session session;

    /// The RLP list of the actual call arguments, see predicate::is_allowed_calldata().
    bytes actual_arguments;
};

/// The wallet owner's off-chain authorization installing the operator permission.
struct Permit
{
    /// The address of the wallet's sudo validator followed by the signature it verifies.
    bytes signature;

    OperatorPermission permission;
    std::vector<SpendingLimitConfig> spending_limits;
};

/// The session-key validator part of the user operation signature
/// (after the 20-byte validator address).
///
/// Single call payload:
///   abi.encode(bytes32[] proof, address operator, Session session, bytes actual_arguments,
///              bytes operator_signature)
/// Batch payload:
///   abi.encode(bytes32[][] proofs, address operator, Session[] sessions,
///              bytes[] actual_arguments, bytes operator_signature)
/// Either may be followed by the permit: (bytes signature, OperatorPermission permission,
/// SpendingLimitConfig[] spending_limits).
struct SessionSignature
{
    bool is_batch = false;
    address op;
    std::vector<SessionCall> calls;
    bytes operator_signature;
    std::optional<Permit> permit;
};

/// ABI-encodes the payload. A single call payload requires exactly one call.
/// @throws std::invalid_argument  A single call payload with other number of calls.
[[nodiscard]] bytes encode_session_signature(const SessionSignature& sig);

/// Decodes the payload. The permit presence is detected by the size of the payload head.
/// @throws ValidationError  MALFORMED_SIGNATURE.
[[nodiscard]] SessionSignature decode_session_signature(bytes_view payload, bool is_batch);

/// Computes the hash the operator signs:
/// the EIP-191 hash of keccak256(abi.encode(op_hash, validator)).
///
/// Binding the validator address prevents replaying the signature to other validators.
[[nodiscard]] hash256 operator_message_hash(const hash256& op_hash, const address& validator);

/// Computes the hash of the permit the wallet owner signs:
/// keccak256(abi.encode(wallet, operator, keccak256(abi.encode(permission)),
///                      keccak256(abi.encode(spending_limits)), chain_id, nonce)).
[[nodiscard]] hash256 permit_hash(const address& wallet, const address& op,
    const OperatorPermission& permission, std::span<const SpendingLimitConfig> spending_limits,
    uint64_t chain_id, const intx::uint256& nonce);

}  // namespace warden
