// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <initializer_list>
#include <span>

/// The calldata predicate language.
///
/// The allowed arguments of a session are an RLP list of predicate nodes, one per argument slot.
/// The first slot constrains the native value of the call. A node is an RLP list
/// [tag, operand]: leaves carry the ABI-encoded literal, AND/OR nodes carry the list of children.
namespace warden::predicate
{
enum class Op : uint8_t
{
    ANY = 0x00,
    NE = 0x01,
    EQ = 0x02,
    GT = 0x03,
    LT = 0x04,
    AND = 0x05,
    OR = 0x06,
};

/// Checks the actual call arguments against the allowed predicates.
///
/// @param allowed_arguments  The RLP list of predicate nodes.
/// @param actual_arguments   The RLP list of actual argument values: the ABI-encoded native value
///                           followed by the ABI words of the call arguments.
/// @param value              The native value of the call.
/// @return Whether every predicate holds.
/// @throws ValidationError  On a slot count mismatch, a native value mismatch,
///                          an unknown tag or a malformed node.
[[nodiscard]] bool is_allowed_calldata(
    bytes_view allowed_arguments, bytes_view actual_arguments, const intx::uint256& value);

/// Encodes a leaf node with the raw ABI-encoded literal.
[[nodiscard]] bytes leaf(Op op, bytes_view literal);

[[nodiscard]] bytes any();
[[nodiscard]] bytes eq(const bytes32& word);
[[nodiscard]] bytes ne(const bytes32& word);
[[nodiscard]] bytes gt(const bytes32& word);
[[nodiscard]] bytes lt(const bytes32& word);

inline bytes eq(const intx::uint256& v)
{
    return eq(to_bytes32(v));
}
inline bytes ne(const intx::uint256& v)
{
    return ne(to_bytes32(v));
}
inline bytes gt(const intx::uint256& v)
{
    return gt(to_bytes32(v));
}
inline bytes lt(const intx::uint256& v)
{
    return lt(to_bytes32(v));
}
inline bytes eq(const address& a)
{
    return eq(to_bytes32(a));
}
inline bytes ne(const address& a)
{
    return ne(to_bytes32(a));
}

/// Encodes the AND node of already encoded children.
[[nodiscard]] bytes all_of(std::initializer_list<bytes> children);

/// Encodes the OR node of already encoded children.
[[nodiscard]] bytes any_of(std::initializer_list<bytes> children);

/// Encodes the list of per-slot predicates (the allowed arguments of a session).
[[nodiscard]] bytes encode_allowed(std::span<const bytes> nodes);
[[nodiscard]] bytes encode_allowed(std::initializer_list<bytes> nodes);

/// Encodes the actual arguments: the native value word followed by the argument encodings.
[[nodiscard]] bytes encode_arguments(const intx::uint256& value, std::span<const bytes> arguments);

/// Encodes the actual arguments of the calldata with static arguments only:
/// the arguments part (after the selector) is split into ABI words.
///
/// @throws std::invalid_argument  The arguments part is not a whole number of words.
[[nodiscard]] bytes encode_call_arguments(const intx::uint256& value, bytes_view calldata);

}  // namespace warden::predicate
