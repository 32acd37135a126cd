// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "abi.hpp"
#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <span>
#include <vector>

namespace warden
{
/// The call pattern delegated by a wallet to an operator.
///
/// Sessions are committed as leaves of the operator's session Merkle tree.
struct Session
{
    /// The address allowed to be called.
    address to;

    /// The allowed function selector. Selector 0 allows calls with empty calldata.
    uint32_t selector = 0;

    /// The RLP list of argument predicates, see predicate::is_allowed_calldata().
    bytes allowed_arguments;

    /// The pinned paymaster. Zero means any.
    address paymaster;

    /// The validity window (uint48 timestamps). Zero valid_until means no expiry.
    uint64_t valid_until = 0;
    uint64_t valid_after = 0;

    /// The maximum number of uses. Zero or max uint128 (and above) means unlimited.
    intx::uint256 times_limit = 0;

    [[nodiscard]] bool has_unlimited_uses() const noexcept
    {
        return times_limit == 0 || times_limit >= MAX_UINT128;
    }

    friend bool operator==(const Session&, const Session&) = default;
};

/// ABI-encodes the session fields
/// (address, bytes4, bytes, address, uint48, uint48, uint256).
[[nodiscard]] bytes abi_encode(const Session& session);

/// Decodes the session from the decoder positioned at the session tuple head.
[[nodiscard]] Session decode_session(abi::AbiDecoder& fields);

/// Computes the Merkle leaf of the session: keccak256(keccak256(abi_encode(session))).
[[nodiscard]] hash256 session_leaf_hash(const Session& session);

/// Hashes the pair of nodes in sorted order.
[[nodiscard]] hash256 hash_pair(const hash256& a, const hash256& b) noexcept;

/// Verifies the Merkle proof of the leaf against the root.
[[nodiscard]] bool verify_proof(
    std::span<const bytes32> proof, const hash256& root, const hash256& leaf) noexcept;

/// Verifies the session is a leaf of the tree with the given root.
/// @throws ValidationError  INVALID_SESSION_ROOT.
void verify_session_membership(
    std::span<const bytes32> proof, const hash256& root, const Session& session);

/// Checks the call (to, data, value) against the session.
///
/// The actual arguments must encode exactly the arguments part of the data
/// (the items after the native value slot concatenated) and satisfy the session predicates.
/// @throws ValidationError  INVALID_TO, INVALID_SELECTOR, CALLDATA_NOT_EQUALLY_ENCODED,
///                          INVALID_ARGUMENTS or a predicate evaluation error.
void check_arguments(const Session& session, const address& to, bytes_view data,
    const intx::uint256& value, bytes_view actual_arguments);

/// The session Merkle tree built off-chain by the wallet owner.
///
/// The layout is compatible with OpenZeppelin's StandardMerkleTree:
/// leaves are sorted by hash and stored in reverse order at the end of the node array,
/// the node i is the hash of the nodes 2i+1 and 2i+2.
class SessionTree
{
    std::vector<Session> m_sessions;

    /// The leaf hash of each session.
    std::vector<hash256> m_leaves;

    /// The tree nodes, the root first.
    std::vector<hash256> m_nodes;

    [[nodiscard]] size_t node_index(size_t session_index) const;

public:
    /// @throws std::invalid_argument  No sessions given.
    explicit SessionTree(std::vector<Session> sessions);

    [[nodiscard]] const hash256& root() const noexcept { return m_nodes.front(); }

    [[nodiscard]] const std::vector<Session>& sessions() const noexcept { return m_sessions; }

    [[nodiscard]] const hash256& leaf(size_t session_index) const
    {
        return m_leaves.at(session_index);
    }

    /// Returns the proof of the session at the index (in the construction order).
    [[nodiscard]] std::vector<bytes32> proof(size_t session_index) const;

    /// Returns the proof of the session.
    /// @throws std::out_of_range  The session is not in the tree.
    [[nodiscard]] std::vector<bytes32> proof(const Session& session) const;
};

}  // namespace warden
