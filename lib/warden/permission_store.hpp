// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include "permission.hpp"
#include "spending.hpp"
#include <intx/intx.hpp>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

namespace warden
{
/// The persistent state of the session-key validator.
///
/// The tables are namespaced by the wallet. Within a wallet the records are keyed by the operator
/// or by the hash of the composite key (operator, token) or (operator, session leaf).
/// Every modification is journaled so it can be reverted by rollback().
class PermissionStore
{
    struct WalletTables
    {
        std::unordered_map<address, OperatorPermission> permissions;
        std::unordered_map<address, intx::uint256> permit_nonces;
        std::unordered_map<bytes32, SpendingLimit> spending_limits;
        std::unordered_map<bytes32, intx::uint256> session_uses;
        std::unordered_set<bytes32> revoked;
    };

    struct JournalBase
    {
        address wallet;
    };

    struct JournalPermissionChange : JournalBase
    {
        address op;
        std::optional<OperatorPermission> prev;
    };

    struct JournalSpendingLimitChange : JournalBase
    {
        bytes32 key;
        std::optional<SpendingLimit> prev;
    };

    struct JournalSessionUse : JournalBase
    {
        bytes32 key;
    };

    struct JournalPermitNonceBump : JournalBase
    {
        address op;
    };

    struct JournalRevocation : JournalBase
    {
        bytes32 hash;
    };

    /// Revocations and permit nonces survive the clearing.
    struct JournalWalletCleared : JournalBase
    {
        std::unordered_map<address, OperatorPermission> permissions;
        std::unordered_map<bytes32, SpendingLimit> spending_limits;
        std::unordered_map<bytes32, intx::uint256> session_uses;
    };

    using JournalEntry = std::variant<JournalPermissionChange, JournalSpendingLimitChange,
        JournalSessionUse, JournalPermitNonceBump, JournalRevocation, JournalWalletCleared>;

    std::unordered_map<address, WalletTables> m_wallets;

    /// The list of changes with information how to revert them.
    std::vector<JournalEntry> m_journal;

    [[nodiscard]] const WalletTables* find(const address& wallet) const noexcept;

public:
    /// Computes the key of the (operator, token) spending limit record.
    [[nodiscard]] static bytes32 spending_limit_key(const address& op, const address& token);

    /// Computes the key of the (operator, session leaf) usage record.
    [[nodiscard]] static bytes32 session_key(const address& op, const hash256& leaf);

    /// Returns the operator permission. Operators without one get the empty permission.
    [[nodiscard]] OperatorPermission get_permission(const address& wallet, const address& op) const;
    void set_permission(const address& wallet, const address& op, const OperatorPermission& p);

    /// Returns the spending limit. Unknown records are unset limits.
    [[nodiscard]] SpendingLimit get_spending_limit(
        const address& wallet, const address& op, const address& token) const;
    void set_spending_limit(const address& wallet, const address& op, const address& token,
        const SpendingLimit& limit);
    void delete_spending_limit(const address& wallet, const address& op, const address& token);

    [[nodiscard]] intx::uint256 get_session_uses(
        const address& wallet, const address& op, const hash256& leaf) const;

    /// Increments the usage counter of the session.
    void record_session_use(const address& wallet, const address& op, const hash256& leaf);

    [[nodiscard]] intx::uint256 get_permit_nonce(const address& wallet, const address& op) const;
    void bump_permit_nonce(const address& wallet, const address& op);

    [[nodiscard]] bool is_revoked(const address& wallet, const bytes32& hash) const;

    /// Marks the hash revoked. Revocation is permanent.
    void revoke(const address& wallet, const bytes32& hash);

    /// Removes the permissions, spending limits and session uses of the wallet.
    ///
    /// The permit nonces and the revoked hashes are kept so consumed or revoked permits
    /// cannot be replayed after the wallet re-enables the validator.
    void clear_wallet(const address& wallet);

    /// Returns the journal checkpoint. Pass it to rollback()
    /// to revert the changes made after it.
    [[nodiscard]] size_t checkpoint() const noexcept { return m_journal.size(); }

    /// Reverts changes made after the checkpoint.
    void rollback(size_t checkpoint);

    /// Makes all changes permanent by dropping the journal.
    void commit() noexcept { m_journal.clear(); }
};
}  // namespace warden
