// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "events.hpp"
#include "permission.hpp"
#include "permission_store.hpp"
#include "session.hpp"
#include "session_signature.hpp"
#include "spending.hpp"
#include "validation_data.hpp"
#include "validator.hpp"
#include <intx/intx.hpp>
#include <memory>
#include <optional>
#include <span>
#include <system_error>
#include <variant>
#include <vector>

namespace warden
{
/// The session-key validator configuration.
struct Config
{
    /// The address of the validator itself. The operator signatures are bound to it.
    address self;

    /// The chain id the permits are bound to.
    uint64_t chain_id = 1;
};

/// The session-key validator.
///
/// Authorizes wallet operations signed by operator keys within the limits of the operator
/// permission set by the wallet: the Merkle-committed sessions, the fee budget, the number of
/// uses and the per-token spending limits.
///
/// The management methods take the calling wallet and modify only the records of that wallet.
/// Neither they nor another validation may be called while a validation is in progress
/// (e.g. from the is_valid_signature of a validator checking the permit).
class SessionKeyValidator : public IValidator
{
    Config m_config;
    PermissionStore m_store;

    /// A validation is in progress. The journal of the store spans the whole validation.
    bool m_validating = false;

    std::unique_ptr<EventListener> m_first_listener;

    /// The installed permit, reported to the listeners once the validation succeeds.
    struct ConsumedPermit
    {
        address op;
        hash256 hash;
        intx::uint256 nonce;
        OperatorPermission permission;
        std::vector<SpendingLimitConfig> spending_limits;
    };

    /// @throws ValidationError  REENTRANT_CALL if a validation is in progress.
    void check_idle() const;

    /// Verifies and installs the permit.
    ConsumedPermit consume_permit(
        Wallet& wallet, const address& op, const Permit& permit, const BlockInfo& block);

    /// Checks and charges the spending limits of the call outflows.
    void spend(const address& wallet, const address& op, const Call& call, const BlockInfo& block);

    /// Checks and records the session use.
    void use_session(const address& wallet, const address& op, const Session& session);

    ValidationData validate(Wallet& wallet, const UserOperation& op, const hash256& op_hash,
        const BlockInfo& block, std::optional<ConsumedPermit>& consumed_permit);

public:
    explicit SessionKeyValidator(const Config& config) noexcept : m_config{config} {}

    [[nodiscard]] const Config& config() const noexcept { return m_config; }

    void add_listener(std::unique_ptr<EventListener> listener) noexcept
    {
        // Find the first empty unique_ptr and assign the new listener to it.
        auto* end = &m_first_listener;
        while (*end)
            end = &(*end)->m_next_listener;
        *end = std::move(listener);
    }

    [[nodiscard]] EventListener* get_listener() const noexcept { return m_first_listener.get(); }

    /// Validates the user operation signed by an operator.
    ///
    /// @return The packed validation data: the intersection of the permission and the session
    ///         validity windows, or the failure flag if the operator signature is invalid.
    ///         The store changes of a failed signature check are reverted.
    /// @throws ValidationError  The operation is not authorized. The store changes are reverted.
    intx::uint256 validate_signature(Wallet& wallet, const UserOperation& op,
        const hash256& op_hash, const BlockInfo& block) override;

    /// Session keys never sign on behalf of the wallet.
    [[nodiscard]] bool is_valid_signature(
        Wallet& /*wallet*/, const hash256& /*hash*/, bytes_view /*signature*/) override
    {
        return false;
    }

    /// Removes all records of the wallet.
    void clear_wallet_config(const address& wallet) override;

    void set_session_root(const address& wallet, const address& op, const hash256& root);

    /// The budget setters accept values up to max uint128 (unlimited).
    /// @throws std::invalid_argument  The budget does not fit 128 bits.
    void set_operator_remaining_gas(
        const address& wallet, const address& op, const intx::uint256& gas);
    void set_operator_remaining_times(
        const address& wallet, const address& op, const intx::uint256& times);
    void set_operator_permission(
        const address& wallet, const address& op, const OperatorPermission& permission);
    void set_spending_limit(const address& wallet, const address& op,
        const SpendingLimitConfig& config, const BlockInfo& block);
    void batch_set_spending_limit(const address& wallet, const address& op,
        std::span<const SpendingLimitConfig> configs, const BlockInfo& block);

    /// Zeroes the spent amount keeping the allowance and the schedule.
    void reset_spending_limit(const address& wallet, const address& op, const address& token);
    void delete_spending_limit(const address& wallet, const address& op, const address& token);

    /// Revokes the permit hash. Revoked permits are rejected.
    void revoke_signature(const address& wallet, const hash256& hash);

    [[nodiscard]] hash256 get_session_root(const address& wallet, const address& op) const;
    [[nodiscard]] OperatorPermission get_operator_permission(
        const address& wallet, const address& op) const;
    [[nodiscard]] intx::uint256 get_operator_remaining_gas(
        const address& wallet, const address& op) const;
    [[nodiscard]] intx::uint256 get_operator_remaining_times(
        const address& wallet, const address& op) const;
    [[nodiscard]] intx::uint256 get_session_times_used(
        const address& wallet, const address& op, const Session& session) const;
    [[nodiscard]] SpendingLimit get_spending_limit(
        const address& wallet, const address& op, const address& token) const;
    [[nodiscard]] std::vector<SpendingLimit> batch_get_spending_limit(
        const address& wallet, const address& op, std::span<const address> tokens) const;
    [[nodiscard]] intx::uint256 get_permit_nonce(const address& wallet, const address& op) const;

    /// Returns the hash the wallet owner signs to authorize the permit with the current nonce.
    [[nodiscard]] hash256 get_permit_message_hash(const address& wallet, const address& op,
        const OperatorPermission& permission,
        std::span<const SpendingLimitConfig> spending_limits) const;

    [[nodiscard]] bool is_revoked(const address& wallet, const hash256& hash) const;

    /// @throws ValidationError  INVALID_SESSION_ROOT.
    static void validate_session_root(
        std::span<const bytes32> proof, const hash256& root, const Session& session);

    [[nodiscard]] static bool is_allowed_calldata(
        bytes_view allowed_arguments, bytes_view actual_arguments, const intx::uint256& value);

    static void check_arguments(const Session& session, const address& to, bytes_view data,
        const intx::uint256& value, bytes_view actual_arguments);

    /// @throws ValidationError  INVALID_PAYMASTER if the paymaster is pinned and differs.
    static void validate_paymaster(const UserOperation& op, const address& pinned);

    /// Charges the operation fee and the use to the permission.
    ///
    /// @return The permission with the budgets decreased or the error code:
    ///         GAS_FEE_EXCEEDS_REMAINING_GAS or OPERATOR_USAGE_EXHAUSTED.
    [[nodiscard]] static std::variant<OperatorPermission, std::error_code>
    validate_operator_gas_usage(const UserOperation& op, const OperatorPermission& permission);

    [[nodiscard]] static std::variant<ValidationData, std::error_code> get_validation_intersection(
        uint64_t valid_until_a, uint64_t valid_until_b, uint64_t valid_after_a,
        uint64_t valid_after_b);
};

}  // namespace warden
