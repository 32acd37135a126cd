// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "events.hpp"
#include "hash_utils.hpp"
#include "user_operation.hpp"
#include "validator.hpp"
#include <intx/intx.hpp>
#include <memory>
#include <unordered_map>

namespace warden
{
/// The modular wallet host.
///
/// Keeps the registry of enabled validators and routes the user operation validation
/// to the validator selected by the signature prefix.
class Wallet
{
    struct ValidatorEntry
    {
        ValidatorType type = ValidatorType::disabled;
        IValidator* validator = nullptr;
    };

    address m_address;

    /// The enabled validators. The validators are owned by the caller.
    std::unordered_map<address, ValidatorEntry> m_validators;

    std::unique_ptr<EventListener> m_first_listener;

    /// Returns the validator addressed by the 20-byte signature prefix.
    [[nodiscard]] std::pair<address, const ValidatorEntry*> select_validator(
        bytes_view signature) const noexcept;

public:
    explicit Wallet(const address& addr) noexcept : m_address{addr} {}

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    [[nodiscard]] const address& get_address() const noexcept { return m_address; }

    void add_listener(std::unique_ptr<EventListener> listener) noexcept
    {
        auto* end = &m_first_listener;
        while (*end)
            end = &(*end)->m_next_listener;
        *end = std::move(listener);
    }

    [[nodiscard]] EventListener* get_listener() const noexcept { return m_first_listener.get(); }

    /// Enables the validator under the address.
    /// @throws ValidationError  INVALID_VALIDATOR_TYPE for the disabled type.
    void enable_validator(const address& validator_address, ValidatorType type, IValidator& v);

    /// Disables the validator and asks it to clear the wallet configuration.
    /// A failure of the validator to clear the configuration does not prevent disabling,
    /// it is reported to the listeners.
    /// @throws ValidationError  VALIDATOR_NOT_ENABLED.
    void disable_validator(const address& validator_address);

    [[nodiscard]] ValidatorType validator_type(const address& validator_address) const noexcept;

    /// Returns the enabled validator or null.
    [[nodiscard]] IValidator* find_validator(const address& validator_address) const noexcept;

    /// Validates the user operation (the EntryPoint's validateUserOp).
    ///
    /// An exception thrown by the validator is reported to the listeners (UNKNOWN_ERROR unless
    /// it carries an error code) and the failure is returned as SIG_VALIDATION_FAILED.
    /// Normal validators may only authorize normalExecute and batchNormalExecute.
    /// @return The packed validation data.
    [[nodiscard]] intx::uint256 validate_user_op(
        const UserOperation& op, const hash256& op_hash, const BlockInfo& block);

    /// Checks the signature on behalf of the wallet (EIP-1271).
    /// Only sudo validators may sign for the wallet.
    [[nodiscard]] bool is_valid_signature(const hash256& hash, bytes_view signature);
};
}  // namespace warden
