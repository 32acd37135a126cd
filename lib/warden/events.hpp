// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include "permission.hpp"
#include "spending.hpp"
#include <intx/intx.hpp>
#include <memory>
#include <ostream>
#include <system_error>

namespace warden
{
class EventListener
{
    friend class SessionKeyValidator;  // Have access the m_next_listener to traverse the list.
    friend class Wallet;
    std::unique_ptr<EventListener> m_next_listener;

public:
    virtual ~EventListener() = default;

    void notify_session_root_set(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const hash256& root) noexcept
    {
        on_session_root_set(wallet, op, root);
        if (m_next_listener)
            m_next_listener->notify_session_root_set(wallet, op, root);
    }

    void notify_operator_permission_set(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const OperatorPermission& permission) noexcept
    {
        on_operator_permission_set(wallet, op, permission);
        if (m_next_listener)
            m_next_listener->notify_operator_permission_set(wallet, op, permission);
    }

    void notify_remaining_gas_set(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const intx::uint256& gas) noexcept
    {
        on_remaining_gas_set(wallet, op, gas);
        if (m_next_listener)
            m_next_listener->notify_remaining_gas_set(wallet, op, gas);
    }

    void notify_remaining_times_set(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const intx::uint256& times) noexcept
    {
        on_remaining_times_set(wallet, op, times);
        if (m_next_listener)
            m_next_listener->notify_remaining_times_set(wallet, op, times);
    }

    void notify_spending_limit_set(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const SpendingLimitConfig& config) noexcept
    {
        on_spending_limit_set(wallet, op, config);
        if (m_next_listener)
            m_next_listener->notify_spending_limit_set(wallet, op, config);
    }

    void notify_spending_limit_reset(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const address& token) noexcept
    {
        on_spending_limit_reset(wallet, op, token);
        if (m_next_listener)
            m_next_listener->notify_spending_limit_reset(wallet, op, token);
    }

    void notify_spending_limit_deleted(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const address& token) noexcept
    {
        on_spending_limit_deleted(wallet, op, token);
        if (m_next_listener)
            m_next_listener->notify_spending_limit_deleted(wallet, op, token);
    }

    void notify_signature_revoked(  // NOLINT(misc-no-recursion)
        const address& wallet, const hash256& hash) noexcept
    {
        on_signature_revoked(wallet, hash);
        if (m_next_listener)
            m_next_listener->notify_signature_revoked(wallet, hash);
    }

    void notify_permit_consumed(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& op, const hash256& permit_hash,
        const intx::uint256& nonce) noexcept
    {
        on_permit_consumed(wallet, op, permit_hash, nonce);
        if (m_next_listener)
            m_next_listener->notify_permit_consumed(wallet, op, permit_hash, nonce);
    }

    void notify_wallet_config_cleared(const address& wallet) noexcept  // NOLINT(misc-no-recursion)
    {
        on_wallet_config_cleared(wallet);
        if (m_next_listener)
            m_next_listener->notify_wallet_config_cleared(wallet);
    }

    void notify_validation_failed(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& validator, std::error_code error) noexcept
    {
        on_validation_failed(wallet, validator, error);
        if (m_next_listener)
            m_next_listener->notify_validation_failed(wallet, validator, error);
    }

    void notify_disabled_with_error(  // NOLINT(misc-no-recursion)
        const address& wallet, const address& validator, std::error_code error) noexcept
    {
        on_disabled_with_error(wallet, validator, error);
        if (m_next_listener)
            m_next_listener->notify_disabled_with_error(wallet, validator, error);
    }

private:
    virtual void on_session_root_set(
        const address& wallet, const address& op, const hash256& root) noexcept = 0;
    virtual void on_operator_permission_set(
        const address& wallet, const address& op, const OperatorPermission& permission) noexcept = 0;
    virtual void on_remaining_gas_set(
        const address& wallet, const address& op, const intx::uint256& gas) noexcept = 0;
    virtual void on_remaining_times_set(
        const address& wallet, const address& op, const intx::uint256& times) noexcept = 0;
    virtual void on_spending_limit_set(
        const address& wallet, const address& op, const SpendingLimitConfig& config) noexcept = 0;
    virtual void on_spending_limit_reset(
        const address& wallet, const address& op, const address& token) noexcept = 0;
    virtual void on_spending_limit_deleted(
        const address& wallet, const address& op, const address& token) noexcept = 0;
    virtual void on_signature_revoked(const address& wallet, const hash256& hash) noexcept = 0;
    virtual void on_permit_consumed(const address& wallet, const address& op,
        const hash256& permit_hash, const intx::uint256& nonce) noexcept = 0;
    virtual void on_wallet_config_cleared(const address& wallet) noexcept = 0;
    virtual void on_validation_failed(
        const address& wallet, const address& validator, std::error_code error) noexcept = 0;
    virtual void on_disabled_with_error(
        const address& wallet, const address& validator, std::error_code error) noexcept = 0;
};

/// Creates the event writer reporting every event as a JSON object in a separate line.
///
/// @param out  Report output stream.
/// @return     Event writer object.
std::unique_ptr<EventListener> create_json_event_writer(std::ostream& out);

}  // namespace warden
