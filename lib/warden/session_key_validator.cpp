// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "session_key_validator.hpp"
#include "ecdsa.hpp"
#include "errors.hpp"
#include "predicate.hpp"
#include "wallet.hpp"
#include <algorithm>
#include <stdexcept>

namespace warden
{
namespace
{
constexpr bool is_unlimited(const intx::uint256& budget) noexcept
{
    return budget >= MAX_UINT128;
}

void check_budget(const intx::uint256& budget)
{
    if (budget > MAX_UINT128)
        throw std::invalid_argument{"budget exceeds uint128: " + intx::to_string(budget)};
}

uint64_t to_minutes(const BlockInfo& block) noexcept
{
    return block.timestamp / 60;
}

/// Narrows the validity window by the window of the next constraint.
void narrow(ValidationData& window, uint64_t valid_until, uint64_t valid_after)
{
    const auto result =
        intersect_validity(window.valid_until, valid_until, window.valid_after, valid_after);
    if (const auto* error = std::get_if<std::error_code>(&result))
        throw ValidationError{*error};
    window = std::get<ValidationData>(result);
}
}  // namespace

void SessionKeyValidator::check_idle() const
{
    if (m_validating)
        throw ValidationError{REENTRANT_CALL};
}

intx::uint256 SessionKeyValidator::validate_signature(
    Wallet& wallet, const UserOperation& op, const hash256& op_hash, const BlockInfo& block)
{
    check_idle();
    m_validating = true;

    const auto& wallet_address = wallet.get_address();
    const auto checkpoint = m_store.checkpoint();
    std::optional<ConsumedPermit> consumed_permit;
    ValidationData result;
    try
    {
        result = validate(wallet, op, op_hash, block, consumed_permit);
    }
    catch (...)
    {
        m_store.rollback(checkpoint);
        m_validating = false;
        throw;
    }
    m_validating = false;

    if (result.sig_failed)
    {
        m_store.rollback(checkpoint);
        return pack(result);
    }

    m_store.commit();

    if (consumed_permit.has_value() && m_first_listener)
    {
        const auto& p = *consumed_permit;
        m_first_listener->notify_operator_permission_set(wallet_address, p.op, p.permission);
        for (const auto& config : p.spending_limits)
            m_first_listener->notify_spending_limit_set(wallet_address, p.op, config);
        m_first_listener->notify_permit_consumed(wallet_address, p.op, p.hash, p.nonce);
    }
    return pack(result);
}

ValidationData SessionKeyValidator::validate(Wallet& wallet, const UserOperation& op,
    const hash256& op_hash, const BlockInfo& block, std::optional<ConsumedPermit>& consumed_permit)
{
    const auto& wallet_address = wallet.get_address();

    const auto wallet_op = decode_wallet_operation(op.call_data);
    if (std::any_of(wallet_op.calls.begin(), wallet_op.calls.end(),
            [](const Call& call) { return call.operation != 0; }))
        throw ValidationError{DELEGATECALL_NOT_ALLOWED};

    if (op.signature.size() < sizeof(address))
        throw ValidationError{MALFORMED_SIGNATURE};
    const auto payload = bytes_view{op.signature}.substr(sizeof(address));
    const auto sig = decode_session_signature(payload, wallet_op.is_batch);
    if (sig.calls.size() != wallet_op.calls.size())
        throw ValidationError{INVALID_BATCH_LENGTH};

    if (sig.permit.has_value())
        consumed_permit = consume_permit(wallet, sig.op, *sig.permit, block);

    const auto permission = m_store.get_permission(wallet_address, sig.op);
    validate_paymaster(op, permission.paymaster);

    const auto charged = validate_operator_gas_usage(op, permission);
    if (const auto* error = std::get_if<std::error_code>(&charged))
        throw ValidationError{*error};
    if (const auto& updated = std::get<OperatorPermission>(charged); updated != permission)
        m_store.set_permission(wallet_address, sig.op, updated);

    ValidationData window;
    narrow(window, permission.valid_until, permission.valid_after);

    for (size_t i = 0; i < sig.calls.size(); ++i)
    {
        const auto& session_call = sig.calls[i];
        const auto& session = session_call.session;
        const auto& call = wallet_op.calls[i];

        verify_session_membership(session_call.proof, permission.session_root, session);
        validate_paymaster(op, session.paymaster);
        warden::check_arguments(
            session, call.to, call.data, call.value, session_call.actual_arguments);
        use_session(wallet_address, sig.op, session);
        spend(wallet_address, sig.op, call, block);
        narrow(window, session.valid_until, session.valid_after);
    }

    const auto signer =
        ecdsa::recover_signer(operator_message_hash(op_hash, m_config.self), sig.operator_signature);
    window.sig_failed = !signer.has_value() || *signer != sig.op;
    return window;
}

SessionKeyValidator::ConsumedPermit SessionKeyValidator::consume_permit(
    Wallet& wallet, const address& op, const Permit& permit, const BlockInfo& block)
{
    const auto& wallet_address = wallet.get_address();
    if (permit.signature.size() < sizeof(address))
        throw ValidationError{MALFORMED_SIGNATURE};

    const auto nonce = m_store.get_permit_nonce(wallet_address, op);
    const auto hash = permit_hash(
        wallet_address, op, permit.permission, permit.spending_limits, m_config.chain_id, nonce);

    address permit_validator;
    std::copy_n(permit.signature.data(), sizeof(permit_validator), permit_validator.bytes);
    if (wallet.validator_type(permit_validator) != ValidatorType::sudo)
        throw ValidationError{INVALID_PERMIT_VALIDATOR};
    if (m_store.is_revoked(wallet_address, hash))
        throw ValidationError{PERMIT_REVOKED};
    if (!wallet.is_valid_signature(hash, permit.signature))
        throw ValidationError{INVALID_PERMIT_SIGNATURE};

    m_store.set_permission(wallet_address, op, permit.permission);
    for (const auto& config : permit.spending_limits)
    {
        m_store.set_spending_limit(
            wallet_address, op, config.token, make_spending_limit(config, to_minutes(block)));
    }
    m_store.revoke(wallet_address, hash);
    m_store.bump_permit_nonce(wallet_address, op);

    return {op, hash, nonce, permit.permission, permit.spending_limits};
}

void SessionKeyValidator::spend(
    const address& wallet, const address& op, const Call& call, const BlockInfo& block)
{
    for (const auto& [token, amount] : extract_outflows(wallet, call.to, call.value, call.data))
    {
        auto limit = m_store.get_spending_limit(wallet, op, token);
        if (!limit.is_set())
            continue;
        apply_scheduled_reset(limit, to_minutes(block));
        charge(limit, amount);
        m_store.set_spending_limit(wallet, op, token, limit);
    }
}

void SessionKeyValidator::use_session(
    const address& wallet, const address& op, const Session& session)
{
    const auto leaf = session_leaf_hash(session);
    if (!session.has_unlimited_uses() &&
        m_store.get_session_uses(wallet, op, leaf) >= session.times_limit)
        throw ValidationError{SESSION_USAGE_EXCEEDED};
    m_store.record_session_use(wallet, op, leaf);
}

void SessionKeyValidator::clear_wallet_config(const address& wallet)
{
    check_idle();
    m_store.clear_wallet(wallet);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_wallet_config_cleared(wallet);
}

void SessionKeyValidator::set_session_root(
    const address& wallet, const address& op, const hash256& root)
{
    check_idle();
    auto permission = m_store.get_permission(wallet, op);
    permission.session_root = root;
    m_store.set_permission(wallet, op, permission);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_session_root_set(wallet, op, root);
}

void SessionKeyValidator::set_operator_remaining_gas(
    const address& wallet, const address& op, const intx::uint256& gas)
{
    check_idle();
    check_budget(gas);
    auto permission = m_store.get_permission(wallet, op);
    permission.gas_remaining = gas;
    m_store.set_permission(wallet, op, permission);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_remaining_gas_set(wallet, op, gas);
}

void SessionKeyValidator::set_operator_remaining_times(
    const address& wallet, const address& op, const intx::uint256& times)
{
    check_idle();
    check_budget(times);
    auto permission = m_store.get_permission(wallet, op);
    permission.times_remaining = times;
    m_store.set_permission(wallet, op, permission);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_remaining_times_set(wallet, op, times);
}

void SessionKeyValidator::set_operator_permission(
    const address& wallet, const address& op, const OperatorPermission& permission)
{
    check_idle();
    check_budget(permission.gas_remaining);
    check_budget(permission.times_remaining);
    m_store.set_permission(wallet, op, permission);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_operator_permission_set(wallet, op, permission);
}

void SessionKeyValidator::set_spending_limit(const address& wallet, const address& op,
    const SpendingLimitConfig& config, const BlockInfo& block)
{
    check_idle();
    m_store.set_spending_limit(
        wallet, op, config.token, make_spending_limit(config, to_minutes(block)));
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_spending_limit_set(wallet, op, config);
}

void SessionKeyValidator::batch_set_spending_limit(const address& wallet, const address& op,
    std::span<const SpendingLimitConfig> configs, const BlockInfo& block)
{
    check_idle();
    for (const auto& config : configs)
        set_spending_limit(wallet, op, config, block);
}

void SessionKeyValidator::reset_spending_limit(
    const address& wallet, const address& op, const address& token)
{
    check_idle();
    auto limit = m_store.get_spending_limit(wallet, op, token);
    limit.spent = 0;
    m_store.set_spending_limit(wallet, op, token, limit);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_spending_limit_reset(wallet, op, token);
}

void SessionKeyValidator::delete_spending_limit(
    const address& wallet, const address& op, const address& token)
{
    check_idle();
    m_store.delete_spending_limit(wallet, op, token);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_spending_limit_deleted(wallet, op, token);
}

void SessionKeyValidator::revoke_signature(const address& wallet, const hash256& hash)
{
    check_idle();
    m_store.revoke(wallet, hash);
    m_store.commit();
    if (m_first_listener)
        m_first_listener->notify_signature_revoked(wallet, hash);
}

hash256 SessionKeyValidator::get_session_root(const address& wallet, const address& op) const
{
    return m_store.get_permission(wallet, op).session_root;
}

OperatorPermission SessionKeyValidator::get_operator_permission(
    const address& wallet, const address& op) const
{
    return m_store.get_permission(wallet, op);
}

intx::uint256 SessionKeyValidator::get_operator_remaining_gas(
    const address& wallet, const address& op) const
{
    return m_store.get_permission(wallet, op).gas_remaining;
}

intx::uint256 SessionKeyValidator::get_operator_remaining_times(
    const address& wallet, const address& op) const
{
    return m_store.get_permission(wallet, op).times_remaining;
}

intx::uint256 SessionKeyValidator::get_session_times_used(
    const address& wallet, const address& op, const Session& session) const
{
    return m_store.get_session_uses(wallet, op, session_leaf_hash(session));
}

SpendingLimit SessionKeyValidator::get_spending_limit(
    const address& wallet, const address& op, const address& token) const
{
    return m_store.get_spending_limit(wallet, op, token);
}

std::vector<SpendingLimit> SessionKeyValidator::batch_get_spending_limit(
    const address& wallet, const address& op, std::span<const address> tokens) const
{
    std::vector<SpendingLimit> limits;
    limits.reserve(tokens.size());
    for (const auto& token : tokens)
        limits.emplace_back(m_store.get_spending_limit(wallet, op, token));
    return limits;
}

intx::uint256 SessionKeyValidator::get_permit_nonce(const address& wallet, const address& op) const
{
    return m_store.get_permit_nonce(wallet, op);
}

hash256 SessionKeyValidator::get_permit_message_hash(const address& wallet, const address& op,
    const OperatorPermission& permission, std::span<const SpendingLimitConfig> spending_limits) const
{
    return permit_hash(wallet, op, permission, spending_limits, m_config.chain_id,
        m_store.get_permit_nonce(wallet, op));
}

bool SessionKeyValidator::is_revoked(const address& wallet, const hash256& hash) const
{
    return m_store.is_revoked(wallet, hash);
}

void SessionKeyValidator::validate_session_root(
    std::span<const bytes32> proof, const hash256& root, const Session& session)
{
    verify_session_membership(proof, root, session);
}

bool SessionKeyValidator::is_allowed_calldata(
    bytes_view allowed_arguments, bytes_view actual_arguments, const intx::uint256& value)
{
    return predicate::is_allowed_calldata(allowed_arguments, actual_arguments, value);
}

void SessionKeyValidator::check_arguments(const Session& session, const address& to,
    bytes_view data, const intx::uint256& value, bytes_view actual_arguments)
{
    warden::check_arguments(session, to, data, value, actual_arguments);
}

void SessionKeyValidator::validate_paymaster(const UserOperation& op, const address& pinned)
{
    if (pinned != address{} && paymaster_of(op) != pinned)
        throw ValidationError{INVALID_PAYMASTER};
}

std::variant<OperatorPermission, std::error_code> SessionKeyValidator::validate_operator_gas_usage(
    const UserOperation& op, const OperatorPermission& permission)
{
    auto result = permission;

    if (!is_unlimited(permission.gas_remaining))
    {
        const auto fee = max_gas_fee(op);
        if (!fee.has_value() || *fee > permission.gas_remaining)
            return make_error_code(GAS_FEE_EXCEEDS_REMAINING_GAS);
        result.gas_remaining -= *fee;
    }

    if (permission.times_remaining == 0)
        return make_error_code(OPERATOR_USAGE_EXHAUSTED);
    if (!is_unlimited(permission.times_remaining))
        result.times_remaining -= 1;

    return result;
}

std::variant<ValidationData, std::error_code> SessionKeyValidator::get_validation_intersection(
    uint64_t valid_until_a, uint64_t valid_until_b, uint64_t valid_after_a, uint64_t valid_after_b)
{
    return intersect_validity(valid_until_a, valid_until_b, valid_after_a, valid_after_b);
}
}  // namespace warden
