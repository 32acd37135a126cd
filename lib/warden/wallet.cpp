// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "wallet.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include "validation_data.hpp"
#include <algorithm>
#include <exception>
#include <system_error>

namespace warden
{
void Wallet::enable_validator(const address& validator_address, ValidatorType type, IValidator& v)
{
    if (type == ValidatorType::disabled)
        throw ValidationError{INVALID_VALIDATOR_TYPE};
    m_validators[validator_address] = {type, &v};
}

void Wallet::disable_validator(const address& validator_address)
{
    const auto it = m_validators.find(validator_address);
    if (it == m_validators.end())
        throw ValidationError{VALIDATOR_NOT_ENABLED};

    auto* const validator = it->second.validator;
    m_validators.erase(it);

    try
    {
        validator->clear_wallet_config(m_address);
    }
    catch (const std::system_error& e)
    {
        if (m_first_listener)
            m_first_listener->notify_disabled_with_error(m_address, validator_address, e.code());
    }
    catch (const std::exception&)
    {
        if (m_first_listener)
        {
            m_first_listener->notify_disabled_with_error(
                m_address, validator_address, make_error_code(UNKNOWN_ERROR));
        }
    }
}

ValidatorType Wallet::validator_type(const address& validator_address) const noexcept
{
    const auto it = m_validators.find(validator_address);
    return it != m_validators.end() ? it->second.type : ValidatorType::disabled;
}

IValidator* Wallet::find_validator(const address& validator_address) const noexcept
{
    const auto it = m_validators.find(validator_address);
    return it != m_validators.end() ? it->second.validator : nullptr;
}

std::pair<address, const Wallet::ValidatorEntry*> Wallet::select_validator(
    bytes_view signature) const noexcept
{
    address validator_address;
    if (signature.size() < sizeof(validator_address))
        return {validator_address, nullptr};
    std::copy_n(signature.data(), sizeof(validator_address), validator_address.bytes);

    const auto it = m_validators.find(validator_address);
    return {validator_address, it != m_validators.end() ? &it->second : nullptr};
}

intx::uint256 Wallet::validate_user_op(
    const UserOperation& op, const hash256& op_hash, const BlockInfo& block)
{
    const auto [validator_address, entry] = select_validator(op.signature);
    if (entry == nullptr)
        return SIG_VALIDATION_FAILED;

    if (entry->type == ValidatorType::normal)
    {
        const auto selector = abi::load_selector(op.call_data);
        if (selector != NORMAL_EXECUTE_SELECTOR && selector != BATCH_NORMAL_EXECUTE_SELECTOR)
            return SIG_VALIDATION_FAILED;
    }

    try
    {
        return entry->validator->validate_signature(*this, op, op_hash, block);
    }
    catch (const std::system_error& e)
    {
        if (m_first_listener)
            m_first_listener->notify_validation_failed(m_address, validator_address, e.code());
        return SIG_VALIDATION_FAILED;
    }
    catch (const std::exception&)
    {
        if (m_first_listener)
        {
            m_first_listener->notify_validation_failed(
                m_address, validator_address, make_error_code(UNKNOWN_ERROR));
        }
        return SIG_VALIDATION_FAILED;
    }
}

bool Wallet::is_valid_signature(const hash256& hash, bytes_view signature)
{
    const auto [validator_address, entry] = select_validator(signature);
    if (entry == nullptr || entry->type != ValidatorType::sudo)
        return false;
    return entry->validator->is_valid_signature(
        *this, hash, signature.substr(sizeof(validator_address)));
}
}  // namespace warden
