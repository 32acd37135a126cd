// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include "user_operation.hpp"
#include <intx/intx.hpp>

namespace warden
{
class Wallet;

/// The class of a validator registered in a wallet.
enum class ValidatorType : uint8_t
{
    disabled = 0,

    /// Sudo validators authorize any operation, including wallet configuration changes.
    sudo = 1,

    /// Normal validators authorize the normal execution entry points only.
    normal = 2,
};

/// The block context of the validation.
struct BlockInfo
{
    uint64_t timestamp = 0;
};

/// The validator plugin interface.
class IValidator
{
public:
    virtual ~IValidator() = default;

    /// Validates the user operation of the wallet.
    ///
    /// @return The packed validation data.
    /// @throws ValidationError  The operation is rejected (the validation call reverts).
    virtual intx::uint256 validate_signature(Wallet& wallet, const UserOperation& op,
        const hash256& op_hash, const BlockInfo& block) = 0;

    /// Checks the signature on behalf of the wallet (EIP-1271).
    [[nodiscard]] virtual bool is_valid_signature(
        Wallet& wallet, const hash256& hash, bytes_view signature) = 0;

    /// Removes the wallet configuration kept by the validator. Called when it gets disabled.
    virtual void clear_wallet_config(const address& wallet) = 0;
};

}  // namespace warden
