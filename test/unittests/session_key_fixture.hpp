// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <gtest/gtest.h>
#include <test/utils/owner_validator.hpp>
#include <test/utils/utils.hpp>
#include <warden/errors.hpp>
#include <warden/session_key_validator.hpp>
#include <warden/wallet.hpp>

namespace warden::test
{
/// Fixture of the session-key validation tests.
///
/// The wallet has the owner ECDSA validator enabled as sudo and the session-key validator
/// enabled as normal. The operator key signs the session operations, the owner key signs permits.
class session_key_validation : public testing::Test
{
protected:
    static constexpr auto Wallet1 = 0x3a11e7_address;
    static constexpr auto SessionKeyValidatorAddr = 0x5e55_address;
    static constexpr auto OwnerValidatorAddr = 0x0e1e_address;
    static constexpr auto EntryPoint = 0x5ff137d4b0fdcd49dca30c7cf57e578a026d2789_address;
    static constexpr uint64_t ChainId = 1;
    static constexpr auto Token = 0x7070_address;
    static constexpr auto Paymaster = 0xfa11_address;

    /// Private key 1. The address is 0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf.
    static constexpr intx::uint256 OperatorKey{1};
    static constexpr intx::uint256 OwnerKey{2};
    static constexpr intx::uint256 StrangerKey{3};

    const address Operator = ecdsa::to_address(OperatorKey);
    const address Owner = ecdsa::to_address(OwnerKey);

    Wallet wallet{Wallet1};
    SessionKeyValidator validator{{.self = SessionKeyValidatorAddr, .chain_id = ChainId}};
    OwnerValidator owner;
    BlockInfo block{.timestamp = 1'700'000'000};

    /// The fee budget of the default user operation: (1000 + 1000 + 500) * 1.
    UserOperation op{
        .sender = Wallet1,
        .call_gas_limit = 1000,
        .verification_gas_limit = 1000,
        .pre_verification_gas = 500,
        .max_fee_per_gas = 1,
    };

    void SetUp() override;

    /// Sets the unlimited permission with the given session root.
    void grant(const hash256& session_root);

    /// Session allowing the ERC-20 transfer of the Token with the predicates of
    /// the (value, recipient, amount) slots.
    [[nodiscard]] Session transfer_session(bytes allowed_arguments) const;

    [[nodiscard]] static bytes transfer_calldata(const address& to, const intx::uint256& amount);

    /// Builds the call of the session: the actual arguments are derived from the call.
    [[nodiscard]] static SessionCall session_call(
        const SessionTree& tree, const Session& session, const Call& call);

    /// Sets the call data of the operation to normalExecute or batchNormalExecute of the calls.
    void set_calls(std::span<const Call> calls, bool is_batch);

    /// Signs the operation with the key, puts the signature payload to the operation
    /// and returns the operation hash.
    hash256 sign(SessionSignature sig, const intx::uint256& key = OperatorKey);

    /// Creates the permit signed by the owner for the current permit nonce.
    [[nodiscard]] Permit make_permit(const OperatorPermission& permission,
        std::vector<SpendingLimitConfig> limits, const intx::uint256& key = OwnerKey) const;

    /// Signs the operation and runs the session-key validator directly.
    intx::uint256 validate(const SessionSignature& sig, const intx::uint256& key = OperatorKey);

    /// Signs the operation and runs the validation through the wallet.
    intx::uint256 validate_user_op(
        const SessionSignature& sig, const intx::uint256& key = OperatorKey);
};
}  // namespace warden::test
