// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "session_key_fixture.hpp"
#include <gmock/gmock.h>
#include <warden/predicate.hpp>
#include <sstream>
#include <stdexcept>

using namespace warden;
using namespace warden::test;
using namespace testing;

namespace
{
class MockListener : public EventListener
{
public:
    MOCK_METHOD(void, on_session_root_set, (const address&, const address&, const hash256&),
        (noexcept, override));
    MOCK_METHOD(void, on_operator_permission_set,
        (const address&, const address&, const OperatorPermission&), (noexcept, override));
    MOCK_METHOD(void, on_remaining_gas_set, (const address&, const address&, const intx::uint256&),
        (noexcept, override));
    MOCK_METHOD(void, on_remaining_times_set,
        (const address&, const address&, const intx::uint256&), (noexcept, override));
    MOCK_METHOD(void, on_spending_limit_set,
        (const address&, const address&, const SpendingLimitConfig&), (noexcept, override));
    MOCK_METHOD(void, on_spending_limit_reset, (const address&, const address&, const address&),
        (noexcept, override));
    MOCK_METHOD(void, on_spending_limit_deleted, (const address&, const address&, const address&),
        (noexcept, override));
    MOCK_METHOD(void, on_signature_revoked, (const address&, const hash256&), (noexcept, override));
    MOCK_METHOD(void, on_permit_consumed,
        (const address&, const address&, const hash256&, const intx::uint256&),
        (noexcept, override));
    MOCK_METHOD(void, on_wallet_config_cleared, (const address&), (noexcept, override));
    MOCK_METHOD(void, on_validation_failed, (const address&, const address&, std::error_code),
        (noexcept, override));
    MOCK_METHOD(void, on_disabled_with_error, (const address&, const address&, std::error_code),
        (noexcept, override));
};

/// The validator failing to clear the wallet configuration.
class BrokenValidator : public IValidator
{
public:
    intx::uint256 validate_signature(
        Wallet&, const UserOperation&, const hash256&, const BlockInfo&) override
    {
        return SIG_VALIDATION_FAILED;
    }

    [[nodiscard]] bool is_valid_signature(Wallet&, const hash256&, bytes_view) override
    {
        return false;
    }

    void clear_wallet_config(const address&) override { throw ValidationError{UNKNOWN_ERROR}; }
};

/// The validator failing with exceptions not carrying an error code.
class FaultyValidator : public IValidator
{
public:
    intx::uint256 validate_signature(
        Wallet&, const UserOperation&, const hash256&, const BlockInfo&) override
    {
        throw std::runtime_error{"validator fault"};
    }

    [[nodiscard]] bool is_valid_signature(Wallet&, const hash256&, bytes_view) override
    {
        return false;
    }

    void clear_wallet_config(const address&) override { throw std::out_of_range{"no config"}; }
};

class events : public session_key_validation
{
protected:
    StrictMock<MockListener>& listener = add_mock_listener();

    StrictMock<MockListener>& add_mock_listener()
    {
        auto mock = std::make_unique<StrictMock<MockListener>>();
        auto& ref = *mock;
        validator.add_listener(std::move(mock));
        return ref;
    }

    Session any_transfer_session() const
    {
        return transfer_session(
            predicate::encode_allowed({predicate::any(), predicate::any(), predicate::any()}));
    }
};
}  // namespace

TEST_F(events, management)
{
    constexpr auto Root = 0x2007_bytes32;
    const SpendingLimitConfig config{.token = Token, .allowance = 10};

    InSequence seq;
    EXPECT_CALL(listener, on_session_root_set(Wallet1, Operator, Root));
    EXPECT_CALL(listener, on_remaining_gas_set(Wallet1, Operator, intx::uint256{100}));
    EXPECT_CALL(listener, on_remaining_times_set(Wallet1, Operator, intx::uint256{3}));
    EXPECT_CALL(listener,
        on_spending_limit_set(Wallet1, Operator, Field(&SpendingLimitConfig::allowance, 10)));
    EXPECT_CALL(listener, on_spending_limit_reset(Wallet1, Operator, Token));
    EXPECT_CALL(listener, on_spending_limit_deleted(Wallet1, Operator, Token));
    EXPECT_CALL(listener, on_signature_revoked(Wallet1, Root));
    EXPECT_CALL(listener, on_wallet_config_cleared(Wallet1));

    validator.set_session_root(Wallet1, Operator, Root);
    validator.set_operator_remaining_gas(Wallet1, Operator, 100);
    validator.set_operator_remaining_times(Wallet1, Operator, 3);
    validator.set_spending_limit(Wallet1, Operator, config, block);
    validator.reset_spending_limit(Wallet1, Operator, Token);
    validator.delete_spending_limit(Wallet1, Operator, Token);
    validator.revoke_signature(Wallet1, Root);
    validator.clear_wallet_config(Wallet1);
}

TEST_F(events, rejected_setter_emits_nothing)
{
    EXPECT_THROW(validator.set_operator_remaining_gas(Wallet1, Operator, MAX_UINT128 + 1),
        std::invalid_argument);
}

TEST_F(events, listener_chain)
{
    auto& second = add_mock_listener();
    EXPECT_CALL(listener, on_signature_revoked(Wallet1, _));
    EXPECT_CALL(second, on_signature_revoked(Wallet1, _));
    validator.revoke_signature(Wallet1, {});
}

TEST_F(events, permit_consumed)
{
    const auto session = any_transfer_session();
    const SessionTree tree{std::vector{session}};
    const OperatorPermission permission{
        .session_root = tree.root(),
        .gas_remaining = MAX_UINT128,
        .times_remaining = MAX_UINT128,
    };
    const std::vector<SpendingLimitConfig> limits{
        {.token = Token, .allowance = 500},
        {.token = NATIVE_TOKEN, .allowance = 7},
    };
    const auto hash = validator.get_permit_message_hash(Wallet1, Operator, permission, limits);

    const Call call{.to = Token, .data = transfer_calldata(Operator, 100)};
    set_calls({&call, 1}, false);

    {
        InSequence seq;
        EXPECT_CALL(listener, on_operator_permission_set(Wallet1, Operator, permission));
        EXPECT_CALL(listener,
            on_spending_limit_set(Wallet1, Operator, Field(&SpendingLimitConfig::token, Token)));
        EXPECT_CALL(listener, on_spending_limit_set(
                                  Wallet1, Operator, Field(&SpendingLimitConfig::token, NATIVE_TOKEN)));
        EXPECT_CALL(listener, on_permit_consumed(Wallet1, Operator, hash, intx::uint256{0}));
    }

    EXPECT_EQ(validate({.op = Operator,
                  .calls = {session_call(tree, session, call)},
                  .permit = make_permit(permission, limits)}),
        0);
}

TEST_F(events, reverted_permit_emits_nothing)
{
    const auto session = any_transfer_session();
    const SessionTree tree{std::vector{session}};
    const OperatorPermission permission{
        .session_root = tree.root(),
        .gas_remaining = MAX_UINT128,
        .times_remaining = MAX_UINT128,
    };

    const Call call{.to = Token, .data = transfer_calldata(Operator, 100)};
    set_calls({&call, 1}, false);

    // Failed operator signature.
    EXPECT_TRUE(unpack(validate({.op = Operator,
                                    .calls = {session_call(tree, session, call)},
                                    .permit = make_permit(permission, {})},
                           StrangerKey))
                    .sig_failed);

    // Session check failure after the permit is installed.
    const Call other{.to = Paymaster, .data = transfer_calldata(Operator, 100)};
    set_calls({&other, 1}, false);
    EXPECT_VALIDATION_ERROR(validate({.op = Operator,
                                .calls = {session_call(tree, session, other)},
                                .permit = make_permit(permission, {})}),
        INVALID_TO);
}

TEST_F(events, wallet_reports_failures)
{
    auto wallet_listener = std::make_unique<StrictMock<MockListener>>();
    auto& wallet_mock = *wallet_listener;
    wallet.add_listener(std::move(wallet_listener));

    const auto session = any_transfer_session();
    const SessionTree tree{std::vector{session}};
    const Call call{.to = Token, .data = transfer_calldata(Operator, 100)};
    set_calls({&call, 1}, false);

    // No permission: the fee budget is empty.
    EXPECT_CALL(wallet_mock, on_validation_failed(Wallet1, SessionKeyValidatorAddr,
                                 make_error_code(GAS_FEE_EXCEEDS_REMAINING_GAS)));
    EXPECT_EQ(validate_user_op({.op = Operator, .calls = {session_call(tree, session, call)}}),
        SIG_VALIDATION_FAILED);

    constexpr auto BrokenAddr = 0x0bad_address;
    BrokenValidator broken;
    wallet.enable_validator(BrokenAddr, ValidatorType::normal, broken);
    EXPECT_CALL(
        wallet_mock, on_disabled_with_error(Wallet1, BrokenAddr, make_error_code(UNKNOWN_ERROR)));
    wallet.disable_validator(BrokenAddr);
    EXPECT_EQ(wallet.validator_type(BrokenAddr), ValidatorType::disabled);
}

TEST_F(events, wallet_reports_unknown_errors)
{
    auto wallet_listener = std::make_unique<StrictMock<MockListener>>();
    auto& wallet_mock = *wallet_listener;
    wallet.add_listener(std::move(wallet_listener));

    constexpr auto FaultyAddr = 0x0fa1_address;
    FaultyValidator faulty;
    wallet.enable_validator(FaultyAddr, ValidatorType::sudo, faulty);

    op.signature = bytes{FaultyAddr.bytes, sizeof(address)};
    EXPECT_CALL(
        wallet_mock, on_validation_failed(Wallet1, FaultyAddr, make_error_code(UNKNOWN_ERROR)));
    EXPECT_EQ(wallet.validate_user_op(op, {}, block), SIG_VALIDATION_FAILED);

    EXPECT_CALL(
        wallet_mock, on_disabled_with_error(Wallet1, FaultyAddr, make_error_code(UNKNOWN_ERROR)));
    wallet.disable_validator(FaultyAddr);
    EXPECT_EQ(wallet.validator_type(FaultyAddr), ValidatorType::disabled);
}

TEST(json_event_writer, management_events)
{
    std::ostringstream out;
    SessionKeyValidator validator{{.self = 0x5e55_address}};
    validator.add_listener(create_json_event_writer(out));

    constexpr auto Wallet = 0x3a11e7_address;
    constexpr auto Op = 0x0901_address;
    validator.set_session_root(Wallet, Op, 0x01_bytes32);
    validator.set_operator_remaining_gas(Wallet, Op, 100);
    validator.set_spending_limit(Wallet, Op,
        {.token = 0x7070_address,
            .allowance = 5,
            .reset_base_minutes = 1,
            .reset_interval_minutes = 60},
        {});
    validator.clear_wallet_config(Wallet);

    EXPECT_EQ(out.str(),
        R"({"event":"SessionRootSet","wallet":"0x00000000000000000000000000000000003a11e7",)"
        R"("operator":"0x0000000000000000000000000000000000000901",)"
        R"("sessionRoot":"0x0000000000000000000000000000000000000000000000000000000000000001"})"
        "\n"
        R"({"event":"RemainingGasSet","wallet":"0x00000000000000000000000000000000003a11e7",)"
        R"("operator":"0x0000000000000000000000000000000000000901","gasRemaining":"100"})"
        "\n"
        R"({"event":"SpendingLimitSet","wallet":"0x00000000000000000000000000000000003a11e7",)"
        R"("operator":"0x0000000000000000000000000000000000000901",)"
        R"("token":"0x0000000000000000000000000000000000007070","allowance":"5",)"
        R"("resetBaseTimeMinutes":"1","resetTimeIntervalMinutes":"60"})"
        "\n"
        R"({"event":"WalletConfigCleared","wallet":"0x00000000000000000000000000000000003a11e7"})"
        "\n");
}
