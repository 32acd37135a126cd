// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "events.hpp"
#include <evmc/hex.hpp>

namespace warden
{
namespace
{
std::string hex(bytes_view data)
{
    return "0x" + evmc::hex(data);
}

class JsonEventWriter : public EventListener
{
    std::ostream& m_out;  ///< Output stream.

    void begin(const char* name, const address& wallet)
    {
        m_out << R"({"event":")" << name << R"(","wallet":")" << hex(wallet) << '"';
    }

    void field(const char* name, bytes_view value)
    {
        m_out << R"(,")" << name << R"(":")" << hex(value) << '"';
    }

    void field(const char* name, const intx::uint256& value)
    {
        m_out << R"(,")" << name << R"(":")" << intx::to_string(value) << '"';
    }

    void end() { m_out << "}\n"; }

    void on_session_root_set(
        const address& wallet, const address& op, const hash256& root) noexcept override
    {
        begin("SessionRootSet", wallet);
        field("operator", op);
        field("sessionRoot", root);
        end();
    }

    void on_operator_permission_set(const address& wallet, const address& op,
        const OperatorPermission& permission) noexcept override
    {
        begin("OperatorPermissionSet", wallet);
        field("operator", op);
        field("sessionRoot", permission.session_root);
        field("paymaster", permission.paymaster);
        field("validUntil", permission.valid_until);
        field("validAfter", permission.valid_after);
        field("gasRemaining", permission.gas_remaining);
        field("timesRemaining", permission.times_remaining);
        end();
    }

    void on_remaining_gas_set(
        const address& wallet, const address& op, const intx::uint256& gas) noexcept override
    {
        begin("RemainingGasSet", wallet);
        field("operator", op);
        field("gasRemaining", gas);
        end();
    }

    void on_remaining_times_set(
        const address& wallet, const address& op, const intx::uint256& times) noexcept override
    {
        begin("RemainingTimesSet", wallet);
        field("operator", op);
        field("timesRemaining", times);
        end();
    }

    void on_spending_limit_set(const address& wallet, const address& op,
        const SpendingLimitConfig& config) noexcept override
    {
        begin("SpendingLimitSet", wallet);
        field("operator", op);
        field("token", config.token);
        field("allowance", config.allowance);
        field("resetBaseTimeMinutes", config.reset_base_minutes);
        field("resetTimeIntervalMinutes", config.reset_interval_minutes);
        end();
    }

    void on_spending_limit_reset(
        const address& wallet, const address& op, const address& token) noexcept override
    {
        begin("SpendingLimitReset", wallet);
        field("operator", op);
        field("token", token);
        end();
    }

    void on_spending_limit_deleted(
        const address& wallet, const address& op, const address& token) noexcept override
    {
        begin("SpendingLimitDeleted", wallet);
        field("operator", op);
        field("token", token);
        end();
    }

    void on_signature_revoked(const address& wallet, const hash256& hash) noexcept override
    {
        begin("SignatureRevoked", wallet);
        field("hash", hash);
        end();
    }

    void on_permit_consumed(const address& wallet, const address& op, const hash256& permit_hash,
        const intx::uint256& nonce) noexcept override
    {
        begin("PermitConsumed", wallet);
        field("operator", op);
        field("hash", permit_hash);
        field("nonce", nonce);
        end();
    }

    void on_wallet_config_cleared(const address& wallet) noexcept override
    {
        begin("WalletConfigCleared", wallet);
        end();
    }

    void on_validation_failed(
        const address& wallet, const address& validator, std::error_code error) noexcept override
    {
        begin("ValidationFailed", wallet);
        field("validator", validator);
        m_out << R"(,"error":")" << error.message() << '"';
        end();
    }

    void on_disabled_with_error(
        const address& wallet, const address& validator, std::error_code error) noexcept override
    {
        begin("DisabledWithError", wallet);
        field("validator", validator);
        m_out << R"(,"error":")" << error.message() << '"';
        end();
    }

public:
    explicit JsonEventWriter(std::ostream& out) noexcept : m_out{out}
    {
        m_out << std::dec;  // Set number formatting to dec, JSON does not support other forms.
    }
};
}  // namespace

std::unique_ptr<EventListener> create_json_event_writer(std::ostream& out)
{
    return std::make_unique<JsonEventWriter>(out);
}
}  // namespace warden
