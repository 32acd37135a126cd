// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "abi.hpp"
#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <span>
#include <vector>

namespace warden
{
/// The ERC-20 function selectors moving value out of the wallet.
namespace erc20
{
inline constexpr uint32_t TRANSFER = 0xa9059cbb;            // transfer(address,uint256)
inline constexpr uint32_t TRANSFER_FROM = 0x23b872dd;       // transferFrom(address,address,uint256)
inline constexpr uint32_t APPROVE = 0x095ea7b3;             // approve(address,uint256)
inline constexpr uint32_t INCREASE_ALLOWANCE = 0x39509351;  // increaseAllowance(address,uint256)
}  // namespace erc20

/// The pseudo-address of the native token.
inline constexpr address NATIVE_TOKEN{};

/// The value leaving the wallet by a single call.
struct Outflow
{
    address token;
    intx::uint256 amount;
};

/// Extracts the value the call (to, value, data) moves out of the wallet.
///
/// The native value is spent from NATIVE_TOKEN. For ERC-20 calls to the token `to`:
/// transfer counts when the recipient is not the wallet, transferFrom when the wallet is the
/// owner, approve and increaseAllowance when the spender is not the wallet.
/// @throws ValidationError  MALFORMED_CALLDATA when an ERC-20 call has malformed arguments.
[[nodiscard]] std::vector<Outflow> extract_outflows(
    const address& wallet, const address& to, const intx::uint256& value, bytes_view data);

/// The spending limit update requested by the wallet owner.
struct SpendingLimitConfig
{
    address token;

    /// The maximum amount spent within a reset interval. Zero removes the limit.
    intx::uint256 allowance;

    /// The reset schedule: the base time and the interval in minutes. Zero interval never resets.
    uint32_t reset_base_minutes = 0;
    uint16_t reset_interval_minutes = 0;
};

/// ABI-encodes the configs as the single SpendingLimitConfig[] parameter.
[[nodiscard]] bytes abi_encode(std::span<const SpendingLimitConfig> configs);

/// Decodes the SpendingLimitConfig[] array.
[[nodiscard]] std::vector<SpendingLimitConfig> decode_spending_limit_configs(
    abi::AbiDecoder& params);

/// The spending limit of an operator for a token.
struct SpendingLimit
{
    intx::uint256 allowance;
    intx::uint256 spent;
    uint32_t last_reset_minutes = 0;
    uint16_t reset_interval_minutes = 0;

    /// Unset limits (zero allowance) do not restrict spending.
    [[nodiscard]] bool is_set() const noexcept { return allowance != 0; }

    friend bool operator==(const SpendingLimit&, const SpendingLimit&) = default;
};

/// Creates the spending limit from the config. The last reset time is the latest reset point
/// of the schedule not after now.
[[nodiscard]] SpendingLimit make_spending_limit(
    const SpendingLimitConfig& config, uint64_t now_minutes) noexcept;

/// Zeroes the spent amount if a reset point has passed since the last reset.
void apply_scheduled_reset(SpendingLimit& limit, uint64_t now_minutes) noexcept;

/// Adds the amount to the spent amount.
/// @throws ValidationError  TOKEN_OVERSPENDING when the allowance would be exceeded.
///                          The limit is not modified then.
void charge(SpendingLimit& limit, const intx::uint256& amount);

}  // namespace warden
