// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "spending.hpp"
#include "errors.hpp"

namespace warden
{
namespace
{
uint32_t latest_reset_point(uint64_t base, uint64_t interval, uint64_t now) noexcept
{
    if (interval == 0 || now < base)
        return static_cast<uint32_t>(base);
    return static_cast<uint32_t>(base + (now - base) / interval * interval);
}
}  // namespace

std::vector<Outflow> extract_outflows(
    const address& wallet, const address& to, const intx::uint256& value, bytes_view data)
{
    std::vector<Outflow> outflows;
    if (value != 0)
        outflows.push_back({NATIVE_TOKEN, value});

    const auto selector = abi::load_selector(data);
    if (selector != erc20::TRANSFER && selector != erc20::TRANSFER_FROM &&
        selector != erc20::APPROVE && selector != erc20::INCREASE_ALLOWANCE)
        return outflows;

    try
    {
        abi::AbiDecoder args{data.substr(4)};
        switch (selector)
        {
        case erc20::TRANSFER_FROM:
        {
            const auto from = args.addr();
            [[maybe_unused]] const auto recipient = args.addr();
            const auto amount = args.uint();
            if (from == wallet)
                outflows.push_back({to, amount});
            break;
        }
        default:
        {
            // transfer(recipient), approve(spender), increaseAllowance(spender)
            const auto counterparty = args.addr();
            const auto amount = args.uint();
            if (counterparty != wallet)
                outflows.push_back({to, amount});
            break;
        }
        }
    }
    catch (const abi::DecodingError&)
    {
        throw ValidationError{MALFORMED_CALLDATA};
    }
    return outflows;
}

bytes abi_encode(std::span<const SpendingLimitConfig> configs)
{
    bytes elements{bytes_view{to_bytes32(intx::uint256{configs.size()})}};
    for (const auto& c : configs)
    {
        elements += abi::AbiEncoder{}
                        .add_address(c.token)
                        .add_uint(c.allowance)
                        .add_uint(c.reset_base_minutes)
                        .add_uint(c.reset_interval_minutes)
                        .encode_final();
    }
    return abi::AbiEncoder{}.add_dynamic(std::move(elements)).encode_final();
}

std::vector<SpendingLimitConfig> decode_spending_limit_configs(abi::AbiDecoder& params)
{
    auto [count, elements] = params.array();
    std::vector<SpendingLimitConfig> configs;
    configs.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        SpendingLimitConfig c;
        c.token = elements.addr();
        c.allowance = elements.uint();
        c.reset_base_minutes = elements.uint_n<uint32_t>();
        c.reset_interval_minutes = elements.uint_n<uint16_t>();
        configs.emplace_back(c);
    }
    return configs;
}

SpendingLimit make_spending_limit(const SpendingLimitConfig& config, uint64_t now_minutes) noexcept
{
    return {
        .allowance = config.allowance,
        .spent = 0,
        .last_reset_minutes = latest_reset_point(
            config.reset_base_minutes, config.reset_interval_minutes, now_minutes),
        .reset_interval_minutes = config.reset_interval_minutes,
    };
}

void apply_scheduled_reset(SpendingLimit& limit, uint64_t now_minutes) noexcept
{
    if (limit.reset_interval_minutes == 0)
        return;
    if (now_minutes < uint64_t{limit.last_reset_minutes} + limit.reset_interval_minutes)
        return;

    limit.spent = 0;
    limit.last_reset_minutes =
        latest_reset_point(limit.last_reset_minutes, limit.reset_interval_minutes, now_minutes);
}

void charge(SpendingLimit& limit, const intx::uint256& amount)
{
    if (!limit.is_set())
        return;

    if (limit.spent > limit.allowance || amount > limit.allowance - limit.spent)
        throw ValidationError{TOKEN_OVERSPENDING};
    limit.spent += amount;
}

}  // namespace warden
