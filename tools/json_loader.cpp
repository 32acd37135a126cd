// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "json_loader.hpp"
#include <evmc/hex.hpp>
#include <stdexcept>

namespace warden::cmd
{
namespace
{
template <typename T>
T load_if_exists(const json::json& j, std::string_view key)
{
    if (const auto it = j.find(key); it != j.end())
        return from_json<T>(*it);
    return {};
}
}  // namespace

template <>
uint64_t from_json<uint64_t>(const json::json& j)
{
    if (j.is_number_unsigned())
        return j.get<uint64_t>();

    const auto s = j.get<std::string>();
    size_t num_processed = 0;
    const auto v = std::stoull(s, &num_processed, 0);
    if (num_processed == 0 || num_processed != s.size())
        throw std::invalid_argument("from_json<uint64_t>: must be integer or string of integer");
    return v;
}

template <>
intx::uint256 from_json<intx::uint256>(const json::json& j)
{
    if (j.is_number_unsigned())
        return j.get<uint64_t>();
    return intx::from_string<intx::uint256>(j.get<std::string>());
}

template <>
address from_json<address>(const json::json& j)
{
    const auto s = j.get<std::string>();
    const auto addr = evmc::from_hex<address>(s);
    if (!addr)
        throw std::invalid_argument("invalid address: " + s);
    return *addr;
}

template <>
bytes from_json<bytes>(const json::json& j)
{
    const auto s = j.get<std::string>();
    auto data = evmc::from_hex(s);
    if (!data)
        throw std::invalid_argument("invalid hex: " + s);
    return std::move(*data);
}

template <>
Session from_json<Session>(const json::json& j)
{
    Session session;
    session.to = from_json<address>(j.at("to"));
    if (const auto it = j.find("selector"); it != j.end())
    {
        const auto selector = from_json<bytes>(*it);
        if (selector.size() != 4)
            throw std::invalid_argument("selector must have 4 bytes");
        session.selector = abi::load_selector(selector);
    }
    session.allowed_arguments = load_if_exists<bytes>(j, "allowedArguments");
    session.paymaster = load_if_exists<address>(j, "paymaster");
    session.valid_until = load_if_exists<uint64_t>(j, "validUntil");
    session.valid_after = load_if_exists<uint64_t>(j, "validAfter");
    session.times_limit = load_if_exists<intx::uint256>(j, "timesLimit");
    return session;
}

template <>
UserOperation from_json<UserOperation>(const json::json& j)
{
    UserOperation op;
    op.sender = from_json<address>(j.at("sender"));
    op.nonce = load_if_exists<intx::uint256>(j, "nonce");
    op.init_code = load_if_exists<bytes>(j, "initCode");
    op.call_data = load_if_exists<bytes>(j, "callData");
    op.call_gas_limit = load_if_exists<intx::uint256>(j, "callGasLimit");
    op.verification_gas_limit = load_if_exists<intx::uint256>(j, "verificationGasLimit");
    op.pre_verification_gas = load_if_exists<intx::uint256>(j, "preVerificationGas");
    op.max_fee_per_gas = load_if_exists<intx::uint256>(j, "maxFeePerGas");
    op.max_priority_fee_per_gas = load_if_exists<intx::uint256>(j, "maxPriorityFeePerGas");
    op.paymaster_and_data = load_if_exists<bytes>(j, "paymasterAndData");
    op.signature = load_if_exists<bytes>(j, "signature");
    return op;
}

std::vector<Session> load_sessions(std::istream& input)
{
    const auto j = json::json::parse(input);
    std::vector<Session> sessions;
    if (j.is_array())
    {
        for (const auto& s : j)
            sessions.emplace_back(from_json<Session>(s));
    }
    else
        sessions.emplace_back(from_json<Session>(j));
    return sessions;
}

UserOperation load_user_operation(std::istream& input)
{
    return from_json<UserOperation>(json::json::parse(input));
}

std::string to_json_hex(bytes_view data)
{
    return "0x" + evmc::hex(data);
}
}  // namespace warden::cmd
