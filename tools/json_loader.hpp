// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>
#include <warden/session.hpp>
#include <warden/user_operation.hpp>
#include <istream>
#include <vector>

namespace warden::cmd
{
namespace json = nlohmann;

template <typename T>
T from_json(const json::json& j) = delete;

template <>
uint64_t from_json<uint64_t>(const json::json& j);

template <>
intx::uint256 from_json<intx::uint256>(const json::json& j);

template <>
address from_json<address>(const json::json& j);

template <>
bytes from_json<bytes>(const json::json& j);

/// Loads the session object:
/// {"to", "selector", "allowedArguments", "paymaster", "validUntil", "validAfter", "timesLimit"}.
/// Missing fields other than "to" get the zero value.
template <>
Session from_json<Session>(const json::json& j);

/// Loads the user operation object with the EntryPoint RPC field names.
template <>
UserOperation from_json<UserOperation>(const json::json& j);

/// Loads the single session object or the array of sessions.
std::vector<Session> load_sessions(std::istream& input);

UserOperation load_user_operation(std::istream& input);

/// Serializes the bytes as the 0x-prefixed hex string.
std::string to_json_hex(bytes_view data);
}  // namespace warden::cmd
