// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <bit>
#include <ostream>

namespace warden
{
using evmc::address;
using evmc::bytes;
using evmc::bytes32;
using evmc::bytes_view;
using namespace evmc::literals;

/// Default type for 256-bit hash.
using hash256 = bytes32;

/// The largest value of a uint128 budget. Budgets holding this value are unlimited.
inline constexpr auto MAX_UINT128 = (intx::uint256{1} << 128) - 1;

/// Computes Keccak hash out of input bytes (wrapper of ethash::keccak256).
inline hash256 keccak256(bytes_view data) noexcept
{
    return std::bit_cast<hash256>(ethash::keccak256(data.data(), data.size()));
}

/// Loads big-endian uint256 from a 32-byte word.
inline intx::uint256 to_uint256(const bytes32& word) noexcept
{
    return intx::be::load<intx::uint256>(word);
}

/// Stores uint256 as a big-endian 32-byte word.
inline bytes32 to_bytes32(const intx::uint256& value) noexcept
{
    return intx::be::store<bytes32>(value);
}

/// Left-pads the address to the 32-byte word.
inline bytes32 to_bytes32(const address& addr) noexcept
{
    bytes32 word;
    std::copy_n(addr.bytes, sizeof(addr), &word.bytes[sizeof(word) - sizeof(addr)]);
    return word;
}
}  // namespace warden

std::ostream& operator<<(std::ostream& out, const warden::address& a);
std::ostream& operator<<(std::ostream& out, const warden::bytes32& b);
