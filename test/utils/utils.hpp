// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <warden/errors.hpp>
#include <algorithm>

/// Expects the statement to throw warden::ValidationError with the given error code.
#define EXPECT_VALIDATION_ERROR(STATEMENT, ERROR_CODE)                              \
    try                                                                             \
    {                                                                               \
        STATEMENT;                                                                  \
        ADD_FAILURE() << "expected ValidationError: "                               \
                      << warden::make_error_code(ERROR_CODE).message();             \
    }                                                                               \
    catch (const warden::ValidationError& validation_error)                         \
    {                                                                               \
        EXPECT_EQ(validation_error.code(), warden::make_error_code(ERROR_CODE))     \
            << validation_error.code().message();                                   \
    }                                                                               \
    (void)0

namespace warden::test
{
using evmc::bytes;
using evmc::bytes_view;
using evmc::from_hex;
using evmc::from_spaced_hex;
using evmc::hex;

/// Converts a string to bytes by casting individual characters.
inline bytes to_bytes(std::string_view s)
{
    return {s.begin(), s.end()};
}

/// Produces bytes out of string literal.
inline bytes operator""_b(const char* data, size_t size)
{
    return to_bytes({data, size});
}

inline bytes operator""_hex(const char* s, size_t size)
{
    return from_spaced_hex({s, size}).value();
}

/// Encodes the value as the 32-byte ABI word.
inline bytes word(const intx::uint256& v)
{
    uint8_t b[32];
    intx::be::store(b, v);
    return {b, sizeof(b)};
}

/// Encodes the address as the 32-byte ABI word.
inline bytes word(const evmc::address& addr)
{
    bytes w(12, 0);
    w.append(addr.bytes, sizeof(addr));
    return w;
}

}  // namespace warden::test
