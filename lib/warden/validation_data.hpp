// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <intx/intx.hpp>
#include <system_error>
#include <variant>

namespace warden
{
/// The validator verdict returned to the wallet.
///
/// At the external boundary it is packed into the ERC-4337 validation data word:
/// bits 0-159 the signature failure flag, bits 160-207 valid_until, bits 208-255 valid_after.
struct ValidationData
{
    bool sig_failed = false;

    /// The last timestamp the operation is valid at. Zero means no expiry.
    uint64_t valid_until = 0;

    /// The first timestamp the operation is valid at.
    uint64_t valid_after = 0;

    friend bool operator==(const ValidationData&, const ValidationData&) = default;
};

/// The packed validation data of the failed signature check.
inline constexpr intx::uint256 SIG_VALIDATION_FAILED{1};

/// Packs the validation data. The timestamps are truncated to 48 bits.
[[nodiscard]] intx::uint256 pack(const ValidationData& data) noexcept;

/// Unpacks the validation data word. Any non-zero flag is a failure.
[[nodiscard]] ValidationData unpack(const intx::uint256& packed) noexcept;

/// Intersects two validity windows. Zero valid_until is unbounded.
///
/// @return The intersection or INVALID_VALIDATION_DURATION if it is empty
///         (valid_after later than a bounded valid_until).
[[nodiscard]] std::variant<ValidationData, std::error_code> intersect_validity(
    uint64_t valid_until_a, uint64_t valid_until_b, uint64_t valid_after_a, uint64_t valid_after_b);

}  // namespace warden
