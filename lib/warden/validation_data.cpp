// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "validation_data.hpp"
#include "errors.hpp"
#include <algorithm>

namespace warden
{
namespace
{
constexpr uint64_t TIMESTAMP_MASK = (uint64_t{1} << 48) - 1;
constexpr unsigned VALID_UNTIL_SHIFT = 160;
constexpr unsigned VALID_AFTER_SHIFT = 160 + 48;
}  // namespace

intx::uint256 pack(const ValidationData& data) noexcept
{
    return intx::uint256{data.sig_failed ? 1u : 0u} |
           (intx::uint256{data.valid_until & TIMESTAMP_MASK} << VALID_UNTIL_SHIFT) |
           (intx::uint256{data.valid_after & TIMESTAMP_MASK} << VALID_AFTER_SHIFT);
}

ValidationData unpack(const intx::uint256& packed) noexcept
{
    const auto flag = packed & ((intx::uint256{1} << VALID_UNTIL_SHIFT) - 1);
    return {
        .sig_failed = flag != 0,
        .valid_until = static_cast<uint64_t>(packed >> VALID_UNTIL_SHIFT) & TIMESTAMP_MASK,
        .valid_after = static_cast<uint64_t>(packed >> VALID_AFTER_SHIFT) & TIMESTAMP_MASK,
    };
}

std::variant<ValidationData, std::error_code> intersect_validity(
    uint64_t valid_until_a, uint64_t valid_until_b, uint64_t valid_after_a, uint64_t valid_after_b)
{
    uint64_t valid_until = 0;
    if (valid_until_a == 0 || valid_until_b == 0)
        valid_until = std::max(valid_until_a, valid_until_b);
    else
        valid_until = std::min(valid_until_a, valid_until_b);

    const auto valid_after = std::max(valid_after_a, valid_after_b);

    if (valid_until != 0 && valid_after > valid_until)
        return make_error_code(INVALID_VALIDATION_DURATION);

    return ValidationData{.sig_failed = false, .valid_until = valid_until, .valid_after = valid_after};
}

}  // namespace warden
