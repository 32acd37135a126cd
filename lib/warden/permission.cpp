// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "permission.hpp"

namespace warden
{
bytes abi_encode(const OperatorPermission& permission)
{
    return abi::AbiEncoder{}
        .add_word(permission.session_root)
        .add_address(permission.paymaster)
        .add_uint(permission.valid_until)
        .add_uint(permission.valid_after)
        .add_uint(permission.gas_remaining)
        .add_uint(permission.times_remaining)
        .encode_final();
}

OperatorPermission decode_operator_permission(abi::AbiDecoder& fields)
{
    OperatorPermission p;
    p.session_root = fields.word();
    p.paymaster = fields.addr();
    p.valid_until = fields.uint_n<uint64_t>(48);
    p.valid_after = fields.uint_n<uint64_t>(48);
    p.gas_remaining = fields.uint_n<intx::uint256>(128);
    p.times_remaining = fields.uint_n<intx::uint256>(128);
    return p;
}

}  // namespace warden
