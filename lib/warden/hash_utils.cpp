// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#include "hash_utils.hpp"

std::ostream& operator<<(std::ostream& out, const warden::address& a)
{
    return out << "0x" << evmc::hex(a);
}

std::ostream& operator<<(std::ostream& out, const warden::bytes32& b)
{
    return out << "0x" << evmc::hex(b);
}
