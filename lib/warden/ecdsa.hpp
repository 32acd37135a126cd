// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <optional>

namespace warden::ecdsa
{
using namespace intx::literals;

/// The secp256k1 curve group order (N).
inline constexpr auto SECP256K1N =
    0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_u256;

/// Secp256k1's N/2 is the upper bound of the signature's s value (EIP-2).
inline constexpr auto SECP256K1N_OVER_2 = SECP256K1N / 2;

/// The size of the Ethereum "r || s || v" signature.
inline constexpr size_t SIGNATURE_SIZE = 65;

struct Signature
{
    intx::uint256 r;
    intx::uint256 s;

    /// The parity of the R point's y coordinate.
    bool y_parity = false;
};

/// Parses the 65-byte "r || s || v" signature. The v byte must be 0, 1, 27 or 28.
[[nodiscard]] std::optional<Signature> parse_signature(bytes_view signature) noexcept;

/// Serializes the signature as 65-byte "r || s || v" with v in {27, 28}.
[[nodiscard]] bytes serialize(const Signature& signature);

/// Recovers the Ethereum address of the public key that produced the signature of hash e.
///
/// Follows
/// https://en.wikipedia.org/wiki/Elliptic_Curve_Digital_Signature_Algorithm#Public_key_recovery
/// @return The signer address or std::nullopt if r, s are out of range or no point R exists.
[[nodiscard]] std::optional<address> ecrecover(
    const hash256& e, const intx::uint256& r, const intx::uint256& s, bool y_parity);

/// Recovers the signer of the 65-byte signature. Rejects malleable (high-s) signatures.
[[nodiscard]] std::optional<address> recover_signer(const hash256& hash, bytes_view signature);

/// Computes the EIP-191 hash of the 32-byte message: "\x19Ethereum Signed Message:\n32" || hash.
[[nodiscard]] hash256 to_eth_signed_message_hash(const hash256& hash) noexcept;

/// Computes the Ethereum address of the private key.
[[nodiscard]] address to_address(const intx::uint256& private_key);

/// Signs the hash with the private key. The s value is normalized to the lower half.
[[nodiscard]] Signature sign(const hash256& hash, const intx::uint256& private_key);

}  // namespace warden::ecdsa
