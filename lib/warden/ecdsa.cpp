// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string_view>

namespace warden::ecdsa
{
namespace
{
struct BnDeleter
{
    void operator()(BIGNUM* p) const noexcept { BN_free(p); }
};
struct BnCtxDeleter
{
    void operator()(BN_CTX* p) const noexcept { BN_CTX_free(p); }
};
struct GroupDeleter
{
    void operator()(EC_GROUP* p) const noexcept { EC_GROUP_free(p); }
};
struct PointDeleter
{
    void operator()(EC_POINT* p) const noexcept { EC_POINT_free(p); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

void check(int status)
{
    if (status != 1)
        throw std::runtime_error("openssl: secp256k1 operation failed");
}

BnPtr to_bn(const intx::uint256& x)
{
    uint8_t b[32];
    intx::be::store(b, x);
    BnPtr bn{BN_bin2bn(b, sizeof(b), nullptr)};
    if (!bn)
        throw std::bad_alloc{};
    return bn;
}

intx::uint256 from_bn(const BIGNUM* bn)
{
    uint8_t b[32];
    check(BN_bn2binpad(bn, b, sizeof(b)) == sizeof(b) ? 1 : 0);
    return intx::be::load<intx::uint256>(b);
}

/// The secp256k1 context shared by all operations of a single call.
struct Curve
{
    GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    BnCtxPtr ctx{BN_CTX_new()};

    Curve()
    {
        if (!group || !ctx)
            throw std::bad_alloc{};
    }

    [[nodiscard]] PointPtr new_point() const
    {
        PointPtr p{EC_POINT_new(group.get())};
        if (!p)
            throw std::bad_alloc{};
        return p;
    }

    /// Returns affine (x, y) of the point.
    [[nodiscard]] std::pair<intx::uint256, intx::uint256> affine(const EC_POINT* p) const
    {
        const BnPtr x{BN_new()};
        const BnPtr y{BN_new()};
        check(EC_POINT_get_affine_coordinates(group.get(), p, x.get(), y.get(), ctx.get()));
        return {from_bn(x.get()), from_bn(y.get())};
    }
};

address to_address(const intx::uint256& x, const intx::uint256& y) noexcept
{
    // This performs Ethereum's address hashing on an uncompressed pubkey.
    uint8_t serialized[64];
    intx::be::unsafe::store(serialized, x);
    intx::be::unsafe::store(serialized + 32, y);

    const auto hashed = keccak256({serialized, sizeof(serialized)});
    address ret;
    std::copy_n(&hashed.bytes[12], sizeof(ret), ret.bytes);
    return ret;
}

intx::uint256 mulmod_n(const intx::uint256& a, const intx::uint256& b) noexcept
{
    return intx::mulmod(a, b, SECP256K1N);
}

intx::uint256 inv_n(const intx::uint256& a, BN_CTX* ctx)
{
    // Fermat's little theorem: a^(n-2) mod n.
    const BnPtr r{BN_new()};
    check(BN_mod_exp(
        r.get(), to_bn(a).get(), to_bn(SECP256K1N - 2).get(), to_bn(SECP256K1N).get(), ctx));
    return from_bn(r.get());
}
}  // namespace

std::optional<Signature> parse_signature(bytes_view signature) noexcept
{
    if (signature.size() != SIGNATURE_SIZE)
        return std::nullopt;

    const auto v = signature[64];
    if (v != 0 && v != 1 && v != 27 && v != 28)
        return std::nullopt;

    return Signature{
        .r = intx::be::unsafe::load<intx::uint256>(&signature[0]),
        .s = intx::be::unsafe::load<intx::uint256>(&signature[32]),
        .y_parity = (v == 1 || v == 28),
    };
}

bytes serialize(const Signature& signature)
{
    bytes out(SIGNATURE_SIZE, 0);
    intx::be::unsafe::store(&out[0], signature.r);
    intx::be::unsafe::store(&out[32], signature.s);
    out[64] = signature.y_parity ? 28 : 27;
    return out;
}

std::optional<address> ecrecover(
    const hash256& e, const intx::uint256& r, const intx::uint256& s, bool y_parity)
{
    // 1. Validate r and s are within [1, n-1].
    if (r == 0 || r >= SECP256K1N || s == 0 || s >= SECP256K1N)
        return std::nullopt;

    const Curve curve;

    // 2. Calculate the point R from x = r and the y parity.
    //    The x = r + n candidate is not addressable with Ethereum's v value.
    auto point_r = curve.new_point();
    if (EC_POINT_set_compressed_coordinates(curve.group.get(), point_r.get(), to_bn(r).get(),
            y_parity ? 1 : 0, curve.ctx.get()) != 1)
        return std::nullopt;

    // 3. Convert hash e to z field element by doing z = e % n.
    auto z = to_uint256(e);
    if (z >= SECP256K1N)
        z -= SECP256K1N;

    // 4. Calculate u1 = -z/r and u2 = s/r.
    const auto r_inv = inv_n(r, curve.ctx.get());
    const auto u1 = mulmod_n(SECP256K1N - z, r_inv);
    const auto u2 = mulmod_n(s, r_inv);

    // 5. Calculate the public key point Q = u1*G + u2*R.
    auto point_q = curve.new_point();
    check(EC_POINT_mul(curve.group.get(), point_q.get(), to_bn(u1).get(), point_r.get(),
        to_bn(u2).get(), curve.ctx.get()));

    if (EC_POINT_is_at_infinity(curve.group.get(), point_q.get()) == 1)
        return std::nullopt;

    const auto [x, y] = curve.affine(point_q.get());
    return to_address(x, y);
}

std::optional<address> recover_signer(const hash256& hash, bytes_view signature)
{
    const auto sig = parse_signature(signature);
    if (!sig.has_value() || sig->s > SECP256K1N_OVER_2)
        return std::nullopt;
    return ecrecover(hash, sig->r, sig->s, sig->y_parity);
}

hash256 to_eth_signed_message_hash(const hash256& hash) noexcept
{
    static constexpr std::string_view PREFIX = "\x19" "Ethereum Signed Message:\n32";
    uint8_t message[PREFIX.size() + sizeof(hash)];
    std::copy_n(PREFIX.data(), PREFIX.size(), message);
    std::copy_n(hash.bytes, sizeof(hash), &message[PREFIX.size()]);
    return keccak256({message, sizeof(message)});
}

address to_address(const intx::uint256& private_key)
{
    if (private_key == 0 || private_key >= SECP256K1N)
        throw std::invalid_argument("invalid secp256k1 private key");

    const Curve curve;
    auto point_q = curve.new_point();
    check(EC_POINT_mul(curve.group.get(), point_q.get(), to_bn(private_key).get(), nullptr,
        nullptr, curve.ctx.get()));
    const auto [x, y] = curve.affine(point_q.get());
    return to_address(x, y);
}

Signature sign(const hash256& hash, const intx::uint256& private_key)
{
    if (private_key == 0 || private_key >= SECP256K1N)
        throw std::invalid_argument("invalid secp256k1 private key");

    const Curve curve;
    const auto order = to_bn(SECP256K1N);
    auto z = to_uint256(hash);
    if (z >= SECP256K1N)
        z -= SECP256K1N;

    while (true)
    {
        const BnPtr k_bn{BN_new()};
        check(BN_rand_range(k_bn.get(), order.get()));
        const auto k = from_bn(k_bn.get());
        if (k == 0)
            continue;

        auto point_r = curve.new_point();
        check(EC_POINT_mul(
            curve.group.get(), point_r.get(), k_bn.get(), nullptr, nullptr, curve.ctx.get()));
        const auto [rx, ry] = curve.affine(point_r.get());

        // Only x < n keeps the recovery id within {0, 1}.
        if (rx >= SECP256K1N)
            continue;

        const auto r = rx;
        const auto k_inv = inv_n(k, curve.ctx.get());
        const auto s = mulmod_n(k_inv, intx::addmod(z, mulmod_n(r, private_key), SECP256K1N));
        if (r == 0 || s == 0)
            continue;

        const bool y_parity = (ry & 1) != 0;
        if (s > SECP256K1N_OVER_2)
            return {r, SECP256K1N - s, !y_parity};
        return {r, s, y_parity};
    }
}

}  // namespace warden::ecdsa
