// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "session_signature.hpp"
#include "ecdsa.hpp"
#include "errors.hpp"
#include <stdexcept>

namespace warden
{
namespace
{
/// The head size of the payload without and with the permit.
/// The permission tuple is static so it is encoded in place.
constexpr size_t PLAIN_HEAD_SIZE = 5 * abi::WORD_SIZE;
constexpr size_t PERMIT_HEAD_SIZE = (5 + 1 + 6 + 1) * abi::WORD_SIZE;

void add_permit(abi::AbiEncoder& encoder, const Permit& permit)
{
    encoder.add_bytes(permit.signature);
    const auto permission = abi_encode(permit.permission);
    abi::AbiDecoder permission_words{permission};
    for (int i = 0; i < 6; ++i)
        encoder.add_word(permission_words.word());

    // abi_encode() of the array yields the offset word followed by the array encoding.
    const auto limits = abi_encode(permit.spending_limits);
    encoder.add_dynamic(limits.substr(abi::WORD_SIZE));
}
}  // namespace

bytes encode_session_signature(const SessionSignature& sig)
{
    abi::AbiEncoder encoder;
    if (!sig.is_batch)
    {
        if (sig.calls.size() != 1)
            throw std::invalid_argument("single call payload requires exactly one session");
        const auto& call = sig.calls.front();
        encoder.add_dynamic(abi::encode_word_array(call.proof))
            .add_address(sig.op)
            .add_dynamic(abi_encode(call.session))
            .add_bytes(call.actual_arguments)
            .add_bytes(sig.operator_signature);
    }
    else
    {
        std::vector<bytes> proofs;
        std::vector<bytes> sessions;
        std::vector<bytes> arguments;
        for (const auto& call : sig.calls)
        {
            proofs.emplace_back(abi::encode_word_array(call.proof));
            sessions.emplace_back(abi_encode(call.session));
            arguments.emplace_back(abi::encode_bytes(call.actual_arguments));
        }
        encoder.add_dynamic(abi::encode_dynamic_array(proofs))
            .add_address(sig.op)
            .add_dynamic(abi::encode_dynamic_array(sessions))
            .add_dynamic(abi::encode_dynamic_array(arguments))
            .add_bytes(sig.operator_signature);
    }

    if (sig.permit.has_value())
        add_permit(encoder, *sig.permit);
    return encoder.encode_final();
}

SessionSignature decode_session_signature(bytes_view payload, bool is_batch)
{
    try
    {
        abi::AbiDecoder d{payload};
        const auto head_size = to_uint256(d.peek_word(0));
        if (head_size != PLAIN_HEAD_SIZE && head_size != PERMIT_HEAD_SIZE)
            throw ValidationError{MALFORMED_SIGNATURE};

        SessionSignature sig;
        sig.is_batch = is_batch;
        if (!is_batch)
        {
            SessionCall call;
            call.proof = d.word_array();
            sig.op = d.addr();
            auto session = d.tuple();
            call.session = decode_session(session);
            call.actual_arguments = d.dynamic_bytes();
            sig.calls.emplace_back(std::move(call));
        }
        else
        {
            auto [num_proofs, proofs] = d.array();
            sig.op = d.addr();
            auto [num_sessions, sessions] = d.array();
            auto [num_arguments, arguments] = d.array();
            if (num_proofs != num_sessions || num_proofs != num_arguments)
                throw ValidationError{INVALID_BATCH_LENGTH};

            sig.calls.resize(num_proofs);
            for (auto& call : sig.calls)
            {
                call.proof = proofs.word_array();
                auto session = sessions.tuple();
                call.session = decode_session(session);
                call.actual_arguments = arguments.dynamic_bytes();
            }
        }
        sig.operator_signature = d.dynamic_bytes();

        if (head_size == PERMIT_HEAD_SIZE)
        {
            Permit permit;
            permit.signature = d.dynamic_bytes();
            permit.permission = decode_operator_permission(d);
            permit.spending_limits = decode_spending_limit_configs(d);
            sig.permit = std::move(permit);
        }
        return sig;
    }
    catch (const abi::DecodingError&)
    {
        throw ValidationError{MALFORMED_SIGNATURE};
    }
}

hash256 operator_message_hash(const hash256& op_hash, const address& validator)
{
    const auto message = abi::AbiEncoder{}.add_word(op_hash).add_address(validator).encode_final();
    return ecdsa::to_eth_signed_message_hash(keccak256(message));
}

hash256 permit_hash(const address& wallet, const address& op,
    const OperatorPermission& permission, std::span<const SpendingLimitConfig> spending_limits,
    uint64_t chain_id, const intx::uint256& nonce)
{
    return keccak256(abi::AbiEncoder{}
                         .add_address(wallet)
                         .add_address(op)
                         .add_word(keccak256(abi_encode(permission)))
                         .add_word(keccak256(abi_encode(spending_limits)))
                         .add_uint(chain_id)
                         .add_uint(nonce)
                         .encode_final());
}

}  // namespace warden
