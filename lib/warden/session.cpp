// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "session.hpp"
#include "errors.hpp"
#include "predicate.hpp"
#include "rlp.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace warden
{
bytes abi_encode(const Session& session)
{
    return abi::AbiEncoder{}
        .add_address(session.to)
        .add_word(abi::encode_selector_word(session.selector))
        .add_bytes(session.allowed_arguments)
        .add_address(session.paymaster)
        .add_uint(session.valid_until)
        .add_uint(session.valid_after)
        .add_uint(session.times_limit)
        .encode_final();
}

Session decode_session(abi::AbiDecoder& fields)
{
    Session s;
    s.to = fields.addr();
    s.selector = fields.selector();
    s.allowed_arguments = fields.dynamic_bytes();
    s.paymaster = fields.addr();
    s.valid_until = fields.uint_n<uint64_t>(48);
    s.valid_after = fields.uint_n<uint64_t>(48);
    s.times_limit = fields.uint();
    return s;
}

hash256 session_leaf_hash(const Session& session)
{
    return keccak256(keccak256(abi_encode(session)));
}

hash256 hash_pair(const hash256& a, const hash256& b) noexcept
{
    uint8_t buffer[2 * sizeof(hash256)];
    const auto& [lo, hi] = std::minmax(a, b);
    std::copy_n(lo.bytes, sizeof(lo), buffer);
    std::copy_n(hi.bytes, sizeof(hi), &buffer[sizeof(lo)]);
    return keccak256({buffer, sizeof(buffer)});
}

bool verify_proof(
    std::span<const bytes32> proof, const hash256& root, const hash256& leaf) noexcept
{
    auto computed = leaf;
    for (const auto& sibling : proof)
        computed = hash_pair(computed, sibling);
    return computed == root;
}

void verify_session_membership(
    std::span<const bytes32> proof, const hash256& root, const Session& session)
{
    if (!verify_proof(proof, root, session_leaf_hash(session)))
        throw ValidationError{INVALID_SESSION_ROOT};
}

void check_arguments(const Session& session, const address& to, bytes_view data,
    const intx::uint256& value, bytes_view actual_arguments)
{
    if (to != session.to)
        throw ValidationError{INVALID_TO};

    // Calldata of 1-3 bytes has no selector but is not the plain transfer either.
    if (!data.empty() && data.size() < 4)
        throw ValidationError{INVALID_SELECTOR};
    if (abi::load_selector(data) != session.selector)
        throw ValidationError{INVALID_SELECTOR};

    const auto args = data.empty() ? bytes_view{} : data.substr(4);

    std::vector<rlp::Item> actual;
    try
    {
        actual = rlp::decode_list(actual_arguments);
    }
    catch (const rlp::DecodingError&)
    {
        throw ValidationError{MALFORMED_CALLDATA};
    }

    bytes encoded_args;
    for (size_t i = 1; i < actual.size(); ++i)
    {
        if (actual[i].is_list)
            throw ValidationError{CALLDATA_NOT_EQUALLY_ENCODED};
        encoded_args += actual[i].payload;
    }
    if (encoded_args != args)
        throw ValidationError{CALLDATA_NOT_EQUALLY_ENCODED};

    if (!predicate::is_allowed_calldata(session.allowed_arguments, actual_arguments, value))
        throw ValidationError{INVALID_ARGUMENTS};
}

SessionTree::SessionTree(std::vector<Session> sessions) : m_sessions{std::move(sessions)}
{
    if (m_sessions.empty())
        throw std::invalid_argument("session tree requires at least one session");

    const auto n = m_sessions.size();
    m_leaves.reserve(n);
    for (const auto& s : m_sessions)
        m_leaves.emplace_back(session_leaf_hash(s));

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(
        order.begin(), order.end(), [this](size_t a, size_t b) { return m_leaves[a] < m_leaves[b]; });

    m_nodes.resize(2 * n - 1);
    for (size_t i = 0; i < n; ++i)
        m_nodes[m_nodes.size() - 1 - i] = m_leaves[order[i]];
    for (size_t i = m_nodes.size() - n; i-- > 0;)
        m_nodes[i] = hash_pair(m_nodes[2 * i + 1], m_nodes[2 * i + 2]);
}

size_t SessionTree::node_index(size_t session_index) const
{
    const auto& leaf = m_leaves.at(session_index);
    const auto n = m_sessions.size();
    for (size_t i = m_nodes.size() - n; i < m_nodes.size(); ++i)
    {
        if (m_nodes[i] == leaf)
            return i;
    }
    throw std::logic_error("session tree leaf not found");
}

std::vector<bytes32> SessionTree::proof(size_t session_index) const
{
    std::vector<bytes32> siblings;
    for (auto i = node_index(session_index); i > 0; i = (i - 1) / 2)
        siblings.emplace_back(m_nodes[(i % 2 == 1) ? i + 1 : i - 1]);
    return siblings;
}

std::vector<bytes32> SessionTree::proof(const Session& session) const
{
    const auto it = std::find(m_sessions.begin(), m_sessions.end(), session);
    if (it == m_sessions.end())
        throw std::out_of_range("session is not in the tree");
    return proof(static_cast<size_t>(it - m_sessions.begin()));
}

}  // namespace warden
