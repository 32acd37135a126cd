// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "predicate.hpp"
#include "abi.hpp"
#include "errors.hpp"
#include "rlp.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace warden::predicate
{
namespace
{
/// The nesting limit of AND/OR nodes.
constexpr int MAX_DEPTH = 64;

std::vector<rlp::Item> decode_or(bytes_view input, ErrorCode errc)
{
    try
    {
        return rlp::decode_list(input);
    }
    catch (const rlp::DecodingError&)
    {
        throw ValidationError{errc};
    }
}

intx::uint256 load_word(bytes_view encoded)
{
    if (encoded.size() < abi::WORD_SIZE)
        throw ValidationError{INVALID_PREDICATE};
    return intx::be::unsafe::load<intx::uint256>(encoded.data());
}

bool evaluate(const rlp::Item& node, bytes_view actual, int depth)
{
    if (!node.is_list || depth > MAX_DEPTH)
        throw ValidationError{INVALID_PREDICATE};

    std::vector<rlp::Item> fields;
    try
    {
        fields = rlp::list_items(node);
    }
    catch (const rlp::DecodingError&)
    {
        throw ValidationError{INVALID_PREDICATE};
    }

    if (fields.size() != 2 || fields[0].is_list || fields[0].payload.size() != 1)
        throw ValidationError{INVALID_PREDICATE};

    const auto& operand = fields[1];
    const auto tag = fields[0].payload[0];
    switch (static_cast<Op>(tag))
    {
    case Op::ANY:
        return true;
    case Op::EQ:
    case Op::NE:
    {
        if (operand.is_list)
            throw ValidationError{INVALID_PREDICATE};
        const bool equal = operand.payload == actual;
        return static_cast<Op>(tag) == Op::EQ ? equal : !equal;
    }
    case Op::GT:
    case Op::LT:
    {
        if (operand.is_list)
            throw ValidationError{INVALID_PREDICATE};
        const auto limit = load_word(operand.payload);
        const auto v = load_word(actual);
        return static_cast<Op>(tag) == Op::GT ? v > limit : v < limit;
    }
    case Op::AND:
    case Op::OR:
    {
        if (!operand.is_list)
            throw ValidationError{INVALID_PREDICATE};
        std::vector<rlp::Item> children;
        try
        {
            children = rlp::list_items(operand);
        }
        catch (const rlp::DecodingError&)
        {
            throw ValidationError{INVALID_PREDICATE};
        }
        if (children.size() < 2)
            throw ValidationError{INVALID_PREDICATE};

        // All children are evaluated so a malformed branch is never hidden by short-circuiting.
        bool all = true;
        bool some = false;
        for (const auto& child : children)
        {
            const auto r = evaluate(child, actual, depth + 1);
            all = all && r;
            some = some || r;
        }
        return static_cast<Op>(tag) == Op::AND ? all : some;
    }
    default:
        throw ValidationError{INVALID_CALLDATA_PREFIX};
    }
}

bytes node(Op op, bytes_view encoded_operand)
{
    const uint8_t tag[]{static_cast<uint8_t>(op)};
    return rlp::wrap_list(rlp::encode(bytes_view{tag, 1}) + bytes{encoded_operand});
}

bytes concat(std::span<const bytes> parts)
{
    bytes content;
    for (const auto& p : parts)
        content += p;
    return content;
}
}  // namespace

bool is_allowed_calldata(
    bytes_view allowed_arguments, bytes_view actual_arguments, const intx::uint256& value)
{
    const auto allowed = decode_or(allowed_arguments, INVALID_PREDICATE);
    const auto actual = decode_or(actual_arguments, MALFORMED_CALLDATA);

    if (allowed.size() != actual.size())
        throw ValidationError{INVALID_ARGUMENTS_LENGTH};

    if (std::any_of(actual.begin(), actual.end(), [](const auto& item) { return item.is_list; }))
        throw ValidationError{MALFORMED_CALLDATA};

    if (actual.empty())
        return true;

    if (actual[0].payload != bytes_view{to_bytes32(value)})
        throw ValidationError{VALUE_MISMATCH};

    bool allowed_all = true;
    for (size_t i = 0; i < allowed.size(); ++i)
        allowed_all = evaluate(allowed[i], actual[i].payload, 0) && allowed_all;
    return allowed_all;
}

bytes leaf(Op op, bytes_view literal)
{
    return node(op, rlp::encode(literal));
}

bytes any()
{
    return leaf(Op::ANY, {});
}

bytes eq(const bytes32& word)
{
    return leaf(Op::EQ, word);
}

bytes ne(const bytes32& word)
{
    return leaf(Op::NE, word);
}

bytes gt(const bytes32& word)
{
    return leaf(Op::GT, word);
}

bytes lt(const bytes32& word)
{
    return leaf(Op::LT, word);
}

bytes all_of(std::initializer_list<bytes> children)
{
    return node(Op::AND, rlp::wrap_list(concat({children.begin(), children.size()})));
}

bytes any_of(std::initializer_list<bytes> children)
{
    return node(Op::OR, rlp::wrap_list(concat({children.begin(), children.size()})));
}

bytes encode_allowed(std::span<const bytes> nodes)
{
    return rlp::wrap_list(concat(nodes));
}

bytes encode_allowed(std::initializer_list<bytes> nodes)
{
    return encode_allowed(std::span<const bytes>{nodes.begin(), nodes.size()});
}

bytes encode_arguments(const intx::uint256& value, std::span<const bytes> arguments)
{
    std::vector<bytes> items;
    items.reserve(arguments.size() + 1);
    items.emplace_back(bytes_view{to_bytes32(value)});
    items.insert(items.end(), arguments.begin(), arguments.end());
    return rlp::encode(items);
}

bytes encode_call_arguments(const intx::uint256& value, bytes_view calldata)
{
    if (calldata.size() < 4)
        return encode_arguments(value, {});

    auto args = calldata.substr(4);
    if (args.size() % abi::WORD_SIZE != 0)
        throw std::invalid_argument("calldata arguments are not a whole number of words");

    std::vector<bytes> words;
    for (; !args.empty(); args.remove_prefix(abi::WORD_SIZE))
        words.emplace_back(args.substr(0, abi::WORD_SIZE));
    return encode_arguments(value, words);
}

}  // namespace warden::predicate
