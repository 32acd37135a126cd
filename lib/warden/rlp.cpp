// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "rlp.hpp"

namespace warden::rlp
{
namespace
{
/// Loads the big-endian length of a long-form header.
uint64_t load_length(bytes_view input)
{
    if (input.empty() || input.size() > sizeof(uint64_t))
        throw DecodingError("rlp decoding error: invalid length of length");
    if (input[0] == 0)
        throw DecodingError("rlp decoding error: length has leading zeros");

    uint64_t len = 0;
    for (const auto b : input)
        len = (len << 8) | b;

    if (len <= 55)
        throw DecodingError("rlp decoding error: non-canonical long length");
    return len;
}
}  // namespace

// RLP decoding implementation based on
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/#definition
Item decode_item(bytes_view& input)
{
    if (input.empty())
        throw DecodingError("rlp decoding error: input is empty");

    const auto prefix = input[0];
    size_t header_len = 0;
    uint64_t payload_len = 0;
    bool is_list = false;

    if (prefix < 0x80)
    {
        const Item item{false, input.substr(0, 1), input.substr(0, 1)};
        input.remove_prefix(1);
        return item;
    }
    else if (prefix < 0xb8)  // [0x80, 0xb7]
    {
        header_len = 1;
        payload_len = prefix - 0x80u;
    }
    else if (prefix < 0xc0)  // [0xb8, 0xbf]
    {
        const size_t len_of_len = prefix - 0xb7u;
        if (len_of_len >= input.size())
            throw DecodingError("rlp decoding error: input too short");
        header_len = 1 + len_of_len;
        payload_len = load_length(input.substr(1, len_of_len));
    }
    else if (prefix < 0xf8)  // [0xc0, 0xf7]
    {
        header_len = 1;
        payload_len = prefix - 0xc0u;
        is_list = true;
    }
    else  // [0xf8, 0xff]
    {
        const size_t len_of_len = prefix - 0xf7u;
        if (len_of_len >= input.size())
            throw DecodingError("rlp decoding error: input too short");
        header_len = 1 + len_of_len;
        payload_len = load_length(input.substr(1, len_of_len));
        is_list = true;
    }

    if (payload_len > input.size() - header_len)
        throw DecodingError("rlp decoding error: input too short");

    const auto payload = input.substr(header_len, static_cast<size_t>(payload_len));
    if (!is_list && payload.size() == 1 && payload[0] < 0x80)
        throw DecodingError("rlp decoding error: non-canonical single byte");

    const Item item{is_list, payload, input.substr(0, header_len + payload.size())};
    input.remove_prefix(item.encoded.size());
    return item;
}

std::vector<Item> list_items(const Item& list)
{
    if (!list.is_list)
        throw DecodingError("rlp decoding error: unexpected type. list expected");

    std::vector<Item> items;
    auto payload = list.payload;
    while (!payload.empty())
        items.emplace_back(decode_item(payload));
    return items;
}

std::vector<Item> decode_list(bytes_view input)
{
    const auto list = decode_item(input);
    if (!input.empty())
        throw DecodingError("rlp decoding error: trailing bytes after list");
    return list_items(list);
}

}  // namespace warden::rlp
