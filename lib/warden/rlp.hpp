// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <cassert>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace warden::rlp
{
using evmc::bytes;
using evmc::bytes_view;

/// The RLP decoding failure.
struct DecodingError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

namespace internal
{
template <uint8_t ShortBase, uint8_t LongBase>
inline bytes encode_length(size_t l)
{
    static constexpr uint8_t short_cutoff = 55;
    static_assert(ShortBase + short_cutoff <= 0xff);
    assert(l <= 0xffffff);

    if (l <= short_cutoff)
        return {static_cast<uint8_t>(ShortBase + l)};
    else if (const auto l0 = static_cast<uint8_t>(l); l <= 0xff)
        return {LongBase + 1, l0};
    else if (const auto l1 = static_cast<uint8_t>(l >> 8); l <= 0xffff)
        return {LongBase + 2, l1, l0};
    else
        return {LongBase + 3, static_cast<uint8_t>(l >> 16), l1, l0};
}
}  // namespace internal

/// Wraps the concatenation of already encoded items as RLP list.
inline bytes wrap_list(bytes_view content)
{
    return internal::encode_length<192, 247>(content.size()) += content;
}

inline bytes_view trim(bytes_view b) noexcept
{
    b.remove_prefix(std::min(b.find_first_not_of(uint8_t{0x00}), b.size()));
    return b;
}

inline bytes encode(bytes_view data)
{
    static constexpr uint8_t short_base = 128;
    if (data.size() == 1 && data[0] < short_base)
        return {data[0]};

    return internal::encode_length<short_base, 183>(data.size()) += data;
}

inline bytes encode(uint64_t x)
{
    uint8_t b[sizeof(x)];
    intx::be::store(b, x);
    return encode(trim({b, sizeof(b)}));
}

inline bytes encode(const intx::uint256& x)
{
    uint8_t b[sizeof(x)];
    intx::be::store(b, x);
    return encode(trim({b, sizeof(b)}));
}

/// Encodes a vector of byte strings as RLP list of strings.
inline bytes encode(const std::vector<bytes>& items)
{
    bytes content;
    for (const auto& item : items)
        content += encode(bytes_view{item});
    return wrap_list(content);
}

/// Encodes the fixed-size collection of heterogeneous values as RLP list.
template <typename... Types>
inline bytes encode_tuple(const Types&... elements)
{
    return wrap_list((encode(elements) + ...));
}

/// The decoded RLP item. Views point into the decoded input.
struct Item
{
    bool is_list = false;

    /// The payload: string bytes or the concatenated encoding of list elements.
    bytes_view payload;

    /// The full encoding of the item including its header.
    bytes_view encoded;
};

/// Decodes the next item from the input and advances the input past it.
///
/// Non-canonical encodings (a single byte below 0x80 in a string header,
/// long-form lengths that would fit the short form, lengths with leading zeros) are rejected.
/// @throws DecodingError  The input is malformed.
[[nodiscard]] Item decode_item(bytes_view& input);

/// Decodes the list elements of the single RLP list occupying the whole input.
///
/// @throws DecodingError  The input is not exactly one well-formed list.
[[nodiscard]] std::vector<Item> decode_list(bytes_view input);

/// Decodes the elements of an already decoded list item.
[[nodiscard]] std::vector<Item> list_items(const Item& list);

}  // namespace warden::rlp
