// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "hash_utils.hpp"
#include <intx/intx.hpp>
#include <limits>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

/// Helpers for the Solidity contract ABI.
///
/// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
namespace warden::abi
{
/// The ABI decoding failure: out-of-bounds offsets, dirty padding, values not fitting the type.
struct DecodingError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// The size of the ABI word.
inline constexpr size_t WORD_SIZE = 32;

/// Loads the 4-byte function selector from the beginning of the calldata.
/// Calldata shorter than 4 bytes has the selector 0.
uint32_t load_selector(bytes_view calldata) noexcept;

/// Stores the selector as 4 big-endian bytes.
bytes selector_bytes(uint32_t selector);

/// Left-aligns the 4-byte selector in the ABI word (the encoding of bytes4).
bytes32 encode_selector_word(uint32_t selector) noexcept;

/// Encodes the dynamic `bytes` value: the length word followed by the zero-padded data.
bytes encode_bytes(bytes_view data);

/// Encodes a tuple (or a function argument list).
///
/// Static values are appended to the head. Dynamic values are appended to the tail
/// and their head slot gets the offset resolved in encode_final().
class AbiEncoder
{
    bytes m_head;
    bytes m_tail;
    std::vector<std::pair<size_t, size_t>> m_unresolved_offsets;

public:
    AbiEncoder& add_word(const bytes32& word);
    AbiEncoder& add_address(const address& addr) { return add_word(to_bytes32(addr)); }
    AbiEncoder& add_uint(const intx::uint256& value) { return add_word(to_bytes32(value)); }
    AbiEncoder& add_bool(bool value) { return add_uint(value ? 1 : 0); }

    /// Adds the already encoded dynamic value (e.g. the result of encode_bytes()).
    AbiEncoder& add_dynamic(bytes encoded);

    AbiEncoder& add_bytes(bytes_view data) { return add_dynamic(encode_bytes(data)); }

    [[nodiscard]] bytes encode_final() const;
};

/// Encodes the array of statically-sized words (e.g. bytes32[], uint256[]).
bytes encode_word_array(std::span<const bytes32> words);

/// Encodes the array of dynamic values given their individual encodings
/// (e.g. bytes[], bytes32[][], tuple arrays with dynamic members).
bytes encode_dynamic_array(std::span<const bytes> encoded_elements);

/// Reads values from an ABI-encoded tuple.
///
/// The decoder walks the head of the tuple word by word. Dynamic values are followed
/// through their offsets which are relative to the beginning of the tuple.
class AbiDecoder
{
    bytes_view m_frame;
    size_t m_pos = 0;

    [[nodiscard]] bytes_view tail_at_offset();

public:
    explicit AbiDecoder(bytes_view frame) noexcept : m_frame{frame} {}

    /// The number of bytes of the head consumed so far.
    [[nodiscard]] size_t position() const noexcept { return m_pos; }

    /// Peeks the word at the given head position without consuming it.
    [[nodiscard]] bytes32 peek_word(size_t pos) const;

    bytes32 word();
    address addr();
    intx::uint256 uint();
    uint32_t selector();

    /// Reads the unsigned integer which must fit the given number of bits.
    template <typename T>
    T uint_n(unsigned bits = std::numeric_limits<T>::digits)
    {
        const auto v = uint();
        if (bits < 256 && (v >> bits) != 0)
            throw DecodingError("abi decoding error: integer out of range");
        return static_cast<T>(v);
    }

    /// Reads the dynamic `bytes` value.
    bytes dynamic_bytes();

    /// Reads the dynamic tuple and returns the decoder positioned at its head.
    AbiDecoder tuple();

    /// Reads the dynamic array. Returns the number of elements and the decoder
    /// positioned at the first element.
    std::pair<size_t, AbiDecoder> array();

    /// Reads the dynamic array of statically-sized words.
    std::vector<bytes32> word_array();
};

}  // namespace warden::abi
