// warden: Session-key authorization engine for modular smart-contract wallets
// Copyright 2026 The warden Authors.
// SPDX-License-Identifier: Apache-2.0

#include "abi.hpp"
#include <algorithm>

namespace warden::abi
{
namespace
{
constexpr size_t padded_size(size_t size) noexcept
{
    return (size + WORD_SIZE - 1) / WORD_SIZE * WORD_SIZE;
}

bytes_view consume_bytes(bytes_view& data, size_t num_bytes)
{
    if (data.size() < num_bytes)
        throw DecodingError("abi decoding error: input too short");
    const auto ret = data.substr(0, num_bytes);
    data.remove_prefix(num_bytes);
    return ret;
}

size_t to_size(const intx::uint256& v)
{
    // Anything above 2^32 cannot be a valid offset or length of an in-memory input.
    if (v > std::numeric_limits<uint32_t>::max())
        throw DecodingError("abi decoding error: offset or length too big");
    return static_cast<size_t>(v);
}
}  // namespace

uint32_t load_selector(bytes_view calldata) noexcept
{
    if (calldata.size() < 4)
        return 0;
    return (uint32_t{calldata[0]} << 24) | (uint32_t{calldata[1]} << 16) |
           (uint32_t{calldata[2]} << 8) | uint32_t{calldata[3]};
}

bytes selector_bytes(uint32_t selector)
{
    return {static_cast<uint8_t>(selector >> 24), static_cast<uint8_t>(selector >> 16),
        static_cast<uint8_t>(selector >> 8), static_cast<uint8_t>(selector)};
}

bytes32 encode_selector_word(uint32_t selector) noexcept
{
    bytes32 word;
    word.bytes[0] = static_cast<uint8_t>(selector >> 24);
    word.bytes[1] = static_cast<uint8_t>(selector >> 16);
    word.bytes[2] = static_cast<uint8_t>(selector >> 8);
    word.bytes[3] = static_cast<uint8_t>(selector);
    return word;
}

bytes encode_bytes(bytes_view data)
{
    bytes output;
    output.reserve(WORD_SIZE + padded_size(data.size()));
    output += bytes_view{to_bytes32(intx::uint256{data.size()})};
    output += data;
    output.append(padded_size(data.size()) - data.size(), 0);
    return output;
}

AbiEncoder& AbiEncoder::add_word(const bytes32& word)
{
    m_head += bytes_view{word};
    return *this;
}

AbiEncoder& AbiEncoder::add_dynamic(bytes encoded)
{
    m_unresolved_offsets.emplace_back(m_head.size(), m_tail.size());
    m_head += bytes_view{bytes32{}};
    m_tail += encoded;
    return *this;
}

bytes AbiEncoder::encode_final() const
{
    auto head = m_head;
    for (const auto& [slot, tail_offset] : m_unresolved_offsets)
    {
        const auto offset = to_bytes32(intx::uint256{head.size() + tail_offset});
        std::copy_n(offset.bytes, sizeof(offset), &head[slot]);
    }
    return head + m_tail;
}

bytes encode_word_array(std::span<const bytes32> words)
{
    bytes output{bytes_view{to_bytes32(intx::uint256{words.size()})}};
    for (const auto& w : words)
        output += bytes_view{w};
    return output;
}

bytes encode_dynamic_array(std::span<const bytes> encoded_elements)
{
    AbiEncoder elements;
    for (const auto& e : encoded_elements)
        elements.add_dynamic(e);
    return bytes{bytes_view{to_bytes32(intx::uint256{encoded_elements.size()})}} +
           elements.encode_final();
}

bytes32 AbiDecoder::peek_word(size_t pos) const
{
    if (pos > m_frame.size() || m_frame.size() - pos < WORD_SIZE)
        throw DecodingError("abi decoding error: input too short");
    bytes32 w;
    std::copy_n(&m_frame[pos], WORD_SIZE, w.bytes);
    return w;
}

bytes32 AbiDecoder::word()
{
    const auto w = peek_word(m_pos);
    m_pos += WORD_SIZE;
    return w;
}

address AbiDecoder::addr()
{
    const auto w = word();
    if (std::any_of(w.bytes, w.bytes + 12, [](uint8_t b) { return b != 0; }))
        throw DecodingError("abi decoding error: dirty address padding");
    address a;
    std::copy_n(&w.bytes[12], sizeof(a), a.bytes);
    return a;
}

intx::uint256 AbiDecoder::uint()
{
    return to_uint256(word());
}

uint32_t AbiDecoder::selector()
{
    const auto w = word();
    if (std::any_of(w.bytes + 4, w.bytes + WORD_SIZE, [](uint8_t b) { return b != 0; }))
        throw DecodingError("abi decoding error: dirty bytes4 padding");
    return load_selector({w.bytes, 4});
}

bytes_view AbiDecoder::tail_at_offset()
{
    const auto offset = to_size(uint());
    if (offset > m_frame.size())
        throw DecodingError("abi decoding error: offset out of bounds");
    return m_frame.substr(offset);
}

bytes AbiDecoder::dynamic_bytes()
{
    auto tail = tail_at_offset();
    const auto len = to_size(intx::be::unsafe::load<intx::uint256>(
        consume_bytes(tail, WORD_SIZE).data()));
    return bytes{consume_bytes(tail, len)};
}

AbiDecoder AbiDecoder::tuple()
{
    return AbiDecoder{tail_at_offset()};
}

std::pair<size_t, AbiDecoder> AbiDecoder::array()
{
    auto tail = tail_at_offset();
    const auto count = to_size(intx::be::unsafe::load<intx::uint256>(
        consume_bytes(tail, WORD_SIZE).data()));
    // Every element occupies at least one head word.
    if (count > tail.size() / WORD_SIZE)
        throw DecodingError("abi decoding error: array length out of bounds");
    return {count, AbiDecoder{tail}};
}

std::vector<bytes32> AbiDecoder::word_array()
{
    auto [count, elements] = array();
    std::vector<bytes32> words;
    words.reserve(count);
    for (size_t i = 0; i < count; ++i)
        words.emplace_back(elements.word());
    return words;
}

}  // namespace warden::abi
