/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/PaddedBlock.hpp"
#include "electionguard/Exception.hpp"

#include <algorithm>
#include <cstring>

namespace electionguard {

BlockSize blockSizeFromBytes(std::size_t total) {
    switch(total) {
        case totalSize(BlockSize::Bytes512):
            return BlockSize::Bytes512;
        default:
            throw Exception{"Unsupported block size: " + std::to_string(total)};
    }
}

PaddedBlock PaddedBlock::Encode(const void* payload, std::size_t length,
                                BlockSize size, bool allow_truncation) {
    const auto max_length = capacity(size);
    if(length > max_length) {
        if(!allow_truncation)
            throw TruncationError{
                "Padded data of " + std::to_string(length)
                + " bytes exceeds allowed padded data size of "
                + std::to_string(max_length)};
        length = max_length;
    }
    const auto padding_length = max_length - length;

    PaddedBlock block{size};
    block.m_data.resize(totalSize(size), PadByte);
    block.m_data[0] = static_cast<std::uint8_t>((padding_length >> 8) & 0xFF);
    block.m_data[1] = static_cast<std::uint8_t>(padding_length & 0xFF);
    if(length != 0)
        std::memcpy(block.m_data.data() + PadIndicatorSize, payload, length);
    return block;
}

PaddedBlock::PaddedBlock(Bytes data, BlockSize size)
: m_data(std::move(data))
, m_size(size) {
    if(m_data.size() != totalSize(size))
        throw MalformedBlockError{
            "Padded block has " + std::to_string(m_data.size())
            + " bytes, expected " + std::to_string(totalSize(size))};
    const auto padding_length = paddingIndicator(m_data);
    if(padding_length > capacity(size))
        throw MalformedBlockError{
            "Padding indicator " + std::to_string(padding_length)
            + " exceeds block capacity of " + std::to_string(capacity(size))};
}

std::size_t PaddedBlock::paddingIndicator(const Bytes& data) {
    return (static_cast<std::size_t>(data[0]) << 8) | static_cast<std::size_t>(data[1]);
}

Bytes PaddedBlock::decode() const {
    const auto message_end = totalSize(m_size) - paddingLength();
    return Bytes(m_data.begin() + PadIndicatorSize, m_data.begin() + message_end);
}

Bytes addPadding(const Bytes& payload, BlockSize size, bool allow_truncation) {
    return PaddedBlock::Encode(payload, size, allow_truncation).bytes();
}

Bytes removePadding(const Bytes& block, BlockSize size) {
    return PaddedBlock{block, size}.decode();
}

}
