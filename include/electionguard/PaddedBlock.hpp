/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_PADDED_BLOCK_HPP
#define ELECTIONGUARD_PADDED_BLOCK_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Exception.hpp>

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace electionguard {

using Bytes = std::vector<std::uint8_t>;

/**
 * @brief Number of bytes used by the big-endian padding indicator
 * at the beginning of every padded block.
 */
constexpr const std::size_t PadIndicatorSize = 2;

/**
 * @brief Byte used to fill the end of a padded block.
 */
constexpr const std::uint8_t PadByte = 0x00;

/**
 * @brief Allowed total sizes of a padded block, indicator included.
 */
enum class BlockSize : std::size_t {
    Bytes512 = 512
};

/**
 * @brief Total number of bytes of a block of the given class.
 */
constexpr std::size_t totalSize(BlockSize size) {
    return static_cast<std::size_t>(size);
}

/**
 * @brief Maximum payload length of a block of the given class.
 */
constexpr std::size_t capacity(BlockSize size) {
    return totalSize(size) - PadIndicatorSize;
}

/**
 * @brief Converts a total block size (e.g. 512) into a BlockSize.
 * Throws an Exception if the size is not a supported block class.
 */
BlockSize blockSizeFromBytes(std::size_t total);

/**
 * @brief A PaddedBlock is a byte sequence of exactly totalSize(size)
 * bytes made of a 2-byte big-endian padding indicator, the payload,
 * and PadByte filler. The indicator holds the number of filler bytes.
 */
class PaddedBlock {

    public:

    /**
     * @brief Pads the payload into a block of the requested class.
     *
     * If the payload is longer than capacity(size), throws a
     * TruncationError unless allow_truncation is true, in which case
     * only the first capacity(size) bytes are kept. Truncation is lossy:
     * the dropped bytes cannot be recovered from the block.
     *
     * @param payload Bytes to pad.
     * @param size Block class.
     * @param allow_truncation Whether to cut oversize payloads.
     */
    static PaddedBlock Encode(const void* payload, std::size_t length,
                              BlockSize size, bool allow_truncation = false);

    static PaddedBlock Encode(const Bytes& payload,
                              BlockSize size, bool allow_truncation = false) {
        return Encode(payload.data(), payload.size(), size, allow_truncation);
    }

    static PaddedBlock Encode(std::string_view payload,
                              BlockSize size, bool allow_truncation = false) {
        return Encode(payload.data(), payload.size(), size, allow_truncation);
    }

    /**
     * @brief Wraps bytes that are expected to form a block of the given
     * class. Throws a MalformedBlockError if the length or the padding
     * indicator are inconsistent with the class.
     */
    PaddedBlock(Bytes data, BlockSize size);

    PaddedBlock(const PaddedBlock&) = default; // LCOV_EXCL_LINE

    PaddedBlock(PaddedBlock&&) = default; // LCOV_EXCL_LINE

    PaddedBlock& operator=(const PaddedBlock&) = default; // LCOV_EXCL_LINE

    PaddedBlock& operator=(PaddedBlock&&) = default; // LCOV_EXCL_LINE

    ~PaddedBlock() = default; // LCOV_EXCL_LINE

    /**
     * @brief Returns the payload stored in the block.
     */
    Bytes decode() const;

    /**
     * @brief Value of the padding indicator (number of filler bytes).
     */
    std::size_t paddingLength() const {
        return paddingIndicator(m_data);
    }

    /**
     * @brief Length of the payload stored in the block.
     */
    std::size_t payloadLength() const {
        return capacity(m_size) - paddingLength();
    }

    BlockSize blockSize() const {
        return m_size;
    }

    /**
     * @brief Returns the raw bytes of the block.
     */
    const Bytes& bytes() const & {
        return m_data;
    }

    Bytes&& bytes() && {
        return std::move(m_data);
    }

    private:

    PaddedBlock(BlockSize size)
    : m_size(size) {}

    static std::size_t paddingIndicator(const Bytes& data);

    Bytes     m_data;
    BlockSize m_size;
};

/**
 * @brief Adds padding to a payload. Equivalent to
 * PaddedBlock::Encode(payload, size, allow_truncation).bytes().
 */
Bytes addPadding(const Bytes& payload, BlockSize size, bool allow_truncation = false);

/**
 * @brief Removes the padding of a block produced by addPadding.
 * Throws a MalformedBlockError if the block is inconsistent with
 * the requested class.
 */
Bytes removePadding(const Bytes& block, BlockSize size);

}

#endif
