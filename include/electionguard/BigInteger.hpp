/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_BIG_INTEGER_HPP
#define ELECTIONGUARD_BIG_INTEGER_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Exception.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace electionguard {

/**
 * @brief Non-negative integer of arbitrary size, stored as its
 * big-endian magnitude without leading zero bytes. No arithmetic is
 * provided: the class only carries values between their textual and
 * binary representations.
 */
class BigInteger {

    public:

    /**
     * @brief Constructs the value 0.
     */
    BigInteger() = default;

    BigInteger(std::uint64_t value);

    /**
     * @brief Constructs a BigInteger from a big-endian magnitude.
     * Leading zero bytes are dropped.
     */
    static BigInteger FromBytes(std::vector<std::uint8_t> bytes);

    /**
     * @brief Parses a hexadecimal string. The string may start with
     * "0x", may use either case and may have an odd number of digits.
     * Throws a ParseError if the string is not hexadecimal.
     */
    static BigInteger FromHex(std::string_view hex);

    /**
     * @brief Uppercase hexadecimal form with an even number of digits.
     * Zero is formatted as "00".
     */
    std::string toHex() const;

    const std::vector<std::uint8_t>& bytes() const {
        return m_bytes;
    }

    /**
     * @brief Number of significant bits (0 for the value 0).
     */
    std::size_t bitLength() const;

    bool isZero() const {
        return m_bytes.empty();
    }

    int compare(const BigInteger& other) const;

    bool operator==(const BigInteger& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const BigInteger& other) const { return m_bytes != other.m_bytes; }
    bool operator<(const BigInteger& other) const  { return compare(other) < 0; }

    private:

    std::vector<std::uint8_t> m_bytes;
};

}

#endif
