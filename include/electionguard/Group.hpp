/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_GROUP_HPP
#define ELECTIONGUARD_GROUP_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/BigInteger.hpp>

namespace electionguard {

/**
 * @brief Number of bits of the large prime P.
 */
constexpr const std::size_t LargePrimeBits = 4096;

/**
 * @brief The small prime Q = 2^256 - 189.
 */
const BigInteger& smallPrime();

/**
 * @brief An element of the integers modulo the small prime Q.
 * Construction throws a ParseError if the value is not below Q.
 */
class ElementModQ {

    public:

    ElementModQ() = default;

    explicit ElementModQ(BigInteger value);

    static ElementModQ FromHex(std::string_view hex) {
        return ElementModQ{BigInteger::FromHex(hex)};
    }

    const BigInteger& value() const {
        return m_value;
    }

    std::string toHex() const {
        return m_value.toHex();
    }

    bool operator==(const ElementModQ& other) const { return m_value == other.m_value; }
    bool operator!=(const ElementModQ& other) const { return m_value != other.m_value; }

    private:

    BigInteger m_value;
};

/**
 * @brief An element of the integers modulo the large prime P.
 * Only the bit length of the value is checked (at most LargePrimeBits).
 */
class ElementModP {

    public:

    ElementModP() = default;

    explicit ElementModP(BigInteger value);

    static ElementModP FromHex(std::string_view hex) {
        return ElementModP{BigInteger::FromHex(hex)};
    }

    const BigInteger& value() const {
        return m_value;
    }

    std::string toHex() const {
        return m_value.toHex();
    }

    bool operator==(const ElementModP& other) const { return m_value == other.m_value; }
    bool operator!=(const ElementModP& other) const { return m_value != other.m_value; }

    private:

    BigInteger m_value;
};

}

#endif
