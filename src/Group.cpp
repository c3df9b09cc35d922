/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/Group.hpp"
#include "electionguard/Exception.hpp"

namespace electionguard {

const BigInteger& smallPrime() {
    // 2^256 - 189
    static const BigInteger q = BigInteger::FromHex(
        "FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF43");
    return q;
}

ElementModQ::ElementModQ(BigInteger value)
: m_value(std::move(value)) {
    if(!(m_value < smallPrime()))
        throw ParseError{"Value " + m_value.toHex() + " is not an element of Z_q"};
}

ElementModP::ElementModP(BigInteger value)
: m_value(std::move(value)) {
    if(m_value.bitLength() > LargePrimeBits)
        throw ParseError{"Value of " + std::to_string(m_value.bitLength())
                         + " bits is not an element of Z_p"};
}

}
