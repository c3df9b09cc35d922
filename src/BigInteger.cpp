/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/BigInteger.hpp"
#include "electionguard/Exception.hpp"

#include <algorithm>

namespace electionguard {

static int hexDigitValue(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static void stripLeadingZeros(std::vector<std::uint8_t>& bytes) {
    auto first = std::find_if(bytes.begin(), bytes.end(),
                              [](std::uint8_t b) { return b != 0; });
    bytes.erase(bytes.begin(), first);
}

BigInteger::BigInteger(std::uint64_t value) {
    while(value != 0) {
        m_bytes.push_back(static_cast<std::uint8_t>(value & 0xFF));
        value >>= 8;
    }
    std::reverse(m_bytes.begin(), m_bytes.end());
}

BigInteger BigInteger::FromBytes(std::vector<std::uint8_t> bytes) {
    BigInteger result;
    result.m_bytes = std::move(bytes);
    stripLeadingZeros(result.m_bytes);
    return result;
}

BigInteger BigInteger::FromHex(std::string_view hex) {
    if(hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex.remove_prefix(2);
    if(hex.empty())
        throw ParseError{"Empty hexadecimal string"};

    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2 + 1);
    std::size_t i = 0;
    // an odd number of digits means the first byte has a single digit
    if(hex.size() % 2 == 1) {
        int v = hexDigitValue(hex[0]);
        if(v < 0) throw ParseError{"Invalid hexadecimal string: " + std::string{hex}};
        bytes.push_back(static_cast<std::uint8_t>(v));
        i = 1;
    }
    for(; i < hex.size(); i += 2) {
        int hi = hexDigitValue(hex[i]);
        int lo = hexDigitValue(hex[i+1]);
        if(hi < 0 || lo < 0)
            throw ParseError{"Invalid hexadecimal string: " + std::string{hex}};
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return FromBytes(std::move(bytes));
}

std::string BigInteger::toHex() const {
    static const char digits[] = "0123456789ABCDEF";
    if(m_bytes.empty()) return "00";
    std::string result;
    result.reserve(2*m_bytes.size());
    for(auto b : m_bytes) {
        result.push_back(digits[b >> 4]);
        result.push_back(digits[b & 0x0F]);
    }
    return result;
}

std::size_t BigInteger::bitLength() const {
    if(m_bytes.empty()) return 0;
    std::size_t bits = 8*(m_bytes.size() - 1);
    auto top = m_bytes.front();
    while(top != 0) {
        ++bits;
        top >>= 1;
    }
    return bits;
}

int BigInteger::compare(const BigInteger& other) const {
    if(m_bytes.size() != other.m_bytes.size())
        return m_bytes.size() < other.m_bytes.size() ? -1 : 1;
    auto mismatch = std::mismatch(m_bytes.begin(), m_bytes.end(), other.m_bytes.begin());
    if(mismatch.first == m_bytes.end()) return 0;
    return *mismatch.first < *mismatch.second ? -1 : 1;
}

}
