/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_COERCION_REGISTRY_HPP
#define ELECTIONGUARD_COERCION_REGISTRY_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Exception.hpp>

#include <bitset>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace electionguard {

/**
 * @brief Types that do not have an unambiguous JSON mapping and
 * require a coercion rule to be formatted or parsed.
 */
enum class CoercedType : std::uint8_t {
    DateTime,
    BigInteger,
    ElementModP,
    ElementModQ,
    ElectionType,
    ReportingUnitType,
    VoteVariationType,
    SpecVersion,
    BallotBoxState,
    ProofUsage,
    ContestErrorType
};

constexpr const std::size_t NumCoercedTypes =
    static_cast<std::size_t>(CoercedType::ContestErrorType) + 1;

/**
 * @brief Name of the coerced type as used in configuration documents
 * (e.g. "datetime", "element_mod_p").
 */
const char* toString(CoercedType type);

/**
 * @brief Converts a name produced by toString back into a CoercedType.
 * Throws an Exception if the name is unknown.
 */
CoercedType coercedTypeFromString(std::string_view name);

/**
 * @brief The CoercionRegistry is the set of coercion rules available
 * to a SerializationContext. The rules themselves are the Codec
 * specializations of the coerced types; the registry decides which
 * of them may be used. A registry is immutable once constructed.
 */
class CoercionRegistry {

    public:

    /**
     * @brief Registry enabling every coerced type.
     */
    static CoercionRegistry Default();

    /**
     * @brief Registry enabling only the provided types.
     */
    CoercionRegistry(std::initializer_list<CoercedType> types);

    explicit CoercionRegistry(const std::vector<CoercedType>& types);

    CoercionRegistry(const CoercionRegistry&) = default; // LCOV_EXCL_LINE

    CoercionRegistry(CoercionRegistry&&) = default; // LCOV_EXCL_LINE

    CoercionRegistry& operator=(const CoercionRegistry&) = default; // LCOV_EXCL_LINE

    CoercionRegistry& operator=(CoercionRegistry&&) = default; // LCOV_EXCL_LINE

    ~CoercionRegistry() = default; // LCOV_EXCL_LINE

    bool contains(CoercedType type) const {
        return m_enabled.test(static_cast<std::size_t>(type));
    }

    /**
     * @brief Throws an UnsupportedTypeError if the type is not
     * part of the registry.
     */
    void require(CoercedType type) const;

    /**
     * @brief Enabled types, in declaration order of CoercedType.
     */
    std::vector<CoercedType> types() const;

    private:

    std::bitset<NumCoercedTypes> m_enabled;
};

}

#endif
