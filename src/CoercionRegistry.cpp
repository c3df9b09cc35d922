/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/CoercionRegistry.hpp"
#include "electionguard/Exception.hpp"

#include <array>

namespace electionguard {

static const std::array<const char*, NumCoercedTypes> coercedTypeNames = {
    "datetime",
    "big_integer",
    "element_mod_p",
    "element_mod_q",
    "election_type",
    "reporting_unit_type",
    "vote_variation_type",
    "spec_version",
    "ballot_box_state",
    "proof_usage",
    "contest_error_type"
};

const char* toString(CoercedType type) {
    return coercedTypeNames[static_cast<std::size_t>(type)];
}

CoercedType coercedTypeFromString(std::string_view name) {
    for(std::size_t i = 0; i < NumCoercedTypes; ++i) {
        if(name == coercedTypeNames[i])
            return static_cast<CoercedType>(i);
    }
    throw Exception{"Unknown coerced type: " + std::string{name}};
}

CoercionRegistry CoercionRegistry::Default() {
    CoercionRegistry registry{};
    registry.m_enabled.set();
    return registry;
}

CoercionRegistry::CoercionRegistry(std::initializer_list<CoercedType> types) {
    for(auto t : types) m_enabled.set(static_cast<std::size_t>(t));
}

CoercionRegistry::CoercionRegistry(const std::vector<CoercedType>& types) {
    for(auto t : types) m_enabled.set(static_cast<std::size_t>(t));
}

void CoercionRegistry::require(CoercedType type) const {
    if(!contains(type))
        throw UnsupportedTypeError{
            std::string{"No coercion registered for type "} + toString(type)};
}

std::vector<CoercedType> CoercionRegistry::types() const {
    std::vector<CoercedType> result;
    for(std::size_t i = 0; i < NumCoercedTypes; ++i) {
        if(m_enabled.test(i)) result.push_back(static_cast<CoercedType>(i));
    }
    return result;
}

}
