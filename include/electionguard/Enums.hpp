/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_ENUMS_HPP
#define ELECTIONGUARD_ENUMS_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/CoercionRegistry.hpp>
#include <electionguard/Json.hpp>

#include <utility>
#include <vector>

namespace electionguard {

enum class ElectionType {
    Unknown,
    General,
    PartisanPrimaryClosed,
    PartisanPrimaryOpen,
    Primary,
    Runoff,
    Special,
    Other
};

enum class ReportingUnitType {
    Unknown,
    BallotBatch,
    BallotStyleArea,
    Borough,
    City,
    CityCouncil,
    CombinedPrecinct,
    Congressional,
    Country,
    County,
    CountyCouncil,
    DropBox,
    Judicial,
    Municipality,
    PollingPlace,
    Precinct,
    School,
    Special,
    SplitPrecinct,
    State,
    StateHouse,
    StateSenate,
    Township,
    Utility,
    Village,
    VoteCenter,
    Ward,
    Water,
    Other
};

enum class VoteVariationType {
    Unknown,
    OneOfM,
    Approval,
    Borda,
    Cumulative,
    Majority,
    NOfM,
    Plurality,
    Proportional,
    Range,
    Rcv,
    SuperMajority,
    Other
};

enum class SpecVersion {
    EG0_95,
    EG1_0
};

/**
 * @brief State of a ballot in the ballot box. Serialized as an integer.
 */
enum class BallotBoxState {
    Cast = 1,
    Spoiled = 2,
    Unknown = 999
};

enum class ProofUsage {
    Unknown,
    SecretValue,
    SelectionLimit,
    SelectionValue
};

enum class ContestErrorType {
    Default,
    NullVote,
    UnderVote,
    OverVote
};

/**
 * @brief EnumTraits associates an enumeration with its coercion and
 * with the JSON value of each of its enumerators. Enumerations without
 * a specialization cannot be serialized.
 */
template<typename E>
struct EnumTraits {};

#define ELECTIONGUARD_DECLARE_ENUM_TRAITS(__enum__)                             \
    template<>                                                                  \
    struct EnumTraits<__enum__> {                                               \
        static constexpr CoercedType coercion = CoercedType::__enum__;          \
        static constexpr const char* name = #__enum__;                          \
        static const std::vector<std::pair<__enum__, nlohmann::json>>& values(); \
    }

ELECTIONGUARD_DECLARE_ENUM_TRAITS(ElectionType);
ELECTIONGUARD_DECLARE_ENUM_TRAITS(ReportingUnitType);
ELECTIONGUARD_DECLARE_ENUM_TRAITS(VoteVariationType);
ELECTIONGUARD_DECLARE_ENUM_TRAITS(SpecVersion);
ELECTIONGUARD_DECLARE_ENUM_TRAITS(BallotBoxState);
ELECTIONGUARD_DECLARE_ENUM_TRAITS(ProofUsage);
ELECTIONGUARD_DECLARE_ENUM_TRAITS(ContestErrorType);

#undef ELECTIONGUARD_DECLARE_ENUM_TRAITS

}

#endif
