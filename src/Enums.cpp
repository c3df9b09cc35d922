/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/Enums.hpp"

namespace electionguard {

const std::vector<std::pair<ElectionType, nlohmann::json>>&
EnumTraits<ElectionType>::values() {
    static const std::vector<std::pair<ElectionType, nlohmann::json>> table = {
        {ElectionType::Unknown,               "unknown"},
        {ElectionType::General,               "general"},
        {ElectionType::PartisanPrimaryClosed, "partisan_primary_closed"},
        {ElectionType::PartisanPrimaryOpen,   "partisan_primary_open"},
        {ElectionType::Primary,               "primary"},
        {ElectionType::Runoff,                "runoff"},
        {ElectionType::Special,               "special"},
        {ElectionType::Other,                 "other"}
    };
    return table;
}

const std::vector<std::pair<ReportingUnitType, nlohmann::json>>&
EnumTraits<ReportingUnitType>::values() {
    static const std::vector<std::pair<ReportingUnitType, nlohmann::json>> table = {
        {ReportingUnitType::Unknown,          "unknown"},
        {ReportingUnitType::BallotBatch,      "ballot_batch"},
        {ReportingUnitType::BallotStyleArea,  "ballot_style_area"},
        {ReportingUnitType::Borough,          "borough"},
        {ReportingUnitType::City,             "city"},
        {ReportingUnitType::CityCouncil,      "city_council"},
        {ReportingUnitType::CombinedPrecinct, "combined_precinct"},
        {ReportingUnitType::Congressional,    "congressional"},
        {ReportingUnitType::Country,          "country"},
        {ReportingUnitType::County,           "county"},
        {ReportingUnitType::CountyCouncil,    "county_council"},
        {ReportingUnitType::DropBox,          "drop_box"},
        {ReportingUnitType::Judicial,         "judicial"},
        {ReportingUnitType::Municipality,     "municipality"},
        {ReportingUnitType::PollingPlace,     "polling_place"},
        {ReportingUnitType::Precinct,         "precinct"},
        {ReportingUnitType::School,           "school"},
        {ReportingUnitType::Special,          "special"},
        {ReportingUnitType::SplitPrecinct,    "split_precinct"},
        {ReportingUnitType::State,            "state"},
        {ReportingUnitType::StateHouse,       "state_house"},
        {ReportingUnitType::StateSenate,      "state_senate"},
        {ReportingUnitType::Township,         "township"},
        {ReportingUnitType::Utility,          "utility"},
        {ReportingUnitType::Village,          "village"},
        {ReportingUnitType::VoteCenter,       "vote_center"},
        {ReportingUnitType::Ward,             "ward"},
        {ReportingUnitType::Water,            "water"},
        {ReportingUnitType::Other,            "other"}
    };
    return table;
}

const std::vector<std::pair<VoteVariationType, nlohmann::json>>&
EnumTraits<VoteVariationType>::values() {
    static const std::vector<std::pair<VoteVariationType, nlohmann::json>> table = {
        {VoteVariationType::Unknown,       "unknown"},
        {VoteVariationType::OneOfM,        "one_of_m"},
        {VoteVariationType::Approval,      "approval"},
        {VoteVariationType::Borda,         "borda"},
        {VoteVariationType::Cumulative,    "cumulative"},
        {VoteVariationType::Majority,      "majority"},
        {VoteVariationType::NOfM,          "n_of_m"},
        {VoteVariationType::Plurality,     "plurality"},
        {VoteVariationType::Proportional,  "proportional"},
        {VoteVariationType::Range,         "range"},
        {VoteVariationType::Rcv,           "rcv"},
        {VoteVariationType::SuperMajority, "super_majority"},
        {VoteVariationType::Other,         "other"}
    };
    return table;
}

const std::vector<std::pair<SpecVersion, nlohmann::json>>&
EnumTraits<SpecVersion>::values() {
    static const std::vector<std::pair<SpecVersion, nlohmann::json>> table = {
        {SpecVersion::EG0_95, "v0.95"},
        {SpecVersion::EG1_0,  "v1.0"}
    };
    return table;
}

const std::vector<std::pair<BallotBoxState, nlohmann::json>>&
EnumTraits<BallotBoxState>::values() {
    static const std::vector<std::pair<BallotBoxState, nlohmann::json>> table = {
        {BallotBoxState::Cast,    1},
        {BallotBoxState::Spoiled, 2},
        {BallotBoxState::Unknown, 999}
    };
    return table;
}

const std::vector<std::pair<ProofUsage, nlohmann::json>>&
EnumTraits<ProofUsage>::values() {
    static const std::vector<std::pair<ProofUsage, nlohmann::json>> table = {
        {ProofUsage::Unknown,        "Unknown"},
        {ProofUsage::SecretValue,    "Prove knowledge of secret value"},
        {ProofUsage::SelectionLimit, "Prove value within selection's limit"},
        {ProofUsage::SelectionValue, "Prove selection's value (0 or 1)"}
    };
    return table;
}

const std::vector<std::pair<ContestErrorType, nlohmann::json>>&
EnumTraits<ContestErrorType>::values() {
    static const std::vector<std::pair<ContestErrorType, nlohmann::json>> table = {
        {ContestErrorType::Default,   "default"},
        {ContestErrorType::NullVote,  "nullvote"},
        {ContestErrorType::UnderVote, "undervote"},
        {ContestErrorType::OverVote,  "overvote"}
    };
    return table;
}

}
