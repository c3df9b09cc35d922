/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_ELECTION_RECORDS_HPP
#define ELECTIONGUARD_ELECTION_RECORDS_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Codec.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace electionguard {

/**
 * @brief Parameters of the group used by an election.
 */
struct ElectionConstants {

    BigInteger large_prime;
    BigInteger small_prime;
    BigInteger cofactor;
    BigInteger generator;

    static constexpr auto fields() {
        return std::make_tuple(
            field("large_prime", &ElectionConstants::large_prime),
            field("small_prime", &ElectionConstants::small_prime),
            field("cofactor", &ElectionConstants::cofactor),
            field("generator", &ElectionConstants::generator));
    }

    bool operator==(const ElectionConstants& other) const {
        return large_prime == other.large_prime
            && small_prime == other.small_prime
            && cofactor == other.cofactor
            && generator == other.generator;
    }
};

/**
 * @brief Context shared by every encryption of an election.
 */
struct CiphertextElectionContext {

    std::uint32_t number_of_guardians = 0;
    std::uint32_t quorum = 0;
    ElementModP   elgamal_public_key;
    ElementModQ   commitment_hash;
    ElementModQ   manifest_hash;
    ElementModQ   crypto_base_hash;
    ElementModQ   crypto_extended_base_hash;
    std::optional<std::map<std::string, std::string>> extended_data;

    static constexpr auto fields() {
        using C = CiphertextElectionContext;
        return std::make_tuple(
            field("number_of_guardians", &C::number_of_guardians),
            field("quorum", &C::quorum),
            field("elgamal_public_key", &C::elgamal_public_key),
            field("commitment_hash", &C::commitment_hash),
            field("manifest_hash", &C::manifest_hash),
            field("crypto_base_hash", &C::crypto_base_hash),
            field("crypto_extended_base_hash", &C::crypto_extended_base_hash),
            field("extended_data", &C::extended_data));
    }

    bool operator==(const CiphertextElectionContext& other) const {
        return number_of_guardians == other.number_of_guardians
            && quorum == other.quorum
            && elgamal_public_key == other.elgamal_public_key
            && commitment_hash == other.commitment_hash
            && manifest_hash == other.manifest_hash
            && crypto_base_hash == other.crypto_base_hash
            && crypto_extended_base_hash == other.crypto_extended_base_hash
            && extended_data == other.extended_data;
    }
};

struct SchnorrProof {

    ElementModP public_key;
    ElementModP commitment;
    ElementModQ challenge;
    ElementModQ response;
    ProofUsage  usage = ProofUsage::SecretValue;

    static constexpr auto fields() {
        return std::make_tuple(
            field("public_key", &SchnorrProof::public_key),
            field("commitment", &SchnorrProof::commitment),
            field("challenge", &SchnorrProof::challenge),
            field("response", &SchnorrProof::response),
            field("usage", &SchnorrProof::usage));
    }

    bool operator==(const SchnorrProof& other) const {
        return public_key == other.public_key
            && commitment == other.commitment
            && challenge == other.challenge
            && response == other.response
            && usage == other.usage;
    }
};

/**
 * @brief Public key material published by a guardian after the key ceremony.
 */
struct GuardianRecord {

    std::string                guardian_id;
    std::uint32_t              sequence_order = 0;
    ElementModP                election_public_key;
    std::vector<ElementModP>   election_commitments;
    std::vector<SchnorrProof>  election_proofs;

    static constexpr auto fields() {
        return std::make_tuple(
            field("guardian_id", &GuardianRecord::guardian_id),
            field("sequence_order", &GuardianRecord::sequence_order),
            field("election_public_key", &GuardianRecord::election_public_key),
            field("election_commitments", &GuardianRecord::election_commitments),
            field("election_proofs", &GuardianRecord::election_proofs));
    }

    bool operator==(const GuardianRecord& other) const {
        return guardian_id == other.guardian_id
            && sequence_order == other.sequence_order
            && election_public_key == other.election_public_key
            && election_commitments == other.election_commitments
            && election_proofs == other.election_proofs;
    }
};

/**
 * @brief Summary of a ballot once it went through the ballot box.
 */
struct SubmittedBallotInfo {

    std::string    object_id;
    std::string    style_id;
    ElementModQ    manifest_hash;
    ElementModQ    code;
    BallotBoxState state = BallotBoxState::Unknown;
    DateTime       timestamp;
    std::map<std::string, ContestErrorType> contest_errors;

    static constexpr auto fields() {
        using B = SubmittedBallotInfo;
        return std::make_tuple(
            field("object_id", &B::object_id),
            field("style_id", &B::style_id),
            field("manifest_hash", &B::manifest_hash),
            field("code", &B::code),
            field("state", &B::state),
            field("timestamp", &B::timestamp),
            field("contest_errors", &B::contest_errors));
    }

    bool operator==(const SubmittedBallotInfo& other) const {
        return object_id == other.object_id
            && style_id == other.style_id
            && manifest_hash == other.manifest_hash
            && code == other.code
            && state == other.state
            && timestamp == other.timestamp
            && contest_errors == other.contest_errors;
    }
};

struct GeopoliticalUnitInfo {

    std::string       object_id;
    std::string       name;
    ReportingUnitType type = ReportingUnitType::Unknown;

    static constexpr auto fields() {
        return std::make_tuple(
            field("object_id", &GeopoliticalUnitInfo::object_id),
            field("name", &GeopoliticalUnitInfo::name),
            field("type", &GeopoliticalUnitInfo::type));
    }

    bool operator==(const GeopoliticalUnitInfo& other) const {
        return object_id == other.object_id
            && name == other.name
            && type == other.type;
    }
};

struct ContestInfo {

    std::string                  object_id;
    std::uint32_t                sequence_order = 0;
    std::string                  electoral_district_id;
    VoteVariationType            vote_variation = VoteVariationType::Unknown;
    std::uint32_t                number_elected = 0;
    std::optional<std::uint32_t> votes_allowed;
    std::string                  name;

    static constexpr auto fields() {
        return std::make_tuple(
            field("object_id", &ContestInfo::object_id),
            field("sequence_order", &ContestInfo::sequence_order),
            field("electoral_district_id", &ContestInfo::electoral_district_id),
            field("vote_variation", &ContestInfo::vote_variation),
            field("number_elected", &ContestInfo::number_elected),
            field("votes_allowed", &ContestInfo::votes_allowed),
            field("name", &ContestInfo::name));
    }

    bool operator==(const ContestInfo& other) const {
        return object_id == other.object_id
            && sequence_order == other.sequence_order
            && electoral_district_id == other.electoral_district_id
            && vote_variation == other.vote_variation
            && number_elected == other.number_elected
            && votes_allowed == other.votes_allowed
            && name == other.name;
    }
};

/**
 * @brief Subset of an election manifest: its identification,
 * its dates, its geopolitical units and its contests.
 */
struct ManifestInfo {

    std::string                       election_scope_id;
    SpecVersion                       spec_version = SpecVersion::EG1_0;
    ElectionType                      type = ElectionType::Unknown;
    DateTime                          start_date;
    DateTime                          end_date;
    std::vector<GeopoliticalUnitInfo> geopolitical_units;
    std::vector<ContestInfo>          contests;
    std::optional<std::string>        name;

    static constexpr auto fields() {
        return std::make_tuple(
            field("election_scope_id", &ManifestInfo::election_scope_id),
            field("spec_version", &ManifestInfo::spec_version),
            field("type", &ManifestInfo::type),
            field("start_date", &ManifestInfo::start_date),
            field("end_date", &ManifestInfo::end_date),
            field("geopolitical_units", &ManifestInfo::geopolitical_units),
            field("contests", &ManifestInfo::contests),
            field("name", &ManifestInfo::name));
    }

    bool operator==(const ManifestInfo& other) const {
        return election_scope_id == other.election_scope_id
            && spec_version == other.spec_version
            && type == other.type
            && start_date == other.start_date
            && end_date == other.end_date
            && geopolitical_units == other.geopolitical_units
            && contests == other.contests
            && name == other.name;
    }
};

}

#endif
