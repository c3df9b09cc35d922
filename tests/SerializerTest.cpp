/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <electionguard/Serializer.hpp>
#include <electionguard/ElectionRecords.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>
#include <vector>

using namespace electionguard;

namespace {

SchnorrProof makeProof(std::uint64_t seed) {
    SchnorrProof proof;
    proof.public_key = ElementModP{BigInteger{seed}};
    proof.commitment = ElementModP{BigInteger{seed + 1}};
    proof.challenge  = ElementModQ{BigInteger{seed + 2}};
    proof.response   = ElementModQ{BigInteger{seed + 3}};
    return proof;
}

CiphertextElectionContext makeContext() {
    CiphertextElectionContext context;
    context.number_of_guardians = 5;
    context.quorum = 3;
    context.elgamal_public_key = ElementModP::FromHex(std::string(1024, 'A'));
    context.commitment_hash = ElementModQ::FromHex("01");
    context.manifest_hash = ElementModQ::FromHex("02");
    context.crypto_base_hash = ElementModQ::FromHex("03");
    context.crypto_extended_base_hash = ElementModQ::FromHex(std::string(62, 'F') + "00");
    return context;
}

ManifestInfo makeManifest() {
    ManifestInfo manifest;
    manifest.election_scope_id = "jefferson-county-primary";
    manifest.spec_version = SpecVersion::EG1_0;
    manifest.type = ElectionType::PartisanPrimaryClosed;
    manifest.start_date = DateTime{2020, 3, 1, 8};
    manifest.end_date = DateTime{2020, 3, 1, 20, 0, 0, 0, -300};
    manifest.geopolitical_units = {
        GeopoliticalUnitInfo{"jefferson-county", "Jefferson County", ReportingUnitType::County},
        GeopoliticalUnitInfo{"harrison-township", "Harrison Township", ReportingUnitType::Township}
    };
    ContestInfo contest;
    contest.object_id = "justice-supreme-court";
    contest.sequence_order = 0;
    contest.electoral_district_id = "jefferson-county";
    contest.vote_variation = VoteVariationType::NOfM;
    contest.number_elected = 2;
    contest.votes_allowed = 2;
    contest.name = "Justice of the Supreme Court";
    manifest.contests.push_back(contest);
    return manifest;
}

}

TEST_CASE("Serializer primitives test", "[serializer]") {

    SerializationContext ctx;

    SECTION("Round trip of structural values") {
        REQUIRE(fromRaw<bool>(toRaw(true, ctx), ctx) == true);
        REQUIRE(fromRaw<int>(toRaw(-42, ctx), ctx) == -42);
        REQUIRE(fromRaw<std::uint64_t>(toRaw(std::uint64_t{1} << 63, ctx), ctx) == std::uint64_t{1} << 63);
        REQUIRE(fromRaw<double>(toRaw(2.5, ctx), ctx) == 2.5);
        REQUIRE(fromRaw<std::string>(toRaw(std::string{"héllo"}, ctx), ctx) == "héllo");

        std::vector<std::optional<int>> v{1, std::nullopt, 3};
        REQUIRE(fromRaw<std::vector<std::optional<int>>>(toRaw(v, ctx), ctx) == v);

        std::map<std::string, std::vector<std::string>> m{{"a", {"x"}}, {"b", {}}};
        REQUIRE(fromRaw<decltype(m)>(toRaw(m, ctx), ctx) == m);
    }

    SECTION("Integer ranges") {
        REQUIRE_THROWS_AS(fromRaw<std::uint8_t>("256", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<std::uint32_t>("-1", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<std::int8_t>("-129", ctx), ParseError);
        REQUIRE(fromRaw<std::int8_t>("-128", ctx) == -128);
        REQUIRE_THROWS_AS(fromRaw<int>("1.5", ctx), ParseError);
    }

    SECTION("Mismatched JSON kinds") {
        REQUIRE_THROWS_AS(fromRaw<std::string>("12", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<bool>("\"true\"", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<std::vector<int>>("{}", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<std::map<std::string, int>>("[]", ctx), ParseError);
    }

    SECTION("Malformed JSON") {
        REQUIRE_THROWS_AS(fromRaw<ElectionConstants>("{not json", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<int>("", ctx), ParseError);
    }

    SECTION("Non-finite doubles") {
        const auto inf = std::numeric_limits<double>::infinity();
        REQUIRE(toRaw(std::nan(""), ctx) == "\"NaN\"");
        REQUIRE(toRaw(inf, ctx) == "\"Infinity\"");
        REQUIRE(toRaw(-inf, ctx) == "\"-Infinity\"");
        REQUIRE(std::isnan(fromRaw<double>(toRaw(std::nan(""), ctx), ctx)));
        REQUIRE(fromRaw<double>(toRaw(inf, ctx), ctx) == inf);
        REQUIRE(fromRaw<double>(toRaw(-inf, ctx), ctx) == -inf);
        REQUIRE_THROWS_AS(fromRaw<double>("null", ctx), ParseError);
        REQUIRE_THROWS_AS(fromRaw<double>("\"infinity\"", ctx), ParseError);

        std::vector<double> v{1.0, inf};
        REQUIRE(fromRaw<std::vector<double>>(toRaw(v, ctx), ctx) == v);
    }

    SECTION("Strings that are not valid UTF-8") {
        REQUIRE_THROWS_AS(toRaw(std::string{"Jefferson\xff"}, ctx), EncodingError);
        GeopoliticalUnitInfo unit{"jefferson-county", "Jefferson\xff", ReportingUnitType::County};
        REQUIRE_THROWS_AS(toRaw(unit, ctx), EncodingError);
        REQUIRE_NOTHROW(toJson(unit, ctx));
    }
}

TEST_CASE("Serializer coercions test", "[serializer]") {

    SerializationContext ctx;

    SECTION("BigInteger") {
        REQUIRE(toJson(BigInteger{0x0ABC}, ctx) == "0ABC");
        REQUIRE(fromJson<BigInteger>("0abc", ctx) == BigInteger{0xABC});
        REQUIRE(fromJson<BigInteger>(2748, ctx) == BigInteger{0xABC});
        REQUIRE_THROWS_AS(fromJson<BigInteger>(-1, ctx), ParseError);
        REQUIRE_THROWS_AS(fromJson<BigInteger>("xyz", ctx), ParseError);
    }

    SECTION("Group elements") {
        REQUIRE(toJson(ElementModQ::FromHex("0a"), ctx) == "0A");
        REQUIRE_THROWS_AS(fromJson<ElementModQ>(std::string(64, 'F'), ctx), ParseError);
        REQUIRE_THROWS_AS(fromJson<ElementModP>(12, ctx), ParseError);
    }

    SECTION("DateTime") {
        DateTime dt{2021, 11, 2, 7, 15, 0, 0, 0};
        REQUIRE(toJson(dt, ctx) == "2021-11-02T07:15:00+00:00");
        REQUIRE(fromJson<DateTime>("2021-11-02T07:15:00Z", ctx) == dt);
        REQUIRE_THROWS_AS(fromJson<DateTime>("November 2nd", ctx), ParseError);
    }

    SECTION("Enumerations") {
        REQUIRE(toJson(ElectionType::General, ctx) == "general");
        REQUIRE(toJson(ReportingUnitType::BallotStyleArea, ctx) == "ballot_style_area");
        REQUIRE(toJson(VoteVariationType::OneOfM, ctx) == "one_of_m");
        REQUIRE(toJson(SpecVersion::EG1_0, ctx) == "v1.0");
        REQUIRE(toJson(BallotBoxState::Spoiled, ctx) == 2);
        REQUIRE(toJson(ProofUsage::SecretValue, ctx) == "Prove knowledge of secret value");
        REQUIRE(toJson(ContestErrorType::OverVote, ctx) == "overvote");

        REQUIRE(fromJson<BallotBoxState>(999, ctx) == BallotBoxState::Unknown);
        REQUIRE(fromJson<ElectionType>("runoff", ctx) == ElectionType::Runoff);
        REQUIRE_THROWS_AS(fromJson<BallotBoxState>(3, ctx), ParseError);
        REQUIRE_THROWS_AS(fromJson<BallotBoxState>("cast", ctx), ParseError);
        REQUIRE_THROWS_AS(fromJson<ElectionType>("General", ctx), ParseError);
    }

    SECTION("Coercions missing from the registry") {
        SerializationContext partial{CoercionRegistry{CoercedType::BigInteger}};
        REQUIRE_NOTHROW(toJson(BigInteger{1}, partial));
        REQUIRE_THROWS_AS(toJson(DateTime{2020, 1, 1}, partial), UnsupportedTypeError);
        REQUIRE_THROWS_AS(toJson(ElectionType::General, partial), UnsupportedTypeError);
        REQUIRE_THROWS_AS(fromJson<ElementModQ>("01", partial), UnsupportedTypeError);
        REQUIRE_THROWS_AS(fromRaw<SchnorrProof>(toRaw(makeProof(1), ctx), partial),
                          UnsupportedTypeError);
        REQUIRE(fromRaw<ElectionConstants>(
                    R"({"large_prime":"17","small_prime":"0B","cofactor":"02","generator":"03"})",
                    partial).small_prime == BigInteger{11});
    }
}

TEST_CASE("Serializer records test", "[serializer]") {

    SerializationContext ctx;

    SECTION("ElectionConstants") {
        ElectionConstants constants{BigInteger{23}, BigInteger{11}, BigInteger{2}, BigInteger{4}};
        auto raw = toRaw(constants, ctx);
        REQUIRE(raw ==
            "{\n"
            "  \"cofactor\": \"02\",\n"
            "  \"generator\": \"04\",\n"
            "  \"large_prime\": \"17\",\n"
            "  \"small_prime\": \"0B\"\n"
            "}");
        REQUIRE(fromRaw<ElectionConstants>(raw, ctx) == constants);

        constexpr auto fields = ElectionConstants::fields();
        STATIC_REQUIRE(std::tuple_size_v<std::remove_const_t<decltype(fields)>> == 4);
        REQUIRE(std::string{std::get<0>(fields).name} == "large_prime");
    }

    SECTION("Serialization is deterministic") {
        auto context = makeContext();
        REQUIRE(toRaw(context, ctx) == toRaw(context, ctx));
        REQUIRE(toRaw(context, ctx) == toRaw(fromRaw<CiphertextElectionContext>(toRaw(context, ctx), ctx), ctx));
    }

    SECTION("Optional fields") {
        auto context = makeContext();
        auto json = toJson(context, ctx);
        REQUIRE(!json.contains("extended_data"));
        REQUIRE(fromJson<CiphertextElectionContext>(json, ctx) == context);

        context.extended_data = std::map<std::string, std::string>{{"county", "jefferson"}};
        json = toJson(context, ctx);
        REQUIRE(json["extended_data"]["county"] == "jefferson");
        REQUIRE(fromJson<CiphertextElectionContext>(json, ctx) == context);

        json["extended_data"] = nullptr;
        REQUIRE(!fromJson<CiphertextElectionContext>(json, ctx).extended_data.has_value());
    }

    SECTION("Nested records") {
        GuardianRecord guardian;
        guardian.guardian_id = "guardian-1";
        guardian.sequence_order = 1;
        guardian.election_public_key = ElementModP{BigInteger{1234}};
        guardian.election_commitments = {ElementModP{BigInteger{5}}, ElementModP{BigInteger{6}}};
        guardian.election_proofs = {makeProof(10), makeProof(20)};
        REQUIRE(fromRaw<GuardianRecord>(toRaw(guardian, ctx), ctx) == guardian);

        auto manifest = makeManifest();
        REQUIRE(fromRaw<ManifestInfo>(toRaw(manifest, ctx), ctx) == manifest);
    }

    SECTION("Ballot with coerced members") {
        SubmittedBallotInfo ballot;
        ballot.object_id = "ballot-1";
        ballot.style_id = "style-1";
        ballot.manifest_hash = ElementModQ::FromHex("AA");
        ballot.code = ElementModQ::FromHex("BB");
        ballot.state = BallotBoxState::Cast;
        ballot.timestamp = DateTime{2020, 3, 1, 10, 30, 0, 123};
        ballot.contest_errors = {{"contest-1", ContestErrorType::UnderVote}};
        auto json = toJson(ballot, ctx);
        REQUIRE(json["state"] == 1);
        REQUIRE(json["timestamp"] == "2020-03-01T10:30:00.000123");
        REQUIRE(json["contest_errors"]["contest-1"] == "undervote");
        REQUIRE(fromJson<SubmittedBallotInfo>(json, ctx) == ballot);
    }

    SECTION("Extra members are ignored") {
        auto json = toJson(makeProof(3), ctx);
        json["unexpected"] = {1, 2, 3};
        REQUIRE(fromJson<SchnorrProof>(json, ctx) == makeProof(3));
    }

    SECTION("Missing and invalid members") {
        auto json = toJson(makeProof(3), ctx);
        json.erase("challenge");
        REQUIRE_THROWS_AS(fromJson<SchnorrProof>(json, ctx), ParseError);

        json = toJson(makeProof(3), ctx);
        json["usage"] = "Prove nothing";
        REQUIRE_THROWS_WITH(fromJson<SchnorrProof>(json, ctx),
                            Catch::Matchers::ContainsSubstring("usage"));

        REQUIRE_THROWS_AS(fromRaw<SchnorrProof>("[]", ctx), ParseError);
    }

    SECTION("Different indentation") {
        SerializationContext compact{CoercionRegistry::Default(), -1};
        REQUIRE(toRaw(std::vector<int>{1, 2}, compact) == "[1,2]");
        SerializationContext wide{CoercionRegistry::Default(), 4};
        REQUIRE(toRaw(std::vector<int>{1}, wide) == "[\n    1\n]");
    }
}

TEST_CASE("Padded serialization test", "[serializer][padding]") {

    SerializationContext ctx;

    SECTION("Round trip through a padded block") {
        auto proof = makeProof(7);
        auto block = paddedEncode(proof, BlockSize::Bytes512, ctx);
        REQUIRE(block.bytes().size() == 512);
        REQUIRE(block.payloadLength() == toRaw(proof, ctx).size());
        REQUIRE(paddedDecode<SchnorrProof>(block, ctx) == proof);
        REQUIRE(paddedDecode<SchnorrProof>(block.bytes(), BlockSize::Bytes512, ctx) == proof);
    }

    SECTION("Oversize documents") {
        auto context = makeContext();
        REQUIRE(toRaw(context, ctx).size() > capacity(BlockSize::Bytes512));
        REQUIRE_THROWS_AS(paddedEncode(context, BlockSize::Bytes512, ctx), TruncationError);

        auto block = paddedEncode(context, BlockSize::Bytes512, ctx, true);
        REQUIRE(block.paddingLength() == 0);
        REQUIRE_THROWS_AS(paddedDecode<CiphertextElectionContext>(block, ctx), ParseError);
    }

    SECTION("Strings that are not valid UTF-8") {
        REQUIRE_THROWS_AS(paddedEncode(std::string{"\xc3"}, BlockSize::Bytes512, ctx),
                          EncodingError);
    }
}

TEST_CASE("Serializer concurrent use of a shared context", "[serializer]") {

    const SerializationContext ctx;
    const auto manifest = makeManifest();
    const auto expected = toRaw(manifest, ctx);

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for(int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for(int j = 0; j < 50; ++j) {
                auto raw = toRaw(manifest, ctx);
                auto block = paddedEncode(manifest.contests, BlockSize::Bytes512, ctx);
                if(raw != expected
                || !(fromRaw<ManifestInfo>(raw, ctx) == manifest)
                || paddedDecode<std::vector<ContestInfo>>(block, ctx) != manifest.contests)
                    failures++;
            }
        });
    }
    for(auto& t : threads) t.join();
    REQUIRE(failures == 0);
}
