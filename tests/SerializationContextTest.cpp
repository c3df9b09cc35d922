/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_all.hpp>
#include <electionguard/SerializationContext.hpp>

using electionguard::CoercedType;
using electionguard::CoercionRegistry;
using electionguard::SerializationContext;

TEST_CASE("CoercionRegistry test", "[registry]") {

    SECTION("Default registry contains every coercion") {
        auto registry = CoercionRegistry::Default();
        REQUIRE(registry.types().size() == electionguard::NumCoercedTypes);
        for(auto t : registry.types()) {
            REQUIRE(registry.contains(t));
            REQUIRE_NOTHROW(registry.require(t));
        }
    }

    SECTION("Partial registry") {
        CoercionRegistry registry{CoercedType::BigInteger, CoercedType::DateTime};
        REQUIRE(registry.contains(CoercedType::BigInteger));
        REQUIRE(registry.contains(CoercedType::DateTime));
        REQUIRE(!registry.contains(CoercedType::ElementModQ));
        REQUIRE_THROWS_AS(registry.require(CoercedType::ElementModQ),
                          electionguard::UnsupportedTypeError);
        REQUIRE(registry.types() == std::vector<CoercedType>{
                CoercedType::DateTime, CoercedType::BigInteger});
    }

    SECTION("Names") {
        for(auto t : CoercionRegistry::Default().types()) {
            REQUIRE(electionguard::coercedTypeFromString(electionguard::toString(t)) == t);
        }
        REQUIRE(std::string{electionguard::toString(CoercedType::ElementModP)} == "element_mod_p");
        REQUIRE_THROWS_AS(electionguard::coercedTypeFromString("float"), electionguard::Exception);
    }
}

TEST_CASE("SerializationContext test", "[context]") {

    SECTION("Default context") {
        SerializationContext ctx;
        REQUIRE(ctx.indent() == 2);
        REQUIRE(ctx.registry().contains(CoercedType::ContestErrorType));
    }

    SECTION("Context from an empty configuration") {
        auto ctx = SerializationContext::FromDocument(electionguard::Document{"{}"});
        REQUIRE(ctx.indent() == electionguard::DefaultIndent);
        REQUIRE(ctx.registry().types().size() == electionguard::NumCoercedTypes);
    }

    SECTION("Context from a configuration") {
        auto ctx = SerializationContext::FromDocument(electionguard::Document{
            R"({"indent": 4, "coercions": ["big_integer", "proof_usage"]})"});
        REQUIRE(ctx.indent() == 4);
        REQUIRE(ctx.registry().contains(CoercedType::BigInteger));
        REQUIRE(ctx.registry().contains(CoercedType::ProofUsage));
        REQUIRE(!ctx.registry().contains(CoercedType::DateTime));

        auto config = ctx.toDocument();
        auto ctx2 = SerializationContext::FromDocument(config);
        REQUIRE(ctx2.indent() == 4);
        REQUIRE(ctx2.registry().types() == ctx.registry().types());
    }

    SECTION("Invalid configurations") {
        using electionguard::Document;
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{"[]"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"indent": "2"})"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"indent": -4})"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"indent": 4294967298})"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"indent": -4294967296})"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"coercions": "datetime"})"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"coercions": [1]})"}),
                          electionguard::Exception);
        REQUIRE_THROWS_AS(SerializationContext::FromDocument(Document{R"({"coercions": ["bignum"]})"}),
                          electionguard::Exception);
    }
}
