/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/Codec.hpp"

namespace electionguard {

namespace detail {

void throwUnexpectedKind(const char* expected, const nlohmann::json& json) {
    throw ParseError{std::string{"Expected "} + expected + ", found "
                     + json.type_name() + " " + json.dump()};
}

}

nlohmann::json Codec<BigInteger>::format(const BigInteger& value, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::BigInteger);
    return value.toHex();
}

BigInteger Codec<BigInteger>::parse(const nlohmann::json& json, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::BigInteger);
    if(json.is_number_unsigned())
        return BigInteger{json.get<std::uint64_t>()};
    if(json.is_number_integer()) {
        auto v = json.get<std::int64_t>();
        if(v < 0) throw ParseError{"Negative value " + json.dump() + " for a BigInteger"};
        return BigInteger{static_cast<std::uint64_t>(v)};
    }
    if(json.is_string())
        return BigInteger::FromHex(json.get_ref<const std::string&>());
    detail::throwUnexpectedKind("hexadecimal string", json);
}

nlohmann::json Codec<ElementModP>::format(const ElementModP& value, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::ElementModP);
    return value.toHex();
}

ElementModP Codec<ElementModP>::parse(const nlohmann::json& json, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::ElementModP);
    if(!json.is_string()) detail::throwUnexpectedKind("hexadecimal string", json);
    return ElementModP{BigInteger::FromHex(json.get_ref<const std::string&>())};
}

nlohmann::json Codec<ElementModQ>::format(const ElementModQ& value, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::ElementModQ);
    return value.toHex();
}

ElementModQ Codec<ElementModQ>::parse(const nlohmann::json& json, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::ElementModQ);
    if(!json.is_string()) detail::throwUnexpectedKind("hexadecimal string", json);
    return ElementModQ{BigInteger::FromHex(json.get_ref<const std::string&>())};
}

nlohmann::json Codec<DateTime>::format(const DateTime& value, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::DateTime);
    return value.toIsoFormat();
}

DateTime Codec<DateTime>::parse(const nlohmann::json& json, const SerializationContext& ctx) {
    ctx.registry().require(CoercedType::DateTime);
    if(!json.is_string()) detail::throwUnexpectedKind("ISO-8601 string", json);
    return DateTime::Parse(json.get_ref<const std::string&>());
}

}
