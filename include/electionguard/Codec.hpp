/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_CODEC_HPP
#define ELECTIONGUARD_CODEC_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Exception.hpp>
#include <electionguard/Json.hpp>
#include <electionguard/SerializationContext.hpp>
#include <electionguard/BigInteger.hpp>
#include <electionguard/Group.hpp>
#include <electionguard/DateTime.hpp>
#include <electionguard/Enums.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

namespace electionguard {

/**
 * @brief A Codec<T> converts values of type T into JSON and back.
 * Each specialization provides:
 *
 * static nlohmann::json format(const T&, const SerializationContext&);
 * static T parse(const nlohmann::json&, const SerializationContext&);
 *
 * Errors in parse are reported with a ParseError. Codecs of coerced types
 * throw an UnsupportedTypeError if the context's registry does not
 * contain their coercion. Types without a Codec do not compile.
 */

/**
 * @brief Describes a member of a record type. Record types expose
 * their members through a static fields() function returning a tuple
 * of Field objects, e.g.
 *
 * static constexpr auto fields() {
 *     return std::make_tuple(field("name", &Contest::name),
 *                            field("votes", &Contest::votes));
 * }
 */
template<typename Class, typename Member>
struct Field {
    const char*    name;
    Member Class::* member;
};

template<typename Class, typename Member>
constexpr Field<Class, Member> field(const char* name, Member Class::* member) {
    return Field<Class, Member>{name, member};
}

namespace detail {

template<typename T, typename = void>
struct HasFields : std::false_type {};

template<typename T>
struct HasFields<T, std::void_t<decltype(T::fields())>> : std::true_type {};

template<typename T, typename = void>
struct HasEnumTraits : std::false_type {};

template<typename T>
struct HasEnumTraits<T, std::void_t<decltype(EnumTraits<T>::values())>> : std::true_type {};

template<typename T>
struct IsOptional : std::false_type {};

template<typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

[[noreturn]] void throwUnexpectedKind(const char* expected, const nlohmann::json& json);

}

template<>
struct Codec<bool> {
    static nlohmann::json format(bool value, const SerializationContext&) {
        return value;
    }
    static bool parse(const nlohmann::json& json, const SerializationContext&) {
        if(!json.is_boolean()) detail::throwUnexpectedKind("boolean", json);
        return json.get<bool>();
    }
};

template<typename T>
struct Codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {

    static nlohmann::json format(T value, const SerializationContext&) {
        return value;
    }

    static T parse(const nlohmann::json& json, const SerializationContext&) {
        if(!json.is_number_integer()) detail::throwUnexpectedKind("integer", json);
        if(json.is_number_unsigned()) {
            auto v = json.get<std::uint64_t>();
            if(v <= static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                return static_cast<T>(v);
        } else {
            auto v = json.get<std::int64_t>();
            if(v >= 0) {
                if(static_cast<std::uint64_t>(v) <= static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
                    return static_cast<T>(v);
            } else if constexpr (std::is_signed_v<T>) {
                if(v >= static_cast<std::int64_t>(std::numeric_limits<T>::min()))
                    return static_cast<T>(v);
            }
        }
        throw ParseError{"Integer " + json.dump() + " is out of range"};
    }
};

/**
 * @brief JSON numbers cannot hold NaN or infinities, so these are
 * written as the strings "NaN", "Infinity" and "-Infinity".
 */
template<>
struct Codec<double> {
    static nlohmann::json format(double value, const SerializationContext&) {
        if(std::isnan(value)) return "NaN";
        if(std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
        return value;
    }
    static double parse(const nlohmann::json& json, const SerializationContext&) {
        if(json.is_string()) {
            const auto& str = json.get_ref<const std::string&>();
            if(str == "NaN") return std::numeric_limits<double>::quiet_NaN();
            if(str == "Infinity") return std::numeric_limits<double>::infinity();
            if(str == "-Infinity") return -std::numeric_limits<double>::infinity();
        }
        if(!json.is_number()) detail::throwUnexpectedKind("number", json);
        return json.get<double>();
    }
};

template<>
struct Codec<std::string> {
    static nlohmann::json format(const std::string& value, const SerializationContext&) {
        return value;
    }
    static std::string parse(const nlohmann::json& json, const SerializationContext&) {
        if(!json.is_string()) detail::throwUnexpectedKind("string", json);
        return json.get<std::string>();
    }
};

/**
 * @brief Raw JSON values are carried as they are.
 */
template<>
struct Codec<nlohmann::json> {
    static nlohmann::json format(const nlohmann::json& value, const SerializationContext&) {
        return value;
    }
    static nlohmann::json parse(const nlohmann::json& json, const SerializationContext&) {
        return json;
    }
};

template<>
struct Codec<BigInteger> {
    static nlohmann::json format(const BigInteger& value, const SerializationContext& ctx);
    static BigInteger parse(const nlohmann::json& json, const SerializationContext& ctx);
};

template<>
struct Codec<ElementModP> {
    static nlohmann::json format(const ElementModP& value, const SerializationContext& ctx);
    static ElementModP parse(const nlohmann::json& json, const SerializationContext& ctx);
};

template<>
struct Codec<ElementModQ> {
    static nlohmann::json format(const ElementModQ& value, const SerializationContext& ctx);
    static ElementModQ parse(const nlohmann::json& json, const SerializationContext& ctx);
};

template<>
struct Codec<DateTime> {
    static nlohmann::json format(const DateTime& value, const SerializationContext& ctx);
    static DateTime parse(const nlohmann::json& json, const SerializationContext& ctx);
};

template<typename E>
struct Codec<E, std::enable_if_t<std::is_enum_v<E> && detail::HasEnumTraits<E>::value>> {

    static nlohmann::json format(E value, const SerializationContext& ctx) {
        ctx.registry().require(EnumTraits<E>::coercion);
        for(const auto& [enumerator, json] : EnumTraits<E>::values()) {
            if(enumerator == value) return json;
        }
        throw Exception{std::string{"Invalid value for enumeration "} + EnumTraits<E>::name};
    }

    static E parse(const nlohmann::json& json, const SerializationContext& ctx) {
        ctx.registry().require(EnumTraits<E>::coercion);
        for(const auto& [enumerator, value] : EnumTraits<E>::values()) {
            if(value == json) return enumerator;
        }
        throw ParseError{"Invalid " + std::string{EnumTraits<E>::name} + " value: " + json.dump()};
    }
};

template<typename T>
struct Codec<std::optional<T>> {

    static nlohmann::json format(const std::optional<T>& value, const SerializationContext& ctx) {
        if(!value) return nullptr;
        return Codec<T>::format(*value, ctx);
    }

    static std::optional<T> parse(const nlohmann::json& json, const SerializationContext& ctx) {
        if(json.is_null()) return std::nullopt;
        return Codec<T>::parse(json, ctx);
    }
};

template<typename T>
struct Codec<std::vector<T>> {

    static nlohmann::json format(const std::vector<T>& value, const SerializationContext& ctx) {
        auto result = nlohmann::json::array();
        for(const auto& item : value)
            result.push_back(Codec<T>::format(item, ctx));
        return result;
    }

    static std::vector<T> parse(const nlohmann::json& json, const SerializationContext& ctx) {
        if(!json.is_array()) detail::throwUnexpectedKind("array", json);
        std::vector<T> result;
        result.reserve(json.size());
        for(std::size_t i = 0; i < json.size(); ++i) {
            try {
                result.push_back(Codec<T>::parse(json[i], ctx));
            } catch(const ParseError& ex) {
                throw ParseError{"In item " + std::to_string(i) + ": " + ex.what()};
            }
        }
        return result;
    }
};

template<typename T>
struct Codec<std::map<std::string, T>> {

    static nlohmann::json format(const std::map<std::string, T>& value, const SerializationContext& ctx) {
        auto result = nlohmann::json::object();
        for(const auto& [key, item] : value)
            result[key] = Codec<T>::format(item, ctx);
        return result;
    }

    static std::map<std::string, T> parse(const nlohmann::json& json, const SerializationContext& ctx) {
        if(!json.is_object()) detail::throwUnexpectedKind("object", json);
        std::map<std::string, T> result;
        for(auto it = json.begin(); it != json.end(); ++it) {
            try {
                result.emplace(it.key(), Codec<T>::parse(it.value(), ctx));
            } catch(const ParseError& ex) {
                throw ParseError{"In key \"" + it.key() + "\": " + ex.what()};
            }
        }
        return result;
    }
};

/**
 * @brief Codec for record types (types with a static fields() function).
 * Absent optional members are omitted when formatting and accepted when
 * parsing. Members of the JSON object that the record does not declare
 * are ignored.
 */
template<typename T>
struct Codec<T, std::enable_if_t<detail::HasFields<T>::value>> {

    static nlohmann::json format(const T& value, const SerializationContext& ctx) {
        auto result = nlohmann::json::object();
        std::apply([&](const auto&... f) {
            (formatField(result, value, f, ctx), ...);
        }, T::fields());
        return result;
    }

    static T parse(const nlohmann::json& json, const SerializationContext& ctx) {
        if(!json.is_object()) detail::throwUnexpectedKind("object", json);
        T result{};
        std::apply([&](const auto&... f) {
            (parseField(json, result, f, ctx), ...);
        }, T::fields());
        return result;
    }

    private:

    template<typename Member>
    static void formatField(nlohmann::json& out, const T& value,
                            const Field<T, Member>& f,
                            const SerializationContext& ctx) {
        const auto& member = value.*(f.member);
        if constexpr (detail::IsOptional<Member>::value) {
            if(!member) return;
        }
        out[f.name] = Codec<Member>::format(member, ctx);
    }

    template<typename Member>
    static void parseField(const nlohmann::json& in, T& value,
                           const Field<T, Member>& f,
                           const SerializationContext& ctx) {
        auto it = in.find(f.name);
        if(it == in.end()) {
            if constexpr (detail::IsOptional<Member>::value) {
                value.*(f.member) = std::nullopt;
                return;
            } else {
                throw ParseError{std::string{"Missing field \""} + f.name + "\""};
            }
        }
        try {
            value.*(f.member) = Codec<Member>::parse(*it, ctx);
        } catch(const ParseError& ex) {
            throw ParseError{std::string{"In field \""} + f.name + "\": " + ex.what()};
        }
    }
};

}

#endif
