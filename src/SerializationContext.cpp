/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#include "electionguard/SerializationContext.hpp"
#include "electionguard/Exception.hpp"

#include <cstdint>
#include <limits>

namespace electionguard {

SerializationContext::SerializationContext(CoercionRegistry registry, int indent)
: m_registry(std::move(registry))
, m_indent(indent) {
    if(indent < -1)
        throw Exception{"Invalid indentation: " + std::to_string(indent)};
}

SerializationContext SerializationContext::FromDocument(const Document& config) {
    const auto& json = config.json();
    if(!json.is_object()) {
        throw Exception(
                "Cannot create SerializationContext from Document: "
                "invalid configuration (expected JSON object)");
    }

    int indent = DefaultIndent;
    if(json.contains("indent")) {
        auto& indent_json = json["indent"];
        if(!indent_json.is_number_integer()) {
            throw Exception(
                    "Cannot create SerializationContext from Document: "
                    "invalid \"indent\" field (expected integer)");
        }
        bool in_range = false;
        if(indent_json.is_number_unsigned()) {
            in_range = indent_json.get<std::uint64_t>()
                    <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
        } else {
            auto v = indent_json.get<std::int64_t>();
            in_range = v >= std::numeric_limits<int>::min()
                    && v <= std::numeric_limits<int>::max();
        }
        if(!in_range) {
            throw Exception(
                    "Cannot create SerializationContext from Document: "
                    "\"indent\" field out of range");
        }
        indent = static_cast<int>(indent_json.get<std::int64_t>());
    }

    if(!json.contains("coercions"))
        return SerializationContext{CoercionRegistry::Default(), indent};

    auto& coercions = json["coercions"];
    if(!coercions.is_array()) {
        throw Exception(
                "Cannot create SerializationContext from Document: "
                "invalid \"coercions\" field (expected array)");
    }
    std::vector<CoercedType> types;
    for(auto& entry : coercions) {
        if(!entry.is_string()) {
            throw Exception(
                    "Cannot create SerializationContext from Document: "
                    "invalid entry in \"coercions\" (expected string)");
        }
        types.push_back(coercedTypeFromString(entry.get_ref<const std::string&>()));
    }
    return SerializationContext{CoercionRegistry{types}, indent};
}

Document SerializationContext::toDocument() const {
    auto coercions = nlohmann::json::array();
    for(auto t : m_registry.types())
        coercions.push_back(toString(t));
    return Document{nlohmann::json{
        {"indent", m_indent},
        {"coercions", std::move(coercions)}
    }};
}

}
