/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_SERIALIZER_HPP
#define ELECTIONGUARD_SERIALIZER_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Codec.hpp>
#include <electionguard/Document.hpp>
#include <electionguard/PaddedBlock.hpp>
#include <electionguard/SerializationContext.hpp>

#include <string>
#include <string_view>

namespace electionguard {

/**
 * @brief Converts a value into its JSON form.
 */
template<typename T>
nlohmann::json toJson(const T& value, const SerializationContext& ctx) {
    return Codec<T>::format(value, ctx);
}

/**
 * @brief Reconstructs a value of type T from its JSON form.
 * Throws a ParseError if the JSON does not have the shape of T.
 */
template<typename T>
T fromJson(const nlohmann::json& json, const SerializationContext& ctx) {
    return Codec<T>::parse(json, ctx);
}

/**
 * @brief Serializes a value into JSON text, indented according to the
 * context. Members of JSON objects are sorted by name, so the text of
 * a given value is always the same.
 */
template<typename T>
std::string toRaw(const T& value, const SerializationContext& ctx) {
    return Document{toJson(value, ctx)}.dump(ctx.indent());
}

/**
 * @brief Deserializes JSON text as a value of type T.
 * Throws a ParseError if the text is not valid JSON or does not have
 * the shape of T, and an UnsupportedTypeError if T requires a coercion
 * the context does not provide.
 */
template<typename T>
T fromRaw(std::string_view raw, const SerializationContext& ctx) {
    Document doc{raw};
    return fromJson<T>(doc.json(), ctx);
}

/**
 * @brief Serializes a value and pads its UTF-8 text into a block.
 * See PaddedBlock::Encode for the truncation semantics.
 */
template<typename T>
PaddedBlock paddedEncode(const T& value, BlockSize size,
                         const SerializationContext& ctx,
                         bool allow_truncation = false) {
    return PaddedBlock::Encode(toRaw(value, ctx), size, allow_truncation);
}

/**
 * @brief Deserializes the payload of a block produced by paddedEncode.
 */
template<typename T>
T paddedDecode(const PaddedBlock& block, const SerializationContext& ctx) {
    auto payload = block.decode();
    return fromRaw<T>(std::string_view{
        reinterpret_cast<const char*>(payload.data()), payload.size()}, ctx);
}

template<typename T>
T paddedDecode(const Bytes& block, BlockSize size, const SerializationContext& ctx) {
    return paddedDecode<T>(PaddedBlock{block, size}, ctx);
}

}

#endif
