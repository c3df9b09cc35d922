/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_DOCUMENT_IO_HPP
#define ELECTIONGUARD_DOCUMENT_IO_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Document.hpp>
#include <electionguard/Serializer.hpp>

#include <istream>
#include <string>
#include <vector>

namespace electionguard {

/**
 * @brief Extension of the files written by toFile.
 */
constexpr const char* DefaultFileExtension = "json";

/**
 * @brief Builds the path <directory>/<name>.<extension>.
 */
std::string constructPath(const std::string& name,
                          const std::string& directory = "",
                          const std::string& extension = DefaultFileExtension);

/**
 * @brief Reads and parses a whole JSON file.
 * Throws an Exception if the file cannot be read
 * and a ParseError if it is not valid JSON.
 */
Document readDocument(const std::string& path);

/**
 * @brief Reads and parses a whole JSON stream.
 */
Document readDocument(std::istream& stream);

/**
 * @brief Writes a Document to <directory>/<name>.json, creating the
 * directory if needed, and returns the path of the written file.
 * Existing files are overwritten.
 */
std::string writeDocument(const Document& doc,
                          const std::string& name,
                          const std::string& directory,
                          int indent = DefaultIndent);

/**
 * @brief Serializes a value to <directory>/<name>.json.
 *
 * @return the path of the written file.
 */
template<typename T>
std::string toFile(const T& value,
                   const std::string& name,
                   const std::string& directory,
                   const SerializationContext& ctx) {
    return writeDocument(Document{toJson(value, ctx)}, name, directory, ctx.indent());
}

/**
 * @brief Deserializes a JSON file as a value of type T.
 */
template<typename T>
T fromFile(const std::string& path, const SerializationContext& ctx) {
    return fromJson<T>(readDocument(path).json(), ctx);
}

/**
 * @brief Deserializes a JSON stream as a value of type T.
 */
template<typename T>
T fromStream(std::istream& stream, const SerializationContext& ctx) {
    return fromJson<T>(readDocument(stream).json(), ctx);
}

/**
 * @brief Deserializes a JSON file holding an array of values of type T.
 */
template<typename T>
std::vector<T> fromListInFile(const std::string& path, const SerializationContext& ctx) {
    return fromFile<std::vector<T>>(path, ctx);
}

/**
 * @brief Deserializes a JSON stream holding an array of values of type T.
 */
template<typename T>
std::vector<T> fromListInStream(std::istream& stream, const SerializationContext& ctx) {
    return fromStream<std::vector<T>>(stream, ctx);
}

}

#endif
