/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_DOCUMENT_HPP
#define ELECTIONGUARD_DOCUMENT_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/Exception.hpp>
#include <electionguard/Json.hpp>

#include <string>
#include <string_view>

namespace electionguard {

/**
 * @brief A Document encapsulates the JSON form of a serialized value,
 * or a JSON configuration. Constructing a Document from text parses
 * the text and throws a ParseError if it is not valid JSON.
 */
class Document {

    public:

    /**
     * @brief Constructor parsing the provided JSON text.
     *
     * @param content JSON text.
     */
    Document(std::string_view content) {
        try {
            m_content = nlohmann::json::parse(content);
        } catch(const nlohmann::json::parse_error& ex) {
            throw ParseError{std::string{"Could not parse JSON: "} + ex.what()};
        }
    }

    Document(const std::string& content)
    : Document(std::string_view{content}) {}

    Document(const char* content)
    : Document(std::string_view{content}) {}

    /**
     * @brief Constructor taking an already formed JSON value.
     * The default-constructed Document is an empty JSON object.
     */
    Document(nlohmann::json json = nlohmann::json::object())
    : m_content(std::move(json)) {}

    Document(const Document&) = default; // LCOV_EXCL_LINE

    Document(Document&&) = default; // LCOV_EXCL_LINE

    Document& operator=(const Document&) = default; // LCOV_EXCL_LINE

    Document& operator=(Document&&) = default; // LCOV_EXCL_LINE

    ~Document() = default; // LCOV_EXCL_LINE

    /**
     * @brief Returns the underlying JSON value.
     */
    const nlohmann::json& json() const & {
        return m_content;
    }

    /**
     * @brief Returns the underlying JSON value.
     */
    nlohmann::json& json() & {
        return m_content;
    }

    /**
     * @brief Returns the underlying JSON value.
     */
    nlohmann::json&& json() && {
        return std::move(m_content);
    }

    /**
     * @brief Serializes the Document into text. An indent of -1
     * produces the compact form; any other value produces one member
     * per line, indented by that many spaces. Non-ASCII characters
     * are written as UTF-8. Throws an EncodingError if a string in
     * the Document is not valid UTF-8.
     */
    std::string dump(int indent = -1) const {
        try {
            return m_content.dump(indent);
        } catch(const nlohmann::json::type_error& ex) {
            throw EncodingError{ex.what()};
        }
    }

    private:

    nlohmann::json m_content;
};

}

#endif
