/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_SERIALIZATION_CONTEXT_HPP
#define ELECTIONGUARD_SERIALIZATION_CONTEXT_HPP

#include <electionguard/ForwardDcl.hpp>
#include <electionguard/CoercionRegistry.hpp>
#include <electionguard/Document.hpp>

namespace electionguard {

/**
 * @brief Indentation used by default when producing JSON text.
 */
constexpr const int DefaultIndent = 2;

/**
 * @brief The SerializationContext carries everything a serialize or
 * deserialize call needs besides its input: the coercion registry and
 * the formatting options. It is built once and passed by const
 * reference, so that concurrent calls can share it without locking.
 */
class SerializationContext {

    public:

    SerializationContext(CoercionRegistry registry = CoercionRegistry::Default(),
                         int indent = DefaultIndent);

    /**
     * @brief Builds a SerializationContext from a JSON configuration of
     * the form {"indent": 2, "coercions": ["datetime", "big_integer"]}.
     * Missing entries keep their default value (every coercion enabled,
     * indentation of 2). Throws an Exception if the configuration is
     * invalid.
     */
    static SerializationContext FromDocument(const Document& config);

    SerializationContext(const SerializationContext&) = default; // LCOV_EXCL_LINE

    SerializationContext(SerializationContext&&) = default; // LCOV_EXCL_LINE

    SerializationContext& operator=(const SerializationContext&) = default; // LCOV_EXCL_LINE

    SerializationContext& operator=(SerializationContext&&) = default; // LCOV_EXCL_LINE

    ~SerializationContext() = default; // LCOV_EXCL_LINE

    const CoercionRegistry& registry() const {
        return m_registry;
    }

    int indent() const {
        return m_indent;
    }

    /**
     * @brief Converts the context back into a configuration that
     * FromDocument accepts.
     */
    Document toDocument() const;

    private:

    CoercionRegistry m_registry;
    int              m_indent;
};

}

#endif
