/*
 * (C) 2025 The University of Chicago
 *
 * See COPYRIGHT in top-level directory.
 */
#ifndef ELECTIONGUARD_EXCEPTION_HPP
#define ELECTIONGUARD_EXCEPTION_HPP

#include <electionguard/ForwardDcl.hpp>

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace electionguard {

/**
 * @brief Base class of every exception thrown by the library.
 * File system failures are reported directly with this type.
 */
class Exception : public std::logic_error {

    public:

    Exception(const Exception&) = default; // LCOV_EXCL_LINE

    Exception(Exception&&) = default; // LCOV_EXCL_LINE

    Exception& operator=(const Exception&) = default; // LCOV_EXCL_LINE

    Exception& operator=(Exception&&) = default; // LCOV_EXCL_LINE

    Exception(const char* w)
    : std::logic_error(w) {}

    Exception(const std::string& w)
    : std::logic_error(w) {}
};

/**
 * @brief Raised when a payload does not fit in the requested
 * block size and truncation was not allowed.
 */
class TruncationError : public Exception {

    public:

    template<typename ... Args>
    TruncationError(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief Raised when a padded block has the wrong length or carries
 * a padding indicator that cannot describe a valid payload.
 */
class MalformedBlockError : public Exception {

    public:

    template<typename ... Args>
    MalformedBlockError(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief Raised when a text is not valid JSON, or when a valid
 * JSON document does not have the shape of the requested type.
 */
class ParseError : public Exception {

    public:

    template<typename ... Args>
    ParseError(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief Raised when a value cannot be written as JSON text,
 * e.g. a string that is not valid UTF-8.
 */
class EncodingError : public Exception {

    public:

    template<typename ... Args>
    EncodingError(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

/**
 * @brief Raised when a value requires a coercion rule that the
 * SerializationContext in use does not provide.
 */
class UnsupportedTypeError : public Exception {

    public:

    template<typename ... Args>
    UnsupportedTypeError(Args&&... args)
    : Exception(std::forward<Args>(args)...) {}
};

}

#endif
