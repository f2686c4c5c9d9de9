/**
 * @file errors.h
 * @brief Exception hierarchy for libpubid
 *
 * Every failure surfaced by the library derives from PubIdException and
 * carries a stable error code next to the human-readable message.
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pubid {

/**
 * @brief Base exception for all PubID errors
 */
class PubIdException : public std::runtime_error {
private:
    std::string code_;

public:
    /**
     * @brief Construct a new PubID exception
     * @param code Error code (e.g., "UNKNOWN_SERIES")
     * @param message Human-readable error message
     */
    PubIdException(std::string code, const std::string& message)
        : std::runtime_error(message),
          code_(std::move(code)) {}

    /**
     * @brief Get the error code
     */
    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }
};

/// @brief Reason a PubID string was rejected
enum class ParseErrorKind {
    UNKNOWN_SERIES,      ///< Series token has no registry entry for the publisher
    MALFORMED_DOCNUMBER  ///< Remainder does not match the docnumber+qualifier grammar
};

/// @brief Convert ParseErrorKind to string
inline std::string parseErrorKindToString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UNKNOWN_SERIES:      return "UNKNOWN_SERIES";
        case ParseErrorKind::MALFORMED_DOCNUMBER: return "MALFORMED_DOCNUMBER";
    }
    return "UNKNOWN";
}

/**
 * @brief PubID string could not be parsed
 */
class ParseError : public PubIdException {
private:
    ParseErrorKind kind_;
    std::string input_;

public:
    ParseError(ParseErrorKind kind, std::string input, const std::string& message)
        : PubIdException(parseErrorKindToString(kind),
                         "Parse error: " + message + " (input: '" + input + "')"),
          kind_(kind),
          input_(std::move(input)) {}

    [[nodiscard]] ParseErrorKind getKind() const noexcept {
        return kind_;
    }

    /// @brief The text that was being parsed
    [[nodiscard]] const std::string& getInput() const noexcept {
        return input_;
    }
};

/**
 * @brief Identifier construction or mutation violated a model invariant
 */
class InvalidModelError : public PubIdException {
public:
    explicit InvalidModelError(const std::string& message)
        : PubIdException("INVALID_MODEL", "Invalid identifier: " + message) {}
};

/**
 * @brief Series source is malformed or ambiguous
 */
class RegistryError : public PubIdException {
public:
    explicit RegistryError(const std::string& message)
        : PubIdException("INVALID_REGISTRY", "Series registry error: " + message) {}
};

} // namespace pubid
