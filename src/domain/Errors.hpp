/**
 * @file Errors.hpp
 * @brief Exception types raised while validating requests and processing documents.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace linkwalker::domain {

/**
 * @class LinkWalkerError
 * @brief Base class for every error LinkWalker raises on purpose.
 */
class LinkWalkerError : public std::runtime_error {
public:
    explicit LinkWalkerError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Missing or invalid request input (path, find text, scope). */
class InputError : public LinkWalkerError {
public:
    explicit InputError(const std::string& message) : LinkWalkerError(message) {}
};

/** @brief The file could not be read or is not a document container. */
class DocumentOpenError : public LinkWalkerError {
public:
    explicit DocumentOpenError(const std::string& message) : LinkWalkerError(message) {}
};

/** @brief A required document part is missing or malformed. */
class DocumentParseError : public LinkWalkerError {
public:
    explicit DocumentParseError(const std::string& message) : LinkWalkerError(message) {}
};

/** @brief Persisting the document failed. */
class DocumentSaveError : public LinkWalkerError {
public:
    explicit DocumentSaveError(const std::string& message) : LinkWalkerError(message) {}
};

/** @brief Rewriting a hyperlink relationship or field instruction failed. */
class MutationError : public LinkWalkerError {
public:
    explicit MutationError(const std::string& message) : LinkWalkerError(message) {}
};

} // namespace linkwalker::domain
