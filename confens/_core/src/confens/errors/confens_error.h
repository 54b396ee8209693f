#pragma once

#include "error_categories.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace confens {
namespace errors {

/**
 * Base exception class for all confens errors.
 *
 * Carries a category, message, suggestion and context so the CLI and the
 * Python bindings can report failures consistently.
 */
class ConfensError : public std::runtime_error {
protected:
    ErrorCategory category_;
    std::string message_;
    std::string suggestion_;
    std::string context_;

public:
    ConfensError(ErrorCategory category, const std::string& message,
                 const std::string& suggestion = "",
                 const std::string& context = "");

    virtual ~ConfensError() = default;

    ErrorCategory category() const { return category_; }
    const std::string& message() const { return message_; }
    const std::string& suggestion() const { return suggestion_; }
    const std::string& context() const { return context_; }

    /**
     * Get fully formatted error message for display.
     * Format:
     *   [ERROR] {category}: {message}
     *   Context: {context}
     *   Suggestion: {suggestion}
     */
    std::string formatted() const;
};

/**
 * File I/O error - file not found, cannot read.
 */
class FileNotFoundError : public ConfensError {
public:
    FileNotFoundError(const std::string& path,
                      const std::string& file_type = "file");
};

/**
 * File cannot be written.
 */
class FileWriteError : public ConfensError {
public:
    FileWriteError(const std::string& path,
                   const std::string& reason = "");
};

/**
 * Validation error - parameter out of range, invalid value.
 */
class ValidationError : public ConfensError {
public:
    ValidationError(const std::string& param_name,
                    const std::string& value,
                    const std::string& expected);

    ValidationError(const std::string& message,
                    const std::string& suggestion = "");
};

/**
 * File format error - unsupported format, parse failure, corrupt archive.
 */
class FormatError : public ConfensError {
public:
    FormatError(const std::string& path,
                const std::string& reason,
                const std::vector<std::string>& supported_formats = {});
};

/**
 * Array shape or dimension error.
 */
class DimensionError : public ConfensError {
public:
    DimensionError(const std::string& param_name,
                   const std::string& actual_shape,
                   const std::string& expected_shape);
};

/**
 * Operation requested on an ensemble that cannot support it (empty, missing
 * presence weights, missing transformations, too few inputs).
 */
class PreconditionError : public ConfensError {
public:
    PreconditionError(const std::string& operation,
                      const std::string& requirement,
                      const std::string& suggestion = "");
};

/**
 * Conformation label (or other identifier) not present.
 */
class LookupError : public ConfensError {
public:
    LookupError(const std::string& what,
                const std::string& key,
                const std::string& where);
};

/**
 * Algorithm error - degenerate input, failed numeric step.
 */
class AlgorithmError : public ConfensError {
public:
    AlgorithmError(const std::string& algorithm_name,
                   const std::string& error_message,
                   const std::string& suggestion = "");
};

}  // namespace errors
}  // namespace confens
