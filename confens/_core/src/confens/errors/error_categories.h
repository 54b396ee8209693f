#pragma once

#include <string>

namespace confens {
namespace errors {

/**
 * Error categories for unified error handling across all components.
 *
 * These categories help classify errors and provide appropriate
 * suggestions to users.
 */
enum class ErrorCategory {
    FileIO,        // File not found, read/write errors, permission errors
    Validation,    // Invalid parameters, out of range values
    Format,        // Unsupported file format, parse errors, malformed archives
    Algorithm,     // Superposition/refinement failures
    Precondition,  // Operation called on an ensemble in the wrong state or of the wrong kind
    Lookup,        // Conformation label or identifier not found
};

/**
 * Get string representation of error category for display.
 */
inline std::string category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::FileIO:
            return "File I/O";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::Format:
            return "Format";
        case ErrorCategory::Algorithm:
            return "Algorithm";
        case ErrorCategory::Precondition:
            return "Precondition";
        case ErrorCategory::Lookup:
            return "Lookup";
        default:
            return "Unknown";
    }
}

}  // namespace errors
}  // namespace confens
