#include "confens_error.h"
#include <sstream>

namespace confens {
namespace errors {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += delimiter;
        result += items[i];
    }
    return result;
}

}  // namespace

ConfensError::ConfensError(ErrorCategory category, const std::string& message,
                           const std::string& suggestion, const std::string& context)
    : std::runtime_error(message),
      category_(category),
      message_(message),
      suggestion_(suggestion),
      context_(context) {}

std::string ConfensError::formatted() const {
    std::ostringstream oss;
    oss << "[ERROR] " << category_to_string(category_) << ": " << message_;

    if (!context_.empty()) {
        oss << "\n  Context: " << context_;
    }

    if (!suggestion_.empty()) {
        oss << "\n  Suggestion: " << suggestion_;
    }

    return oss.str();
}

FileNotFoundError::FileNotFoundError(const std::string& path, const std::string& file_type)
    : ConfensError(
        ErrorCategory::FileIO,
        file_type + " not found: " + path,
        "Check that the file path exists and is readable",
        "") {}

FileWriteError::FileWriteError(const std::string& path, const std::string& reason)
    : ConfensError(
        ErrorCategory::FileIO,
        "Cannot write to file: " + path,
        "Check that the directory exists and you have write permissions",
        reason.empty() ? "" : "Reason: " + reason) {}

ValidationError::ValidationError(const std::string& param_name,
                                 const std::string& value,
                                 const std::string& expected)
    : ConfensError(
        ErrorCategory::Validation,
        "Invalid value for " + param_name + ": " + value,
        "Expected: " + expected,
        "") {}

ValidationError::ValidationError(const std::string& message, const std::string& suggestion)
    : ConfensError(ErrorCategory::Validation, message, suggestion, "") {}

FormatError::FormatError(const std::string& path,
                         const std::string& reason,
                         const std::vector<std::string>& supported_formats)
    : ConfensError(
        ErrorCategory::Format,
        "Format error in " + path + ": " + reason,
        supported_formats.empty() ? "" : "Supported formats: " + join(supported_formats, ", "),
        "") {}

DimensionError::DimensionError(const std::string& param_name,
                               const std::string& actual_shape,
                               const std::string& expected_shape)
    : ConfensError(
        ErrorCategory::Validation,
        "Invalid shape for " + param_name + ": " + actual_shape,
        "Expected shape: " + expected_shape,
        "") {}

PreconditionError::PreconditionError(const std::string& operation,
                                     const std::string& requirement,
                                     const std::string& suggestion)
    : ConfensError(
        ErrorCategory::Precondition,
        operation + " requires " + requirement,
        suggestion,
        "") {}

LookupError::LookupError(const std::string& what,
                         const std::string& key,
                         const std::string& where)
    : ConfensError(
        ErrorCategory::Lookup,
        "Could not find " + what + " '" + key + "' in " + where,
        "Check the spelling, or pass the index instead of the label",
        "") {}

AlgorithmError::AlgorithmError(const std::string& algorithm_name,
                               const std::string& error_message,
                               const std::string& suggestion)
    : ConfensError(
        ErrorCategory::Algorithm,
        algorithm_name + " failed: " + error_message,
        suggestion.empty() ? "Check the input coordinates and weights" : suggestion,
        "") {}

}  // namespace errors
}  // namespace confens
