#pragma once

#include "confens_error.h"
#include <string>
#include <vector>

namespace confens {
namespace validation {

/**
 * Centralized validation functions with consistent error messages.
 *
 * These functions throw specific error types (FileNotFoundError,
 * ValidationError, PreconditionError, ...) with helpful context.
 */

/**
 * Validate that a file exists and is a regular file.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ValidationError if the path is not a regular file
 */
void validate_file_exists(const std::string& path,
                          const std::string& file_type = "file");

/**
 * Validate that a directory exists.
 *
 * @throws FileNotFoundError if directory doesn't exist
 */
void validate_directory_exists(const std::string& path);

/**
 * Validate that the parent directory of an output file exists.
 *
 * @throws FileWriteError if the parent directory doesn't exist
 */
void validate_output_path(const std::string& path);

/**
 * Validate that a value is in [min, max].
 *
 * @throws ValidationError if value is out of range
 */
void validate_range(float value, float min, float max, const std::string& param_name);

/**
 * Validate that a value is in the half-open interval (min, max].
 * Used for occupancy thresholds, where 0 is meaningless.
 *
 * @throws ValidationError if value is out of range
 */
void validate_open_closed_range(float value, float min, float max,
                                const std::string& param_name);

/**
 * Validate that a value is positive.
 *
 * @throws ValidationError if value <= 0
 */
void validate_positive(int value, const std::string& param_name);

/**
 * Validate that two dimensions match.
 *
 * @throws DimensionError if dimensions don't match
 */
void validate_dimensions_match(size_t dim1, size_t dim2,
                               const std::string& param1_name,
                               const std::string& param2_name);

/**
 * Validate that a value is one of a fixed set of choices.
 *
 * @throws ValidationError listing the accepted choices
 */
void validate_choice(const std::string& value,
                     const std::vector<std::string>& choices,
                     const std::string& param_name);

}  // namespace validation
}  // namespace confens
