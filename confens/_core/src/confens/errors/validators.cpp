#include "validators.h"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace confens {
namespace validation {

void validate_file_exists(const std::string& path, const std::string& file_type) {
    if (!fs::exists(path)) {
        throw errors::FileNotFoundError(path, file_type);
    }
    if (!fs::is_regular_file(path)) {
        throw errors::ValidationError(
            file_type + " is not a regular file: " + path,
            "Provide a path to a file, not a directory"
        );
    }
}

void validate_directory_exists(const std::string& path) {
    if (!fs::exists(path)) {
        throw errors::FileNotFoundError(path, "Directory");
    }
    if (!fs::is_directory(path)) {
        throw errors::ValidationError(
            "Path is not a directory: " + path,
            "Provide a path to a directory, not a file"
        );
    }
}

void validate_output_path(const std::string& path) {
    fs::path p(path);
    fs::path parent = p.parent_path();

    if (!parent.empty() && !fs::exists(parent)) {
        throw errors::FileWriteError(
            path,
            "Parent directory does not exist: " + parent.string()
        );
    }
}

void validate_range(float value, float min, float max, const std::string& param_name) {
    if (!(value >= min && value <= max)) {
        std::ostringstream actual_str, expected;
        actual_str << value;
        expected << "value in range [" << min << ", " << max << "]";
        throw errors::ValidationError(
            param_name,
            actual_str.str(),
            expected.str()
        );
    }
}

void validate_open_closed_range(float value, float min, float max,
                                const std::string& param_name) {
    if (!(value > min && value <= max)) {
        std::ostringstream actual_str, expected;
        actual_str << value;
        expected << "value in range (" << min << ", " << max << "]";
        throw errors::ValidationError(
            param_name,
            actual_str.str(),
            expected.str()
        );
    }
}

void validate_positive(int value, const std::string& param_name) {
    if (value <= 0) {
        throw errors::ValidationError(
            param_name,
            std::to_string(value),
            "positive integer (> 0)"
        );
    }
}

void validate_dimensions_match(size_t dim1, size_t dim2,
                               const std::string& param1_name,
                               const std::string& param2_name) {
    if (dim1 != dim2) {
        throw errors::DimensionError(
            param1_name + " vs " + param2_name,
            std::to_string(dim1),
            std::to_string(dim2)
        );
    }
}

void validate_choice(const std::string& value,
                     const std::vector<std::string>& choices,
                     const std::string& param_name) {
    if (std::find(choices.begin(), choices.end(), value) != choices.end()) {
        return;
    }
    std::string expected = "one of ";
    for (size_t i = 0; i < choices.size(); ++i) {
        if (i > 0) expected += ", ";
        expected += "'" + choices[i] + "'";
    }
    throw errors::ValidationError(param_name, value, expected);
}

}  // namespace validation
}  // namespace confens
