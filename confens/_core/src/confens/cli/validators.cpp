#include "validators.h"

#include <filesystem>
#include <sstream>

namespace confens {
namespace cli {

namespace {

// Parse a whole argument as a number; false on trailing garbage.
bool to_number(const std::string& value, double& out) {
    std::istringstream ss(value);
    ss >> out;
    return !ss.fail() && ss.eof();
}

std::string format_bound(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

Validator ExistingFile() {
    return Validator(
        [](const std::string& filename) -> std::string {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(filename, ec)) {
                return "File does not exist: " + filename;
            }
            return "";
        },
        "FILE(existing)");
}

Validator ExistingDirectory() {
    return Validator(
        [](const std::string& path) -> std::string {
            std::error_code ec;
            if (!std::filesystem::is_directory(path, ec)) {
                return "Directory does not exist: " + path;
            }
            return "";
        },
        "DIR(existing)");
}

Validator Range(double min, double max) {
    return Validator(
        [min, max](const std::string& value) -> std::string {
            double num = 0.0;
            if (!to_number(value, num)) {
                return "Not a valid number: " + value;
            }
            if (num < min || num > max) {
                return "Value " + value + " not in range [" + format_bound(min) + ", " +
                       format_bound(max) + "]";
            }
            return "";
        },
        "in [" + format_bound(min) + ", " + format_bound(max) + "]");
}

Validator OpenClosedRange(double min, double max) {
    return Validator(
        [min, max](const std::string& value) -> std::string {
            double num = 0.0;
            if (!to_number(value, num)) {
                return "Not a valid number: " + value;
            }
            if (num <= min || num > max) {
                return "Value " + value + " not in range (" + format_bound(min) + ", " +
                       format_bound(max) + "]";
            }
            return "";
        },
        "in (" + format_bound(min) + ", " + format_bound(max) + "]");
}

Validator Choice(const std::vector<std::string>& choices) {
    std::string joined;
    for (size_t i = 0; i < choices.size(); ++i) {
        if (i > 0)
            joined += "|";
        joined += choices[i];
    }
    return Validator(
        [choices, joined](const std::string& value) -> std::string {
            for (const auto& c : choices) {
                if (c == value)
                    return "";
            }
            return "Invalid value '" + value + "' (choose from " + joined + ")";
        },
        joined);
}

}  // namespace cli
}  // namespace confens
