#pragma once

#include <functional>
#include <string>
#include <vector>

namespace confens {
namespace cli {

// Checks a raw argument and returns an error message (empty if valid)
class Validator {
    std::function<std::string(const std::string&)> func_;
    std::string description_;

public:
    Validator(std::function<std::string(const std::string&)> func, const std::string& desc)
        : func_(std::move(func)), description_(desc) {
    }

    std::string operator()(const std::string& value) const {
        return func_(value);
    }

    const std::string& description() const {
        return description_;
    }
};

// Built-in validators
Validator ExistingFile();
Validator ExistingDirectory();
Validator Range(double min, double max);
Validator OpenClosedRange(double min, double max);  // (min, max]
Validator Choice(const std::vector<std::string>& choices);

}  // namespace cli
}  // namespace confens
