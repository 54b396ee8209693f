#pragma once

#include "types.h"
#include "validators.h"
#include <memory>
#include <string>
#include <vector>

namespace confens {
namespace cli {

// A command line option: flag, named option or positional argument
class Option {
    std::string names_;  // e.g. "-o,--output" or "input"
    std::string description_;
    std::unique_ptr<TypedValue> value_;
    std::vector<Validator> validators_;
    bool required_{false};
    bool is_flag_{false};  // Takes no value; presence sets the bound bool
    int actual_count_{0};
    bool consume_remaining_{false};

    std::vector<std::string> short_names_;
    std::vector<std::string> long_names_;
    std::vector<std::string> positional_names_;

    void parse_names();

public:
    Option(const std::string& names, const std::string& desc);

    // Fluent setters
    Option* required(bool value = true);
    Option* check(const Validator& validator);
    Option* consume_remaining(bool value = true);
    Option* flag(bool value = true);

    template <typename T>
    Option* bind(T* ptr) {
        value_ = std::make_unique<TypedValueImpl<T>>(ptr);
        return this;
    }

    // Parsing
    bool parse(const std::string& input);
    [[nodiscard]] bool matches(const std::string& arg) const;
    [[nodiscard]] bool has_embedded_value(const std::string& arg) const;  // --name=value
    [[nodiscard]] std::string extract_value(const std::string& arg) const;
    [[nodiscard]] bool consumes_remaining() const {
        return consume_remaining_;
    }
    [[nodiscard]] bool is_flag() const {
        return is_flag_;
    }

    // Getters
    [[nodiscard]] bool is_required() const {
        return required_;
    }
    [[nodiscard]] bool is_satisfied() const;
    [[nodiscard]] int count() const {
        return actual_count_;
    }
    [[nodiscard]] std::string help_text() const;
    [[nodiscard]] const std::string& names() const {
        return names_;
    }
    [[nodiscard]] const std::string& description() const {
        return description_;
    }
    [[nodiscard]] bool is_positional() const {
        return !positional_names_.empty() && short_names_.empty() && long_names_.empty();
    }
};

}  // namespace cli
}  // namespace confens
