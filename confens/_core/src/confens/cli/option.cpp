#include "option.h"
#include "errors.h"
#include <sstream>

namespace confens {
namespace cli {

Option::Option(const std::string& names, const std::string& desc)
    : names_(names), description_(desc) {
    parse_names();
}

void Option::parse_names() {
    // Comma-separated: "-o,--output" for named options, "input" for positionals
    std::string current;
    std::istringstream stream(names_);

    while (std::getline(stream, current, ',')) {
        current.erase(0, current.find_first_not_of(" \t"));
        current.erase(current.find_last_not_of(" \t") + 1);

        if (current.empty())
            continue;

        if (current.size() >= 2 && current[0] == '-' && current[1] == '-') {
            long_names_.push_back(current);
        } else if (current.size() >= 2 && current[0] == '-') {
            short_names_.push_back(current);
        } else {
            positional_names_.push_back(current);
        }
    }
}

Option* Option::required(bool value) {
    required_ = value;
    return this;
}

Option* Option::check(const Validator& validator) {
    validators_.push_back(validator);
    return this;
}

Option* Option::consume_remaining(bool value) {
    consume_remaining_ = value;
    return this;
}

Option* Option::flag(bool value) {
    is_flag_ = value;
    return this;
}

bool Option::parse(const std::string& input) {
    for (const auto& validator : validators_) {
        std::string error = validator(input);
        if (!error.empty()) {
            throw ValidationError(names_, error);
        }
    }

    if (!value_) {
        throw ParseError("option " + names_ + " is not bound to a variable");
    }

    if (!value_->parse(input)) {
        throw ParseError::bad_value(names_, input);
    }

    ++actual_count_;
    return true;
}

bool Option::matches(const std::string& arg) const {
    for (const auto& s : short_names_) {
        if (arg == s)
            return true;
    }

    auto equals_pos = arg.find('=');
    for (const auto& l : long_names_) {
        if (arg == l)
            return true;
        if (equals_pos != std::string::npos && arg.compare(0, equals_pos, l) == 0 &&
            equals_pos == l.size()) {
            return true;
        }
    }

    return false;
}

bool Option::has_embedded_value(const std::string& arg) const {
    return arg.size() > 2 && arg[0] == '-' && arg[1] == '-' && arg.find('=') != std::string::npos;
}

std::string Option::extract_value(const std::string& arg) const {
    auto equals_pos = arg.find('=');
    if (equals_pos != std::string::npos) {
        return arg.substr(equals_pos + 1);
    }
    return "";
}

bool Option::is_satisfied() const {
    if (!required_)
        return true;
    return actual_count_ > 0;
}

std::string Option::help_text() const {
    std::ostringstream oss;

    if (!short_names_.empty() || !long_names_.empty()) {
        bool first = true;
        for (const auto& s : short_names_) {
            if (!first)
                oss << ",";
            oss << s;
            first = false;
        }
        for (const auto& l : long_names_) {
            if (!first)
                oss << ",";
            oss << l;
            first = false;
        }
    } else if (!positional_names_.empty()) {
        oss << positional_names_[0];
    }

    if (value_ && !is_flag_) {
        oss << " " << value_->type_name();
    }

    if (!validators_.empty()) {
        oss << " (";
        for (size_t i = 0; i < validators_.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << validators_[i].description();
        }
        oss << ")";
    }

    return oss.str();
}

}  // namespace cli
}  // namespace confens
