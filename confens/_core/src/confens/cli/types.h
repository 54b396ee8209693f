#pragma once

#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace confens {
namespace cli {

// Generic conversion from string
template <typename T>
bool parse_value(const std::string& input, T& output) {
    std::istringstream ss(input);
    ss >> output;
    return !ss.fail() && ss.eof();
}

template <>
inline bool parse_value<std::string>(const std::string& input, std::string& output) {
    output = input;
    return true;
}

// true/false, yes/no, 1/0, on/off
template <>
inline bool parse_value<bool>(const std::string& input, bool& output) {
    std::string lower = input;
    for (auto& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        output = true;
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        output = false;
        return true;
    }
    return false;
}

// Lists accumulate: every occurrence appends, and commas split one occurrence
// into several items ("--labels a,b --labels c" gives a, b, c).
template <>
inline bool parse_value<std::vector<std::string>>(const std::string& input,
                                                  std::vector<std::string>& output) {
    std::istringstream ss(input);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            output.push_back(item);
        }
    }
    return true;
}

// Type-erased storage
class TypedValue {
public:
    virtual ~TypedValue() = default;
    virtual bool parse(const std::string& input) = 0;
    virtual std::string type_name() const = 0;
};

template <typename T>
class TypedValueImpl : public TypedValue {
    T* ptr_;

public:
    explicit TypedValueImpl(T* ptr) : ptr_(ptr) {
    }

    bool parse(const std::string& input) override {
        return parse_value(input, *ptr_);
    }

    std::string type_name() const override {
        if (std::is_same<T, std::string>::value)
            return "TEXT";
        if (std::is_same<T, int>::value)
            return "INT";
        if (std::is_same<T, float>::value || std::is_same<T, double>::value)
            return "FLOAT";
        if (std::is_same<T, bool>::value)
            return "BOOL";
        if (std::is_same<T, std::vector<std::string>>::value)
            return "TEXT...";
        return "VALUE";
    }
};

}  // namespace cli
}  // namespace confens
