/**
 * Minimal JSON value for archive headers.
 *
 * Covers what the ensemble archive header needs: objects, arrays, strings
 * (with escapes and \u sequences), numbers, booleans and null.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace confens {
namespace io {

class JsonValue {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    JsonValue() = default;
    JsonValue(bool value) : type_(Type::Bool), bool_(value) {}
    JsonValue(double value) : type_(Type::Number), number_(value) {}
    JsonValue(int value) : type_(Type::Number), number_(value) {}
    JsonValue(size_t value) : type_(Type::Number), number_(static_cast<double>(value)) {}
    JsonValue(const char* value) : type_(Type::String), string_(value) {}
    JsonValue(std::string value) : type_(Type::String), string_(std::move(value)) {}

    static JsonValue array();
    static JsonValue object();

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    /// @throws FormatError on type mismatch
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;
    const std::vector<JsonValue>& as_array() const;
    const std::map<std::string, JsonValue>& as_object() const;

    /// Append to an array.
    void push_back(JsonValue value);

    /// Insert or replace an object member.
    void set(const std::string& key, JsonValue value);

    bool contains(const std::string& key) const;

    /// @throws FormatError if the key is missing
    const JsonValue& at(const std::string& key) const;

    /// Compact serialization.
    std::string dump() const;

    /// @throws FormatError on malformed input
    static JsonValue parse(const std::string& text);

private:
    void dump_to(std::string& out) const;

    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    std::vector<JsonValue> array_;
    std::map<std::string, JsonValue> object_;
};

}  // namespace io
}  // namespace confens
