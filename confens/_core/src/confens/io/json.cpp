#include "json.h"

#include "confens/errors/confens_error.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace confens {
namespace io {

namespace {

[[noreturn]] void fail(const std::string& reason, size_t pos) {
    throw errors::FormatError("JSON header", reason + " at offset " + std::to_string(pos));
}

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    JsonValue parse_document() {
        JsonValue value = parse_value();
        skip_whitespace();
        if (pos_ != s_.size()) fail("trailing characters", pos_);
        return value;
    }

private:
    void skip_whitespace() {
        while (pos_ < s_.size() &&
               (s_[pos_] == ' ' || s_[pos_] == '\n' || s_[pos_] == '\r' || s_[pos_] == '\t')) {
            pos_++;
        }
    }

    char peek() {
        skip_whitespace();
        if (pos_ >= s_.size()) fail("unexpected end of input", pos_);
        return s_[pos_];
    }

    void expect(char c) {
        if (peek() != c) fail(std::string("expected '") + c + "'", pos_);
        pos_++;
    }

    bool consume_literal(const char* literal) {
        size_t n = std::char_traits<char>::length(literal);
        if (s_.compare(pos_, n, literal) == 0) {
            pos_ += n;
            return true;
        }
        return false;
    }

    JsonValue parse_value() {
        char c = peek();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return JsonValue(parse_string());
        if (consume_literal("true")) return JsonValue(true);
        if (consume_literal("false")) return JsonValue(false);
        if (consume_literal("null")) return JsonValue();
        return JsonValue(parse_number());
    }

    JsonValue parse_object() {
        JsonValue obj = JsonValue::object();
        expect('{');
        if (peek() == '}') {
            pos_++;
            return obj;
        }
        while (true) {
            if (peek() != '"') fail("expected string key", pos_);
            std::string key = parse_string();
            expect(':');
            obj.set(key, parse_value());
            char c = peek();
            pos_++;
            if (c == '}') break;
            if (c != ',') fail("expected ',' or '}'", pos_ - 1);
        }
        return obj;
    }

    JsonValue parse_array() {
        JsonValue arr = JsonValue::array();
        expect('[');
        if (peek() == ']') {
            pos_++;
            return arr;
        }
        while (true) {
            arr.push_back(parse_value());
            char c = peek();
            pos_++;
            if (c == ']') break;
            if (c != ',') fail("expected ',' or ']'", pos_ - 1);
        }
        return arr;
    }

    double parse_number() {
        const char* begin = s_.c_str() + pos_;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin) fail("invalid value", pos_);
        pos_ += static_cast<size_t>(end - begin);
        return value;
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > s_.size()) fail("truncated \\u escape", pos_);
        unsigned code = 0;
        for (int k = 0; k < 4; k++) {
            char h = s_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("invalid \\u escape", pos_ - 1);
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            if (pos_ >= s_.size()) fail("unterminated string", pos_);
            char c = s_[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                result.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) fail("unterminated escape", pos_);
            char e = s_[pos_++];
            switch (e) {
                case '"': result.push_back('"'); break;
                case '\\': result.push_back('\\'); break;
                case '/': result.push_back('/'); break;
                case 'b': result.push_back('\b'); break;
                case 'f': result.push_back('\f'); break;
                case 'n': result.push_back('\n'); break;
                case 'r': result.push_back('\r'); break;
                case 't': result.push_back('\t'); break;
                case 'u': {
                    unsigned cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF && s_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        unsigned low = parse_hex4();
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    fail("invalid escape", pos_ - 1);
            }
        }
        return result;
    }

    const std::string& s_;
    size_t pos_ = 0;
};

void dump_string(std::string& out, const std::string& s) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

}  // namespace

JsonValue JsonValue::array() {
    JsonValue v;
    v.type_ = Type::Array;
    return v;
}

JsonValue JsonValue::object() {
    JsonValue v;
    v.type_ = Type::Object;
    return v;
}

bool JsonValue::as_bool() const {
    if (type_ != Type::Bool) fail("expected boolean", 0);
    return bool_;
}

double JsonValue::as_number() const {
    if (type_ != Type::Number) fail("expected number", 0);
    return number_;
}

const std::string& JsonValue::as_string() const {
    if (type_ != Type::String) fail("expected string", 0);
    return string_;
}

const std::vector<JsonValue>& JsonValue::as_array() const {
    if (type_ != Type::Array) fail("expected array", 0);
    return array_;
}

const std::map<std::string, JsonValue>& JsonValue::as_object() const {
    if (type_ != Type::Object) fail("expected object", 0);
    return object_;
}

void JsonValue::push_back(JsonValue value) {
    if (type_ == Type::Null) type_ = Type::Array;
    if (type_ != Type::Array) fail("push_back on non-array", 0);
    array_.push_back(std::move(value));
}

void JsonValue::set(const std::string& key, JsonValue value) {
    if (type_ == Type::Null) type_ = Type::Object;
    if (type_ != Type::Object) fail("set on non-object", 0);
    object_[key] = std::move(value);
}

bool JsonValue::contains(const std::string& key) const {
    return type_ == Type::Object && object_.count(key) > 0;
}

const JsonValue& JsonValue::at(const std::string& key) const {
    auto it = as_object().find(key);
    if (it == object_.end()) fail("missing key '" + key + "'", 0);
    return it->second;
}

std::string JsonValue::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

void JsonValue::dump_to(std::string& out) const {
    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += bool_ ? "true" : "false";
            break;
        case Type::Number: {
            char buf[32];
            if (std::floor(number_) == number_ && std::abs(number_) < 1e15) {
                std::snprintf(buf, sizeof(buf), "%.0f", number_);
            } else {
                std::snprintf(buf, sizeof(buf), "%.17g", number_);
            }
            out += buf;
            break;
        }
        case Type::String:
            dump_string(out, string_);
            break;
        case Type::Array:
            out.push_back('[');
            for (size_t k = 0; k < array_.size(); k++) {
                if (k > 0) out.push_back(',');
                array_[k].dump_to(out);
            }
            out.push_back(']');
            break;
        case Type::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& entry : object_) {
                if (!first) out.push_back(',');
                first = false;
                dump_string(out, entry.first);
                out.push_back(':');
                entry.second.dump_to(out);
            }
            out.push_back('}');
            break;
        }
    }
}

JsonValue JsonValue::parse(const std::string& text) {
    Parser parser(text);
    return parser.parse_document();
}

}  // namespace io
}  // namespace confens
