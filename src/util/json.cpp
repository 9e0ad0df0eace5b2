// VINDEX - JSON Value Implementation
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include "vindex/util/json.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace vindex {
namespace util {

const JSONValue JSONValue::nullValue_;

namespace {
const JSONValue::Array kEmptyArray;
const JSONValue::Object kEmptyObject;
const std::string kEmptyString;
}

// ============================================================================
// Formatting Helpers
// ============================================================================

std::string FormatNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    char buffer[32];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    return buffer;
}

std::string QuoteJSONString(const std::string& str) {
    std::ostringstream ss;
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

// ============================================================================
// Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    return type_ == Type::Bool ? boolValue_ : defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString() const {
    return type_ == Type::String ? stringValue_ : kEmptyString;
}

const JSONValue::Array& JSONValue::GetArray() const {
    return type_ == Type::Array ? arrayValue_ : kEmptyArray;
}

const JSONValue::Object& JSONValue::GetObject() const {
    return type_ == Type::Object ? objectValue_ : kEmptyObject;
}

bool JSONValue::HasKey(const std::string& key) const {
    return type_ == Type::Object && objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    return it == objectValue_.end() ? nullValue_ : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (IsNumber() && other.IsNumber()) {
        return GetDouble() == other.GetDouble();
    }
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::Null:   return true;
        case Type::Bool:   return boolValue_ == other.boolValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array:  return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
        default:           return false;
    }
}

// ============================================================================
// Serialization
// ============================================================================

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    const std::string indentStr(static_cast<size_t>(indent) * 2, ' ');
    const std::string childIndent(static_cast<size_t>(indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;
        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;
        case Type::Int:
            ss << intValue_;
            break;
        case Type::Double:
            ss << FormatNumber(doubleValue_);
            break;
        case Type::String:
            ss << QuoteJSONString(stringValue_);
            break;
        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << '[';
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (i > 0) ss << ',';
                if (pretty) ss << '\n' << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
            }
            if (pretty) ss << '\n' << indentStr;
            ss << ']';
            break;
        }
        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << '{';
            bool first = true;
            for (const auto& [key, value] : objectValue_) {
                if (!first) ss << ',';
                first = false;
                if (pretty) ss << '\n' << childIndent;
                ss << QuoteJSONString(key) << (pretty ? ": " : ":")
                   << value.ToJSON(pretty, indent + 1);
            }
            if (pretty) ss << '\n' << indentStr;
            ss << '}';
            break;
        }
    }
    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

/// Recursive-descent parser over a single document
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != text_.size()) return std::nullopt;
        return value;
    }

private:
    static constexpr int MAX_DEPTH = 128;

    const std::string& text_;
    size_t pos_{0};

    void SkipWhitespace() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (text_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_DEPTH) return std::nullopt;
        SkipWhitespace();
        if (pos_ >= text_.size()) return std::nullopt;

        char c = text_[pos_];
        if (c == 'n') return Consume("null") ? std::optional<JSONValue>(JSONValue()) : std::nullopt;
        if (c == 't') return Consume("true") ? std::optional<JSONValue>(JSONValue(true)) : std::nullopt;
        if (c == 'f') return Consume("false") ? std::optional<JSONValue>(JSONValue(false)) : std::nullopt;
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return ParseArray(depth);
        if (c == '{') return ParseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();
        return std::nullopt;
    }

    std::optional<std::string> ParseString() {
        if (pos_ >= text_.size() || text_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string result;
        while (pos_ < text_.size() && text_[pos_] != '"') {
            char c = text_[pos_++];
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= text_.size()) return std::nullopt;
            char esc = text_[pos_++];
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) return std::nullopt;
                    unsigned long code = std::strtoul(text_.substr(pos_, 4).c_str(), nullptr, 16);
                    pos_ += 4;
                    AppendUtf8(result, static_cast<unsigned int>(code));
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        if (pos_ >= text_.size()) return std::nullopt;
        ++pos_;
        return result;
    }

    static void AppendUtf8(std::string& out, unsigned int code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        bool isFloat = false;

        if (text_[pos_] == '-') ++pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            isFloat = true;
            ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            isFloat = true;
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
        }

        const std::string numStr = text_.substr(start, pos_ - start);
        char* end = nullptr;
        errno = 0;
        if (!isFloat) {
            long long value = std::strtoll(numStr.c_str(), &end, 10);
            if (errno == 0 && end != numStr.c_str() && *end == '\0') {
                return JSONValue(static_cast<int64_t>(value));
            }
            errno = 0;
        }
        double value = std::strtod(numStr.c_str(), &end);
        if (errno != 0 || end == numStr.c_str() || *end != '\0') {
            return std::nullopt;
        }
        return JSONValue(value);
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;
        JSONValue::Array arr;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }
        while (true) {
            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            if (text_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            if (text_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;
        JSONValue::Object obj;
        SkipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }
        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return std::nullopt;
            ++pos_;

            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            SkipWhitespace();
            if (pos_ >= text_.size()) return std::nullopt;
            if (text_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            if (text_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }
};

} // namespace

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    return Parser(json).ParseDocument();
}

} // namespace util
} // namespace vindex
