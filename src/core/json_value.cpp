// ProctorSFU - Exam Proctoring Media Server
// JSON parser and serializer

#include "proctorsfu/core/json_value.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace proctorsfu {
namespace core {

namespace {

// Signaling payloads come from untrusted clients
constexpr int MAX_NESTING_DEPTH = 64;

using ParseResult = Result<JsonValue, Error>;

ParseResult parseFailure(const std::string& message, size_t offset) {
    return ParseResult::error(Error(ErrorCode::ValidationError,
        "Malformed JSON: " + message, "offset " + std::to_string(offset)));
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    ParseResult parse() {
        skipWhitespace();
        auto result = parseValue(0);
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return parseFailure("unexpected characters after value", pos_);
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (pos_ < input_.size() && input_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    ParseResult parseValue(int depth) {
        if (depth > MAX_NESTING_DEPTH) {
            return parseFailure("nesting too deep", pos_);
        }
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        if (pos_ >= input_.size()) {
            return parseFailure("unexpected end of input", pos_);
        }
        return parseFailure(std::string("unexpected character '") + c + "'", pos_);
    }

    bool readHex4(uint32_t& out) {
        if (pos_ + 4 > input_.size()) {
            return false;
        }
        out = 0;
        for (int i = 0; i < 4; ++i) {
            char h = input_[pos_++];
            out <<= 4;
            if (h >= '0' && h <= '9') out |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') out |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') out |= static_cast<uint32_t>(h - 'A' + 10);
            else return false;
        }
        return true;
    }

    ParseResult parseString() {
        if (!match('"')) {
            return parseFailure("expected '\"'", pos_);
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c != '\\') {
                result += c;
                continue;
            }
            char escaped = consume();
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t cp = 0;
                    if (!readHex4(cp)) {
                        return parseFailure("invalid \\u escape", pos_);
                    }
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF && match('\\') && match('u')) {
                        uint32_t low = 0;
                        if (!readHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                            return parseFailure("invalid surrogate pair", pos_);
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(result, cp);
                    break;
                }
                default:
                    return parseFailure("invalid escape sequence", pos_);
            }
        }

        if (!match('"')) {
            return parseFailure("unterminated string", pos_);
        }
        return ParseResult::success(JsonValue::string(std::move(result)));
    }

    ParseResult parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        try {
            return ParseResult::success(JsonValue::number(std::stod(numStr)));
        } catch (const std::exception&) {
            return parseFailure("invalid number '" + numStr + "'", start);
        }
    }

    ParseResult parseBool() {
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue::boolean(true));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return ParseResult::success(JsonValue::boolean(false));
        }
        return parseFailure("expected 'true' or 'false'", pos_);
    }

    ParseResult parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return ParseResult::success(JsonValue());
        }
        return parseFailure("expected 'null'", pos_);
    }

    ParseResult parseArray(int depth) {
        match('[');
        JsonValue value = JsonValue::array();

        skipWhitespace();
        if (match(']')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            auto element = parseValue(depth + 1);
            if (element.isError()) {
                return element;
            }
            value.push(std::move(element).value());

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return parseFailure("expected ',' or ']' in array", pos_);
            }
        }
        return ParseResult::success(std::move(value));
    }

    ParseResult parseObject(int depth) {
        match('{');
        JsonValue value = JsonValue::object();

        skipWhitespace();
        if (match('}')) {
            return ParseResult::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                return parseFailure("expected string key in object", pos_);
            }
            auto key = parseString();
            if (key.isError()) {
                return key;
            }

            skipWhitespace();
            if (!match(':')) {
                return parseFailure("expected ':' after key", pos_);
            }

            auto member = parseValue(depth + 1);
            if (member.isError()) {
                return member;
            }
            value.set(key.value().getString(), std::move(member).value());

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return parseFailure("expected ',' or '}' in object", pos_);
            }
        }
        return ParseResult::success(std::move(value));
    }
};

void escapeInto(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

JsonValue JsonValue::boolean(bool value) {
    JsonValue v;
    v.type_ = JsonType::Boolean;
    v.boolValue_ = value;
    return v;
}

JsonValue JsonValue::number(double value) {
    JsonValue v;
    v.type_ = JsonType::Number;
    v.numberValue_ = value;
    return v;
}

JsonValue JsonValue::string(std::string value) {
    JsonValue v;
    v.type_ = JsonType::String;
    v.stringValue_ = std::move(value);
    return v;
}

JsonValue JsonValue::array() {
    JsonValue v;
    v.type_ = JsonType::Array;
    return v;
}

JsonValue JsonValue::object() {
    JsonValue v;
    v.type_ = JsonType::Object;
    return v;
}

Result<JsonValue, Error> JsonValue::parse(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

// =============================================================================
// Access
// =============================================================================

bool JsonValue::getBool(bool fallback) const {
    return isBool() ? boolValue_ : fallback;
}

int64_t JsonValue::getInt(int64_t fallback) const {
    return isNumber() ? static_cast<int64_t>(numberValue_) : fallback;
}

double JsonValue::getDouble(double fallback) const {
    return isNumber() ? numberValue_ : fallback;
}

std::string JsonValue::getString(const std::string& fallback) const {
    return isString() ? stringValue_ : fallback;
}

bool JsonValue::contains(const std::string& key) const {
    return isObject() && objectValue_.find(key) != objectValue_.end();
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    static const JsonValue nullValue;
    if (!isObject()) {
        return nullValue;
    }
    auto it = objectValue_.find(key);
    return it != objectValue_.end() ? it->second : nullValue;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    if (type_ == JsonType::Null) {
        type_ = JsonType::Object;
    }
    objectValue_[key] = std::move(value);
    return *this;
}

JsonValue& JsonValue::push(JsonValue value) {
    if (type_ == JsonType::Null) {
        type_ = JsonType::Array;
    }
    arrayValue_.push_back(std::move(value));
    return *this;
}

// =============================================================================
// Serialization
// =============================================================================

std::string JsonValue::serialize() const {
    std::string out;
    serializeInto(out);
    return out;
}

void JsonValue::serializeInto(std::string& out) const {
    switch (type_) {
        case JsonType::Null:
            out += "null";
            break;
        case JsonType::Boolean:
            out += boolValue_ ? "true" : "false";
            break;
        case JsonType::Number: {
            if (!std::isfinite(numberValue_)) {
                out += "null";
            } else if (std::floor(numberValue_) == numberValue_ &&
                       std::fabs(numberValue_) < 9.007199254740992e15) {
                out += std::to_string(static_cast<int64_t>(numberValue_));
            } else {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%.17g", numberValue_);
                out += buf;
            }
            break;
        }
        case JsonType::String:
            escapeInto(out, stringValue_);
            break;
        case JsonType::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : arrayValue_) {
                if (!first) out += ',';
                first = false;
                item.serializeInto(out);
            }
            out += ']';
            break;
        }
        case JsonType::Object: {
            out += '{';
            bool first = true;
            for (const auto& member : objectValue_) {
                if (!first) out += ',';
                first = false;
                escapeInto(out, member.first);
                out += ':';
                member.second.serializeInto(out);
            }
            out += '}';
            break;
        }
    }
}

} // namespace core
} // namespace proctorsfu
