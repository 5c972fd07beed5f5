// ProctorSFU - Exam Proctoring Media Server
// Minimal JSON document model used by configuration and signaling

#ifndef PROCTORSFU_CORE_JSON_VALUE_HPP
#define PROCTORSFU_CORE_JSON_VALUE_HPP

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace proctorsfu {
namespace core {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief A parsed or built JSON value.
 *
 * Objects keep their members ordered by key, so serialization output is
 * deterministic. Lookups on a non-object or a missing key yield a shared
 * null value rather than failing.
 */
class JsonValue {
public:
    JsonValue() = default;

    static JsonValue boolean(bool value);
    static JsonValue number(double value);
    static JsonValue string(std::string value);
    static JsonValue array();
    static JsonValue object();

    /**
     * @brief Parse a complete JSON text.
     * @return The document, or ValidationError describing the first fault
     */
    static Result<JsonValue, Error> parse(const std::string& text);

    [[nodiscard]] JsonType type() const noexcept { return type_; }
    [[nodiscard]] bool isNull() const noexcept { return type_ == JsonType::Null; }
    [[nodiscard]] bool isBool() const noexcept { return type_ == JsonType::Boolean; }
    [[nodiscard]] bool isNumber() const noexcept { return type_ == JsonType::Number; }
    [[nodiscard]] bool isString() const noexcept { return type_ == JsonType::String; }
    [[nodiscard]] bool isArray() const noexcept { return type_ == JsonType::Array; }
    [[nodiscard]] bool isObject() const noexcept { return type_ == JsonType::Object; }

    bool getBool(bool fallback = false) const;
    int64_t getInt(int64_t fallback = 0) const;
    double getDouble(double fallback = 0.0) const;
    std::string getString(const std::string& fallback = "") const;

    bool contains(const std::string& key) const;
    const JsonValue& operator[](const std::string& key) const;

    const std::vector<JsonValue>& items() const { return arrayValue_; }
    const std::map<std::string, JsonValue>& members() const { return objectValue_; }

    /**
     * @brief Set an object member, converting a null value into an object.
     * @return *this for chaining
     */
    JsonValue& set(const std::string& key, JsonValue value);

    /**
     * @brief Append to an array, converting a null value into an array.
     * @return *this for chaining
     */
    JsonValue& push(JsonValue value);

    /**
     * @brief Compact serialization with no insignificant whitespace.
     */
    std::string serialize() const;

private:
    void serializeInto(std::string& out) const;

    JsonType type_ = JsonType::Null;
    bool boolValue_ = false;
    double numberValue_ = 0.0;
    std::string stringValue_;
    std::vector<JsonValue> arrayValue_;
    std::map<std::string, JsonValue> objectValue_;
};

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_JSON_VALUE_HPP
