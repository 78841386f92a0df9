#pragma once

#include <string>
#include <utility>
#include <vector>

/**
 * Minimal JSON document model. Object members keep their insertion order so
 * sample order survives a parse/serialize cycle.
 */
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::vector<std::pair<std::string, JsonValue>> objectValue;

    static JsonValue null();
    static JsonValue boolean(bool value);
    static JsonValue number(double value);
    static JsonValue string(std::string value);
    static JsonValue array();
    static JsonValue object();

    bool isNull() const noexcept { return type == Type::Null; }
    bool isBool() const noexcept { return type == Type::Bool; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    // Last member with this key, or nullptr.
    const JsonValue* find(const std::string& key) const;

    // Replaces an existing member or appends a new one.
    JsonValue& set(const std::string& key, JsonValue value);
    JsonValue& push(JsonValue value);

    /**
     * @brief Compact serialization; non-finite numbers are written as null.
     */
    std::string dump() const;
};

/**
 * @brief Parses a complete JSON document.
 * @throws Granulo::ValidationException on malformed input or trailing content.
 */
JsonValue parseJsonText(const std::string& text);

std::string escapeJsonString(const std::string& value);
