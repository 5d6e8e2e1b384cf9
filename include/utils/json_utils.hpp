#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace convo {
namespace utils {

enum class JsonType {
    NULL_VALUE,
    BOOLEAN,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT
};

class JsonValue {
public:
    JsonValue() : type_(JsonType::NULL_VALUE) {}
    explicit JsonValue(bool value) : type_(JsonType::BOOLEAN), bool_value_(value) {}
    explicit JsonValue(double value) : type_(JsonType::NUMBER), number_value_(value) {}
    explicit JsonValue(int value) : type_(JsonType::NUMBER), number_value_(value) {}
    explicit JsonValue(size_t value)
        : type_(JsonType::NUMBER), number_value_(static_cast<double>(value)) {}
    explicit JsonValue(const std::string& value) : type_(JsonType::STRING), string_value_(value) {}
    explicit JsonValue(const char* value) : type_(JsonType::STRING), string_value_(value) {}

    static JsonValue object();
    static JsonValue array();

    JsonType getType() const { return type_; }
    bool isNull() const { return type_ == JsonType::NULL_VALUE; }
    bool isNumber() const { return type_ == JsonType::NUMBER; }
    bool isString() const { return type_ == JsonType::STRING; }
    bool isObject() const { return type_ == JsonType::OBJECT; }

    bool asBool() const { return bool_value_; }
    double asNumber() const { return number_value_; }
    const std::string& asString() const { return string_value_; }

    // Array operations
    JsonValue& push(const JsonValue& value);
    const std::vector<JsonValue>& asArray() const { return array_value_; }

    // Object operations
    JsonValue& set(const std::string& key, const JsonValue& value);
    const std::map<std::string, JsonValue>& asObject() const { return object_value_; }
    bool hasProperty(const std::string& key) const;
    const JsonValue& getProperty(const std::string& key) const;

    // Typed lookups returning the fallback when the key is absent; a present
    // key of the wrong type throws std::runtime_error.
    double getNumber(const std::string& key, double fallback) const;
    std::string getString(const std::string& key, const std::string& fallback) const;
    bool getBool(const std::string& key, bool fallback) const;

private:
    JsonType type_;
    bool bool_value_ = false;
    double number_value_ = 0.0;
    std::string string_value_;
    std::vector<JsonValue> array_value_;
    std::map<std::string, JsonValue> object_value_;
    static const JsonValue null_value_;
};

class JsonParser {
public:
    static JsonValue parse(const std::string& json);

    // indent == 0 produces a single line
    static std::string stringify(const JsonValue& value, int indent = 0);

private:
    static JsonValue parseValue(const std::string& json, size_t& pos);
    static JsonValue parseObject(const std::string& json, size_t& pos);
    static JsonValue parseArray(const std::string& json, size_t& pos);
    static JsonValue parseString(const std::string& json, size_t& pos);
    static JsonValue parseNumber(const std::string& json, size_t& pos);
    static JsonValue parseLiteral(const std::string& json, size_t& pos);

    static void skipWhitespace(const std::string& json, size_t& pos);
    static void stringifyValue(const JsonValue& value, int indent, int depth, std::string& out);
    static std::string formatNumber(double value);
    static std::string escapeString(const std::string& str);
};

} // namespace utils
} // namespace convo
