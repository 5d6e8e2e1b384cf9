#include "utils/json_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace convo {
namespace utils {

const JsonValue JsonValue::null_value_;

JsonValue JsonValue::object() {
    JsonValue value;
    value.type_ = JsonType::OBJECT;
    return value;
}

JsonValue JsonValue::array() {
    JsonValue value;
    value.type_ = JsonType::ARRAY;
    return value;
}

JsonValue& JsonValue::push(const JsonValue& value) {
    if (type_ != JsonType::ARRAY) {
        type_ = JsonType::ARRAY;
        array_value_.clear();
    }
    array_value_.push_back(value);
    return *this;
}

JsonValue& JsonValue::set(const std::string& key, const JsonValue& value) {
    if (type_ != JsonType::OBJECT) {
        type_ = JsonType::OBJECT;
        object_value_.clear();
    }
    object_value_[key] = value;
    return *this;
}

bool JsonValue::hasProperty(const std::string& key) const {
    return object_value_.find(key) != object_value_.end();
}

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    const JsonValue& value = getProperty(key);
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isNumber()) {
        throw std::runtime_error("Expected number for key '" + key + "'");
    }
    return value.asNumber();
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    const JsonValue& value = getProperty(key);
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isString()) {
        throw std::runtime_error("Expected string for key '" + key + "'");
    }
    return value.asString();
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    const JsonValue& value = getProperty(key);
    if (value.isNull()) {
        return fallback;
    }
    if (value.getType() != JsonType::BOOLEAN) {
        throw std::runtime_error("Expected boolean for key '" + key + "'");
    }
    return value.asBool();
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    JsonValue value = parseValue(json, pos);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw std::runtime_error("Trailing characters after JSON value at offset " +
                                 std::to_string(pos));
    }
    return value;
}

std::string JsonParser::stringify(const JsonValue& value, int indent) {
    std::string out;
    stringifyValue(value, indent, 0, out);
    return out;
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos) {
    skipWhitespace(json, pos);

    if (pos >= json.length()) {
        throw std::runtime_error("Unexpected end of JSON");
    }

    char c = json[pos];
    if (c == '{') {
        return parseObject(json, pos);
    } else if (c == '[') {
        return parseArray(json, pos);
    } else if (c == '"') {
        return parseString(json, pos);
    } else if (c == 't' || c == 'f' || c == 'n') {
        return parseLiteral(json, pos);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(json, pos);
    }
    throw std::runtime_error("Unexpected character '" + std::string(1, c) +
                             "' at offset " + std::to_string(pos));
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos) {
    JsonValue obj = JsonValue::object();

    pos++; // '{'
    skipWhitespace(json, pos);
    if (pos < json.length() && json[pos] == '}') {
        pos++;
        return obj;
    }

    while (pos < json.length()) {
        skipWhitespace(json, pos);
        if (pos >= json.length() || json[pos] != '"') {
            throw std::runtime_error("Expected string key in object");
        }

        JsonValue key = parseString(json, pos);
        skipWhitespace(json, pos);
        if (pos >= json.length() || json[pos] != ':') {
            throw std::runtime_error("Expected ':' after key '" + key.asString() + "'");
        }
        pos++;

        obj.set(key.asString(), parseValue(json, pos));

        skipWhitespace(json, pos);
        if (pos >= json.length()) {
            break;
        }
        if (json[pos] == '}') {
            pos++;
            return obj;
        }
        if (json[pos] != ',') {
            throw std::runtime_error("Expected ',' or '}' in object");
        }
        pos++;
    }

    throw std::runtime_error("Unexpected end of JSON in object");
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos) {
    JsonValue arr = JsonValue::array();

    pos++; // '['
    skipWhitespace(json, pos);
    if (pos < json.length() && json[pos] == ']') {
        pos++;
        return arr;
    }

    while (pos < json.length()) {
        arr.push(parseValue(json, pos));

        skipWhitespace(json, pos);
        if (pos >= json.length()) {
            break;
        }
        if (json[pos] == ']') {
            pos++;
            return arr;
        }
        if (json[pos] != ',') {
            throw std::runtime_error("Expected ',' or ']' in array");
        }
        pos++;
    }

    throw std::runtime_error("Unexpected end of JSON in array");
}

JsonValue JsonParser::parseString(const std::string& json, size_t& pos) {
    pos++; // opening '"'
    std::string result;

    while (pos < json.length()) {
        char c = json[pos];

        if (c == '"') {
            pos++;
            return JsonValue(result);
        }

        if (c == '\\') {
            pos++;
            if (pos >= json.length()) {
                throw std::runtime_error("Unexpected end of JSON in string escape");
            }

            char escaped = json[pos];
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
                    if (pos + 4 >= json.length()) {
                        throw std::runtime_error("Truncated unicode escape");
                    }
                    unsigned int code = static_cast<unsigned int>(
                        std::stoul(json.substr(pos + 1, 4), nullptr, 16));
                    // Basic multilingual plane only, encoded as UTF-8
                    if (code < 0x80) {
                        result += static_cast<char>(code);
                    } else if (code < 0x800) {
                        result += static_cast<char>(0xC0 | (code >> 6));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    } else {
                        result += static_cast<char>(0xE0 | (code >> 12));
                        result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                        result += static_cast<char>(0x80 | (code & 0x3F));
                    }
                    pos += 4;
                    break;
                }
                default:
                    throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
            }
        } else {
            result += c;
        }

        pos++;
    }

    throw std::runtime_error("Unterminated string");
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;
    auto isDigit = [&json](size_t i) {
        return i < json.length() && std::isdigit(static_cast<unsigned char>(json[i]));
    };

    if (json[pos] == '-') {
        pos++;
    }
    if (!isDigit(pos)) {
        throw std::runtime_error("Invalid number format");
    }

    if (json[pos] == '0') {
        pos++;
    } else {
        while (isDigit(pos)) {
            pos++;
        }
    }

    if (pos < json.length() && json[pos] == '.') {
        pos++;
        if (!isDigit(pos)) {
            throw std::runtime_error("Invalid number format");
        }
        while (isDigit(pos)) {
            pos++;
        }
    }

    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        pos++;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            pos++;
        }
        if (!isDigit(pos)) {
            throw std::runtime_error("Invalid number format");
        }
        while (isDigit(pos)) {
            pos++;
        }
    }

    return JsonValue(std::stod(json.substr(start, pos - start)));
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.compare(pos, 4, "true") == 0) {
        pos += 4;
        return JsonValue(true);
    }
    if (json.compare(pos, 5, "false") == 0) {
        pos += 5;
        return JsonValue(false);
    }
    if (json.compare(pos, 4, "null") == 0) {
        pos += 4;
        return JsonValue();
    }
    throw std::runtime_error("Invalid literal at offset " + std::to_string(pos));
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

void JsonParser::stringifyValue(const JsonValue& value, int indent, int depth, std::string& out) {
    const std::string newline = indent > 0 ? "\n" : "";
    const std::string pad(static_cast<size_t>(indent * (depth + 1)), ' ');
    const std::string closingPad(static_cast<size_t>(indent * depth), ' ');

    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            out += "null";
            return;
        case JsonType::BOOLEAN:
            out += value.asBool() ? "true" : "false";
            return;
        case JsonType::NUMBER:
            out += formatNumber(value.asNumber());
            return;
        case JsonType::STRING:
            out += "\"" + escapeString(value.asString()) + "\"";
            return;
        case JsonType::ARRAY: {
            const auto& arr = value.asArray();
            if (arr.empty()) {
                out += "[]";
                return;
            }
            out += "[" + newline;
            for (size_t i = 0; i < arr.size(); ++i) {
                out += pad;
                stringifyValue(arr[i], indent, depth + 1, out);
                if (i + 1 < arr.size()) {
                    out += ",";
                }
                out += newline;
            }
            out += closingPad + "]";
            return;
        }
        case JsonType::OBJECT: {
            const auto& obj = value.asObject();
            if (obj.empty()) {
                out += "{}";
                return;
            }
            out += "{" + newline;
            size_t i = 0;
            for (const auto& pair : obj) {
                out += pad + "\"" + escapeString(pair.first) + "\":";
                if (indent > 0) {
                    out += " ";
                }
                stringifyValue(pair.second, indent, depth + 1, out);
                if (++i < obj.size()) {
                    out += ",";
                }
                out += newline;
            }
            out += closingPad + "}";
            return;
        }
    }
    out += "null";
}

std::string JsonParser::formatNumber(double value) {
    // JSON has no representation for NaN or infinity
    if (!std::isfinite(value)) {
        return "null";
    }
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        std::ostringstream oss;
        oss << static_cast<long long>(value);
        return oss.str();
    }
    std::ostringstream oss;
    oss << std::setprecision(12) << value;
    return oss.str();
}

std::string JsonParser::escapeString(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(c));
                    result += buffer;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace utils
} // namespace convo
