#include "JsonValue.h"

#include "GranuloExceptions.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace {
class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue(0);
        skipWhitespace();
        if (position != text.size()) {
            fail("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    static constexpr int kMaxDepth = 64;

    const std::string& text;
    size_t position = 0;

    [[noreturn]] void fail(const std::string& message) const {
        throw Granulo::ValidationException(message + " at offset " + std::to_string(position));
    }

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            fail("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            fail("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        const char value = take();
        if (value != expected) {
            fail(std::string("Expected JSON character '") + expected + "'");
        }
    }

    JsonValue parseValue(int depth) {
        if (depth > kMaxDepth) {
            fail("JSON nesting too deep");
        }
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject(depth);
        if (c == '[') return parseArray(depth);
        if (c == '"') return JsonValue::string(parseString());
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        fail("Invalid JSON token");
    }

    JsonValue parseObject(int depth) {
        JsonValue object = JsonValue::object();

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                fail("Expected string key in JSON object");
            }
            std::string key = parseString();
            skipWhitespace();
            expect(':');
            skipWhitespace();
            JsonValue value = parseValue(depth + 1);
            object.objectValue.emplace_back(std::move(key), std::move(value));

            skipWhitespace();
            const char next = take();
            if (next == '}') {
                break;
            }
            if (next != ',') {
                fail("Expected ',' or '}' in JSON object");
            }
        }

        return object;
    }

    JsonValue parseArray(int depth) {
        JsonValue array = JsonValue::array();

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue(depth + 1));
            skipWhitespace();
            const char next = take();
            if (next == ']') {
                break;
            }
            if (next != ',') {
                fail("Expected ',' or ']' in JSON array");
            }
        }

        return array;
    }

    unsigned parseHex4() {
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = take();
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("Invalid \\u escape in JSON string");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        std::string out;
        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("Unescaped control character in JSON string");
            }
            if (c == '\\') {
                const char escaped = take();
                switch (escaped) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned code = parseHex4();
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            if (take() != '\\' || take() != 'u') {
                                fail("Unpaired surrogate in JSON string");
                            }
                            const unsigned low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                fail("Unpaired surrogate in JSON string");
                            }
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default:
                        fail("Unsupported escaped character in JSON string");
                }
                continue;
            }
            out.push_back(c);
        }
        return out;
    }

    JsonValue parseBoolean() {
        if (text.compare(position, 4, "true") == 0) {
            position += 4;
            return JsonValue::boolean(true);
        }
        if (text.compare(position, 5, "false") == 0) {
            position += 5;
            return JsonValue::boolean(false);
        }
        fail("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            fail("Invalid JSON null value");
        }
        position += 4;
        return JsonValue::null();
    }

    JsonValue parseNumber() {
        const size_t start = position;
        if (peek() == '-') take();

        if (position < text.size() && text[position] == '0') {
            ++position;
        } else {
            const size_t digitsStart = position;
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
            if (position == digitsStart) {
                fail("Invalid JSON number");
            }
        }

        if (position < text.size() && text[position] == '.') {
            ++position;
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
                ++position;
            }
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        const std::string token = text.substr(start, position - start);
        try {
            return JsonValue::number(std::stod(token));
        } catch (const std::exception&) {
            fail("Failed to parse JSON number '" + token + "'");
        }
    }
};
} // namespace

JsonValue JsonValue::null() {
    return JsonValue{};
}

JsonValue JsonValue::boolean(bool value) {
    JsonValue out;
    out.type = Type::Bool;
    out.booleanValue = value;
    return out;
}

JsonValue JsonValue::number(double value) {
    JsonValue out;
    out.type = Type::Number;
    out.numberValue = value;
    return out;
}

JsonValue JsonValue::string(std::string value) {
    JsonValue out;
    out.type = Type::String;
    out.stringValue = std::move(value);
    return out;
}

JsonValue JsonValue::array() {
    JsonValue out;
    out.type = Type::Array;
    return out;
}

JsonValue JsonValue::object() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    for (auto it = objectValue.rbegin(); it != objectValue.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    type = Type::Object;
    for (auto& kv : objectValue) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return kv.second;
        }
    }
    objectValue.emplace_back(key, std::move(value));
    return objectValue.back().second;
}

JsonValue& JsonValue::push(JsonValue value) {
    type = Type::Array;
    arrayValue.push_back(std::move(value));
    return arrayValue.back();
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out << buf;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

std::string JsonValue::dump() const {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return booleanValue ? "true" : "false";
        case Type::Number: {
            if (!std::isfinite(numberValue)) return "null";
            std::ostringstream out;
            out << std::setprecision(15) << numberValue;
            return out.str();
        }
        case Type::String:
            return "\"" + escapeJsonString(stringValue) + "\"";
        case Type::Array: {
            std::string out = "[";
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out += ',';
                out += arrayValue[i].dump();
            }
            out += ']';
            return out;
        }
        case Type::Object: {
            std::string out = "{";
            bool first = true;
            for (const auto& kv : objectValue) {
                if (!first) out += ',';
                first = false;
                out += "\"" + escapeJsonString(kv.first) + "\":" + kv.second.dump();
            }
            out += '}';
            return out;
        }
    }
    return "null";
}

JsonValue parseJsonText(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}
