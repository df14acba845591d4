#pragma once

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace json
{

// A JSON number that remembers whether it was written as an integer literal.
// Integers are re-serialized as integers, everything else in float form.
struct Number
{
    double value = 0.0;
    bool integral = false;
    std::int64_t integer = 0;
    std::string lexeme;

    static Number ofDouble(double v)
    {
        Number n;
        n.value = v;
        return n;
    }

    static Number ofInteger(std::int64_t v)
    {
        Number n;
        n.value = static_cast<double>(v);
        n.integral = true;
        n.integer = v;
        return n;
    }

    // Integer literals too large for int64 keep their source text so they are
    // written back unchanged; value holds the nearest double.
    static Number ofLexeme(std::string text, double v)
    {
        Number n;
        n.value = v;
        n.integral = true;
        n.lexeme = std::move(text);
        return n;
    }

    // Integer results that would overflow int64 become doubles.
    Number scaled(std::int64_t factor) const
    {
        if (integral && lexeme.empty() && !multiplyOverflows(integer, factor))
        {
            return ofInteger(integer * factor);
        }
        return ofDouble(value * static_cast<double>(factor));
    }

    bool isZero() const { return integral && lexeme.empty() ? integer == 0 : value == 0.0; }

  private:
    static bool multiplyOverflows(std::int64_t a, std::int64_t b)
    {
        constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
        constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
        if (a == 0 || b == 0)
        {
            return false;
        }
        if (a > 0)
        {
            return b > 0 ? a > kMax / b : b < kMin / a;
        }
        return b > 0 ? a < kMin / b : a < kMax / b;
    }
};

struct JsonValue
{
    enum class Type
    {
        Null,
        Number,
        String,
        Object,
        Array,
        Bool
    };

    using Member = std::pair<std::string, JsonValue>;

    Type type = Type::Null;
    json::Number number;
    bool boolean = false;
    std::string string;
    // Insertion ordered; rewriting a document must not reorder its keys.
    std::vector<Member> object;
    std::vector<JsonValue> array;

    bool isNull() const { return type == Type::Null; }
    bool isNumber() const { return type == Type::Number; }
    bool isString() const { return type == Type::String; }
    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }
    bool isBool() const { return type == Type::Bool; }
};

inline bool operator==(const JsonValue &a, const JsonValue &b);
inline bool operator!=(const JsonValue &a, const JsonValue &b) { return !(a == b); }

inline bool operator==(const Number &a, const Number &b)
{
    if (!a.lexeme.empty() || !b.lexeme.empty())
    {
        return a.lexeme == b.lexeme && a.integral == b.integral;
    }
    if (a.integral && b.integral)
    {
        return a.integer == b.integer;
    }
    return a.integral == b.integral && a.value == b.value;
}

inline bool operator==(const JsonValue &a, const JsonValue &b)
{
    if (a.type != b.type)
    {
        return false;
    }
    switch (a.type)
    {
    case JsonValue::Type::Null: return true;
    case JsonValue::Type::Number: return a.number == b.number;
    case JsonValue::Type::String: return a.string == b.string;
    case JsonValue::Type::Bool: return a.boolean == b.boolean;
    case JsonValue::Type::Array: return a.array == b.array;
    case JsonValue::Type::Object: return a.object == b.object;
    }
    return false;
}

struct ParseFailure
{
    std::size_t offset = 0;
    std::string message;
};

class JsonParser
{
  public:
    explicit JsonParser(const std::string &src) : text(src) {}

    std::optional<JsonValue> parse()
    {
        skipWhitespace();
        auto value = parseValue();
        if (!value.has_value())
        {
            return std::nullopt;
        }
        skipWhitespace();
        if (pos != text.size())
        {
            fail("Unexpected trailing characters");
            return std::nullopt;
        }
        return value;
    }

    const ParseFailure &failure() const { return m_failure; }

  private:
    const std::string &text;
    std::size_t pos = 0;
    ParseFailure m_failure;

    void fail(const char *message)
    {
        if (m_failure.message.empty())
        {
            m_failure.offset = pos;
            m_failure.message = message;
        }
    }

    void skipWhitespace()
    {
        while (pos < text.size())
        {
            const char c = text[pos];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
            {
                ++pos;
            }
            else
            {
                break;
            }
        }
    }

    std::optional<JsonValue> parseValue()
    {
        if (pos >= text.size())
        {
            fail("Unexpected end of input");
            return std::nullopt;
        }
        const char c = text[pos];
        if (c == 'n')
        {
            return parseNull();
        }
        if (c == 't' || c == 'f')
        {
            return parseBool();
        }
        if (c == '"')
        {
            return parseString();
        }
        if (c == '{')
        {
            return parseObject();
        }
        if (c == '[')
        {
            return parseArray();
        }
        if (c == '-' || (c >= '0' && c <= '9'))
        {
            return parseNumber();
        }
        fail("Unexpected character");
        return std::nullopt;
    }

    std::optional<JsonValue> parseNull()
    {
        if (text.compare(pos, 4, "null") == 0)
        {
            pos += 4;
            JsonValue v;
            v.type = JsonValue::Type::Null;
            return v;
        }
        fail("Invalid literal");
        return std::nullopt;
    }

    std::optional<JsonValue> parseBool()
    {
        if (text.compare(pos, 4, "true") == 0)
        {
            pos += 4;
            JsonValue v;
            v.type = JsonValue::Type::Bool;
            v.boolean = true;
            return v;
        }
        if (text.compare(pos, 5, "false") == 0)
        {
            pos += 5;
            JsonValue v;
            v.type = JsonValue::Type::Bool;
            v.boolean = false;
            return v;
        }
        fail("Invalid literal");
        return std::nullopt;
    }

    bool consumeDigits()
    {
        const std::size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        {
            ++pos;
        }
        return pos > start;
    }

    std::optional<JsonValue> parseNumber()
    {
        const std::size_t start = pos;
        bool integral = true;
        if (text[pos] == '-')
        {
            ++pos;
        }
        if (pos < text.size() && text[pos] == '0')
        {
            ++pos;
        }
        else if (!consumeDigits())
        {
            fail("Invalid number");
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == '.')
        {
            integral = false;
            ++pos;
            if (!consumeDigits())
            {
                fail("Invalid number fraction");
                return std::nullopt;
            }
        }
        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E'))
        {
            integral = false;
            ++pos;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
            {
                ++pos;
            }
            if (!consumeDigits())
            {
                fail("Invalid number exponent");
                return std::nullopt;
            }
        }

        const std::string lexeme = text.substr(start, pos - start);
        JsonValue v;
        v.type = JsonValue::Type::Number;
        if (integral)
        {
            errno = 0;
            char *end = nullptr;
            const long long parsed = std::strtoll(lexeme.c_str(), &end, 10);
            if (errno == 0 && end == lexeme.c_str() + lexeme.size())
            {
                v.number = Number::ofInteger(static_cast<std::int64_t>(parsed));
                return v;
            }
            v.number = Number::ofLexeme(lexeme, std::strtod(lexeme.c_str(), nullptr));
            return v;
        }
        v.number = Number::ofDouble(std::strtod(lexeme.c_str(), nullptr));
        return v;
    }

    static void appendUtf8(std::string &out, std::uint32_t code)
    {
        if (code <= 0x7F)
        {
            out.push_back(static_cast<char>(code));
        }
        else if (code <= 0x7FF)
        {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        else if (code <= 0xFFFF)
        {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
        else
        {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    bool readHex4(std::uint32_t &out)
    {
        if (pos + 4 > text.size())
        {
            return false;
        }
        out = 0;
        for (std::size_t i = 0; i < 4; ++i)
        {
            const char h = text[pos + i];
            out <<= 4;
            if (h >= '0' && h <= '9')
            {
                out |= static_cast<std::uint32_t>(h - '0');
            }
            else if (h >= 'a' && h <= 'f')
            {
                out |= static_cast<std::uint32_t>(h - 'a' + 10);
            }
            else if (h >= 'A' && h <= 'F')
            {
                out |= static_cast<std::uint32_t>(h - 'A' + 10);
            }
            else
            {
                return false;
            }
        }
        pos += 4;
        return true;
    }

    std::optional<JsonValue> parseString()
    {
        if (text[pos] != '"')
        {
            fail("Expected string");
            return std::nullopt;
        }
        ++pos;
        std::string result;
        while (pos < text.size())
        {
            char c = text[pos++];
            if (c == '"')
            {
                JsonValue v;
                v.type = JsonValue::Type::String;
                v.string = std::move(result);
                return v;
            }
            if (static_cast<unsigned char>(c) < 0x20)
            {
                fail("Control character in string");
                return std::nullopt;
            }
            if (c == '\\' && pos < text.size())
            {
                char escaped = text[pos++];
                switch (escaped)
                {
                case '"': result.push_back('"'); break;
                case '\\': result.push_back('\\'); break;
                case '/': result.push_back('/'); break;
                case 'b': result.push_back('\b'); break;
                case 'f': result.push_back('\f'); break;
                case 'n': result.push_back('\n'); break;
                case 'r': result.push_back('\r'); break;
                case 't': result.push_back('\t'); break;
                case 'u':
                {
                    std::uint32_t code = 0;
                    if (!readHex4(code))
                    {
                        fail("Invalid unicode escape");
                        return std::nullopt;
                    }
                    if (code >= 0xD800 && code <= 0xDBFF && text.compare(pos, 2, "\\u") == 0)
                    {
                        const std::size_t rewind = pos;
                        pos += 2;
                        std::uint32_t low = 0;
                        if (readHex4(low) && low >= 0xDC00 && low <= 0xDFFF)
                        {
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        }
                        else
                        {
                            pos = rewind;
                        }
                    }
                    appendUtf8(result, code);
                    break;
                }
                default:
                    fail("Invalid escape");
                    return std::nullopt;
                }
            }
            else
            {
                result.push_back(c);
            }
        }
        fail("Unterminated string");
        return std::nullopt;
    }

    std::optional<JsonValue> parseArray()
    {
        if (text[pos] != '[')
        {
            return std::nullopt;
        }
        ++pos;
        JsonValue arrayValue;
        arrayValue.type = JsonValue::Type::Array;
        skipWhitespace();
        if (pos < text.size() && text[pos] == ']')
        {
            ++pos;
            return arrayValue;
        }
        while (pos < text.size())
        {
            skipWhitespace();
            auto value = parseValue();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            arrayValue.array.push_back(std::move(*value));
            skipWhitespace();
            if (pos < text.size() && text[pos] == ',')
            {
                ++pos;
                continue;
            }
            if (pos < text.size() && text[pos] == ']')
            {
                ++pos;
                return arrayValue;
            }
            fail("Expected ',' or ']'");
            return std::nullopt;
        }
        fail("Unterminated array");
        return std::nullopt;
    }

    std::optional<JsonValue> parseObject()
    {
        if (text[pos] != '{')
        {
            return std::nullopt;
        }
        ++pos;
        JsonValue objValue;
        objValue.type = JsonValue::Type::Object;
        skipWhitespace();
        if (pos < text.size() && text[pos] == '}')
        {
            ++pos;
            return objValue;
        }
        while (pos < text.size())
        {
            skipWhitespace();
            if (pos >= text.size() || text[pos] != '"')
            {
                fail("Expected object key");
                return std::nullopt;
            }
            auto key = parseString();
            if (!key.has_value())
            {
                return std::nullopt;
            }
            skipWhitespace();
            if (pos >= text.size() || text[pos] != ':')
            {
                fail("Expected ':'");
                return std::nullopt;
            }
            ++pos;
            skipWhitespace();
            auto value = parseValue();
            if (!value.has_value())
            {
                return std::nullopt;
            }
            insertMember(objValue, std::move(key->string), std::move(*value));
            skipWhitespace();
            if (pos < text.size() && text[pos] == ',')
            {
                ++pos;
                continue;
            }
            if (pos < text.size() && text[pos] == '}')
            {
                ++pos;
                return objValue;
            }
            fail("Expected ',' or '}'");
            return std::nullopt;
        }
        fail("Unterminated object");
        return std::nullopt;
    }

    // Duplicate keys keep their first position and take the last value.
    static void insertMember(JsonValue &obj, std::string key, JsonValue value)
    {
        for (auto &member : obj.object)
        {
            if (member.first == key)
            {
                member.second = std::move(value);
                return;
            }
        }
        obj.object.emplace_back(std::move(key), std::move(value));
    }
};

inline std::optional<JsonValue> parseJson(const std::string &text)
{
    JsonParser parser(text);
    return parser.parse();
}

inline std::optional<JsonValue> parseJson(const std::string &text, ParseFailure &failure)
{
    JsonParser parser(text);
    auto value = parser.parse();
    if (!value)
    {
        failure = parser.failure();
    }
    return value;
}

// ---- construction ----------------------------------------------------------

inline JsonValue makeNull()
{
    return JsonValue{};
}

inline JsonValue makeBool(bool value)
{
    JsonValue v;
    v.type = JsonValue::Type::Bool;
    v.boolean = value;
    return v;
}

inline JsonValue makeNumber(const Number &value)
{
    JsonValue v;
    v.type = JsonValue::Type::Number;
    v.number = value;
    return v;
}

inline JsonValue makeNumber(double value)
{
    return makeNumber(Number::ofDouble(value));
}

inline JsonValue makeString(std::string value)
{
    JsonValue v;
    v.type = JsonValue::Type::String;
    v.string = std::move(value);
    return v;
}

inline JsonValue makeObject()
{
    JsonValue v;
    v.type = JsonValue::Type::Object;
    return v;
}

inline JsonValue makeArray(std::vector<JsonValue> items = {})
{
    JsonValue v;
    v.type = JsonValue::Type::Array;
    v.array = std::move(items);
    return v;
}

// ---- object access ---------------------------------------------------------

inline const JsonValue *getObjectField(const JsonValue &obj, const std::string &key)
{
    if (obj.type != JsonValue::Type::Object)
    {
        return nullptr;
    }
    for (const auto &member : obj.object)
    {
        if (member.first == key)
        {
            return &member.second;
        }
    }
    return nullptr;
}

inline JsonValue *findField(JsonValue &obj, const std::string &key)
{
    if (obj.type != JsonValue::Type::Object)
    {
        return nullptr;
    }
    for (auto &member : obj.object)
    {
        if (member.first == key)
        {
            return &member.second;
        }
    }
    return nullptr;
}

inline bool hasField(const JsonValue &obj, const std::string &key)
{
    return getObjectField(obj, key) != nullptr;
}

// Replaces an existing value in place, otherwise appends the key at the end.
inline void setField(JsonValue &obj, const std::string &key, JsonValue value)
{
    if (JsonValue *existing = findField(obj, key))
    {
        *existing = std::move(value);
        return;
    }
    obj.object.emplace_back(key, std::move(value));
}

inline bool eraseField(JsonValue &obj, const std::string &key)
{
    if (obj.type != JsonValue::Type::Object)
    {
        return false;
    }
    for (auto it = obj.object.begin(); it != obj.object.end(); ++it)
    {
        if (it->first == key)
        {
            obj.object.erase(it);
            return true;
        }
    }
    return false;
}

inline double getNumber(const JsonValue &obj, const std::string &key, double fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Number)
        {
            return value->number.value;
        }
    }
    return fallback;
}

inline int getInt(const JsonValue &obj, const std::string &key, int fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Number)
        {
            return static_cast<int>(value->number.value);
        }
    }
    return fallback;
}

inline bool getBool(const JsonValue &obj, const std::string &key, bool fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Bool)
        {
            return value->boolean;
        }
    }
    return fallback;
}

inline std::string getString(const JsonValue &obj, const std::string &key, std::string fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::String)
        {
            return value->string;
        }
    }
    return fallback;
}

inline std::vector<std::string> getStringArray(const JsonValue &obj, const std::string &key)
{
    std::vector<std::string> result;
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Array)
        {
            for (const JsonValue &elem : value->array)
            {
                if (elem.type == JsonValue::Type::String)
                {
                    result.push_back(elem.string);
                }
            }
        }
        else if (value->type == JsonValue::Type::String)
        {
            result.push_back(value->string);
        }
    }
    return result;
}

} // namespace json
