#include "json/JsonWriter.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace json
{

namespace
{

// Shortest digit string that round-trips to the same double, with the decimal
// exponent of its first digit.
std::string shortestDigits(double value, int &exponent)
{
    char buffer[40]{};
    for (int precision = 1; precision <= 17; ++precision)
    {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);
        if (std::strtod(buffer, nullptr) == value)
        {
            break;
        }
    }

    const std::string text(buffer);
    const std::size_t ePos = text.find('e');
    exponent = std::atoi(text.c_str() + ePos + 1);

    std::string digits;
    for (std::size_t i = 0; i < ePos; ++i)
    {
        if (text[i] != '.')
        {
            digits.push_back(text[i]);
        }
    }
    while (digits.size() > 1 && digits.back() == '0')
    {
        digits.pop_back();
    }
    return digits;
}

std::string formatDouble(double value)
{
    if (std::isnan(value))
    {
        return "NaN";
    }
    if (std::isinf(value))
    {
        return value < 0.0 ? "-Infinity" : "Infinity";
    }
    if (value == 0.0)
    {
        return std::signbit(value) ? "-0.0" : "0.0";
    }

    int exponent = 0;
    const std::string digits = shortestDigits(std::fabs(value), exponent);

    std::string out;
    if (value < 0.0)
    {
        out.push_back('-');
    }

    if (exponent < -4 || exponent >= 16)
    {
        out.push_back(digits[0]);
        if (digits.size() > 1)
        {
            out.push_back('.');
            out.append(digits, 1, std::string::npos);
        }
        out.push_back('e');
        out.push_back(exponent < 0 ? '-' : '+');
        const int magnitude = exponent < 0 ? -exponent : exponent;
        if (magnitude < 10)
        {
            out.push_back('0');
        }
        out += std::to_string(magnitude);
        return out;
    }

    const int pointPosition = exponent + 1;
    const int digitCount = static_cast<int>(digits.size());
    if (pointPosition <= 0)
    {
        out += "0.";
        out.append(static_cast<std::size_t>(-pointPosition), '0');
        out += digits;
    }
    else if (pointPosition >= digitCount)
    {
        out += digits;
        out.append(static_cast<std::size_t>(pointPosition - digitCount), '0');
        out += ".0";
    }
    else
    {
        out.append(digits, 0, static_cast<std::size_t>(pointPosition));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(pointPosition), std::string::npos);
    }
    return out;
}

void appendUnicodeEscape(std::string &out, unsigned int code)
{
    char buffer[8]{};
    std::snprintf(buffer, sizeof(buffer), "\\u%04x", code);
    out += buffer;
}

// Decodes one UTF-8 sequence starting at index; malformed bytes decode as themselves.
unsigned int decodeUtf8(const std::string &text, std::size_t &index)
{
    const auto lead = static_cast<unsigned char>(text[index]);
    int extra = 0;
    unsigned int code = lead;
    if ((lead & 0xE0) == 0xC0)
    {
        extra = 1;
        code = lead & 0x1F;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
        extra = 2;
        code = lead & 0x0F;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
        extra = 3;
        code = lead & 0x07;
    }

    if (extra == 0 || index + static_cast<std::size_t>(extra) >= text.size())
    {
        ++index;
        return lead;
    }

    for (int i = 1; i <= extra; ++i)
    {
        const auto next = static_cast<unsigned char>(text[index + static_cast<std::size_t>(i)]);
        if ((next & 0xC0) != 0x80)
        {
            ++index;
            return lead;
        }
        code = (code << 6) | (next & 0x3F);
    }
    index += static_cast<std::size_t>(extra) + 1;
    return code;
}

void writeString(std::string &out, const std::string &text, bool ensureAscii)
{
    out.push_back('"');
    std::size_t index = 0;
    while (index < text.size())
    {
        const char c = text[index];
        switch (c)
        {
        case '"': out += "\\\""; ++index; continue;
        case '\\': out += "\\\\"; ++index; continue;
        case '\n': out += "\\n"; ++index; continue;
        case '\r': out += "\\r"; ++index; continue;
        case '\t': out += "\\t"; ++index; continue;
        case '\b': out += "\\b"; ++index; continue;
        case '\f': out += "\\f"; ++index; continue;
        default: break;
        }

        const auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20)
        {
            appendUnicodeEscape(out, byte);
            ++index;
            continue;
        }
        if (!ensureAscii)
        {
            out.push_back(c);
            ++index;
            continue;
        }
        if (byte < 0x7F)
        {
            out.push_back(c);
            ++index;
            continue;
        }

        const unsigned int code = decodeUtf8(text, index);
        if (code > 0xFFFF)
        {
            const unsigned int shifted = code - 0x10000;
            appendUnicodeEscape(out, 0xD800 | (shifted >> 10));
            appendUnicodeEscape(out, 0xDC00 | (shifted & 0x3FF));
        }
        else
        {
            appendUnicodeEscape(out, code);
        }
    }
    out.push_back('"');
}

void newline(std::string &out, const JsonWriteOptions &options, int depth)
{
    if (options.indent < 0)
    {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(options.indent * depth), ' ');
}

void writeValue(std::string &out, const JsonValue &value, const JsonWriteOptions &options, int depth)
{
    switch (value.type)
    {
    case JsonValue::Type::Null:
        out += "null";
        return;
    case JsonValue::Type::Bool:
        out += value.boolean ? "true" : "false";
        return;
    case JsonValue::Type::Number:
        out += formatNumber(value.number);
        return;
    case JsonValue::Type::String:
        writeString(out, value.string, options.ensureAscii);
        return;
    case JsonValue::Type::Array:
    {
        if (value.array.empty())
        {
            out += "[]";
            return;
        }
        out.push_back('[');
        bool first = true;
        for (const JsonValue &item : value.array)
        {
            if (!first)
            {
                out.push_back(',');
                if (options.indent < 0)
                {
                    out.push_back(' ');
                }
            }
            first = false;
            newline(out, options, depth + 1);
            writeValue(out, item, options, depth + 1);
        }
        newline(out, options, depth);
        out.push_back(']');
        return;
    }
    case JsonValue::Type::Object:
    {
        if (value.object.empty())
        {
            out += "{}";
            return;
        }
        out.push_back('{');
        bool first = true;
        for (const auto &member : value.object)
        {
            if (!first)
            {
                out.push_back(',');
                if (options.indent < 0)
                {
                    out.push_back(' ');
                }
            }
            first = false;
            newline(out, options, depth + 1);
            writeString(out, member.first, options.ensureAscii);
            out += ": ";
            writeValue(out, member.second, options, depth + 1);
        }
        newline(out, options, depth);
        out.push_back('}');
        return;
    }
    }
}

} // namespace

std::string formatNumber(const Number &number)
{
    if (!number.lexeme.empty())
    {
        return number.lexeme;
    }
    if (number.integral)
    {
        return std::to_string(number.integer);
    }
    return formatDouble(number.value);
}

std::string writeJson(const JsonValue &value, const JsonWriteOptions &options)
{
    std::string out;
    writeValue(out, value, options, 0);
    if (options.trailingNewline)
    {
        out.push_back('\n');
    }
    return out;
}

} // namespace json
