#pragma once

#include <string>

#include "json/JsonUtils.h"

namespace json
{

struct JsonWriteOptions
{
    int indent = 2;
    // Escape every non-ASCII code point as \uXXXX.
    bool ensureAscii = true;
    bool trailingNewline = true;
};

std::string formatNumber(const Number &number);

std::string writeJson(const JsonValue &value, const JsonWriteOptions &options = {});

} // namespace json
