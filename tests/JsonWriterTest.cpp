#include "TestSupport.h"

#include "json/JsonUtils.h"
#include "json/JsonWriter.h"

#include <string>

using testing_support::assertEqualText;
using testing_support::assertTrue;
using testing_support::parseFixture;

int main()
{
    bool success = true;

    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(100.0)), "100.0", "whole float keeps .0");
    success &= assertEqualText(json::formatNumber(json::Number::ofInteger(100)), "100", "integer stays integral");
    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(0.00001)), "1e-05", "small float exponent");
    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(1e16)), "1e+16", "large float exponent");
    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(1e15)), "1000000000000000.0",
                               "float below the exponent threshold");
    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(0.1)), "0.1", "shortest repr");
    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(-2.5)), "-2.5", "negative float");
    success &= assertEqualText(json::formatNumber(json::Number::ofDouble(0.0)), "0.0", "zero float");

    {
        const json::JsonValue doc = parseFixture(R"({"b": 1, "a": [1.5, true, null], "e": {}, "f": []})");
        const std::string expected = "{\n"
                                     "  \"b\": 1,\n"
                                     "  \"a\": [\n"
                                     "    1.5,\n"
                                     "    true,\n"
                                     "    null\n"
                                     "  ],\n"
                                     "  \"e\": {},\n"
                                     "  \"f\": []\n"
                                     "}\n";
        success &= assertEqualText(json::writeJson(doc), expected, "indented output keeps key order");
    }

    {
        const json::JsonValue doc = parseFixture("{\"name\": \"caf\xC3\xA9 \\\"x\\\"\"}");
        json::JsonWriteOptions options;
        options.indent = -1;
        options.trailingNewline = false;
        success &= assertEqualText(json::writeJson(doc, options), "{\"name\": \"caf\\u00e9 \\\"x\\\"\"}",
                                   "non-ASCII escaped by default");

        options.ensureAscii = false;
        success &= assertEqualText(json::writeJson(doc, options), "{\"name\": \"caf\xC3\xA9 \\\"x\\\"\"}",
                                   "UTF-8 kept when escaping is off");
    }

    {
        const std::string canonicalText = "{\n  \"x\": 2.0,\n  \"y\": -3\n}\n";
        const json::JsonValue doc = parseFixture(canonicalText);
        success &= assertEqualText(json::writeJson(doc), canonicalText, "canonical text re-serializes byte for byte");
        success &= assertTrue(json::writeJson(parseFixture(json::writeJson(doc))) == canonicalText,
                              "writing is stable across a second parse");
    }

    {
        const std::string wideText = "{\n  \"big\": 12345678901234567890,\n  \"neg\": -99999999999999999999\n}\n";
        const json::JsonValue doc = parseFixture(wideText);
        const json::JsonValue *big = json::getObjectField(doc, "big");
        success &= assertTrue(big && big->isNumber() && big->number.integral, "wide integer stays integral");
        success &= assertEqualText(json::writeJson(doc), wideText, "integers beyond 64 bits keep their digits");
        success &= assertTrue(doc == parseFixture(wideText), "wide integers compare by their digits");
        const json::JsonValue neighbour =
            parseFixture("{\"big\": 12345678901234567891, \"neg\": -99999999999999999999}");
        success &= assertTrue(doc != neighbour, "neighbouring wide integers differ");
    }

    return success ? 0 : 1;
}
