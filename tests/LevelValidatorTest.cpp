#include "TestSupport.h"

#include "level/LevelValidator.h"

#include <string>

using testing_support::assertTrue;
using testing_support::parseFixture;

namespace
{

bool hasErrorContaining(const level::LevelValidationResult &result, const std::string &needle)
{
    for (const level::LevelError &error : result.errors)
    {
        if (error.describe().find(needle) != std::string::npos)
        {
            return true;
        }
    }
    return false;
}

const char *kValidLevel = R"({
  "id": "level-3",
  "title": "Crossfire",
  "description": "Two beams.",
  "buttons": [
    {"id": "b1", "endpoints": [{"points": [{"x": 1, "y": 1}], "cycleSeconds": null}],
     "hitAreas": [{"radius": 1.0}], "effects": [{"action": {"type": "toggle", "lasers": ["l1"]}}]}
  ],
  "lasers": [
    {"id": "l1", "color": "red", "thickness": 2, "enabled": true, "type": "ray",
     "endpoints": [{"points": [{"x": 0, "y": 0}, {"x": 4, "y": 0}], "cycleSeconds": 6, "t": 1.5}],
     "rotationSpeed": 0.0},
    {"id": "l2", "color": "blue", "thickness": 1, "enabled": true, "type": "segment",
     "endpoints": [{"points": [{"x": 0, "y": 2}], "cycleSeconds": null},
                   {"points": [{"x": 4, "y": 2}], "cycleSeconds": null}]}
  ],
  "unlocks": []
})";

} // namespace

int main()
{
    bool success = true;

    {
        const level::LevelValidationResult result = level::validateLevel(parseFixture(kValidLevel));
        success &= assertTrue(result.valid && result.errors.empty(), "canonical level validates");
        success &= assertTrue(result.level && result.level->lasers.size() == 2, "lasers decoded");
        if (result.level)
        {
            success &= assertTrue(result.level->lasers[0].variant() == level::LaserVariant::Ray &&
                                      result.level->lasers[0].endpointCount() == 1,
                                  "ray has one endpoint");
            success &= assertTrue(result.level->buttons[0].effectTargets.size() == 1, "effect targets read");
        }
    }

    {
        json::JsonValue doc = parseFixture(kValidLevel);
        json::JsonValue &lasers = *json::findField(doc, "lasers");
        json::setField(lasers.array[1], "id", json::makeString("l1"));
        json::JsonValue &buttons = *json::findField(doc, "buttons");
        json::JsonValue &effects = *json::findField(buttons.array[0], "effects");
        json::JsonValue &targets = *json::findField(*json::findField(effects.array[0], "action"), "lasers");
        targets.array.push_back(json::makeString("ghost"));
        const level::LevelValidationResult result = level::validateLevel(doc);
        success &= assertTrue(!result.valid, "broken references rejected");
        success &= assertTrue(hasErrorContaining(result, "duplicate laser id 'l1'"), "duplicate laser id reported");
        success &= assertTrue(hasErrorContaining(result, "non-existent laser 'ghost'"), "dangling target reported");
    }

    {
        json::JsonValue doc = parseFixture(kValidLevel);
        json::JsonValue &buttons = *json::findField(doc, "buttons");
        buttons.array.clear();
        success &= assertTrue(!level::validateLevel(doc).valid, "level without buttons rejected");

        json::setField(doc, "id", json::makeString("main-menu"));
        success &= assertTrue(level::validateLevel(doc).valid, "menu level may have no buttons");
    }

    {
        json::JsonValue doc = parseFixture(kValidLevel);
        json::JsonValue &lasers = *json::findField(doc, "lasers");
        json::JsonValue &endpoints = *json::findField(lasers.array[1], "endpoints");
        endpoints.array.pop_back();
        const level::LevelValidationResult result = level::validateLevel(doc);
        success &= assertTrue(!result.valid, "segment with one endpoint rejected");
        success &= assertTrue(hasErrorContaining(result, "lasers[1]"), "arity error located");
    }

    {
        json::JsonValue doc = parseFixture(kValidLevel);
        json::JsonValue &buttons = *json::findField(doc, "buttons");
        json::setField(buttons.array[0], "hitAreas", json::makeArray());
        const level::LevelValidationResult result = level::validateLevel(doc);
        success &= assertTrue(!result.valid && hasErrorContaining(result, "has no hit areas"),
                              "button without hit areas rejected");
    }

    {
        json::JsonValue doc = parseFixture(kValidLevel);
        json::eraseField(doc, "title");
        const level::LevelValidationResult result = level::validateLevel(doc);
        success &= assertTrue(!result.valid && hasErrorContaining(result, "title: missing key"),
                              "missing title reported");
    }

    {
        json::JsonValue doc = parseFixture(kValidLevel);
        json::JsonValue &lasers = *json::findField(doc, "lasers");
        json::setField(lasers.array[0], "kind", json::makeObject());
        json::eraseField(lasers.array[0], "type");
        success &= assertTrue(!level::validateLevel(doc).valid, "legacy laser is not canonical");
    }

    return success ? 0 : 1;
}
