#include "migration/ButtonPositionStep.h"

#include "migration/LevelWalk.h"

namespace level::migration
{

namespace
{

bool needsEndpoint(const json::JsonValue &button)
{
    return json::hasField(button, "position") && !json::hasField(button, "endpoint") &&
           !json::hasField(button, "endpoints");
}

} // namespace

bool ButtonPositionStep::needsMigration(const json::JsonValue &document) const
{
    bool needed = false;
    forEachRecord(document, "buttons", DecodeContext{},
                  [&](std::size_t, const json::JsonValue &button, const DecodeContext &) {
                      needed = needed || needsEndpoint(button);
                  });
    return needed;
}

void ButtonPositionStep::rewrite(json::JsonValue &document, StepResult &result) const
{
    DecodeContext ctx;
    ctx.errors = &result.errors;
    forEachRecord(document, "buttons", ctx, [&](std::size_t, json::JsonValue &button, const DecodeContext &buttonCtx) {
        if (!needsEndpoint(button))
        {
            return;
        }
        const json::JsonValue *position = json::getObjectField(button, "position");
        if (!position->isObject())
        {
            buttonCtx.child("position").malformed("position must be a point object");
            return;
        }

        json::JsonValue endpoint = json::makeObject();
        json::setField(endpoint, "points", json::makeArray({*position}));
        json::setField(endpoint, "cycleSeconds", json::makeNull());
        json::setField(button, "endpoint", std::move(endpoint));
        json::eraseField(button, "position");
    });
}

} // namespace level::migration
