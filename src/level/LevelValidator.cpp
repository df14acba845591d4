#include "level/LevelValidator.h"

#include <string>
#include <unordered_set>
#include <utility>

#include "level/EndpointPath.h"
#include "level/LaserRecord.h"

namespace level
{

namespace
{

const json::JsonValue *requireField(const json::JsonValue &obj, const char *key, json::JsonValue::Type type,
                                    const DecodeContext &ctx)
{
    const json::JsonValue *value = json::getObjectField(obj, key);
    if (!value)
    {
        ctx.child(key).malformed("missing key");
        return nullptr;
    }
    if (value->type != type)
    {
        ctx.child(key).malformed("unexpected value type");
        return nullptr;
    }
    return value;
}

bool levelAllowsNoButtons(const std::string &id)
{
    return id.find("menu") != std::string::npos || id.find("background") != std::string::npos;
}

void decodeEffectTargets(const json::JsonValue &effects, const DecodeContext &ctx, Button &button, bool &ok)
{
    for (std::size_t i = 0; i < effects.array.size(); ++i)
    {
        const DecodeContext effectCtx = ctx.element(i);
        const json::JsonValue &effect = effects.array[i];
        const json::JsonValue *action = json::getObjectField(effect, "action");
        if (!action || !action->isObject())
        {
            effectCtx.child("action").malformed("missing key");
            ok = false;
            continue;
        }
        const json::JsonValue *lasers = requireField(*action, "lasers", json::JsonValue::Type::Array,
                                                     effectCtx.child("action"));
        if (!lasers)
        {
            ok = false;
            continue;
        }
        for (const json::JsonValue &target : lasers->array)
        {
            if (!target.isString())
            {
                effectCtx.child("action").child("lasers").malformed("laser id must be a string");
                ok = false;
                continue;
            }
            button.effectTargets.push_back(target.string);
        }
    }
}

} // namespace

std::optional<Button> decodeButton(const json::JsonValue &value, const DecodeContext &ctx)
{
    if (!value.isObject())
    {
        ctx.malformed("button must be an object");
        return std::nullopt;
    }

    bool ok = true;
    Button button;
    if (const json::JsonValue *id = requireField(value, "id", json::JsonValue::Type::String, ctx))
    {
        button.id = id->string;
    }
    else
    {
        ok = false;
    }

    if (const json::JsonValue *endpoints = requireField(value, "endpoints", json::JsonValue::Type::Array, ctx))
    {
        const DecodeContext endpointsCtx = ctx.child("endpoints");
        for (std::size_t i = 0; i < endpoints->array.size(); ++i)
        {
            auto path = decodeEndpointPath(endpoints->array[i], endpointsCtx.element(i));
            if (!path)
            {
                ok = false;
                continue;
            }
            button.endpoints.push_back(std::move(*path));
        }
    }
    else
    {
        ok = false;
    }

    if (const json::JsonValue *hitAreas = requireField(value, "hitAreas", json::JsonValue::Type::Array, ctx))
    {
        button.hitAreaCount = hitAreas->array.size();
    }
    else
    {
        ok = false;
    }

    if (const json::JsonValue *effects = requireField(value, "effects", json::JsonValue::Type::Array, ctx))
    {
        decodeEffectTargets(*effects, ctx.child("effects"), button, ok);
    }
    else
    {
        ok = false;
    }

    if (!ok)
    {
        return std::nullopt;
    }
    return button;
}

std::optional<Level> decodeLevel(const json::JsonValue &document, std::vector<LevelError> &errors)
{
    DecodeContext ctx;
    ctx.errors = &errors;
    if (!document.isObject())
    {
        ctx.malformed("level document must be an object");
        return std::nullopt;
    }

    bool ok = true;
    Level level;
    const auto readString = [&](const char *key, std::string &out) {
        if (const json::JsonValue *value = requireField(document, key, json::JsonValue::Type::String, ctx))
        {
            out = value->string;
        }
        else
        {
            ok = false;
        }
    };
    readString("id", level.id);
    readString("title", level.title);
    readString("description", level.description);

    if (const json::JsonValue *buttons = requireField(document, "buttons", json::JsonValue::Type::Array, ctx))
    {
        const DecodeContext buttonsCtx = ctx.child("buttons");
        for (std::size_t i = 0; i < buttons->array.size(); ++i)
        {
            auto button = decodeButton(buttons->array[i], buttonsCtx.element(i));
            if (!button)
            {
                ok = false;
                continue;
            }
            level.buttons.push_back(std::move(*button));
        }
    }
    else
    {
        ok = false;
    }

    if (const json::JsonValue *lasers = requireField(document, "lasers", json::JsonValue::Type::Array, ctx))
    {
        const DecodeContext lasersCtx = ctx.child("lasers");
        for (std::size_t i = 0; i < lasers->array.size(); ++i)
        {
            auto laser = decodeLaser(lasers->array[i], lasersCtx.element(i));
            if (!laser)
            {
                ok = false;
                continue;
            }
            level.lasers.push_back(std::move(*laser));
        }
    }
    else
    {
        ok = false;
    }

    if (requireField(document, "unlocks", json::JsonValue::Type::Array, ctx))
    {
        level.unlocks = json::getStringArray(document, "unlocks");
    }
    else
    {
        ok = false;
    }

    if (!ok)
    {
        return std::nullopt;
    }
    return level;
}

LevelValidationResult validateLevel(const json::JsonValue &document)
{
    LevelValidationResult result;
    result.level = decodeLevel(document, result.errors);
    if (!result.level)
    {
        result.valid = false;
        return result;
    }

    const Level &level = *result.level;
    DecodeContext ctx;
    ctx.errors = &result.errors;

    if (level.buttons.empty() && !levelAllowsNoButtons(level.id))
    {
        ctx.child("buttons").malformed("level has no buttons");
    }

    std::unordered_set<std::string> buttonIds;
    for (const Button &button : level.buttons)
    {
        if (!buttonIds.insert(button.id).second)
        {
            ctx.child("buttons").malformed("duplicate button id '" + button.id + "'");
        }
    }

    std::unordered_set<std::string> laserIds;
    for (const LaserRecord &laser : level.lasers)
    {
        if (!laserIds.insert(laser.id).second)
        {
            ctx.child("lasers").malformed("duplicate laser id '" + laser.id + "'");
        }
    }

    const DecodeContext buttonsCtx = ctx.child("buttons");
    for (std::size_t i = 0; i < level.buttons.size(); ++i)
    {
        const Button &button = level.buttons[i];
        const DecodeContext buttonCtx = buttonsCtx.element(i);
        if (button.endpoints.empty())
        {
            buttonCtx.malformed("button '" + button.id + "' has no endpoints");
        }
        if (button.hitAreaCount == 0)
        {
            buttonCtx.malformed("button '" + button.id + "' has no hit areas");
        }
        for (const std::string &target : button.effectTargets)
        {
            if (laserIds.count(target) == 0)
            {
                buttonCtx.malformed("button '" + button.id + "' has effect targeting non-existent laser '" +
                                    target + "'");
            }
        }
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace level
