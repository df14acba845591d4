#include "migration/EndpointArrayStep.h"

#include <utility>

#include "migration/LevelWalk.h"

namespace level::migration
{

namespace
{

bool hasBareLayout(const json::JsonValue &record)
{
    return json::hasField(record, "endpoint") || json::hasField(record, "startEndpoint") ||
           json::hasField(record, "endEndpoint");
}

json::JsonValue takeField(json::JsonValue &record, const char *key)
{
    json::JsonValue value = std::move(*json::findField(record, key));
    json::eraseField(record, key);
    return value;
}

void generalize(json::JsonValue &record, const DecodeContext &ctx)
{
    const bool hasSingle = json::hasField(record, "endpoint");
    const bool hasStart = json::hasField(record, "startEndpoint");
    const bool hasEnd = json::hasField(record, "endEndpoint");
    if (!hasSingle && !hasStart && !hasEnd)
    {
        return;
    }
    if (json::hasField(record, "endpoints"))
    {
        ctx.malformed("record has both endpoints and a single-endpoint field");
        return;
    }
    if (hasSingle && (hasStart || hasEnd))
    {
        ctx.malformed("record has both endpoint and startEndpoint/endEndpoint");
        return;
    }
    if (hasSingle)
    {
        json::JsonValue endpoint = takeField(record, "endpoint");
        json::setField(record, "endpoints", json::makeArray({std::move(endpoint)}));
        return;
    }
    if (hasStart != hasEnd)
    {
        ctx.malformed(hasStart ? "startEndpoint without endEndpoint" : "endEndpoint without startEndpoint");
        return;
    }

    json::JsonValue start = takeField(record, "startEndpoint");
    json::JsonValue end = takeField(record, "endEndpoint");
    json::setField(record, "endpoints", json::makeArray({std::move(start), std::move(end)}));
}

// Numeric x/y of a point object; false when it is out of shape.
bool pointCoordinates(const json::JsonValue &point, double &x, double &y)
{
    const json::JsonValue *px = json::getObjectField(point, "x");
    const json::JsonValue *py = json::getObjectField(point, "y");
    if (!px || !py || !px->isNumber() || !py->isNumber())
    {
        return false;
    }
    x = px->number.value;
    y = py->number.value;
    return true;
}

// A stationary path whose points all repeat the first one.
bool hasRedundantPoints(const json::JsonValue &path)
{
    const json::JsonValue *cycle = json::getObjectField(path, "cycleSeconds");
    if (cycle && !cycle->isNull())
    {
        return false;
    }
    const json::JsonValue *points = json::getObjectField(path, "points");
    if (!points || !points->isArray() || points->array.size() < 2)
    {
        return false;
    }
    double firstX = 0.0;
    double firstY = 0.0;
    if (!pointCoordinates(points->array.front(), firstX, firstY))
    {
        return false;
    }
    for (std::size_t i = 1; i < points->array.size(); ++i)
    {
        double x = 0.0;
        double y = 0.0;
        if (!pointCoordinates(points->array[i], x, y) || x != firstX || y != firstY)
        {
            return false;
        }
    }
    return true;
}

bool recordHasRedundantPoints(const json::JsonValue &record)
{
    bool found = false;
    forEachEndpointPath(record, DecodeContext{}, [&](const json::JsonValue &path, const DecodeContext &) {
        found = found || hasRedundantPoints(path);
    });
    return found;
}

void collapseRedundantPoints(json::JsonValue &record, const DecodeContext &ctx)
{
    forEachEndpointPath(record, ctx, [](json::JsonValue &path, const DecodeContext &) {
        if (hasRedundantPoints(path))
        {
            json::findField(path, "points")->array.resize(1);
        }
    });
}

} // namespace

bool EndpointArrayStep::needsMigration(const json::JsonValue &document) const
{
    bool needed = false;
    const auto check = [&](std::size_t, const json::JsonValue &record, const DecodeContext &) {
        needed = needed || hasBareLayout(record) || recordHasRedundantPoints(record);
    };
    forEachRecord(document, "lasers", DecodeContext{}, check);
    forEachRecord(document, "buttons", DecodeContext{}, check);
    return needed;
}

void EndpointArrayStep::rewrite(json::JsonValue &document, StepResult &result) const
{
    DecodeContext ctx;
    ctx.errors = &result.errors;
    const auto generalizeRecord = [](std::size_t, json::JsonValue &record, const DecodeContext &recordCtx) {
        generalize(record, recordCtx);
        collapseRedundantPoints(record, recordCtx);
    };
    forEachRecord(document, "lasers", ctx, generalizeRecord);
    forEachRecord(document, "buttons", ctx, generalizeRecord);
}

} // namespace level::migration
