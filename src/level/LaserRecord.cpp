#include "level/LaserRecord.h"

#include <utility>
#include <vector>

#include "level/EndpointPath.h"

namespace level
{

std::optional<LaserVariant> laserVariantFromString(const std::string &id)
{
    if (id == "ray")
    {
        return LaserVariant::Ray;
    }
    if (id == "segment")
    {
        return LaserVariant::Segment;
    }
    return std::nullopt;
}

namespace
{

void encodeCommonHead(json::JsonValue &obj, const LaserRecord &record)
{
    json::setField(obj, "id", json::makeString(record.id));
    json::setField(obj, "color", json::makeString(record.color));
    json::setField(obj, "thickness", json::makeNumber(record.thickness));
    json::setField(obj, "enabled", json::makeBool(record.enabled));
    json::setField(obj, "type", json::makeString(laserVariantToString(record.variant())));
}

bool requireString(const json::JsonValue &obj, const char *key, const DecodeContext &ctx, std::string &out)
{
    const json::JsonValue *value = json::getObjectField(obj, key);
    if (!value || !value->isString())
    {
        ctx.child(key).malformed("missing or non-string field");
        return false;
    }
    out = value->string;
    return true;
}

bool requireNumber(const json::JsonValue &obj, const char *key, const DecodeContext &ctx, json::Number &out)
{
    const json::JsonValue *value = json::getObjectField(obj, key);
    if (!value || !value->isNumber())
    {
        ctx.child(key).malformed("missing or non-numeric field");
        return false;
    }
    out = value->number;
    return true;
}

} // namespace

json::JsonValue encodeLaser(const LaserRecord &record, LaserEncoding encoding)
{
    json::JsonValue obj = json::makeObject();
    encodeCommonHead(obj, record);

    if (const auto *ray = std::get_if<RayShape>(&record.shape))
    {
        if (encoding == LaserEncoding::Unified)
        {
            json::setField(obj, "endpoint", encodeEndpointPath(ray->endpoint, PhaseKey::InitialT));
            const double angle = ray->initialAngle ? *ray->initialAngle : derivedRayAngle(ray->endpoint);
            json::setField(obj, "initialAngle", json::makeNumber(angle));
        }
        else
        {
            json::setField(obj, "endpoints", json::makeArray({encodeEndpointPath(ray->endpoint, PhaseKey::SparseT)}));
        }
        json::setField(obj, "rotationSpeed", json::makeNumber(ray->rotationSpeed));
    }
    else
    {
        const auto &segment = std::get<SegmentShape>(record.shape);
        if (encoding == LaserEncoding::Unified)
        {
            json::setField(obj, "startEndpoint", encodeEndpointPath(segment.start, PhaseKey::InitialT));
            json::setField(obj, "endEndpoint", encodeEndpointPath(segment.end, PhaseKey::InitialT));
        }
        else
        {
            json::setField(obj, "endpoints",
                           json::makeArray({encodeEndpointPath(segment.start, PhaseKey::SparseT),
                                            encodeEndpointPath(segment.end, PhaseKey::SparseT)}));
        }
    }

    if (record.cadence)
    {
        json::setField(obj, "cadence", *record.cadence);
    }
    return obj;
}

std::optional<LaserRecord> decodeLaser(const json::JsonValue &value, const DecodeContext &ctx)
{
    if (!value.isObject())
    {
        ctx.malformed("laser must be an object");
        return std::nullopt;
    }

    LaserRecord record;
    bool ok = requireString(value, "id", ctx, record.id);
    ok = requireString(value, "color", ctx, record.color) && ok;
    ok = requireNumber(value, "thickness", ctx, record.thickness) && ok;
    record.enabled = json::getBool(value, "enabled", true);
    if (const json::JsonValue *cadence = json::getObjectField(value, "cadence"))
    {
        if (!cadence->isNull())
        {
            record.cadence = *cadence;
        }
    }

    std::string typeName;
    if (!requireString(value, "type", ctx, typeName))
    {
        return std::nullopt;
    }
    const auto variant = laserVariantFromString(typeName);
    if (!variant)
    {
        ctx.child("type").malformed("unknown laser type '" + typeName + "'");
        return std::nullopt;
    }

    const json::JsonValue *endpoints = json::getObjectField(value, "endpoints");
    if (!endpoints || !endpoints->isArray())
    {
        ctx.child("endpoints").malformed("missing endpoints array");
        return std::nullopt;
    }

    const DecodeContext endpointsCtx = ctx.child("endpoints");
    std::vector<EndpointPath> paths;
    for (std::size_t i = 0; i < endpoints->array.size(); ++i)
    {
        auto path = decodeEndpointPath(endpoints->array[i], endpointsCtx.element(i));
        if (!path)
        {
            ok = false;
            continue;
        }
        paths.push_back(std::move(*path));
    }
    if (!ok)
    {
        return std::nullopt;
    }

    if (*variant == LaserVariant::Ray)
    {
        if (paths.size() != 1)
        {
            endpointsCtx.malformed("ray laser needs exactly one endpoint, found " + std::to_string(paths.size()));
            return std::nullopt;
        }
        RayShape ray;
        ray.endpoint = std::move(paths[0]);
        ray.rotationSpeed = json::Number::ofDouble(0.0);
        if (const json::JsonValue *speed = json::getObjectField(value, "rotationSpeed"))
        {
            if (speed->isNumber())
            {
                ray.rotationSpeed = speed->number;
            }
        }
        if (const json::JsonValue *angle = json::getObjectField(value, "initialAngle"))
        {
            if (angle->isNumber())
            {
                ray.initialAngle = angle->number.value;
            }
        }
        record.shape = std::move(ray);
    }
    else
    {
        if (paths.size() != 2)
        {
            endpointsCtx.malformed("segment laser needs exactly two endpoints, found " +
                                   std::to_string(paths.size()));
            return std::nullopt;
        }
        SegmentShape segment;
        segment.start = std::move(paths[0]);
        segment.end = std::move(paths[1]);
        record.shape = std::move(segment);
    }
    return record;
}

} // namespace level
