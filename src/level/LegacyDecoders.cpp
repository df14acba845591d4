#include "level/LegacyDecoders.h"

#include <cmath>
#include <utility>

#include "level/EndpointPath.h"

namespace level
{

namespace
{

constexpr double kPi = 3.14159265358979323846;

std::optional<Coordinate> requireCoordinate(const json::JsonValue &payload, const char *key, const DecodeContext &ctx)
{
    const json::JsonValue *value = json::getObjectField(payload, key);
    if (!value)
    {
        ctx.child(key).malformed("missing field");
        return std::nullopt;
    }
    return decodeCoordinate(*value, ctx.child(key));
}

std::optional<json::Number> requireNumber(const json::JsonValue &payload, const char *key, const DecodeContext &ctx)
{
    const json::JsonValue *value = json::getObjectField(payload, key);
    if (!value || !value->isNumber())
    {
        ctx.child(key).malformed("missing or non-numeric field");
        return std::nullopt;
    }
    return value->number;
}

EndpointPath stationaryAt(const Coordinate &point)
{
    EndpointPath path;
    path.points.push_back(point);
    return path;
}

} // namespace

std::optional<LaserShape> decodeSweeper(const json::JsonValue &payload, const LegacyDecodeOptions &options,
                                        const DecodeContext &ctx)
{
    auto start = requireCoordinate(payload, "start", ctx);
    auto end = requireCoordinate(payload, "end", ctx);
    auto sweepSeconds = requireNumber(payload, "sweepSeconds", ctx);
    if (!start || !end || !sweepSeconds)
    {
        return std::nullopt;
    }
    if (!(sweepSeconds->value > 0.0))
    {
        ctx.child("sweepSeconds").malformed("sweepSeconds must be positive");
        return std::nullopt;
    }

    RayShape ray;
    ray.endpoint.points = {*start, *end};
    ray.endpoint.cycleSeconds = options.roundTripCycles ? sweepSeconds->scaled(2) : *sweepSeconds;
    const double dx = end->x.value - start->x.value;
    const double dy = end->y.value - start->y.value;
    ray.initialAngle = std::atan2(dy, dx) + kPi / 2.0;
    ray.rotationSpeed = json::Number::ofDouble(0.0);
    return LaserShape{std::move(ray)};
}

std::optional<LaserShape> decodeRotor(const json::JsonValue &payload, const LegacyDecodeOptions &,
                                      const DecodeContext &ctx)
{
    auto center = requireCoordinate(payload, "center", ctx);
    auto speedDegrees = requireNumber(payload, "speedDegreesPerSecond", ctx);
    auto angleDegrees = requireNumber(payload, "initialAngleDegrees", ctx);
    if (!center || !speedDegrees || !angleDegrees)
    {
        return std::nullopt;
    }

    RayShape ray;
    ray.endpoint = stationaryAt(*center);
    ray.initialAngle = angleDegrees->value * kPi / 180.0;
    ray.rotationSpeed = json::Number::ofDouble(speedDegrees->value * kPi / 180.0);
    return LaserShape{std::move(ray)};
}

std::optional<LaserShape> decodeSegment(const json::JsonValue &payload, const LegacyDecodeOptions &,
                                        const DecodeContext &ctx)
{
    auto start = requireCoordinate(payload, "start", ctx);
    auto end = requireCoordinate(payload, "end", ctx);
    if (!start || !end)
    {
        return std::nullopt;
    }

    SegmentShape segment;
    segment.start = stationaryAt(*start);
    segment.end = stationaryAt(*end);
    return LaserShape{std::move(segment)};
}

const std::vector<LegacyDecoderEntry> &legacyDecoderTable()
{
    static const std::vector<LegacyDecoderEntry> table{
        {"sweeper", &decodeSweeper},
        {"rotor", &decodeRotor},
        {"segment", &decodeSegment},
    };
    return table;
}

const LegacyDecoderEntry *findLegacyDecoder(const std::string &tag)
{
    for (const LegacyDecoderEntry &entry : legacyDecoderTable())
    {
        if (tag == entry.tag)
        {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<LaserRecord> decodeLegacyLaser(const json::JsonValue &laser, const LegacyDecodeOptions &options,
                                             const DecodeContext &ctx)
{
    if (!laser.isObject())
    {
        ctx.malformed("laser must be an object");
        return std::nullopt;
    }

    const json::JsonValue *kind = json::getObjectField(laser, "kind");
    const DecodeContext kindCtx = ctx.child("kind");
    if (!kind || !kind->isObject())
    {
        kindCtx.malformed("kind must be an object");
        return std::nullopt;
    }
    const json::JsonValue *tag = json::getObjectField(*kind, "type");
    if (!tag || !tag->isString())
    {
        kindCtx.child("type").malformed("missing legacy kind tag");
        return std::nullopt;
    }

    const LegacyDecoderEntry *decoder = findLegacyDecoder(tag->string);
    if (!decoder)
    {
        kindCtx.child("type").report(LevelErrorKind::UnknownLegacyVariant,
                                     "unknown legacy laser kind '" + tag->string + "'");
        return std::nullopt;
    }

    LaserRecord record;
    bool ok = true;
    const json::JsonValue *id = json::getObjectField(laser, "id");
    const json::JsonValue *color = json::getObjectField(laser, "color");
    const json::JsonValue *thickness = json::getObjectField(laser, "thickness");
    if (!id || !id->isString())
    {
        ctx.child("id").malformed("missing or non-string field");
        ok = false;
    }
    if (!color || !color->isString())
    {
        ctx.child("color").malformed("missing or non-string field");
        ok = false;
    }
    if (!thickness || !thickness->isNumber())
    {
        ctx.child("thickness").malformed("missing or non-numeric field");
        ok = false;
    }

    const DecodeContext payloadCtx = kindCtx.child(decoder->tag);
    const json::JsonValue *payload = json::getObjectField(*kind, decoder->tag);
    if (!payload || !payload->isObject())
    {
        payloadCtx.malformed("missing payload for legacy kind");
        return std::nullopt;
    }
    auto shape = decoder->decode(*payload, options, payloadCtx);
    if (!shape || !ok)
    {
        return std::nullopt;
    }

    record.id = id->string;
    record.color = color->string;
    record.thickness = thickness->number;
    record.enabled = json::getBool(laser, "enabled", true);
    if (const json::JsonValue *cadence = json::getObjectField(laser, "cadence"))
    {
        if (!cadence->isNull())
        {
            record.cadence = *cadence;
        }
    }
    record.shape = std::move(*shape);
    return record;
}

} // namespace level
