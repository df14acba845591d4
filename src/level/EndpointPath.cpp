#include "level/EndpointPath.h"

#include <cmath>
#include <vector>

namespace level
{

namespace
{

constexpr double kPi = 3.14159265358979323846;

double easeInOut(double h)
{
    if (h < 0.5)
    {
        return 2.0 * h * h;
    }
    const double tail = -2.0 * h + 2.0;
    return 1.0 - tail * tail / 2.0;
}

bool samePoint(const Coordinate &a, const Coordinate &b)
{
    return a.x.value == b.x.value && a.y.value == b.y.value;
}

Point2 toPoint(const Coordinate &c)
{
    return Point2{c.x.value, c.y.value};
}

std::optional<json::Number> decodeOptionalNumber(const json::JsonValue &obj, const char *key, const DecodeContext &ctx, bool &ok)
{
    const json::JsonValue *value = json::getObjectField(obj, key);
    if (!value || value->isNull())
    {
        return std::nullopt;
    }
    if (!value->isNumber())
    {
        ctx.child(key).malformed("expected a number or null");
        ok = false;
        return std::nullopt;
    }
    return value->number;
}

} // namespace

std::optional<Coordinate> decodeCoordinate(const json::JsonValue &value, const DecodeContext &ctx)
{
    if (!value.isObject())
    {
        ctx.malformed("coordinate must be an object with x and y");
        return std::nullopt;
    }
    const json::JsonValue *x = json::getObjectField(value, "x");
    const json::JsonValue *y = json::getObjectField(value, "y");
    if (!x || !x->isNumber() || !y || !y->isNumber())
    {
        ctx.malformed("coordinate needs numeric x and y");
        return std::nullopt;
    }
    return Coordinate{x->number, y->number};
}

json::JsonValue encodeCoordinate(const Coordinate &coordinate)
{
    json::JsonValue obj = json::makeObject();
    json::setField(obj, "x", json::makeNumber(coordinate.x));
    json::setField(obj, "y", json::makeNumber(coordinate.y));
    return obj;
}

std::optional<EndpointPath> decodeEndpointPath(const json::JsonValue &value, const DecodeContext &ctx)
{
    if (!value.isObject())
    {
        ctx.malformed("endpoint path must be an object");
        return std::nullopt;
    }

    const json::JsonValue *points = json::getObjectField(value, "points");
    if (!points || !points->isArray() || points->array.empty())
    {
        ctx.child("points").malformed("endpoint path needs at least one point");
        return std::nullopt;
    }

    bool ok = true;
    EndpointPath path;
    const DecodeContext pointsCtx = ctx.child("points");
    for (std::size_t i = 0; i < points->array.size(); ++i)
    {
        auto coordinate = decodeCoordinate(points->array[i], pointsCtx.element(i));
        if (!coordinate)
        {
            ok = false;
            continue;
        }
        path.points.push_back(*coordinate);
    }

    path.cycleSeconds = decodeOptionalNumber(value, "cycleSeconds", ctx, ok);

    const bool hasT = json::hasField(value, "t");
    const bool hasInitialT = json::hasField(value, "initialT");
    if (hasT && hasInitialT)
    {
        ctx.malformed("endpoint path has both t and initialT");
        ok = false;
    }
    else
    {
        path.phase = decodeOptionalNumber(value, hasT ? "t" : "initialT", ctx, ok);
    }

    if (!ok)
    {
        return std::nullopt;
    }

    if (path.cycleSeconds)
    {
        if (!(path.cycleSeconds->value > 0.0))
        {
            ctx.child("cycleSeconds").malformed("cycleSeconds must be positive");
            return std::nullopt;
        }
        if (path.points.size() < 2)
        {
            ctx.malformed("a moving endpoint path needs at least two points");
            return std::nullopt;
        }
        return path;
    }

    for (std::size_t i = 1; i < path.points.size(); ++i)
    {
        if (!samePoint(path.points[0], path.points[i]))
        {
            ctx.malformed("a stationary endpoint path has distinct points");
            return std::nullopt;
        }
    }
    path.points.resize(1);
    return path;
}

json::JsonValue encodeEndpointPath(const EndpointPath &path, PhaseKey phaseKey)
{
    json::JsonValue obj = json::makeObject();

    std::vector<json::JsonValue> points;
    points.reserve(path.points.size());
    for (const Coordinate &point : path.points)
    {
        points.push_back(encodeCoordinate(point));
    }
    json::setField(obj, "points", json::makeArray(std::move(points)));
    json::setField(obj, "cycleSeconds", path.cycleSeconds ? json::makeNumber(*path.cycleSeconds) : json::makeNull());

    if (phaseKey == PhaseKey::InitialT)
    {
        json::setField(obj, "initialT", json::makeNumber(path.phase ? *path.phase : json::Number::ofDouble(0.0)));
    }
    else if (path.phase && !path.phase->isZero())
    {
        json::setField(obj, "t", json::makeNumber(*path.phase));
    }
    return obj;
}

Point2 positionAt(const EndpointPath &path, double seconds)
{
    if (path.points.empty())
    {
        return Point2{};
    }
    if (path.isStationary() || path.points.size() < 2 || !(path.cycleSeconds->value > 0.0))
    {
        return toPoint(path.points.front());
    }

    const double cycle = path.cycleSeconds->value;
    double u = std::fmod(seconds + path.phaseSeconds(), cycle) / cycle;
    if (u < 0.0)
    {
        u += 1.0;
    }
    const double progress = easeInOut(u < 0.5 ? u * 2.0 : 2.0 - u * 2.0);

    std::vector<double> legs;
    legs.reserve(path.points.size() - 1);
    double total = 0.0;
    for (std::size_t i = 1; i < path.points.size(); ++i)
    {
        const Point2 a = toPoint(path.points[i - 1]);
        const Point2 b = toPoint(path.points[i]);
        const double length = std::hypot(b.x - a.x, b.y - a.y);
        legs.push_back(length);
        total += length;
    }
    if (total <= 0.0)
    {
        return toPoint(path.points.front());
    }

    double remaining = progress * total;
    for (std::size_t i = 0; i < legs.size(); ++i)
    {
        if (remaining <= legs[i] || i + 1 == legs.size())
        {
            const Point2 a = toPoint(path.points[i]);
            const Point2 b = toPoint(path.points[i + 1]);
            const double f = legs[i] > 0.0 ? std::fmin(remaining / legs[i], 1.0) : 0.0;
            return Point2{a.x + (b.x - a.x) * f, a.y + (b.y - a.y) * f};
        }
        remaining -= legs[i];
    }
    return toPoint(path.points.back());
}

double derivedRayAngle(const EndpointPath &path)
{
    if (path.isStationary() || path.points.size() < 2)
    {
        return 0.0;
    }
    const Point2 a = toPoint(path.points[0]);
    const Point2 b = toPoint(path.points[1]);
    return std::atan2(b.y - a.y, b.x - a.x) + kPi / 2.0;
}

} // namespace level
