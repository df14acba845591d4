#pragma once

#include <optional>

#include "json/JsonUtils.h"
#include "level/LevelError.h"
#include "level/LevelTypes.h"

namespace level
{

// Which key an encoded path carries its phase under.
enum class PhaseKey
{
    // "initialT", always written (0.0 when the path has no phase).
    InitialT,
    // "t", written only when the phase is non-zero.
    SparseT
};

struct Point2
{
    double x = 0.0;
    double y = 0.0;
};

std::optional<Coordinate> decodeCoordinate(const json::JsonValue &value, const DecodeContext &ctx);

json::JsonValue encodeCoordinate(const Coordinate &coordinate);

// Reads `{points, cycleSeconds, t | initialT}`. Redundant duplicate points of a
// stationary path collapse to one; anything else out of shape is reported to
// ctx and yields nullopt.
std::optional<EndpointPath> decodeEndpointPath(const json::JsonValue &value, const DecodeContext &ctx);

json::JsonValue encodeEndpointPath(const EndpointPath &path, PhaseKey phaseKey);

// Position of the path at `seconds` after level load. Moving paths ease along
// the polyline to its last point during the first half of the cycle and back
// during the second half.
Point2 positionAt(const EndpointPath &path, double seconds);

// Direction a ray points when it stores no angle: perpendicular to the first
// leg of a moving path, 0 for a stationary one.
double derivedRayAngle(const EndpointPath &path);

} // namespace level
