#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "json/JsonUtils.h"

namespace level
{

struct Coordinate
{
    json::Number x;
    json::Number y;
};

// Where a point is at time t: stationary, or walking a polyline back and forth.
struct EndpointPath
{
    std::vector<Coordinate> points;
    // Full round trip across all points and back; nullopt means stationary.
    std::optional<json::Number> cycleSeconds;
    // Phase offset in seconds ("t", formerly "initialT"); nullopt means 0.
    std::optional<json::Number> phase;

    bool isStationary() const { return !cycleSeconds.has_value(); }

    double phaseSeconds() const { return phase ? phase->value : 0.0; }
};

enum class LaserVariant : std::uint8_t
{
    Ray = 0,
    Segment = 1
};

inline const char *laserVariantToString(LaserVariant variant)
{
    switch (variant)
    {
    case LaserVariant::Ray:
        return "ray";
    case LaserVariant::Segment:
        return "segment";
    }
    return "ray";
}

std::optional<LaserVariant> laserVariantFromString(const std::string &id);

struct RayShape
{
    EndpointPath endpoint;
    // Radians at phase 0. Only present on records that still store it.
    std::optional<double> initialAngle;
    // Radians per second, signed; 0 means the ray does not rotate.
    json::Number rotationSpeed;
};

struct SegmentShape
{
    EndpointPath start;
    EndpointPath end;
};

struct LaserRecord
{
    std::string id;
    std::string color;
    json::Number thickness;
    bool enabled = true;
    // On/off timing; opaque here and passed through unchanged.
    std::optional<json::JsonValue> cadence;
    std::variant<RayShape, SegmentShape> shape;

    LaserVariant variant() const
    {
        return std::holds_alternative<RayShape>(shape) ? LaserVariant::Ray : LaserVariant::Segment;
    }

    std::size_t endpointCount() const { return variant() == LaserVariant::Ray ? 1 : 2; }
};

struct Button
{
    std::string id;
    std::vector<EndpointPath> endpoints;
    std::size_t hitAreaCount = 0;
    // Laser ids referenced by the button's effect actions.
    std::vector<std::string> effectTargets;
};

struct Level
{
    std::string id;
    std::string title;
    std::string description;
    std::vector<Button> buttons;
    std::vector<LaserRecord> lasers;
    std::vector<std::string> unlocks;
};

} // namespace level
