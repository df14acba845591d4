#include "migration/AngleRemovalStep.h"

#include <cmath>
#include <cstdio>
#include <optional>

#include "level/EndpointPath.h"
#include "migration/LevelWalk.h"

namespace level::migration
{

namespace
{

constexpr double kTwoPi = 6.28318530717958647692;
constexpr double kAngleTolerance = 1e-6;

bool storesAngle(const json::JsonValue &laser)
{
    return json::getString(laser, "type", "") == "ray" && json::hasField(laser, "initialAngle");
}

// The ray's pivot path in whichever layout the record is in.
std::optional<EndpointPath> pivotPath(const json::JsonValue &laser)
{
    const json::JsonValue *source = json::getObjectField(laser, "endpoint");
    if (!source)
    {
        const json::JsonValue *endpoints = json::getObjectField(laser, "endpoints");
        if (endpoints && endpoints->isArray() && endpoints->array.size() == 1)
        {
            source = &endpoints->array.front();
        }
    }
    if (!source)
    {
        return std::nullopt;
    }
    return decodeEndpointPath(*source, DecodeContext{});
}

double angleDistance(double a, double b)
{
    double d = std::fmod(a - b, kTwoPi);
    if (d > kTwoPi / 2.0)
    {
        d -= kTwoPi;
    }
    else if (d < -kTwoPi / 2.0)
    {
        d += kTwoPi;
    }
    return std::fabs(d);
}

} // namespace

bool AngleRemovalStep::needsMigration(const json::JsonValue &document) const
{
    bool needed = false;
    forEachRecord(document, "lasers", DecodeContext{},
                  [&](std::size_t, const json::JsonValue &laser, const DecodeContext &) {
                      needed = needed || storesAngle(laser);
                  });
    return needed;
}

void AngleRemovalStep::rewrite(json::JsonValue &document, StepResult &result) const
{
    forEachRecord(document, "lasers", DecodeContext{},
                  [&](std::size_t, json::JsonValue &laser, const DecodeContext &laserCtx) {
                      if (!storesAngle(laser))
                      {
                          return;
                      }
                      const json::JsonValue *stored = json::getObjectField(laser, "initialAngle");
                      const auto path = pivotPath(laser);
                      if (stored->isNumber() && path)
                      {
                          const double derived = derivedRayAngle(*path);
                          if (angleDistance(stored->number.value, derived) > kAngleTolerance)
                          {
                              char buffer[160];
                              std::snprintf(buffer, sizeof(buffer),
                                            "%s: stored initialAngle %.6f differs from derived angle %.6f",
                                            laserCtx.location.c_str(), stored->number.value, derived);
                              result.warnings.emplace_back(buffer);
                          }
                      }
                      json::eraseField(laser, "initialAngle");
                  });
}

} // namespace level::migration
