#pragma once

#include <optional>

#include "json/JsonUtils.h"
#include "level/LevelError.h"
#include "level/LevelTypes.h"

namespace level
{

enum class LaserEncoding
{
    // Flat record as first written by kind unification: `endpoint` or
    // `startEndpoint`/`endEndpoint`, `initialT` on every path, stored angle.
    Unified,
    // `endpoints` array, sparse `t`, no stored angle.
    Canonical
};

json::JsonValue encodeLaser(const LaserRecord &record, LaserEncoding encoding);

// Reads a canonical flat record (`type` + `endpoints`).
std::optional<LaserRecord> decodeLaser(const json::JsonValue &value, const DecodeContext &ctx);

} // namespace level
