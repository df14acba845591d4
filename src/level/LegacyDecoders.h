#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "json/JsonUtils.h"
#include "level/LevelError.h"
#include "level/LevelTypes.h"

namespace level
{

using LaserShape = std::variant<RayShape, SegmentShape>;

struct LegacyDecodeOptions
{
    // Write sweeper cycles as full round trips (2 x sweepSeconds). When false the
    // one-way time is kept so a later cycle correction doubles it with the rest.
    bool roundTripCycles = true;
};

// Decodes the payload stored under kind[<tag>] into a canonical shape.
using LegacyShapeDecoder = std::optional<LaserShape> (*)(const json::JsonValue &payload,
                                                         const LegacyDecodeOptions &options,
                                                         const DecodeContext &ctx);

struct LegacyDecoderEntry
{
    const char *tag;
    LegacyShapeDecoder decode;
};

const std::vector<LegacyDecoderEntry> &legacyDecoderTable();

const LegacyDecoderEntry *findLegacyDecoder(const std::string &tag);

std::optional<LaserShape> decodeSweeper(const json::JsonValue &payload, const LegacyDecodeOptions &options,
                                        const DecodeContext &ctx);
std::optional<LaserShape> decodeRotor(const json::JsonValue &payload, const LegacyDecodeOptions &options,
                                      const DecodeContext &ctx);
std::optional<LaserShape> decodeSegment(const json::JsonValue &payload, const LegacyDecodeOptions &options,
                                        const DecodeContext &ctx);

// Converts a laser carrying a nested `kind` object into a flat record. Fields
// other than id, color, thickness, enabled and cadence are dropped. An
// unrecognized kind tag is reported as UnknownLegacyVariant.
std::optional<LaserRecord> decodeLegacyLaser(const json::JsonValue &laser, const LegacyDecodeOptions &options,
                                             const DecodeContext &ctx);

} // namespace level
