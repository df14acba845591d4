#include "migration/KindUnificationStep.h"

#include "level/LaserRecord.h"
#include "level/LegacyDecoders.h"
#include "migration/LevelWalk.h"

namespace level::migration
{

bool KindUnificationStep::needsMigration(const json::JsonValue &document) const
{
    bool needed = false;
    forEachRecord(document, "lasers", DecodeContext{},
                  [&](std::size_t, const json::JsonValue &laser, const DecodeContext &) {
                      needed = needed || isLegacyLaser(laser);
                  });
    return needed;
}

void KindUnificationStep::rewrite(json::JsonValue &document, StepResult &result) const
{
    DecodeContext ctx;
    ctx.errors = &result.errors;

    // Sweeper cycles must agree with the lasers already in the file: if those
    // still hold one-way times, write one-way times too and let the cycle
    // correction double them all later.
    const bool stamped = hasLedgerEntry(document, kCycleLedgerEntry);
    LegacyDecodeOptions options;
    options.roundTripCycles = stamped || !hasUncorrectedCycles(document);

    bool convertedMoving = false;
    forEachRecord(document, "lasers", ctx, [&](std::size_t, json::JsonValue &laser, const DecodeContext &laserCtx) {
        if (!isLegacyLaser(laser))
        {
            return;
        }
        auto record = decodeLegacyLaser(laser, options, laserCtx);
        if (!record)
        {
            return;
        }
        if (const auto *ray = std::get_if<RayShape>(&record->shape))
        {
            convertedMoving = convertedMoving || !ray->endpoint.isStationary();
        }
        laser = encodeLaser(*record, LaserEncoding::Unified);
    });

    if (convertedMoving && options.roundTripCycles && !stamped)
    {
        appendLedgerEntry(document, kCycleLedgerEntry, ctx);
    }
}

} // namespace level::migration
