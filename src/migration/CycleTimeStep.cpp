#include "migration/CycleTimeStep.h"

#include "migration/LevelWalk.h"

namespace level::migration
{

bool CycleTimeStep::needsMigration(const json::JsonValue &document) const
{
    return !hasLedgerEntry(document, kCycleLedgerEntry) && hasUncorrectedCycles(document);
}

void CycleTimeStep::rewrite(json::JsonValue &document, StepResult &result) const
{
    if (!needsMigration(document))
    {
        return;
    }

    DecodeContext ctx;
    ctx.errors = &result.errors;
    forEachRecord(document, "lasers", ctx, [&](std::size_t, json::JsonValue &laser, const DecodeContext &laserCtx) {
        if (!isFlatLaser(laser))
        {
            return;
        }
        forEachBareEndpointPath(laser, laserCtx, [&](json::JsonValue &path, const DecodeContext &pathCtx) {
            json::JsonValue *cycle = json::findField(path, "cycleSeconds");
            if (!cycle || cycle->isNull())
            {
                return;
            }
            if (!cycle->isNumber())
            {
                pathCtx.child("cycleSeconds").malformed("cycleSeconds must be a number or null");
                return;
            }
            cycle->number = cycle->number.scaled(2);
        });
    });

    appendLedgerEntry(document, kCycleLedgerEntry, ctx);
}

} // namespace level::migration
