#include "migration/PhaseRenameStep.h"

#include "migration/LevelWalk.h"

namespace level::migration
{

namespace
{

bool pathNeedsRename(const json::JsonValue &path)
{
    if (json::hasField(path, "initialT"))
    {
        return true;
    }
    const json::JsonValue *t = json::getObjectField(path, "t");
    return t && (t->isNull() || (t->isNumber() && t->number.isZero()));
}

void renamePhase(json::JsonValue &path, const DecodeContext &ctx)
{
    const bool hasInitialT = json::hasField(path, "initialT");
    if (hasInitialT && json::hasField(path, "t"))
    {
        ctx.malformed("endpoint path has both t and initialT");
        return;
    }

    const char *key = hasInitialT ? "initialT" : "t";
    const json::JsonValue *phase = json::getObjectField(path, key);
    if (!phase)
    {
        return;
    }
    if (!phase->isNull() && !phase->isNumber())
    {
        ctx.child(key).malformed("phase must be a number or null");
        return;
    }

    const json::JsonValue value = *phase;
    const bool keep = value.isNumber() && !value.number.isZero();
    if (hasInitialT)
    {
        json::eraseField(path, "initialT");
        if (keep)
        {
            json::setField(path, "t", value);
        }
    }
    else if (!keep)
    {
        json::eraseField(path, "t");
    }
}

template <typename Value, typename Fn>
void forEachRecordPath(Value &document, const DecodeContext &ctx, Fn &&fn)
{
    const auto visit = [&](std::size_t, Value &record, const DecodeContext &recordCtx) {
        forEachEndpointPath(record, recordCtx, fn);
    };
    forEachRecord(document, "lasers", ctx, visit);
    forEachRecord(document, "buttons", ctx, visit);
}

} // namespace

bool PhaseRenameStep::needsMigration(const json::JsonValue &document) const
{
    bool needed = false;
    forEachRecordPath(document, DecodeContext{}, [&](const json::JsonValue &path, const DecodeContext &) {
        needed = needed || pathNeedsRename(path);
    });
    return needed;
}

void PhaseRenameStep::rewrite(json::JsonValue &document, StepResult &result) const
{
    DecodeContext ctx;
    ctx.errors = &result.errors;
    forEachRecordPath(document, ctx, [](json::JsonValue &path, const DecodeContext &pathCtx) {
        renamePhase(path, pathCtx);
    });
}

} // namespace level::migration
