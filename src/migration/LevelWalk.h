#pragma once

#include <cstddef>
#include <string>

#include "json/JsonUtils.h"
#include "level/LevelError.h"

namespace level::migration
{

inline constexpr const char *kLedgerKey = "appliedMigrations";
// Stamped only when a moving sweeper cycle was converted.
inline constexpr const char *kCycleLedgerEntry = "fix-cycle-times";

inline bool isEndpointKey(const std::string &key)
{
    return key == "endpoint" || key == "startEndpoint" || key == "endEndpoint";
}

// Calls fn(index, record, ctx) for every object in document[arrayKey].
template <typename Value, typename Fn>
void forEachRecord(Value &document, const char *arrayKey, const DecodeContext &ctx, Fn &&fn)
{
    if (!document.isObject())
    {
        return;
    }
    for (auto &member : document.object)
    {
        if (member.first != arrayKey || !member.second.isArray())
        {
            continue;
        }
        const DecodeContext arrayCtx = ctx.child(arrayKey);
        for (std::size_t i = 0; i < member.second.array.size(); ++i)
        {
            auto &record = member.second.array[i];
            if (record.isObject())
            {
                fn(i, record, arrayCtx.element(i));
            }
        }
    }
}

// Calls fn(path, ctx) for every endpoint path object of a laser or button, in
// any of the layouts the schema has used: `endpoint`, `startEndpoint` +
// `endEndpoint`, or the `endpoints` array.
template <typename Value, typename Fn>
void forEachEndpointPath(Value &record, const DecodeContext &ctx, Fn &&fn)
{
    if (!record.isObject())
    {
        return;
    }
    for (auto &member : record.object)
    {
        if (isEndpointKey(member.first))
        {
            if (member.second.isObject())
            {
                fn(member.second, ctx.child(member.first));
            }
        }
        else if (member.first == "endpoints" && member.second.isArray())
        {
            const DecodeContext arrayCtx = ctx.child("endpoints");
            for (std::size_t i = 0; i < member.second.array.size(); ++i)
            {
                auto &path = member.second.array[i];
                if (path.isObject())
                {
                    fn(path, arrayCtx.element(i));
                }
            }
        }
    }
}

// Like forEachEndpointPath, restricted to the single-field layouts used before
// the endpoints array existed.
template <typename Value, typename Fn>
void forEachBareEndpointPath(Value &record, const DecodeContext &ctx, Fn &&fn)
{
    if (!record.isObject())
    {
        return;
    }
    for (auto &member : record.object)
    {
        if (isEndpointKey(member.first) && member.second.isObject())
        {
            fn(member.second, ctx.child(member.first));
        }
    }
}

// A laser already rewritten into the flat Ray/Segment shape.
bool isFlatLaser(const json::JsonValue &laser);

// A laser still carrying the nested pre-unification `kind` object.
bool isLegacyLaser(const json::JsonValue &laser);

// True when some flat laser still in the single-field layout has a path with a
// non-null cycleSeconds. Those are the records whose cycle may be one-way; the
// endpoints array layout only came after cycles were corrected.
bool hasUncorrectedCycles(const json::JsonValue &document);

bool hasLedgerEntry(const json::JsonValue &document, const std::string &entry);

// Appends entry to the document's ledger array, creating it at the end of the
// document when absent. Reports a ledger that is not an array of strings.
void appendLedgerEntry(json::JsonValue &document, const std::string &entry, const DecodeContext &ctx);

} // namespace level::migration
