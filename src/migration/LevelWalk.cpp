#include "migration/LevelWalk.h"

namespace level::migration
{

bool isFlatLaser(const json::JsonValue &laser)
{
    return laser.isObject() && json::hasField(laser, "type") && !json::hasField(laser, "kind");
}

bool isLegacyLaser(const json::JsonValue &laser)
{
    return laser.isObject() && json::hasField(laser, "kind");
}

bool hasUncorrectedCycles(const json::JsonValue &document)
{
    bool found = false;
    forEachRecord(document, "lasers", DecodeContext{},
                  [&](std::size_t, const json::JsonValue &laser, const DecodeContext &) {
                      if (!isFlatLaser(laser))
                      {
                          return;
                      }
                      forEachBareEndpointPath(laser, DecodeContext{},
                                              [&](const json::JsonValue &path, const DecodeContext &) {
                                                  const json::JsonValue *cycle =
                                                      json::getObjectField(path, "cycleSeconds");
                                                  found = found || (cycle && !cycle->isNull());
                                              });
                  });
    return found;
}

bool hasLedgerEntry(const json::JsonValue &document, const std::string &entry)
{
    const json::JsonValue *ledger = json::getObjectField(document, kLedgerKey);
    if (!ledger || !ledger->isArray())
    {
        return false;
    }
    for (const json::JsonValue &item : ledger->array)
    {
        if (item.isString() && item.string == entry)
        {
            return true;
        }
    }
    return false;
}

void appendLedgerEntry(json::JsonValue &document, const std::string &entry, const DecodeContext &ctx)
{
    json::JsonValue *ledger = json::findField(document, kLedgerKey);
    if (!ledger)
    {
        json::setField(document, kLedgerKey, json::makeArray({json::makeString(entry)}));
        return;
    }
    if (!ledger->isArray())
    {
        ctx.child(kLedgerKey).malformed("migration ledger must be an array");
        return;
    }
    for (const json::JsonValue &item : ledger->array)
    {
        if (!item.isString())
        {
            ctx.child(kLedgerKey).malformed("migration ledger entries must be strings");
            return;
        }
        if (item.string == entry)
        {
            return;
        }
    }
    ledger->array.push_back(json::makeString(entry));
}

} // namespace level::migration
