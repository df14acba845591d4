#pragma once

#include <optional>
#include <vector>

#include "json/JsonUtils.h"
#include "level/LevelError.h"
#include "level/LevelTypes.h"

namespace level
{

struct LevelValidationResult
{
    bool valid = false;
    std::optional<Level> level;
    std::vector<LevelError> errors;
};

std::optional<Button> decodeButton(const json::JsonValue &value, const DecodeContext &ctx);

// Decodes a canonical level document; every shape problem found is reported.
std::optional<Level> decodeLevel(const json::JsonValue &document, std::vector<LevelError> &errors);

// Decodes the document and checks the cross-record rules a playable level
// needs: unique ids, buttons with endpoints and hit areas, effects that only
// target lasers defined in the same level.
LevelValidationResult validateLevel(const json::JsonValue &document);

} // namespace level
