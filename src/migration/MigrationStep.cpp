#include "migration/MigrationStep.h"

#include <utility>

namespace level::migration
{

StepResult IMigrationStep::apply(json::JsonValue &document) const
{
    StepResult result;
    if (!document.isObject())
    {
        result.outcome = StepOutcome::Failed;
        result.errors.push_back({LevelErrorKind::MalformedDocument, "", "level document must be an object"});
        return result;
    }

    json::JsonValue working = document;
    rewrite(working, result);
    if (!result.errors.empty())
    {
        result.outcome = StepOutcome::Failed;
        return result;
    }
    if (working == document)
    {
        result.outcome = StepOutcome::Unchanged;
        return result;
    }
    document = std::move(working);
    result.outcome = StepOutcome::Changed;
    return result;
}

} // namespace level::migration
