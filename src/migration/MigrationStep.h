#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "json/JsonUtils.h"
#include "level/LevelError.h"

namespace level::migration
{

// Historical order of the schema revisions. A pipeline runs steps in this order.
enum class MigrationStage : std::uint8_t
{
    ButtonPosition = 0,
    KindUnification,
    CycleTime,
    EndpointArray,
    AngleRemoval,
    PhaseRename,
};

enum class StepOutcome
{
    Unchanged,
    Changed,
    Failed
};

inline const char *stepOutcomeToString(StepOutcome outcome)
{
    switch (outcome)
    {
    case StepOutcome::Unchanged:
        return "unchanged";
    case StepOutcome::Changed:
        return "changed";
    case StepOutcome::Failed:
        return "failed";
    }
    return "unchanged";
}

struct StepResult
{
    StepOutcome outcome = StepOutcome::Unchanged;
    std::vector<LevelError> errors;
    std::vector<std::string> warnings;

    bool failed() const { return outcome == StepOutcome::Failed; }
    bool changed() const { return outcome == StepOutcome::Changed; }
};

class IMigrationStep
{
  public:
    virtual ~IMigrationStep() = default;

    // Command name, e.g. "rename-phase".
    virtual const char *name() const = 0;
    virtual const char *summary() const = 0;
    virtual MigrationStage stage() const = 0;

    // True when the document still holds something this step rewrites (or a
    // conflict it must report).
    virtual bool needsMigration(const json::JsonValue &document) const = 0;

    // Rewrites a copy of the document and commits it only when no error was
    // reported. Unchanged means the document compares equal afterwards.
    StepResult apply(json::JsonValue &document) const;

  protected:
    virtual void rewrite(json::JsonValue &document, StepResult &result) const = 0;
};

} // namespace level::migration
