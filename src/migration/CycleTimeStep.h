#pragma once

#include "migration/MigrationStep.h"

namespace level::migration
{

class CycleTimeStep : public IMigrationStep
{
  public:
    const char *name() const override { return "fix-cycle-times"; }
    const char *summary() const override { return "double one-way cycleSeconds into full round trips"; }
    MigrationStage stage() const override { return MigrationStage::CycleTime; }

    bool needsMigration(const json::JsonValue &document) const override;

  protected:
    void rewrite(json::JsonValue &document, StepResult &result) const override;
};

} // namespace level::migration
