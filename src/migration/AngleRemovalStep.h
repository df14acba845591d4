#pragma once

#include "migration/MigrationStep.h"

namespace level::migration
{

class AngleRemovalStep : public IMigrationStep
{
  public:
    const char *name() const override { return "remove-angles"; }
    const char *summary() const override { return "drop the stored initialAngle from ray lasers"; }
    MigrationStage stage() const override { return MigrationStage::AngleRemoval; }

    bool needsMigration(const json::JsonValue &document) const override;

  protected:
    void rewrite(json::JsonValue &document, StepResult &result) const override;
};

} // namespace level::migration
