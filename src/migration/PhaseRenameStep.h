#pragma once

#include "migration/MigrationStep.h"

namespace level::migration
{

class PhaseRenameStep : public IMigrationStep
{
  public:
    const char *name() const override { return "rename-phase"; }
    const char *summary() const override { return "rename initialT to t and drop zero phases"; }
    MigrationStage stage() const override { return MigrationStage::PhaseRename; }

    bool needsMigration(const json::JsonValue &document) const override;

  protected:
    void rewrite(json::JsonValue &document, StepResult &result) const override;
};

} // namespace level::migration
