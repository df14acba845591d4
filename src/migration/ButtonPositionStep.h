#pragma once

#include "migration/MigrationStep.h"

namespace level::migration
{

class ButtonPositionStep : public IMigrationStep
{
  public:
    const char *name() const override { return "migrate-buttons"; }
    const char *summary() const override { return "move button position into a stationary endpoint path"; }
    MigrationStage stage() const override { return MigrationStage::ButtonPosition; }

    bool needsMigration(const json::JsonValue &document) const override;

  protected:
    void rewrite(json::JsonValue &document, StepResult &result) const override;
};

} // namespace level::migration
