#pragma once

#include "migration/MigrationStep.h"

namespace level::migration
{

class KindUnificationStep : public IMigrationStep
{
  public:
    const char *name() const override { return "unify-kinds"; }
    const char *summary() const override { return "convert sweeper/rotor/segment lasers into flat ray and segment records"; }
    MigrationStage stage() const override { return MigrationStage::KindUnification; }

    bool needsMigration(const json::JsonValue &document) const override;

  protected:
    void rewrite(json::JsonValue &document, StepResult &result) const override;
};

} // namespace level::migration
