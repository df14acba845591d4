#pragma once

#include "migration/MigrationStep.h"

namespace level::migration
{

class EndpointArrayStep : public IMigrationStep
{
  public:
    const char *name() const override { return "generalize-endpoints"; }
    const char *summary() const override { return "store endpoints in an endpoints array and collapse repeated stationary points"; }
    MigrationStage stage() const override { return MigrationStage::EndpointArray; }

    bool needsMigration(const json::JsonValue &document) const override;

  protected:
    void rewrite(json::JsonValue &document, StepResult &result) const override;
};

} // namespace level::migration
