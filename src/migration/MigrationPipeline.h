#pragma once

#include <memory>
#include <string>
#include <vector>

#include "migration/MigrationStep.h"

namespace level::migration
{

struct StepReport
{
    std::string stepName;
    StepResult result;
};

struct PipelineResult
{
    std::vector<StepReport> steps;
    bool changed = false;
    bool failed = false;

    std::vector<LevelError> errors() const;
    std::vector<std::string> warnings() const;
};

class MigrationPipeline
{
  public:
    MigrationPipeline() = default;
    MigrationPipeline(MigrationPipeline &&) = default;
    MigrationPipeline &operator=(MigrationPipeline &&) = default;

    // Steps must be registered in stage order; registering an earlier stage
    // after a later one throws std::logic_error.
    void registerStep(std::unique_ptr<IMigrationStep> step);

    const std::vector<MigrationStage> &stageOrder() const { return m_stageOrder; }
    std::size_t size() const { return m_steps.size(); }
    bool empty() const { return m_steps.empty(); }
    const IMigrationStep &step(std::size_t index) const { return *m_steps[index]; }

    // Runs every step on a working copy; the document is replaced only when
    // every step succeeded and at least one changed something.
    PipelineResult apply(json::JsonValue &document) const;

  private:
    std::vector<std::unique_ptr<IMigrationStep>> m_steps;
    std::vector<MigrationStage> m_stageOrder;
};

// Command names of every step, in stage order.
const std::vector<std::string> &stepCommands();

std::unique_ptr<IMigrationStep> makeStep(const std::string &command);

MigrationPipeline buildFullPipeline();

} // namespace level::migration
