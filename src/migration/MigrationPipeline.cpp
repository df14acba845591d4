#include "migration/MigrationPipeline.h"

#include <stdexcept>
#include <utility>

#include "migration/AngleRemovalStep.h"
#include "migration/ButtonPositionStep.h"
#include "migration/CycleTimeStep.h"
#include "migration/EndpointArrayStep.h"
#include "migration/KindUnificationStep.h"
#include "migration/PhaseRenameStep.h"

namespace level::migration
{

std::vector<LevelError> PipelineResult::errors() const
{
    std::vector<LevelError> all;
    for (const StepReport &report : steps)
    {
        all.insert(all.end(), report.result.errors.begin(), report.result.errors.end());
    }
    return all;
}

std::vector<std::string> PipelineResult::warnings() const
{
    std::vector<std::string> all;
    for (const StepReport &report : steps)
    {
        for (const std::string &warning : report.result.warnings)
        {
            all.push_back(report.stepName + ": " + warning);
        }
    }
    return all;
}

void MigrationPipeline::registerStep(std::unique_ptr<IMigrationStep> step)
{
    if (!step)
    {
        return;
    }
    const MigrationStage stage = step->stage();
    if (!m_stageOrder.empty())
    {
        const MigrationStage lastStage = m_stageOrder.back();
        if (static_cast<std::uint8_t>(stage) < static_cast<std::uint8_t>(lastStage))
        {
            throw std::logic_error("MigrationPipeline::registerStep stage order violation");
        }
    }
    m_stageOrder.push_back(stage);
    m_steps.push_back(std::move(step));
}

PipelineResult MigrationPipeline::apply(json::JsonValue &document) const
{
    PipelineResult result;
    json::JsonValue working = document;
    for (const auto &step : m_steps)
    {
        StepReport report;
        report.stepName = step->name();
        report.result = step->apply(working);
        result.changed = result.changed || report.result.changed();
        const bool failed = report.result.failed();
        result.steps.push_back(std::move(report));
        if (failed)
        {
            result.failed = true;
            result.changed = false;
            return result;
        }
    }
    if (result.changed)
    {
        document = std::move(working);
    }
    return result;
}

const std::vector<std::string> &stepCommands()
{
    static const std::vector<std::string> commands{
        "migrate-buttons", "unify-kinds", "fix-cycle-times", "generalize-endpoints", "remove-angles", "rename-phase",
    };
    return commands;
}

std::unique_ptr<IMigrationStep> makeStep(const std::string &command)
{
    if (command == "migrate-buttons")
    {
        return std::make_unique<ButtonPositionStep>();
    }
    if (command == "unify-kinds")
    {
        return std::make_unique<KindUnificationStep>();
    }
    if (command == "fix-cycle-times")
    {
        return std::make_unique<CycleTimeStep>();
    }
    if (command == "generalize-endpoints")
    {
        return std::make_unique<EndpointArrayStep>();
    }
    if (command == "remove-angles")
    {
        return std::make_unique<AngleRemovalStep>();
    }
    if (command == "rename-phase")
    {
        return std::make_unique<PhaseRenameStep>();
    }
    return nullptr;
}

MigrationPipeline buildFullPipeline()
{
    MigrationPipeline pipeline;
    for (const std::string &command : stepCommands())
    {
        pipeline.registerStep(makeStep(command));
    }
    return pipeline;
}

} // namespace level::migration
