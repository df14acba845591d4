#include "TestSupport.h"

#include "json/JsonWriter.h"
#include "migration/LevelWalk.h"
#include "migration/MigrationPipeline.h"

#include <cstdint>
#include <memory>
#include <string>

using testing_support::assertTrue;
using testing_support::parseFixture;

namespace
{

using level::migration::StepOutcome;
using level::migration::StepResult;

StepResult runStep(const std::string &command, json::JsonValue &document)
{
    const auto step = level::migration::makeStep(command);
    return step->apply(document);
}

const json::JsonValue *laserAt(const json::JsonValue &document, std::size_t index)
{
    const json::JsonValue *lasers = json::getObjectField(document, "lasers");
    return lasers && index < lasers->array.size() ? &lasers->array[index] : nullptr;
}

const json::JsonValue *buttonAt(const json::JsonValue &document, std::size_t index)
{
    const json::JsonValue *buttons = json::getObjectField(document, "buttons");
    return buttons && index < buttons->array.size() ? &buttons->array[index] : nullptr;
}

bool cycleEquals(const json::JsonValue *path, std::int64_t expected)
{
    const json::JsonValue *cycle = path ? json::getObjectField(*path, "cycleSeconds") : nullptr;
    return cycle && cycle->isNumber() && cycle->number.integral && cycle->number.integer == expected;
}

// A second pass reports Unchanged and leaves the serialized document as it was.
bool secondPassIsNoOp(const std::string &command, json::JsonValue &document, const std::string &label)
{
    const std::string before = json::writeJson(document);
    const StepResult again = runStep(command, document);
    bool success = assertTrue(again.outcome == StepOutcome::Unchanged, label + ": second pass unchanged");
    success &= testing_support::assertEqualText(json::writeJson(document), before, label + ": second pass output");
    return success;
}

bool testButtonPosition()
{
    bool success = true;
    json::JsonValue doc = parseFixture(R"({"buttons": [{"id": "b1", "position": {"x": 2, "y": 3}, "hitAreas": []}]})");
    const StepResult result = runStep("migrate-buttons", doc);
    success &= assertTrue(result.outcome == StepOutcome::Changed, "button position converted");

    const json::JsonValue *button = buttonAt(doc, 0);
    success &= assertTrue(button && !json::hasField(*button, "position"), "position removed");
    success &= assertTrue(button && button->object.back().first == "endpoint", "endpoint appended last");
    const json::JsonValue *endpoint = button ? json::getObjectField(*button, "endpoint") : nullptr;
    const json::JsonValue *points = endpoint ? json::getObjectField(*endpoint, "points") : nullptr;
    success &= assertTrue(points && points->array.size() == 1 && json::getInt(points->array[0], "x", 0) == 2,
                          "position becomes the only point");
    const json::JsonValue *cycle = endpoint ? json::getObjectField(*endpoint, "cycleSeconds") : nullptr;
    success &= assertTrue(cycle && cycle->isNull(), "button endpoint is stationary");
    success &= assertTrue(endpoint && !json::hasField(*endpoint, "t"), "no phase written");

    success &= assertTrue(runStep("migrate-buttons", doc).outcome == StepOutcome::Unchanged,
                          "second pass leaves the button alone");

    json::JsonValue bad = parseFixture(R"({"buttons": [{"id": "b1", "position": [2, 3]}]})");
    const json::JsonValue before = bad;
    const StepResult failed = runStep("migrate-buttons", bad);
    success &= assertTrue(failed.failed() && !failed.errors.empty(), "non-object position fails");
    success &= assertTrue(!failed.errors.empty() && failed.errors.front().location == "buttons[0].position",
                          "failure points at the position");
    success &= assertTrue(bad == before, "failed step leaves the document untouched");
    return success;
}

bool testKindUnification()
{
    bool success = true;
    {
        json::JsonValue doc = parseFixture(R"({"id": "lvl", "lasers": [{"id": "s", "color": "red", "thickness": 2,
            "kind": {"type": "sweeper", "sweeper": {"start": {"x": 0, "y": 0}, "end": {"x": 10, "y": 0},
            "sweepSeconds": 3}}}]})");
        const StepResult result = runStep("unify-kinds", doc);
        success &= assertTrue(result.changed(), "sweeper unified");
        const json::JsonValue *laser = laserAt(doc, 0);
        success &= assertTrue(laser && json::getString(*laser, "type", "") == "ray", "sweeper becomes a ray");
        success &= assertTrue(laser && !json::hasField(*laser, "kind"), "kind removed");
        success &= assertTrue(laser && json::hasField(*laser, "initialAngle"), "angle stored on unification");
        success &= assertTrue(cycleEquals(laser ? json::getObjectField(*laser, "endpoint") : nullptr, 6),
                              "round trip cycle written");
        success &= assertTrue(level::migration::hasLedgerEntry(doc, level::migration::kCycleLedgerEntry),
                              "round trip cycles recorded in the ledger");
        success &= assertTrue(doc.object.back().first == level::migration::kLedgerKey, "ledger appended last");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [
            {"id": "old", "color": "red", "thickness": 2, "enabled": true, "type": "ray",
             "endpoint": {"points": [{"x": 0, "y": 0}, {"x": 0, "y": 5}], "cycleSeconds": 2, "initialT": 0.0},
             "initialAngle": 0.0, "rotationSpeed": 0.0},
            {"id": "s", "color": "red", "thickness": 2,
             "kind": {"type": "sweeper", "sweeper": {"start": {"x": 0, "y": 0}, "end": {"x": 10, "y": 0},
             "sweepSeconds": 3}}}]})");
        success &= assertTrue(runStep("unify-kinds", doc).changed(), "mixed document unified");
        success &= assertTrue(cycleEquals(json::getObjectField(*laserAt(doc, 1), "endpoint"), 3),
                              "sweeper keeps one-way time next to uncorrected lasers");
        success &= assertTrue(!level::migration::hasLedgerEntry(doc, level::migration::kCycleLedgerEntry),
                              "no ledger entry while cycles are one-way");

        success &= assertTrue(runStep("fix-cycle-times", doc).changed(), "cycle correction applies");
        success &= assertTrue(cycleEquals(json::getObjectField(*laserAt(doc, 0), "endpoint"), 4),
                              "existing laser doubled");
        success &= assertTrue(cycleEquals(json::getObjectField(*laserAt(doc, 1), "endpoint"), 6),
                              "converted sweeper doubled with the rest");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "g", "color": "red", "thickness": 2,
            "kind": {"type": "segment", "segment": {"start": {"x": 0, "y": 1}, "end": {"x": 1, "y": 1}}}}]})");
        success &= assertTrue(runStep("unify-kinds", doc).changed(), "segment unified");
        success &= assertTrue(!json::hasField(doc, level::migration::kLedgerKey), "static lasers add no ledger");
        const json::JsonValue *laser = laserAt(doc, 0);
        success &= assertTrue(laser && json::hasField(*laser, "startEndpoint") && json::hasField(*laser, "endEndpoint"),
                              "segment written with start and end paths");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [
            {"id": "g", "color": "red", "thickness": 2,
             "kind": {"type": "segment", "segment": {"start": {"x": 0, "y": 1}, "end": {"x": 1, "y": 1}}}},
            {"id": "b", "color": "red", "thickness": 2, "kind": {"type": "beam", "beam": {}}}]})");
        const json::JsonValue before = doc;
        const StepResult result = runStep("unify-kinds", doc);
        success &= assertTrue(result.failed(), "unknown kind fails the step");
        success &= assertTrue(result.errors.size() == 1 &&
                                  result.errors.front().kind == level::LevelErrorKind::UnknownLegacyVariant,
                              "unknown kind reported once");
        success &= assertTrue(!result.errors.empty() && result.errors.front().location == "lasers[1].kind.type",
                              "unknown kind located");
        success &= assertTrue(doc == before, "no partial rewrite on failure");
    }
    return success;
}

bool testCycleTime()
{
    bool success = true;
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "a", "color": "red", "thickness": 1, "type": "segment",
            "startEndpoint": {"points": [{"x": 0, "y": 0}, {"x": 1, "y": 0}], "cycleSeconds": 1.5, "initialT": 0.0},
            "endEndpoint": {"points": [{"x": 0, "y": 1}], "cycleSeconds": null, "initialT": 0.0}}]})");
        success &= assertTrue(runStep("fix-cycle-times", doc).changed(), "one-way cycles doubled");
        const json::JsonValue *start = json::getObjectField(*laserAt(doc, 0), "startEndpoint");
        const json::JsonValue *cycle = start ? json::getObjectField(*start, "cycleSeconds") : nullptr;
        success &= assertTrue(cycle && !cycle->number.integral && cycle->number.value == 3.0, "float cycle doubled");
        const json::JsonValue *end = json::getObjectField(*laserAt(doc, 0), "endEndpoint");
        success &= assertTrue(end && json::getObjectField(*end, "cycleSeconds")->isNull(), "null cycle untouched");
        success &= assertTrue(runStep("fix-cycle-times", doc).outcome == StepOutcome::Unchanged,
                              "ledger prevents a second doubling");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "a", "color": "red", "thickness": 1, "type": "ray",
            "endpoints": [{"points": [{"x": 0, "y": 0}, {"x": 1, "y": 0}], "cycleSeconds": 4}],
            "rotationSpeed": 0.0}]})");
        success &= assertTrue(runStep("fix-cycle-times", doc).outcome == StepOutcome::Unchanged,
                              "endpoints array layout already corrected");
    }
    {
        json::JsonValue doc = parseFixture(R"({"appliedMigrations": {"bad": true}, "lasers": [{"id": "a",
            "color": "red", "thickness": 1, "type": "ray",
            "endpoint": {"points": [{"x": 0, "y": 0}, {"x": 1, "y": 0}], "cycleSeconds": 4}}]})");
        success &= assertTrue(runStep("fix-cycle-times", doc).failed(), "malformed ledger reported");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "a", "color": "red", "thickness": 1, "type": "ray",
            "endpoint": {"points": [{"x": 0, "y": 0}, {"x": 1, "y": 0}], "cycleSeconds": 9223372036854775807}}]})");
        success &= assertTrue(runStep("fix-cycle-times", doc).changed(), "largest integer cycle converted");
        const json::JsonValue *path = json::getObjectField(*laserAt(doc, 0), "endpoint");
        const json::JsonValue *cycle = path ? json::getObjectField(*path, "cycleSeconds") : nullptr;
        success &= assertTrue(cycle && cycle->isNumber() && !cycle->number.integral, "overflowing cycle becomes float");
        success &= testing_support::assertNear(cycle ? cycle->number.value : 0.0, 18446744073709551614.0,
                                               "doubled cycle keeps its sign and magnitude", 1e4);
    }
    return success;
}

bool testEndpointArray()
{
    bool success = true;
    {
        json::JsonValue doc = parseFixture(R"({
            "buttons": [{"id": "b", "endpoint": {"points": [{"x": 1, "y": 1}], "cycleSeconds": null}}],
            "lasers": [
              {"id": "r", "type": "ray", "endpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null},
               "rotationSpeed": 1.0},
              {"id": "s", "type": "segment",
               "startEndpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null},
               "endEndpoint": {"points": [{"x": 2, "y": 0}], "cycleSeconds": null}}]})");
        success &= assertTrue(runStep("generalize-endpoints", doc).changed(), "bare layouts generalized");
        const json::JsonValue *ray = laserAt(doc, 0);
        const json::JsonValue *segment = laserAt(doc, 1);
        const json::JsonValue *button = buttonAt(doc, 0);
        success &= assertTrue(ray && json::getObjectField(*ray, "endpoints")->array.size() == 1, "ray has one entry");
        success &= assertTrue(ray && !json::hasField(*ray, "endpoint"), "old ray key removed");
        success &= assertTrue(segment && json::getObjectField(*segment, "endpoints")->array.size() == 2,
                              "segment has two entries");
        const json::JsonValue *second = segment ? &json::getObjectField(*segment, "endpoints")->array[1] : nullptr;
        const json::JsonValue *points = second ? json::getObjectField(*second, "points") : nullptr;
        success &= assertTrue(points && json::getInt(points->array[0], "x", 0) == 2, "end path stays second");
        success &= assertTrue(button && json::hasField(*button, "endpoints") && !json::hasField(*button, "endpoint"),
                              "button generalized");
        success &= secondPassIsNoOp("generalize-endpoints", doc, "generalized layout");
    }
    {
        const std::string text = R"({"lasers": [{"id": "r", "type": "ray",
            "endpoints": [{"points": [{"x": 0, "y": 0}, {"x": 4, "y": 0}], "cycleSeconds": 2}],
            "rotationSpeed": 1.0}], "buttons": [{"id": "b",
            "endpoints": [{"points": [{"x": 1, "y": 1}], "cycleSeconds": null}]}]})";
        json::JsonValue doc = parseFixture(text);
        const std::string before = json::writeJson(doc);
        success &= assertTrue(runStep("generalize-endpoints", doc).outcome == StepOutcome::Unchanged,
                              "array layout left alone");
        success &= testing_support::assertEqualText(json::writeJson(doc), before, "array layout output identical");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "r", "type": "ray",
            "endpoints": [{"points": [{"x": 1, "y": 1}, {"x": 1.0, "y": 1}], "cycleSeconds": null}]},
            {"id": "m", "type": "ray",
            "endpoints": [{"points": [{"x": 1, "y": 1}, {"x": 1, "y": 1}], "cycleSeconds": 3}]}]})");
        success &= assertTrue(runStep("generalize-endpoints", doc).changed(), "repeated stationary points collapsed");
        const json::JsonValue *still = &json::getObjectField(*laserAt(doc, 0), "endpoints")->array[0];
        success &= assertTrue(json::getObjectField(*still, "points")->array.size() == 1, "one point kept");
        const json::JsonValue *timed = &json::getObjectField(*laserAt(doc, 1), "endpoints")->array[0];
        success &= assertTrue(json::getObjectField(*timed, "points")->array.size() == 2,
                              "paths with a cycle keep their points");
        success &= secondPassIsNoOp("generalize-endpoints", doc, "collapsed points");
    }
    {
        json::JsonValue doc = parseFixture(R"({"buttons": [{"id": "b",
            "endpoint": {"points": [{"x": 2, "y": 3}, {"x": 2, "y": 3}]}}]})");
        success &= assertTrue(runStep("generalize-endpoints", doc).changed(), "bare button generalized");
        const json::JsonValue *button = buttonAt(doc, 0);
        const json::JsonValue *path = button ? &json::getObjectField(*button, "endpoints")->array[0] : nullptr;
        success &= assertTrue(path && json::getObjectField(*path, "points")->array.size() == 1,
                              "path without a cycle collapsed while generalizing");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "s", "type": "segment",
            "startEndpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null}}]})");
        success &= assertTrue(runStep("generalize-endpoints", doc).failed(), "lone start path rejected");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "r", "type": "ray",
            "endpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null},
            "endpoints": [{"points": [{"x": 0, "y": 0}], "cycleSeconds": null}]}]})");
        success &= assertTrue(runStep("generalize-endpoints", doc).failed(), "mixed layouts rejected");
    }
    return success;
}

bool testAngleRemoval()
{
    bool success = true;
    json::JsonValue doc = parseFixture(R"({"lasers": [
        {"id": "a", "type": "ray",
         "endpoints": [{"points": [{"x": 0, "y": 0}, {"x": 10, "y": 0}], "cycleSeconds": 6}],
         "initialAngle": 1.5707963267948966, "rotationSpeed": 0.0},
        {"id": "b", "type": "ray", "endpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null},
         "initialAngle": 1.0, "rotationSpeed": 0.5},
        {"id": "c", "type": "segment", "initialAngle": 2.0}]})");
    const StepResult result = runStep("remove-angles", doc);
    success &= assertTrue(result.changed(), "angles removed");
    success &= assertTrue(!json::hasField(*laserAt(doc, 0), "initialAngle"), "matching angle removed");
    success &= assertTrue(!json::hasField(*laserAt(doc, 1), "initialAngle"), "differing angle removed");
    success &= assertTrue(json::hasField(*laserAt(doc, 2), "initialAngle"), "segments are not touched");
    success &= assertTrue(result.warnings.size() == 1, "one warning for the differing angle");
    if (!result.warnings.empty())
    {
        success &= assertTrue(result.warnings.front() ==
                                  "lasers[1]: stored initialAngle 1.000000 differs from derived angle 0.000000",
                              "warning names the laser and both angles");
    }
    success &= secondPassIsNoOp("remove-angles", doc, "angles removed");

    {
        json::JsonValue current = parseFixture(R"({"lasers": [{"id": "a", "type": "ray",
            "endpoints": [{"points": [{"x": 0, "y": 0}, {"x": 10, "y": 0}], "cycleSeconds": 6}],
            "rotationSpeed": 0.0}, {"id": "c", "type": "segment", "initialAngle": 2.0}]})");
        const std::string before = json::writeJson(current);
        const StepResult untouched = runStep("remove-angles", current);
        success &= assertTrue(untouched.outcome == StepOutcome::Unchanged && untouched.warnings.empty(),
                              "rays without angles left alone");
        success &= testing_support::assertEqualText(json::writeJson(current), before, "angle-free output identical");
    }
    return success;
}

bool testPhaseRename()
{
    bool success = true;
    {
        json::JsonValue doc = parseFixture(R"({
            "buttons": [{"id": "b", "endpoints": [{"points": [{"x": 0, "y": 0}], "cycleSeconds": null, "t": null}]}],
            "lasers": [{"id": "a", "type": "segment", "endpoints": [
              {"points": [{"x": 0, "y": 0}, {"x": 1, "y": 0}], "cycleSeconds": 2, "initialT": 0.5},
              {"points": [{"x": 0, "y": 1}], "cycleSeconds": null, "initialT": 0.0}]}]})");
        success &= assertTrue(runStep("rename-phase", doc).changed(), "phase renamed");
        const json::JsonValue &paths = *json::getObjectField(*laserAt(doc, 0), "endpoints");
        success &= assertTrue(!json::hasField(paths.array[0], "initialT"), "initialT removed");
        success &= assertTrue(json::getNumber(paths.array[0], "t", 0.0) == 0.5, "non-zero phase kept as t");
        success &= assertTrue(paths.array[0].object.back().first == "t", "t appended last");
        success &= assertTrue(!json::hasField(paths.array[1], "initialT") && !json::hasField(paths.array[1], "t"),
                              "zero phase dropped");
        const json::JsonValue &buttonPath = json::getObjectField(*buttonAt(doc, 0), "endpoints")->array[0];
        success &= assertTrue(!json::hasField(buttonPath, "t"), "null t dropped on buttons");
        success &= assertTrue(runStep("rename-phase", doc).outcome == StepOutcome::Unchanged, "second pass no-op");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "a", "type": "ray",
            "endpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null, "initialT": 1, "t": 1}}]})");
        success &= assertTrue(runStep("rename-phase", doc).failed(), "both phase keys rejected");
    }
    {
        json::JsonValue doc = parseFixture(R"({"lasers": [{"id": "a", "type": "ray",
            "endpoint": {"points": [{"x": 0, "y": 0}], "cycleSeconds": null, "initialT": "soon"}}]})");
        success &= assertTrue(runStep("rename-phase", doc).failed(), "non-numeric phase rejected");
    }
    return success;
}

} // namespace

int main()
{
    bool success = true;

    success &= testButtonPosition();
    success &= testKindUnification();
    success &= testCycleTime();
    success &= testEndpointArray();
    success &= testAngleRemoval();
    success &= testPhaseRename();

    {
        json::JsonValue notObject = parseFixture("[1, 2]");
        const StepResult result = runStep("rename-phase", notObject);
        success &= assertTrue(result.failed(), "non-object document fails");
    }

    return success ? 0 : 1;
}
