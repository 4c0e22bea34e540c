#include <gtest/gtest.h>
#include "core/errors.h"
#include "core/run_state.h"

using namespace nanoflow::core;

namespace {

const std::vector<std::string> kStages = {
    "convert-format", "basecall", "align", "realign-signal", "infer-modification",
};

StageResult result(const std::string& stage, AttemptOutcome outcome, int attempt = 1) {
    StageResult r;
    r.stage = stage;
    r.attempt = attempt;
    r.outcome = outcome;
    r.exit_code = outcome == AttemptOutcome::Succeeded ? 0 : 1;
    return r;
}

} // anonymous namespace

TEST(RunStateTest, FreshState) {
    auto state = RunState::fresh("r1", kStages);

    EXPECT_EQ(state.run_id, "r1");
    EXPECT_EQ(state.status, RunStatus::Pending);
    EXPECT_EQ(state.resume_point, "convert-format");
    EXPECT_FALSE(state.created_at.empty());
    EXPECT_EQ(state.created_at, state.updated_at);
    EXPECT_FALSE(state.any_succeeded());
}

TEST(RunStateTest, ResumePointSkipsSucceededPrefix) {
    auto state = RunState::fresh("r1", kStages);
    EXPECT_EQ(resume_point(state, kStages), 0u);

    state.append(result("convert-format", AttemptOutcome::Succeeded));
    state.append(result("basecall", AttemptOutcome::Succeeded));
    state.append(result("align", AttemptOutcome::Succeeded));
    state.append(result("realign-signal", AttemptOutcome::ProcessFailure));

    EXPECT_EQ(resume_point(state, kStages), 3u);
}

TEST(RunStateTest, LatestResultWins) {
    auto state = RunState::fresh("r1", kStages);
    state.append(result("convert-format", AttemptOutcome::ProcessFailure, 1));
    state.append(result("convert-format", AttemptOutcome::Succeeded, 2));

    EXPECT_TRUE(state.stage_succeeded("convert-format"));
    EXPECT_EQ(state.attempts("convert-format"), 2);
    EXPECT_EQ(state.last_result("convert-format")->attempt, 2);
    EXPECT_EQ(state.last_result("basecall"), nullptr);
    EXPECT_EQ(resume_point(state, kStages), 1u);

    // A later failure of an earlier stage moves the resume point back
    state.append(result("convert-format", AttemptOutcome::ValidationFailure, 3));
    EXPECT_EQ(resume_point(state, kStages), 0u);
}

TEST(RunStateTest, AllSucceeded) {
    auto state = RunState::fresh("r1", kStages);
    for (const auto& stage : kStages) {
        state.append(result(stage, AttemptOutcome::Succeeded));
    }
    EXPECT_FALSE(resume_point(state, kStages).has_value());
    EXPECT_TRUE(state.any_succeeded());
}

TEST(RunStateTest, JsonRoundTrip) {
    auto state = RunState::fresh("r1", kStages);
    state.status = RunStatus::PartiallyCompleted;

    auto failed = result("convert-format", AttemptOutcome::ValidationFailure);
    failed.error = "silent tool failure";
    failed.diagnostics = "[E] no reads\n";
    failed.timed_out = false;
    failed.duration_ms = 1500;
    ValidationOutcome v;
    v.status = ValidationStatus::EmptyArtifact;
    v.artifact = "signal_file";
    v.path = "/out/01_convert/reads.pod5";
    v.detail = "file is empty";
    failed.validation = v;
    state.append(failed);

    auto restored = RunState::from_json(state.to_json());

    EXPECT_EQ(restored.run_id, "r1");
    EXPECT_EQ(restored.status, RunStatus::PartiallyCompleted);
    EXPECT_EQ(restored.stages, kStages);
    ASSERT_EQ(restored.results.size(), 1u);
    const auto& r = restored.results[0];
    EXPECT_EQ(r.outcome, AttemptOutcome::ValidationFailure);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.error, "silent tool failure");
    EXPECT_EQ(r.diagnostics, "[E] no reads\n");
    EXPECT_EQ(r.duration_ms, 1500);
    ASSERT_TRUE(r.validation.has_value());
    EXPECT_EQ(r.validation->status, ValidationStatus::EmptyArtifact);
}

TEST(RunStateTest, NullExitCodeSurvivesRoundTrip) {
    auto r = result("basecall", AttemptOutcome::ConfigurationError);
    r.exit_code.reset();
    auto restored = StageResult::from_json(r.to_json());
    EXPECT_FALSE(restored.exit_code.has_value());
}

TEST(RunStateTest, UnknownValuesRejected) {
    auto j = RunState::fresh("r1", kStages).to_json();
    j["status"] = "exploded";
    EXPECT_THROW(RunState::from_json(j), PersistenceError);

    auto r = result("basecall", AttemptOutcome::Succeeded).to_json();
    r["outcome"] = "mostly_ok";
    EXPECT_THROW(StageResult::from_json(r), PersistenceError);
}
